// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CARDVAULT_CARDS_ASSET_LEDGER_H
#define CARDVAULT_CARDS_ASSET_LEDGER_H

/**
 * @file asset_ledger.h
 * @brief Ownership bookkeeping for cards
 *
 * AssetLedger is the ownership substrate the registry composes with. It
 * knows who holds which card and in which order a holder's cards are
 * enumerated; it knows nothing about use counters or levels.
 *
 * MemoryAssetLedger keeps, per holder, an index-addressable list of cards.
 * New cards are appended. Removing a card moves the holder's last card into
 * the freed slot (swap-and-pop), which is the only way enumeration order
 * ever changes. A transfer from a holder to itself leaves the list as is.
 */

#include <cards/access_control.h>
#include <cards/card_common.h>
#include <sync.h>

#include <map>
#include <optional>
#include <set>
#include <vector>

namespace cards {

/**
 * @brief Ownership substrate consumed by the card controller
 */
class AssetLedger {
public:
    virtual ~AssetLedger() = default;

    // =========================================================================
    // Reads
    // =========================================================================

    /** Current holder of a card, nullopt if the card does not exist */
    virtual std::optional<Address> OwnerOf(CardId id) const = 0;

    /** Number of cards held by owner */
    virtual size_t BalanceOf(const Address& owner) const = 0;

    /** Card at position index in owner's enumeration, nullopt if out of range */
    virtual std::optional<CardId> CardOfOwnerByIndex(const Address& owner, size_t index) const = 0;

    virtual bool Exists(CardId id) const = 0;

    /** true if actor owns id, is approved for id, or is an operator for its owner */
    virtual bool IsApprovedOrOwner(const Address& actor, CardId id) const = 0;

    // =========================================================================
    // Writes
    // =========================================================================

    virtual CardError MintOwnership(const Address& to, CardId id) = 0;

    virtual CardError BurnOwnership(CardId id) = 0;

    virtual CardError TransferOwnership(const Address& from, const Address& to, CardId id) = 0;
};

/**
 * @brief In-memory enumerable ledger with single-card and operator approvals
 *
 * Every ownership change is routed through one update path that refuses to
 * run while the injected HaltState reports halted, so mint, burn and
 * transfer are all frozen during maintenance.
 *
 * Thread-safe for concurrent access.
 */
class MemoryAssetLedger : public AssetLedger {
public:
    /**
     * @param haltState Maintenance flag consulted on every ownership change;
     *                  must outlive the ledger
     */
    explicit MemoryAssetLedger(const HaltState& haltState);

    std::optional<Address> OwnerOf(CardId id) const override;
    size_t BalanceOf(const Address& owner) const override;
    std::optional<CardId> CardOfOwnerByIndex(const Address& owner, size_t index) const override;
    bool Exists(CardId id) const override;
    bool IsApprovedOrOwner(const Address& actor, CardId id) const override;

    CardError MintOwnership(const Address& to, CardId id) override;
    CardError BurnOwnership(CardId id) override;
    CardError TransferOwnership(const Address& from, const Address& to, CardId id) override;

    // =========================================================================
    // Approvals
    // =========================================================================

    /**
     * @brief Approve one address to move a single card
     * @param caller Must be the owner or an operator for the owner
     * @param to Approved address; the null address clears the approval
     */
    CardError Approve(const Address& caller, const Address& to, CardId id);

    /** Currently approved address for id (null if none), nullopt if id does not exist */
    std::optional<Address> GetApproved(CardId id) const;

    /**
     * @brief Let an operator move every card of owner
     * @return APPROVE_TO_CALLER if owner == operatorAddr
     */
    CardError SetApprovalForAll(const Address& owner, const Address& operatorAddr, bool approved);

    bool IsApprovedForAll(const Address& owner, const Address& operatorAddr) const;

    /** All cards of owner in enumeration order */
    std::vector<CardId> GetCardsOf(const Address& owner) const;

    /** Number of existing cards */
    size_t TotalSupply() const;

private:
    /**
     * Single ownership-change path. from null = mint, to null = burn.
     */
    CardError UpdateOwnership(const Address& from, const Address& to, CardId id);

    void AddCardToOwnerEnumeration(const Address& to, CardId id);
    void RemoveCardFromOwnerEnumeration(const Address& from, CardId id);

    bool IsApprovedOrOwnerLocked(const Address& actor, CardId id) const;

    const HaltState& haltState_;

    /** card -> holder */
    std::map<CardId, Address> owners_;

    /** holder -> cards in enumeration order */
    std::map<Address, std::vector<CardId>> ownedCards_;

    /** card -> position inside ownedCards_[owner] */
    std::map<CardId, size_t> ownedCardsIndex_;

    /** card -> single approved address */
    std::map<CardId, Address> cardApprovals_;

    /** owner -> operators */
    std::map<Address, std::set<Address>> operatorApprovals_;

    mutable CCriticalSection cs_ledger_;
};

} // namespace cards

#endif // CARDVAULT_CARDS_ASSET_LEDGER_H
