// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CARDVAULT_CARDS_CARD_CONTROLLER_H
#define CARDVAULT_CARDS_CARD_CONTROLLER_H

/**
 * @file card_controller.h
 * @brief Card lifecycle: mint, burn, transfer and use
 *
 * CardController composes the ownership ledger, the state store, the
 * metadata resolver and the capability / halt collaborators into the
 * operations the registry exposes. Every call first consults the
 * collaborators, then reads or mutates the state store, then (for
 * ownership changes) delegates to the ledger.
 *
 * Maintenance mode freezes mint, burn and transfer. Use operations keep
 * working while halted.
 */

#include <cards/access_control.h>
#include <cards/asset_ledger.h>
#include <cards/card_common.h>
#include <cards/metadata_resolver.h>
#include <cards/state_store.h>
#include <sync.h>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cards {

/**
 * @brief Card lifecycle controller
 *
 * Holds cs_cards_ for the whole of each operation, so a use's
 * read-modify-write and the first-fit scan of a holder's cards never
 * interleave with another mutation.
 *
 * Thread-safe for concurrent access.
 */
class CardController {
public:
    /** Receives (card, maxUses - uses) after every successful use */
    using UsedCallback = std::function<void(CardId, const UseCount&)>;

    /**
     * All collaborators must outlive the controller.
     */
    CardController(AssetLedger& ledger,
                   CardStateStore& state,
                   MetadataResolver& resolver,
                   const CapabilityProvider& capabilities,
                   const HaltState& haltState);

    // =========================================================================
    // Mint / burn / transfer
    // =========================================================================

    /**
     * @brief Mint one card
     * @param caller Must hold MINTER
     * @param to Recipient
     * @param level Level fixed for the card's lifetime
     * @return result with cardIds = {new id}
     *
     * The id counter advances only when the card is created.
     */
    CardResult Mint(const Address& caller, const Address& to, const Level& level);

    /**
     * @brief Mint tos.size() cards, tos[i] receiving a card of levels[i]
     * @return WRONG_INPUT_PARAMS if the vectors are empty or of different
     *         lengths; on success cardIds holds consecutive ids in input order
     */
    CardResult MintBatch(const Address& caller, const std::vector<Address>& tos, const std::vector<Level>& levels);

    /**
     * @brief Burn a card and drop its metadata
     * @param caller Owner, approved address or operator of the owner
     */
    CardResult Burn(const Address& caller, CardId id);

    /**
     * @brief Burn cards in order, stopping at the first failure
     *
     * Cards burned before the failing one stay burned; the failure result
     * lists them in cardIds.
     */
    CardResult BurnBatch(const Address& caller, const std::vector<CardId>& ids);

    /**
     * @brief Move cards from one holder to another, in order
     *
     * Each transfer is checked on its own; the first failure aborts the rest
     * and cards already moved stay moved. Use counters and levels travel with
     * the card unchanged.
     */
    CardResult TransferBatch(const Address& caller, const Address& from, const Address& to,
                             const std::vector<CardId>& ids);

    // =========================================================================
    // Use
    // =========================================================================

    /**
     * @brief Consume count uses of one card
     * @param caller Must hold OPERATOR
     * @return result with meta (after the use) and remainingUses
     */
    CardResult Use(const Address& caller, CardId id, const UseCount& count);

    /**
     * @brief Consume count uses from the first of owner's cards that can take them
     *
     * Scans owner's cards in enumeration order and applies the use to the
     * lowest index whose uses + count <= maxUses.
     *
     * @return NOT_EXISTS if owner holds nothing, MAX_USES_COUNT_REACHED if no
     *         card can take count more uses
     */
    CardResult UseFromHolder(const Address& caller, const Address& owner, const UseCount& count);

    /** Whether UseFromHolder(owner, count) would succeed right now */
    bool CanUseFrom(const Address& owner, const UseCount& count) const;

    // =========================================================================
    // Administration (ADMIN)
    // =========================================================================

    /**
     * @brief Replace the registry limits
     *
     * A lower maxUses does not touch existing counters; cards already above
     * it simply reject further use.
     */
    CardResult SetLimits(const Address& caller, const CardLimits& limits);

    CardResult SetBaseURI(const Address& caller, const std::string& baseURI);

    /** @return WRONG_INPUT_PARAMS if the vectors are empty or differ in length */
    CardResult SetLevelURIs(const Address& caller, const std::vector<Level>& levels,
                            const std::vector<std::string>& uris);

    // =========================================================================
    // Queries
    // =========================================================================

    /** Sum of uses over owner's cards, nullopt if owner holds nothing */
    std::optional<UseCount> TotalUsesOf(const Address& owner) const;

    std::optional<UseCount> UsesOf(CardId id) const;
    std::optional<Level> LevelOf(CardId id) const;
    std::optional<CardMeta> GetMeta(CardId id) const;

    /** Display URI of a card, nullopt if it does not exist */
    std::optional<std::string> GetCardURI(CardId id) const;

    /** Id the next minted card will receive */
    CardId GetNextId() const;

    void RegisterUsedCallback(UsedCallback callback);

private:
    bool HasCapability(const Address& caller, Capability capability, const char* operation) const;

    /** Allocate an id and create the card; capability and halt already checked */
    CardResult MintLocked(const Address& to, const Level& level);

    CardResult BurnLocked(const Address& caller, CardId id);

    CardError TransferOneLocked(const Address& caller, const Address& from, const Address& to, CardId id);

    /** RecordUse + notification; id known to exist */
    CardResult ApplyUseLocked(CardId id, const UseCount& count);

    /** First card of owner, in enumeration order, that can take count more uses */
    std::optional<CardId> FindUsableCardLocked(const Address& owner, const UseCount& count) const;

    void NotifyUsed(CardId id, const UseCount& remaining);

    AssetLedger& ledger_;
    CardStateStore& state_;
    MetadataResolver& resolver_;
    const CapabilityProvider& capabilities_;
    const HaltState& haltState_;

    /** Next card id; starts at 0 and only grows */
    CardId nextId_;

    std::vector<UsedCallback> usedCallbacks_;

    mutable CCriticalSection cs_cards_;
};

} // namespace cards

#endif // CARDVAULT_CARDS_CARD_CONTROLLER_H
