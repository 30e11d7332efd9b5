// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CARDVAULT_CARDS_STATE_STORE_H
#define CARDVAULT_CARDS_STATE_STORE_H

/**
 * @file state_store.h
 * @brief Per-card use counters and levels plus the global limits
 *
 * CardStateStore is the only place a card's use counter is written, so
 * the bound uses <= maxUses is checked in exactly one function
 * (RecordUse). Existence of a card is asked of the ledger: a card minted a
 * moment ago with zero uses exists even though nothing distinguishes its
 * metadata from an empty record.
 */

#include <cards/asset_ledger.h>
#include <cards/card_common.h>
#include <sync.h>

#include <map>
#include <optional>

namespace cards {

/**
 * @brief Store of CardMeta records and CardLimits
 *
 * Thread-safe for concurrent access. Read-modify-write sequences that span
 * several calls (first-fit selection) must be serialised by the caller.
 */
class CardStateStore {
public:
    /**
     * @param ledger Ownership ledger used for existence checks; must outlive
     *               the store
     * @param limits Initial limits
     */
    CardStateStore(const AssetLedger& ledger, const CardLimits& limits);

    /**
     * @brief Create the record of a freshly minted card with uses = 0
     *
     * The caller guarantees id is new; an existing record is overwritten.
     */
    void SetMeta(CardId id, const Level& level);

    /** Drop the record of a burned card. Idempotent. */
    void ClearMeta(CardId id);

    /**
     * @brief Add count uses to a card
     * @param id Card to consume
     * @param count Uses to add
     * @param[out] newUses Counter after the update (untouched on failure)
     * @return ZERO_USE_COUNT if count == 0, MAX_USES_COUNT_REACHED if
     *         uses + count > maxUses, OK otherwise
     */
    CardError RecordUse(CardId id, const UseCount& count, UseCount& newUses);

    /** true if count more uses fit on the card under the current limit */
    bool CanAccept(CardId id, const UseCount& count) const;

    /** Metadata of an existing card, nullopt if the ledger does not know id */
    std::optional<CardMeta> GetMeta(CardId id) const;

    CardLimits GetLimits() const;
    void SetLimits(const CardLimits& limits);

    UseCount GetMaxUses() const;
    UseCount GetMaxOwns() const;

    /** Number of stored metadata records */
    size_t GetRecordCount() const;

private:
    /** Counter of a card, zero if no record exists */
    UseCount UsesOfLocked(CardId id) const;

    const AssetLedger& ledger_;

    CardLimits limits_;

    std::map<CardId, CardMeta> metas_;

    mutable CCriticalSection cs_state_;
};

} // namespace cards

#endif // CARDVAULT_CARDS_STATE_STORE_H
