// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cards/state_store.h>
#include <util.h>

namespace cards {

CardStateStore::CardStateStore(const AssetLedger& ledger, const CardLimits& limits)
    : ledger_(ledger)
    , limits_(limits)
{
}

void CardStateStore::SetMeta(CardId id, const Level& level)
{
    LOCK(cs_state_);
    metas_[id] = CardMeta(0, level);
}

void CardStateStore::ClearMeta(CardId id)
{
    LOCK(cs_state_);
    metas_.erase(id);
}

UseCount CardStateStore::UsesOfLocked(CardId id) const
{
    auto it = metas_.find(id);
    return it == metas_.end() ? UseCount(0) : it->second.uses;
}

CardError CardStateStore::RecordUse(CardId id, const UseCount& count, UseCount& newUses)
{
    LOCK(cs_state_);

    if (count == 0) {
        return CardError::ZERO_USE_COUNT;
    }

    const UseCount current = UsesOfLocked(id);

    // current may exceed maxUses if the limit was lowered after the use
    if (current > limits_.maxUses || count > limits_.maxUses - current) {
        LogPrint(BCLog::CARDS, "CardStateStore: Card %lu cannot take %s more uses (uses=%s, max=%s)\n",
                 id, FormatUseCount(count), FormatUseCount(current), FormatUseCount(limits_.maxUses));
        return CardError::MAX_USES_COUNT_REACHED;
    }

    CardMeta& meta = metas_[id];
    meta.uses = current + count;
    newUses = meta.uses;
    return CardError::OK;
}

bool CardStateStore::CanAccept(CardId id, const UseCount& count) const
{
    LOCK(cs_state_);

    const UseCount current = UsesOfLocked(id);
    return current <= limits_.maxUses && count <= limits_.maxUses - current;
}

std::optional<CardMeta> CardStateStore::GetMeta(CardId id) const
{
    LOCK(cs_state_);

    if (!ledger_.Exists(id)) {
        return std::nullopt;
    }

    auto it = metas_.find(id);
    if (it == metas_.end()) {
        return CardMeta();
    }
    return it->second;
}

CardLimits CardStateStore::GetLimits() const
{
    LOCK(cs_state_);
    return limits_;
}

void CardStateStore::SetLimits(const CardLimits& limits)
{
    LOCK(cs_state_);

    limits_ = limits;
    LogPrintf("CardStateStore: Limits set - maxOwns=%s, maxUses=%s\n",
              FormatUseCount(limits_.maxOwns), FormatUseCount(limits_.maxUses));
}

UseCount CardStateStore::GetMaxUses() const
{
    LOCK(cs_state_);
    return limits_.maxUses;
}

UseCount CardStateStore::GetMaxOwns() const
{
    LOCK(cs_state_);
    return limits_.maxOwns;
}

size_t CardStateStore::GetRecordCount() const
{
    LOCK(cs_state_);
    return metas_.size();
}

} // namespace cards
