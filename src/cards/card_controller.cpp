// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file card_controller.cpp
 * @brief Implementation of the card lifecycle controller
 */

#include <cards/card_controller.h>
#include <util.h>

namespace cards {

CardController::CardController(AssetLedger& ledger,
                               CardStateStore& state,
                               MetadataResolver& resolver,
                               const CapabilityProvider& capabilities,
                               const HaltState& haltState)
    : ledger_(ledger)
    , state_(state)
    , resolver_(resolver)
    , capabilities_(capabilities)
    , haltState_(haltState)
    , nextId_(0)
{
}

bool CardController::HasCapability(const Address& caller, Capability capability, const char* operation) const
{
    if (capabilities_.HasCapability(caller, capability)) {
        return true;
    }
    LogPrint(BCLog::CARDS, "CardController: %s denied - %s lacks %s\n",
             operation, caller.ToString().substr(0, 16), CapabilityToString(capability));
    return false;
}

// ============================================================================
// Mint
// ============================================================================

CardResult CardController::Mint(const Address& caller, const Address& to, const Level& level)
{
    LOCK(cs_cards_);

    if (haltState_.IsHalted()) {
        return CardResult::Failure(CardError::HALTED);
    }
    if (!HasCapability(caller, Capability::MINTER, "Mint")) {
        return CardResult::Failure(CardError::MISSING_CAPABILITY);
    }

    return MintLocked(to, level);
}

CardResult CardController::MintBatch(const Address& caller, const std::vector<Address>& tos,
                                     const std::vector<Level>& levels)
{
    LOCK(cs_cards_);

    if (haltState_.IsHalted()) {
        return CardResult::Failure(CardError::HALTED);
    }
    if (!HasCapability(caller, Capability::MINTER, "MintBatch")) {
        return CardResult::Failure(CardError::MISSING_CAPABILITY);
    }
    if (tos.empty() || tos.size() != levels.size()) {
        LogPrint(BCLog::CARDS, "CardController: MintBatch rejected - %u recipients, %u levels\n",
                 tos.size(), levels.size());
        return CardResult::Failure(CardError::WRONG_INPUT_PARAMS);
    }

    // Reject the whole batch up front so no partial mint is reachable
    for (const Address& to : tos) {
        if (to.IsNull()) {
            return CardResult::Failure(CardError::MINT_TO_NULL_ADDRESS);
        }
    }

    std::vector<CardId> minted;
    minted.reserve(tos.size());
    for (size_t i = 0; i < tos.size(); ++i) {
        CardResult single = MintLocked(tos[i], levels[i]);
        if (!single.success) {
            return CardResult::Failure(single.error, minted);
        }
        minted.push_back(single.cardIds.front());
    }

    LogPrint(BCLog::CARDS, "CardController: Minted batch of %u cards [%lu..%lu]\n",
             minted.size(), minted.front(), minted.back());
    return CardResult::Success(minted);
}

CardResult CardController::MintLocked(const Address& to, const Level& level)
{
    const CardId id = nextId_;

    CardError err = ledger_.MintOwnership(to, id);
    if (err != CardError::OK) {
        LogPrint(BCLog::CARDS, "CardController: Mint of card %lu failed - %s\n", id, CardErrorToString(err));
        return CardResult::Failure(err);
    }

    state_.SetMeta(id, level);
    ++nextId_;

    LogPrint(BCLog::CARDS, "CardController: Minted card %lu (level %s) to %s\n",
             id, FormatUseCount(level), to.ToString().substr(0, 16));
    return CardResult::Success({id});
}

// ============================================================================
// Burn
// ============================================================================

CardResult CardController::Burn(const Address& caller, CardId id)
{
    LOCK(cs_cards_);
    return BurnLocked(caller, id);
}

CardResult CardController::BurnBatch(const Address& caller, const std::vector<CardId>& ids)
{
    LOCK(cs_cards_);

    std::vector<CardId> burned;
    burned.reserve(ids.size());
    for (CardId id : ids) {
        CardResult single = BurnLocked(caller, id);
        if (!single.success) {
            LogPrint(BCLog::CARDS, "CardController: BurnBatch stopped at card %lu after %u burns - %s\n",
                     id, burned.size(), single.ErrorString());
            return CardResult::Failure(single.error, burned);
        }
        burned.push_back(id);
    }
    return CardResult::Success(burned);
}

CardResult CardController::BurnLocked(const Address& caller, CardId id)
{
    if (haltState_.IsHalted()) {
        return CardResult::Failure(CardError::HALTED);
    }
    if (!ledger_.Exists(id)) {
        return CardResult::Failure(CardError::NOT_EXISTS);
    }
    if (!ledger_.IsApprovedOrOwner(caller, id)) {
        return CardResult::Failure(CardError::CALLER_IS_NOT_OWNER_NOR_APPROVED);
    }

    CardError err = ledger_.BurnOwnership(id);
    if (err != CardError::OK) {
        return CardResult::Failure(err);
    }
    state_.ClearMeta(id);

    LogPrint(BCLog::CARDS, "CardController: Burned card %lu\n", id);
    return CardResult::Success({id});
}

// ============================================================================
// Transfer
// ============================================================================

CardResult CardController::TransferBatch(const Address& caller, const Address& from, const Address& to,
                                         const std::vector<CardId>& ids)
{
    LOCK(cs_cards_);

    std::vector<CardId> moved;
    moved.reserve(ids.size());
    for (CardId id : ids) {
        CardError err = TransferOneLocked(caller, from, to, id);
        if (err != CardError::OK) {
            LogPrint(BCLog::CARDS, "CardController: TransferBatch stopped at card %lu after %u transfers - %s\n",
                     id, moved.size(), CardErrorToString(err));
            return CardResult::Failure(err, moved);
        }
        moved.push_back(id);
    }
    return CardResult::Success(moved);
}

CardError CardController::TransferOneLocked(const Address& caller, const Address& from, const Address& to, CardId id)
{
    if (haltState_.IsHalted()) {
        return CardError::HALTED;
    }
    if (!ledger_.Exists(id)) {
        return CardError::NOT_EXISTS;
    }
    if (!ledger_.IsApprovedOrOwner(caller, id)) {
        return CardError::CALLER_IS_NOT_OWNER_NOR_APPROVED;
    }
    return ledger_.TransferOwnership(from, to, id);
}

// ============================================================================
// Use
// ============================================================================

CardResult CardController::Use(const Address& caller, CardId id, const UseCount& count)
{
    LOCK(cs_cards_);

    if (!HasCapability(caller, Capability::OPERATOR, "Use")) {
        return CardResult::Failure(CardError::MISSING_CAPABILITY);
    }
    if (!ledger_.Exists(id)) {
        return CardResult::Failure(CardError::NOT_EXISTS);
    }
    if (count == 0) {
        return CardResult::Failure(CardError::ZERO_USE_COUNT);
    }

    return ApplyUseLocked(id, count);
}

CardResult CardController::UseFromHolder(const Address& caller, const Address& owner, const UseCount& count)
{
    LOCK(cs_cards_);

    if (!HasCapability(caller, Capability::OPERATOR, "UseFromHolder")) {
        return CardResult::Failure(CardError::MISSING_CAPABILITY);
    }
    if (count == 0) {
        return CardResult::Failure(CardError::ZERO_USE_COUNT);
    }
    if (ledger_.BalanceOf(owner) == 0) {
        return CardResult::Failure(CardError::NOT_EXISTS);
    }

    std::optional<CardId> selected = FindUsableCardLocked(owner, count);
    if (!selected) {
        LogPrint(BCLog::CARDS, "CardController: No card of %s can take %s more uses\n",
                 owner.ToString().substr(0, 16), FormatUseCount(count));
        return CardResult::Failure(CardError::MAX_USES_COUNT_REACHED);
    }

    return ApplyUseLocked(*selected, count);
}

bool CardController::CanUseFrom(const Address& owner, const UseCount& count) const
{
    LOCK(cs_cards_);

    if (count == 0) {
        return false;
    }
    return FindUsableCardLocked(owner, count).has_value();
}

CardResult CardController::ApplyUseLocked(CardId id, const UseCount& count)
{
    UseCount newUses = 0;
    CardError err = state_.RecordUse(id, count, newUses);
    if (err != CardError::OK) {
        return CardResult::Failure(err);
    }

    std::optional<CardMeta> meta = state_.GetMeta(id);
    if (!meta) {
        return CardResult::Failure(CardError::NOT_EXISTS);
    }

    const UseCount maxUses = state_.GetMaxUses();
    CardResult result = CardResult::Success({id});
    result.meta = *meta;
    result.remainingUses = maxUses - newUses;

    LogPrint(BCLog::CARDS, "CardController: Card %lu used %s (uses=%s, remaining=%s)\n",
             id, FormatUseCount(count), FormatUseCount(newUses), FormatUseCount(result.remainingUses));

    NotifyUsed(id, result.remainingUses);
    return result;
}

std::optional<CardId> CardController::FindUsableCardLocked(const Address& owner, const UseCount& count) const
{
    const size_t balance = ledger_.BalanceOf(owner);
    for (size_t index = 0; index < balance; ++index) {
        std::optional<CardId> id = ledger_.CardOfOwnerByIndex(owner, index);
        if (id && state_.CanAccept(*id, count)) {
            return id;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Administration
// ============================================================================

CardResult CardController::SetLimits(const Address& caller, const CardLimits& limits)
{
    LOCK(cs_cards_);

    if (!HasCapability(caller, Capability::ADMIN, "SetLimits")) {
        return CardResult::Failure(CardError::MISSING_CAPABILITY);
    }

    state_.SetLimits(limits);
    LogPrint(BCLog::CARDS, "CardController: Limits set to maxOwns=%s, maxUses=%s\n",
             FormatUseCount(limits.maxOwns), FormatUseCount(limits.maxUses));
    return CardResult::Success();
}

CardResult CardController::SetBaseURI(const Address& caller, const std::string& baseURI)
{
    LOCK(cs_cards_);

    if (!HasCapability(caller, Capability::ADMIN, "SetBaseURI")) {
        return CardResult::Failure(CardError::MISSING_CAPABILITY);
    }

    resolver_.SetBaseURI(baseURI);
    return CardResult::Success();
}

CardResult CardController::SetLevelURIs(const Address& caller, const std::vector<Level>& levels,
                                        const std::vector<std::string>& uris)
{
    LOCK(cs_cards_);

    if (!HasCapability(caller, Capability::ADMIN, "SetLevelURIs")) {
        return CardResult::Failure(CardError::MISSING_CAPABILITY);
    }

    CardError err = resolver_.SetLevelURIs(levels, uris);
    if (err != CardError::OK) {
        return CardResult::Failure(err);
    }
    LogPrint(BCLog::CARDS, "CardController: Set %u level URIs\n", levels.size());
    return CardResult::Success();
}

// ============================================================================
// Queries
// ============================================================================

std::optional<UseCount> CardController::TotalUsesOf(const Address& owner) const
{
    LOCK(cs_cards_);

    const size_t balance = ledger_.BalanceOf(owner);
    if (balance == 0) {
        return std::nullopt;
    }

    UseCount total = 0;
    for (size_t index = 0; index < balance; ++index) {
        std::optional<CardId> id = ledger_.CardOfOwnerByIndex(owner, index);
        if (!id) continue;
        std::optional<CardMeta> meta = state_.GetMeta(*id);
        if (meta) {
            total += meta->uses;
        }
    }
    return total;
}

std::optional<UseCount> CardController::UsesOf(CardId id) const
{
    std::optional<CardMeta> meta = GetMeta(id);
    if (!meta) {
        return std::nullopt;
    }
    return meta->uses;
}

std::optional<Level> CardController::LevelOf(CardId id) const
{
    std::optional<CardMeta> meta = GetMeta(id);
    if (!meta) {
        return std::nullopt;
    }
    return meta->level;
}

std::optional<CardMeta> CardController::GetMeta(CardId id) const
{
    LOCK(cs_cards_);
    return state_.GetMeta(id);
}

std::optional<std::string> CardController::GetCardURI(CardId id) const
{
    LOCK(cs_cards_);

    std::optional<CardMeta> meta = state_.GetMeta(id);
    if (!meta) {
        return std::nullopt;
    }
    return resolver_.Resolve(meta->level, resolver_.DefaultCardURI(id));
}

CardId CardController::GetNextId() const
{
    LOCK(cs_cards_);
    return nextId_;
}

// ============================================================================
// Notifications
// ============================================================================

void CardController::RegisterUsedCallback(UsedCallback callback)
{
    LOCK(cs_cards_);
    usedCallbacks_.push_back(callback);
}

void CardController::NotifyUsed(CardId id, const UseCount& remaining)
{
    for (const auto& callback : usedCallbacks_) {
        callback(id, remaining);
    }
}

} // namespace cards
