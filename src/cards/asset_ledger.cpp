// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file asset_ledger.cpp
 * @brief Implementation of the in-memory enumerable ledger
 */

#include <cards/asset_ledger.h>
#include <util.h>

namespace cards {

MemoryAssetLedger::MemoryAssetLedger(const HaltState& haltState)
    : haltState_(haltState)
{
}

// ============================================================================
// Reads
// ============================================================================

std::optional<Address> MemoryAssetLedger::OwnerOf(CardId id) const
{
    LOCK(cs_ledger_);

    auto it = owners_.find(id);
    if (it == owners_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t MemoryAssetLedger::BalanceOf(const Address& owner) const
{
    LOCK(cs_ledger_);

    auto it = ownedCards_.find(owner);
    return it == ownedCards_.end() ? 0 : it->second.size();
}

std::optional<CardId> MemoryAssetLedger::CardOfOwnerByIndex(const Address& owner, size_t index) const
{
    LOCK(cs_ledger_);

    auto it = ownedCards_.find(owner);
    if (it == ownedCards_.end() || index >= it->second.size()) {
        return std::nullopt;
    }
    return it->second[index];
}

bool MemoryAssetLedger::Exists(CardId id) const
{
    LOCK(cs_ledger_);
    return owners_.count(id) > 0;
}

bool MemoryAssetLedger::IsApprovedOrOwner(const Address& actor, CardId id) const
{
    LOCK(cs_ledger_);
    return IsApprovedOrOwnerLocked(actor, id);
}

bool MemoryAssetLedger::IsApprovedOrOwnerLocked(const Address& actor, CardId id) const
{
    auto ownerIt = owners_.find(id);
    if (ownerIt == owners_.end()) {
        return false;
    }
    const Address& owner = ownerIt->second;
    if (actor == owner) {
        return true;
    }

    auto approvalIt = cardApprovals_.find(id);
    if (approvalIt != cardApprovals_.end() && approvalIt->second == actor) {
        return true;
    }

    auto opIt = operatorApprovals_.find(owner);
    return opIt != operatorApprovals_.end() && opIt->second.count(actor) > 0;
}

std::vector<CardId> MemoryAssetLedger::GetCardsOf(const Address& owner) const
{
    LOCK(cs_ledger_);

    auto it = ownedCards_.find(owner);
    if (it == ownedCards_.end()) {
        return {};
    }
    return it->second;
}

size_t MemoryAssetLedger::TotalSupply() const
{
    LOCK(cs_ledger_);
    return owners_.size();
}

// ============================================================================
// Writes
// ============================================================================

CardError MemoryAssetLedger::MintOwnership(const Address& to, CardId id)
{
    LOCK(cs_ledger_);

    if (to.IsNull()) {
        return CardError::MINT_TO_NULL_ADDRESS;
    }
    if (owners_.count(id) > 0) {
        return CardError::ALREADY_MINTED;
    }
    return UpdateOwnership(Address(), to, id);
}

CardError MemoryAssetLedger::BurnOwnership(CardId id)
{
    LOCK(cs_ledger_);

    auto it = owners_.find(id);
    if (it == owners_.end()) {
        return CardError::NOT_EXISTS;
    }
    const Address owner = it->second;
    return UpdateOwnership(owner, Address(), id);
}

CardError MemoryAssetLedger::TransferOwnership(const Address& from, const Address& to, CardId id)
{
    LOCK(cs_ledger_);

    auto it = owners_.find(id);
    if (it == owners_.end()) {
        return CardError::NOT_EXISTS;
    }
    if (it->second != from) {
        return CardError::TRANSFER_FROM_INCORRECT_OWNER;
    }
    if (to.IsNull()) {
        return CardError::TRANSFER_TO_NULL_ADDRESS;
    }
    return UpdateOwnership(from, to, id);
}

CardError MemoryAssetLedger::UpdateOwnership(const Address& from, const Address& to, CardId id)
{
    if (haltState_.IsHalted()) {
        LogPrint(BCLog::LEDGER, "MemoryAssetLedger: Refusing ownership change of card %lu while halted\n", id);
        return CardError::HALTED;
    }

    if (!from.IsNull()) {
        cardApprovals_.erase(id);
    }

    // A transfer to the current owner keeps the enumeration order
    if (from == to) {
        LogPrint(BCLog::LEDGER, "MemoryAssetLedger: Card %lu transferred to its owner %s\n",
                 id, to.ToString().substr(0, 16));
        return CardError::OK;
    }

    if (!from.IsNull()) {
        RemoveCardFromOwnerEnumeration(from, id);
    }

    if (to.IsNull()) {
        owners_.erase(id);
    } else {
        owners_[id] = to;
        AddCardToOwnerEnumeration(to, id);
    }

    LogPrint(BCLog::LEDGER, "MemoryAssetLedger: Card %lu moved %s -> %s\n", id,
             from.IsNull() ? std::string("mint") : from.ToString().substr(0, 16),
             to.IsNull() ? std::string("burn") : to.ToString().substr(0, 16));

    return CardError::OK;
}

void MemoryAssetLedger::AddCardToOwnerEnumeration(const Address& to, CardId id)
{
    std::vector<CardId>& cards = ownedCards_[to];
    ownedCardsIndex_[id] = cards.size();
    cards.push_back(id);
}

void MemoryAssetLedger::RemoveCardFromOwnerEnumeration(const Address& from, CardId id)
{
    auto listIt = ownedCards_.find(from);
    auto indexIt = ownedCardsIndex_.find(id);
    if (listIt == ownedCards_.end() || indexIt == ownedCardsIndex_.end()) {
        return;
    }

    std::vector<CardId>& cards = listIt->second;
    const size_t cardIndex = indexIt->second;
    const size_t lastIndex = cards.size() - 1;

    // Move the last card into the slot of the removed one
    if (cardIndex != lastIndex) {
        CardId lastId = cards[lastIndex];
        cards[cardIndex] = lastId;
        ownedCardsIndex_[lastId] = cardIndex;
    }

    cards.pop_back();
    ownedCardsIndex_.erase(indexIt);

    if (cards.empty()) {
        ownedCards_.erase(listIt);
    }
}

// ============================================================================
// Approvals
// ============================================================================

CardError MemoryAssetLedger::Approve(const Address& caller, const Address& to, CardId id)
{
    LOCK(cs_ledger_);

    auto it = owners_.find(id);
    if (it == owners_.end()) {
        return CardError::NOT_EXISTS;
    }
    const Address& owner = it->second;
    if (to == owner) {
        return CardError::APPROVAL_TO_CURRENT_OWNER;
    }

    auto opIt = operatorApprovals_.find(owner);
    bool isOperator = opIt != operatorApprovals_.end() && opIt->second.count(caller) > 0;
    if (caller != owner && !isOperator) {
        return CardError::CALLER_IS_NOT_OWNER_NOR_APPROVED;
    }

    if (to.IsNull()) {
        cardApprovals_.erase(id);
    } else {
        cardApprovals_[id] = to;
    }
    return CardError::OK;
}

std::optional<Address> MemoryAssetLedger::GetApproved(CardId id) const
{
    LOCK(cs_ledger_);

    if (owners_.count(id) == 0) {
        return std::nullopt;
    }
    auto it = cardApprovals_.find(id);
    return it == cardApprovals_.end() ? Address() : it->second;
}

CardError MemoryAssetLedger::SetApprovalForAll(const Address& owner, const Address& operatorAddr, bool approved)
{
    LOCK(cs_ledger_);

    if (owner == operatorAddr) {
        return CardError::APPROVE_TO_CALLER;
    }

    if (approved) {
        operatorApprovals_[owner].insert(operatorAddr);
    } else {
        auto it = operatorApprovals_.find(owner);
        if (it != operatorApprovals_.end()) {
            it->second.erase(operatorAddr);
            if (it->second.empty()) {
                operatorApprovals_.erase(it);
            }
        }
    }
    return CardError::OK;
}

bool MemoryAssetLedger::IsApprovedForAll(const Address& owner, const Address& operatorAddr) const
{
    LOCK(cs_ledger_);

    auto it = operatorApprovals_.find(owner);
    return it != operatorApprovals_.end() && it->second.count(operatorAddr) > 0;
}

} // namespace cards
