// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cards/card_common.h>

#include <limits>

namespace cards {

std::string FormatUseCount(const UseCount& value)
{
    return value.str();
}

bool ParseUseCount(const std::string& str, UseCount& out)
{
    if (str.empty()) {
        return false;
    }

    static const UseCount maxValue = std::numeric_limits<UseCount>::max();

    UseCount value = 0;
    for (char c : str) {
        if (c < '0' || c > '9') {
            return false;
        }
        unsigned digit = static_cast<unsigned>(c - '0');
        if (value > (maxValue - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }

    out = value;
    return true;
}

std::string CapabilityToString(Capability capability)
{
    switch (capability) {
        case Capability::MINTER: return "MINTER";
        case Capability::OPERATOR: return "OPERATOR";
        case Capability::ADMIN: return "ADMIN";
    }
    return "UNKNOWN";
}

std::string CardErrorToString(CardError error)
{
    switch (error) {
        case CardError::OK: return "OK";
        case CardError::NOT_EXISTS: return "NotExists";
        case CardError::ZERO_USE_COUNT: return "ZeroUseCount";
        case CardError::MAX_USES_COUNT_REACHED: return "MaxUsesCountReached";
        case CardError::WRONG_INPUT_PARAMS: return "WrongInputParams";
        case CardError::CALLER_IS_NOT_OWNER_NOR_APPROVED: return "CallerIsNotOwnerNorApproved";
        case CardError::MISSING_CAPABILITY: return "MissingCapability";
        case CardError::HALTED: return "Halted";
        case CardError::MINT_TO_NULL_ADDRESS: return "MintToNullAddress";
        case CardError::ALREADY_MINTED: return "AlreadyMinted";
        case CardError::TRANSFER_TO_NULL_ADDRESS: return "TransferToNullAddress";
        case CardError::TRANSFER_FROM_INCORRECT_OWNER: return "TransferFromIncorrectOwner";
        case CardError::APPROVAL_TO_CURRENT_OWNER: return "ApprovalToCurrentOwner";
        case CardError::APPROVE_TO_CALLER: return "ApproveToCaller";
    }
    return "Unknown";
}

} // namespace cards
