// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CARDVAULT_CARDS_CARD_COMMON_H
#define CARDVAULT_CARDS_CARD_COMMON_H

/**
 * @file card_common.h
 * @brief Common definitions and types for the card registry
 *
 * Shared identifiers, the 128-bit counter type, the error codes every
 * component reports and the result type returned by state-changing
 * operations.
 */

#include <uint256.h>

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace cards {

/** Card identifier, assigned from a monotonic counter at mint */
typedef uint64_t CardId;

/** Holder / actor identity. The null address never holds a card. */
typedef uint160 Address;

/** Unsigned 128-bit quantity used for use counters, levels and limits */
typedef boost::multiprecision::uint128_t UseCount;

/** Level tags share the counter width */
typedef boost::multiprecision::uint128_t Level;

/** Render a 128-bit value as decimal */
std::string FormatUseCount(const UseCount& value);

/**
 * Parse a decimal 128-bit value.
 * @return false on an empty string, a non-digit or overflow
 */
bool ParseUseCount(const std::string& str, UseCount& out);

/** Roles an actor may hold */
enum class Capability : uint8_t {
    MINTER = 0,     // May mint cards
    OPERATOR = 1,   // May consume card uses
    ADMIN = 2       // May change limits and URIs
};

std::string CapabilityToString(Capability capability);

/** Distinct failure conditions reported by the registry */
enum class CardError : uint8_t {
    OK = 0,
    NOT_EXISTS,
    ZERO_USE_COUNT,
    MAX_USES_COUNT_REACHED,
    WRONG_INPUT_PARAMS,
    CALLER_IS_NOT_OWNER_NOR_APPROVED,
    MISSING_CAPABILITY,
    HALTED,
    MINT_TO_NULL_ADDRESS,
    ALREADY_MINTED,
    TRANSFER_TO_NULL_ADDRESS,
    TRANSFER_FROM_INCORRECT_OWNER,
    APPROVAL_TO_CURRENT_OWNER,
    APPROVE_TO_CALLER
};

/**
 * Convert CardError to its stable name (e.g. "MaxUsesCountReached")
 */
std::string CardErrorToString(CardError error);

inline std::ostream& operator<<(std::ostream& os, CardError error) {
    return os << CardErrorToString(error);
}

inline std::ostream& operator<<(std::ostream& os, Capability capability) {
    return os << CapabilityToString(capability);
}

/**
 * @brief Per-card mutable metadata
 *
 * uses only grows until the card is burned; level is fixed at mint.
 */
struct CardMeta {
    UseCount uses;
    Level level;

    CardMeta() : uses(0), level(0) {}
    CardMeta(const UseCount& u, const Level& l) : uses(u), level(l) {}

    bool operator==(const CardMeta& other) const {
        return uses == other.uses && level == other.level;
    }

    bool operator!=(const CardMeta& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Global registry limits
 *
 * maxOwns is stored and reported but is not enforced by mint or transfer.
 */
struct CardLimits {
    UseCount maxOwns;
    UseCount maxUses;

    CardLimits() : maxOwns(0), maxUses(0) {}
    CardLimits(const UseCount& owns, const UseCount& uses) : maxOwns(owns), maxUses(uses) {}

    bool operator==(const CardLimits& other) const {
        return maxOwns == other.maxOwns && maxUses == other.maxUses;
    }

    bool operator!=(const CardLimits& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Result of a state-changing card operation
 */
struct CardResult {
    /** Whether the operation succeeded */
    bool success;

    /** Failure reason; OK on success */
    CardError error;

    /** Cards minted, burned, transferred or used by the call, in call order */
    std::vector<CardId> cardIds;

    /** Metadata of the used card after a use operation */
    CardMeta meta;

    /** maxUses - uses after a use operation */
    UseCount remainingUses;

    CardResult() : success(false), error(CardError::OK), remainingUses(0) {}

    static CardResult Success(const std::vector<CardId>& ids = {}) {
        CardResult result;
        result.success = true;
        result.cardIds = ids;
        return result;
    }

    static CardResult Failure(CardError err, const std::vector<CardId>& applied = {}) {
        CardResult result;
        result.success = false;
        result.error = err;
        result.cardIds = applied;
        return result;
    }

    std::string ErrorString() const { return CardErrorToString(error); }
};

} // namespace cards

#endif // CARDVAULT_CARDS_CARD_COMMON_H
