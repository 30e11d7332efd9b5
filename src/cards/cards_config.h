// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CARDVAULT_CARDS_CARDS_CONFIG_H
#define CARDVAULT_CARDS_CARDS_CONFIG_H

/**
 * @file cards_config.h
 * @brief Card registry configuration
 *
 * Loads limits and URIs from gArgs (command line or config file) into the
 * state store and the metadata resolver.
 */

#include <cards/card_common.h>
#include <cards/metadata_resolver.h>
#include <cards/state_store.h>

#include <string>

namespace cards {

// Default values for registry configuration
static const char* const DEFAULT_MAX_USES = "5";
static const char* const DEFAULT_MAX_OWNS = "1";

/**
 * Get help message for the registry options
 * @return Help message string
 */
std::string GetCardsHelpMessage();

/**
 * Read the registry's limits from gArgs
 * @param[out] limits Parsed limits
 * @return false if -maxuses or -maxowns is not a non-negative integer
 */
bool ParseCardLimits(CardLimits& limits);

/**
 * Parse one -leveluri value of the form <level>:<uri>
 * @return false if the level is not an integer or the separator is missing
 */
bool ParseLevelURI(const std::string& arg, Level& level, std::string& uri);

/**
 * Apply -maxuses, -maxowns, -cardbaseuri and -leveluri
 * @return true if every option parsed; nothing is applied otherwise
 */
bool InitCardsConfig(CardStateStore& state, MetadataResolver& resolver);

} // namespace cards

#endif // CARDVAULT_CARDS_CARDS_CONFIG_H
