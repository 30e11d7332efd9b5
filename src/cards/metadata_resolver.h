// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CARDVAULT_CARDS_METADATA_RESOLVER_H
#define CARDVAULT_CARDS_METADATA_RESOLVER_H

/**
 * @file metadata_resolver.h
 * @brief Level -> display URI mapping
 *
 * Resolution rules:
 * - no URI for the level: the caller's per-card fallback, unchanged
 * - URI present, base prefix empty: the level URI verbatim
 * - otherwise: base prefix + level URI
 *
 * No caching and no validation of the stored strings.
 */

#include <cards/card_common.h>
#include <sync.h>

#include <map>
#include <string>
#include <vector>

namespace cards {

class MetadataResolver {
public:
    MetadataResolver();

    explicit MetadataResolver(const std::string& baseURI);

    /** Resolve the display URI of a card of the given level */
    std::string Resolve(const Level& level, const std::string& fallbackURI) const;

    /**
     * @brief Default per-card URI used as fallback
     * @return base prefix + decimal id, or "" if no base prefix is set
     */
    std::string DefaultCardURI(CardId id) const;

    /** Set or clear (empty uri) the URI of one level */
    void SetLevelURI(const Level& level, const std::string& uri);

    /**
     * @brief Set URIs for several levels at once
     * @return WRONG_INPUT_PARAMS if the vectors are empty or differ in
     *         length; nothing is written in that case
     */
    CardError SetLevelURIs(const std::vector<Level>& levels, const std::vector<std::string>& uris);

    /** URI of a level, "" if unset */
    std::string GetLevelURI(const Level& level) const;

    void SetBaseURI(const std::string& baseURI);
    std::string GetBaseURI() const;

    size_t GetLevelCount() const;

private:
    std::string baseURI_;

    std::map<Level, std::string> levelURIs_;

    mutable CCriticalSection cs_resolver_;
};

} // namespace cards

#endif // CARDVAULT_CARDS_METADATA_RESOLVER_H
