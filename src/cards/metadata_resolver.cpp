// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cards/metadata_resolver.h>
#include <util.h>

namespace cards {

MetadataResolver::MetadataResolver() = default;

MetadataResolver::MetadataResolver(const std::string& baseURI)
    : baseURI_(baseURI)
{
}

std::string MetadataResolver::Resolve(const Level& level, const std::string& fallbackURI) const
{
    LOCK(cs_resolver_);

    auto it = levelURIs_.find(level);
    if (it == levelURIs_.end() || it->second.empty()) {
        return fallbackURI;
    }

    if (baseURI_.empty()) {
        return it->second;
    }

    return baseURI_ + it->second;
}

std::string MetadataResolver::DefaultCardURI(CardId id) const
{
    LOCK(cs_resolver_);

    if (baseURI_.empty()) {
        return std::string();
    }
    return baseURI_ + std::to_string(id);
}

void MetadataResolver::SetLevelURI(const Level& level, const std::string& uri)
{
    LOCK(cs_resolver_);

    if (uri.empty()) {
        levelURIs_.erase(level);
    } else {
        levelURIs_[level] = uri;
    }
    LogPrint(BCLog::CARDS, "MetadataResolver: Level %s -> \"%s\"\n", FormatUseCount(level), uri);
}

CardError MetadataResolver::SetLevelURIs(const std::vector<Level>& levels, const std::vector<std::string>& uris)
{
    if (levels.empty() || levels.size() != uris.size()) {
        return CardError::WRONG_INPUT_PARAMS;
    }

    LOCK(cs_resolver_);
    for (size_t i = 0; i < levels.size(); ++i) {
        SetLevelURI(levels[i], uris[i]);
    }
    return CardError::OK;
}

std::string MetadataResolver::GetLevelURI(const Level& level) const
{
    LOCK(cs_resolver_);

    auto it = levelURIs_.find(level);
    return it == levelURIs_.end() ? std::string() : it->second;
}

void MetadataResolver::SetBaseURI(const std::string& baseURI)
{
    LOCK(cs_resolver_);
    baseURI_ = baseURI;
}

std::string MetadataResolver::GetBaseURI() const
{
    LOCK(cs_resolver_);
    return baseURI_;
}

size_t MetadataResolver::GetLevelCount() const
{
    LOCK(cs_resolver_);
    return levelURIs_.size();
}

} // namespace cards
