// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cards/cards_config.h>
#include <util.h>

#include <utility>
#include <vector>

namespace cards {

std::string GetCardsHelpMessage()
{
    std::string strUsage;

    strUsage += HelpMessageGroup("Card registry options:");
    strUsage += HelpMessageOpt("-maxuses=<n>", strprintf("Maximum number of uses per card (default: %s)", DEFAULT_MAX_USES));
    strUsage += HelpMessageOpt("-maxowns=<n>", strprintf("Maximum number of cards per holder, stored but not enforced (default: %s)", DEFAULT_MAX_OWNS));
    strUsage += HelpMessageOpt("-cardbaseuri=<uri>", "Prefix prepended to level URIs and card ids (default: empty)");
    strUsage += HelpMessageOpt("-leveluri=<level>:<uri>", "URI for cards of the given level. Can be specified multiple times");
    strUsage += HelpMessageOpt("-debug=<category>", strprintf("Output debugging information. <category> can be: %s", ListLogCategories()));
    strUsage += HelpMessageOpt("-debuglogfile=<file>", "Also append log output to <file> (default: none, console only)");
    strUsage += HelpMessageOpt("-printtoconsole", "Send log output to stdout (default: 0)");

    return strUsage;
}

bool ParseCardLimits(CardLimits& limits)
{
    const std::string maxUses = gArgs.GetArg("-maxuses", std::string(DEFAULT_MAX_USES));
    const std::string maxOwns = gArgs.GetArg("-maxowns", std::string(DEFAULT_MAX_OWNS));

    CardLimits parsed;
    if (!ParseUseCount(maxUses, parsed.maxUses)) {
        LogPrintf("Cards: Invalid -maxuses value '%s'\n", maxUses);
        return false;
    }
    if (!ParseUseCount(maxOwns, parsed.maxOwns)) {
        LogPrintf("Cards: Invalid -maxowns value '%s'\n", maxOwns);
        return false;
    }

    limits = parsed;
    return true;
}

bool ParseLevelURI(const std::string& arg, Level& level, std::string& uri)
{
    size_t sep = arg.find(':');
    if (sep == std::string::npos || sep == 0) {
        return false;
    }
    if (!ParseUseCount(arg.substr(0, sep), level)) {
        return false;
    }
    uri = arg.substr(sep + 1);
    return true;
}

bool InitCardsConfig(CardStateStore& state, MetadataResolver& resolver)
{
    CardLimits limits;
    if (!ParseCardLimits(limits)) {
        return false;
    }

    std::vector<std::pair<Level, std::string>> levelURIs;
    for (const std::string& arg : gArgs.GetArgs("-leveluri")) {
        Level level;
        std::string uri;
        if (!ParseLevelURI(arg, level, uri)) {
            LogPrintf("Cards: Invalid -leveluri value '%s', expected <level>:<uri>\n", arg);
            return false;
        }
        levelURIs.emplace_back(level, uri);
    }

    state.SetLimits(limits);
    resolver.SetBaseURI(gArgs.GetArg("-cardbaseuri", std::string()));
    for (const auto& pair : levelURIs) {
        resolver.SetLevelURI(pair.first, pair.second);
    }

    LogPrint(BCLog::CONFIG, "Cards: Initialized - maxUses=%s, maxOwns=%s, baseuri=\"%s\", %u level URIs\n",
             FormatUseCount(limits.maxUses), FormatUseCount(limits.maxOwns),
             resolver.GetBaseURI(), levelURIs.size());

    return true;
}

} // namespace cards
