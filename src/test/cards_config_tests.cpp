// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <cards/access_control.h>
#include <cards/asset_ledger.h>
#include <cards/cards_config.h>
#include <cards/metadata_resolver.h>
#include <cards/state_store.h>
#include <test/test_cardvault.h>
#include <util.h>

#include <boost/test/unit_test.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

using cards::CardLimits;
using cards::Level;

namespace {

struct ConfigTestingSetup : public BasicTestingSetup {
    cards::PauseSwitch pause;
    cards::MemoryAssetLedger ledger;
    cards::CardStateStore state;
    cards::MetadataResolver resolver;

    ConfigTestingSetup()
        : ledger(pause)
        , state(ledger, CardLimits(0, 0))
    {}
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(cards_config_tests, ConfigTestingSetup)

BOOST_AUTO_TEST_CASE(defaults_applied)
{
    BOOST_REQUIRE(cards::InitCardsConfig(state, resolver));

    BOOST_CHECK_EQUAL(state.GetMaxUses(), 5);
    BOOST_CHECK_EQUAL(state.GetMaxOwns(), 1);
    BOOST_CHECK_EQUAL(resolver.GetBaseURI(), "");
    BOOST_CHECK_EQUAL(resolver.GetLevelCount(), 0u);
}

BOOST_AUTO_TEST_CASE(options_applied)
{
    gArgs.ForceSetArg("-maxuses", "10");
    gArgs.ForceSetArg("-maxowns", "3");
    gArgs.ForceSetArg("-cardbaseuri", "https://cdn/");
    gArgs.AddArg("-leveluri", "2:ipfs://X");
    gArgs.AddArg("-leveluri", "3:ar://Y");

    BOOST_REQUIRE(cards::InitCardsConfig(state, resolver));

    BOOST_CHECK(state.GetLimits() == CardLimits(3, 10));
    BOOST_CHECK_EQUAL(resolver.GetLevelCount(), 2u);
    BOOST_CHECK_EQUAL(resolver.Resolve(2, "none"), "https://cdn/ipfs://X");
    BOOST_CHECK_EQUAL(resolver.Resolve(3, "none"), "https://cdn/ar://Y");
    BOOST_CHECK_EQUAL(resolver.Resolve(4, "none"), "none");
}

BOOST_AUTO_TEST_CASE(wide_limit_accepted)
{
    // 2^128 - 1
    gArgs.ForceSetArg("-maxuses", "340282366920938463463374607431768211455");
    BOOST_REQUIRE(cards::InitCardsConfig(state, resolver));
    BOOST_CHECK_EQUAL(state.GetMaxUses(), std::numeric_limits<cards::UseCount>::max());

    // 2^128 overflows
    gArgs.ForceSetArg("-maxuses", "340282366920938463463374607431768211456");
    CardLimits limits;
    BOOST_CHECK(!cards::ParseCardLimits(limits));
}

BOOST_AUTO_TEST_CASE(invalid_limits_rejected)
{
    const char* bad[] = {"abc", "-1", "", "5x", " 5"};
    for (const char* value : bad) {
        gArgs.ForceSetArg("-maxuses", value);
        BOOST_CHECK_MESSAGE(!cards::InitCardsConfig(state, resolver), "accepted -maxuses=" << value);
    }
    BOOST_CHECK(state.GetLimits() == CardLimits(0, 0));

    gArgs.ClearArgs();
    gArgs.ForceSetArg("-maxowns", "many");
    BOOST_CHECK(!cards::InitCardsConfig(state, resolver));
}

BOOST_AUTO_TEST_CASE(bad_level_uri_applies_nothing)
{
    gArgs.ForceSetArg("-maxuses", "9");
    gArgs.ForceSetArg("-cardbaseuri", "https://cdn/");
    gArgs.AddArg("-leveluri", "1:ok");
    gArgs.AddArg("-leveluri", "two:bad");

    BOOST_CHECK(!cards::InitCardsConfig(state, resolver));
    BOOST_CHECK_EQUAL(state.GetMaxUses(), 0);
    BOOST_CHECK_EQUAL(resolver.GetBaseURI(), "");
    BOOST_CHECK_EQUAL(resolver.GetLevelCount(), 0u);
}

BOOST_AUTO_TEST_CASE(parse_level_uri)
{
    Level level;
    std::string uri;

    BOOST_CHECK(cards::ParseLevelURI("2:ipfs://X", level, uri));
    BOOST_CHECK_EQUAL(level, 2);
    BOOST_CHECK_EQUAL(uri, "ipfs://X");

    // Empty URI is allowed and clears the level when applied
    BOOST_CHECK(cards::ParseLevelURI("7:", level, uri));
    BOOST_CHECK_EQUAL(level, 7);
    BOOST_CHECK_EQUAL(uri, "");

    BOOST_CHECK(!cards::ParseLevelURI("ipfs", level, uri));
    BOOST_CHECK(!cards::ParseLevelURI(":ipfs://X", level, uri));
    BOOST_CHECK(!cards::ParseLevelURI("x:ipfs://X", level, uri));
    BOOST_CHECK(!cards::ParseLevelURI("-1:ipfs://X", level, uri));
}

BOOST_AUTO_TEST_CASE(config_file_and_command_line)
{
    const std::filesystem::path confPath = std::filesystem::temp_directory_path() /
        strprintf("cardvault_test_%016x.conf", InsecureRand64());
    {
        std::ofstream conf(confPath);
        conf << "maxuses=8\n";
        conf << "maxowns=2\n";
        conf << "cardbaseuri=https://cards/\n";
        conf << "leveluri=1:a\n";
        conf << "leveluri=2:b\n";
    }

    const char* argv[] = {"cardvault", "-maxuses=3"};
    gArgs.ParseParameters(2, argv);
    gArgs.ReadConfigFile(confPath.string());
    std::remove(confPath.string().c_str());

    BOOST_REQUIRE(cards::InitCardsConfig(state, resolver));

    // Command line wins over the config file
    BOOST_CHECK_EQUAL(state.GetMaxUses(), 3);
    BOOST_CHECK_EQUAL(state.GetMaxOwns(), 2);
    BOOST_CHECK_EQUAL(resolver.GetLevelCount(), 2u);
    BOOST_CHECK_EQUAL(resolver.Resolve(1, ""), "https://cards/a");
    BOOST_CHECK_EQUAL(resolver.Resolve(2, ""), "https://cards/b");
}

BOOST_AUTO_TEST_CASE(help_lists_options)
{
    const std::string help = cards::GetCardsHelpMessage();
    BOOST_CHECK(help.find("-maxuses=<n>") != std::string::npos);
    BOOST_CHECK(help.find("-maxowns=<n>") != std::string::npos);
    BOOST_CHECK(help.find("-cardbaseuri=<uri>") != std::string::npos);
    BOOST_CHECK(help.find("-leveluri=<level>:<uri>") != std::string::npos);
    BOOST_CHECK(help.find("-debuglogfile=<file>") != std::string::npos);
    BOOST_CHECK(help.find("default: 5") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
