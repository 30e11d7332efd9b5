// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file cards_state_store_tests.cpp
 * @brief Tests for per-card metadata and the use bound
 */

#include <cards/access_control.h>
#include <cards/asset_ledger.h>
#include <cards/state_store.h>
#include <test/test_cardvault.h>

#include <boost/test/unit_test.hpp>

#include <limits>
#include <optional>

using cards::Address;
using cards::CardError;
using cards::CardLimits;
using cards::UseCount;

namespace {

struct StateStoreTestingSetup : public BasicTestingSetup {
    cards::PauseSwitch pause;
    cards::MemoryAssetLedger ledger;
    cards::CardStateStore store;
    Address holder;

    StateStoreTestingSetup()
        : ledger(pause)
        , store(ledger, CardLimits(1, 5))
        , holder(InsecureRandAddress())
    {}

    void MintCard(cards::CardId id, const cards::Level& level)
    {
        BOOST_REQUIRE_EQUAL(ledger.MintOwnership(holder, id), CardError::OK);
        store.SetMeta(id, level);
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(cards_state_store_tests, StateStoreTestingSetup)

BOOST_AUTO_TEST_CASE(limits_roundtrip)
{
    BOOST_CHECK_EQUAL(store.GetMaxUses(), 5);
    BOOST_CHECK_EQUAL(store.GetMaxOwns(), 1);

    store.SetLimits(CardLimits(3, 9));
    BOOST_CHECK(store.GetLimits() == CardLimits(3, 9));
    BOOST_CHECK_EQUAL(store.GetMaxUses(), 9);
}

BOOST_AUTO_TEST_CASE(meta_created_with_zero_uses)
{
    MintCard(0, 7);

    std::optional<cards::CardMeta> meta = store.GetMeta(0);
    BOOST_REQUIRE(meta);
    BOOST_CHECK_EQUAL(meta->uses, 0);
    BOOST_CHECK_EQUAL(meta->level, 7);
}

BOOST_AUTO_TEST_CASE(existence_follows_ledger)
{
    // A record without a ledger entry is not visible
    store.SetMeta(42, 1);
    BOOST_CHECK(!store.GetMeta(42));

    // A ledger entry without a record reads as a zero record
    BOOST_REQUIRE_EQUAL(ledger.MintOwnership(holder, 43), CardError::OK);
    std::optional<cards::CardMeta> meta = store.GetMeta(43);
    BOOST_REQUIRE(meta);
    BOOST_CHECK(*meta == cards::CardMeta());
}

BOOST_AUTO_TEST_CASE(record_use_accumulates)
{
    MintCard(0, 1);

    UseCount newUses = 0;
    BOOST_CHECK_EQUAL(store.RecordUse(0, 2, newUses), CardError::OK);
    BOOST_CHECK_EQUAL(newUses, 2);
    BOOST_CHECK_EQUAL(store.RecordUse(0, 3, newUses), CardError::OK);
    BOOST_CHECK_EQUAL(newUses, 5);
    BOOST_CHECK_EQUAL(store.GetMeta(0)->uses, 5);
    BOOST_CHECK_EQUAL(store.GetMeta(0)->level, 1);
}

BOOST_AUTO_TEST_CASE(record_use_rejects_zero)
{
    MintCard(0, 1);

    UseCount newUses = 77;
    BOOST_CHECK_EQUAL(store.RecordUse(0, 0, newUses), CardError::ZERO_USE_COUNT);
    BOOST_CHECK_EQUAL(newUses, 77);
    BOOST_CHECK_EQUAL(store.GetMeta(0)->uses, 0);
}

BOOST_AUTO_TEST_CASE(record_use_rejects_overflow_of_limit)
{
    MintCard(0, 1);

    UseCount newUses = 0;
    BOOST_CHECK_EQUAL(store.RecordUse(0, 6, newUses), CardError::MAX_USES_COUNT_REACHED);
    BOOST_CHECK_EQUAL(store.RecordUse(0, 4, newUses), CardError::OK);
    BOOST_CHECK_EQUAL(store.RecordUse(0, 2, newUses), CardError::MAX_USES_COUNT_REACHED);
    BOOST_CHECK_EQUAL(store.GetMeta(0)->uses, 4);
    BOOST_CHECK_EQUAL(store.RecordUse(0, 1, newUses), CardError::OK);
    BOOST_CHECK_EQUAL(newUses, 5);
}

BOOST_AUTO_TEST_CASE(record_use_near_128_bit_boundary)
{
    const UseCount max = std::numeric_limits<UseCount>::max();
    store.SetLimits(CardLimits(1, max));
    MintCard(0, 1);

    UseCount newUses = 0;
    BOOST_CHECK_EQUAL(store.RecordUse(0, max - 1, newUses), CardError::OK);
    // uses + count would wrap; must be reported as over the limit
    BOOST_CHECK_EQUAL(store.RecordUse(0, max, newUses), CardError::MAX_USES_COUNT_REACHED);
    BOOST_CHECK_EQUAL(store.RecordUse(0, 1, newUses), CardError::OK);
    BOOST_CHECK_EQUAL(newUses, max);
}

BOOST_AUTO_TEST_CASE(lowered_limit_blocks_further_use)
{
    MintCard(0, 1);

    UseCount newUses = 0;
    BOOST_REQUIRE_EQUAL(store.RecordUse(0, 4, newUses), CardError::OK);
    store.SetLimits(CardLimits(1, 2));

    BOOST_CHECK(!store.CanAccept(0, 1));
    BOOST_CHECK_EQUAL(store.RecordUse(0, 1, newUses), CardError::MAX_USES_COUNT_REACHED);
    BOOST_CHECK_EQUAL(store.GetMeta(0)->uses, 4);
}

BOOST_AUTO_TEST_CASE(can_accept_matches_record_use)
{
    MintCard(0, 1);

    for (int i = 0; i < 200; ++i) {
        UseCount count = InsecureRandRange(4);
        bool accepted = store.CanAccept(0, count);
        UseCount newUses = 0;
        CardError err = store.RecordUse(0, count, newUses);
        if (count == 0) {
            BOOST_CHECK_EQUAL(err, CardError::ZERO_USE_COUNT);
        } else {
            BOOST_CHECK_EQUAL(accepted, err == CardError::OK);
        }
        BOOST_CHECK(store.GetMeta(0)->uses <= store.GetMaxUses());
    }
}

BOOST_AUTO_TEST_CASE(clear_meta_is_idempotent)
{
    MintCard(0, 3);
    UseCount newUses = 0;
    BOOST_REQUIRE_EQUAL(store.RecordUse(0, 2, newUses), CardError::OK);

    store.ClearMeta(0);
    store.ClearMeta(0);
    BOOST_CHECK_EQUAL(store.GetRecordCount(), 0u);

    // Card still in the ledger, record gone: reads as zero
    BOOST_CHECK(*store.GetMeta(0) == cards::CardMeta());
}

BOOST_AUTO_TEST_SUITE_END()
