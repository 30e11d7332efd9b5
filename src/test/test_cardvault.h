// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CARDVAULT_TEST_TEST_CARDVAULT_H
#define CARDVAULT_TEST_TEST_CARDVAULT_H

#include <uint256.h>

#include <cstdint>
#include <random>

/**
 * Pseudo-random generator shared by the test suites. Deterministic unless
 * SeedInsecureRand(false) is called.
 */
extern std::mt19937_64 insecure_rand_ctx;

/**
 * Seed the test RNG
 * @param deterministic Use a fixed seed when true, the clock otherwise
 */
void SeedInsecureRand(bool deterministic = true);

static inline uint64_t InsecureRand64() { return insecure_rand_ctx(); }
static inline uint64_t InsecureRandBits(int bits) { return bits == 0 ? 0 : insecure_rand_ctx() >> (64 - bits); }
static inline uint64_t InsecureRandRange(uint64_t range) { return range == 0 ? 0 : insecure_rand_ctx() % range; }
static inline bool InsecureRandBool() { return insecure_rand_ctx() & 1; }

/** Random non-null 160-bit address */
uint160 InsecureRandAddress();

/**
 * Basic testing setup.
 * Clears gArgs, resets log categories and seeds the test RNG.
 */
struct BasicTestingSetup {
    BasicTestingSetup();
    ~BasicTestingSetup();
};

#endif // CARDVAULT_TEST_TEST_CARDVAULT_H
