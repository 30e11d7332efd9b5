// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <test/test_cardvault.h>

#include <util.h>

#include <chrono>

std::mt19937_64 insecure_rand_ctx(0);

void SeedInsecureRand(bool deterministic)
{
    if (deterministic) {
        insecure_rand_ctx.seed(0);
    } else {
        insecure_rand_ctx.seed(std::chrono::high_resolution_clock::now().time_since_epoch().count());
    }
}

uint160 InsecureRandAddress()
{
    uint160 addr;
    do {
        for (unsigned char* p = addr.begin(); p != addr.end(); ++p) {
            *p = static_cast<unsigned char>(InsecureRandBits(8));
        }
    } while (addr.IsNull());
    return addr;
}

BasicTestingSetup::BasicTestingSetup()
{
    gArgs.ClearArgs();
    fPrintToConsole = false;
    logCategories = BCLog::ALL;
    SeedInsecureRand();
}

BasicTestingSetup::~BasicTestingSetup()
{
    CloseDebugLog();
    gArgs.ClearArgs();
    logCategories = BCLog::NONE;
}
