// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CARDVAULT_SYNC_H
#define CARDVAULT_SYNC_H

#include <mutex>

////////////////////////////////////////////////
//                                            //
// THE SIMPLE DEFINITION, EXCLUDING DEBUG CODE //
//                                            //
////////////////////////////////////////////////

/*
CCriticalSection mutex;
    std::recursive_mutex mutex;

LOCK(mutex);
    std::unique_lock<std::recursive_mutex> criticalblock(mutex);
 */

/**
 * Wrapped mutex: supports recursive locking, but no waiting.
 * Every registry class keeps one of these as cs_<name> and takes it with
 * LOCK() at the top of each public method.
 */
class CCriticalSection : public std::recursive_mutex
{
public:
    CCriticalSection() = default;
    CCriticalSection(const CCriticalSection&) = delete;
    CCriticalSection& operator=(const CCriticalSection&) = delete;
};

/** Wrapper around std::unique_lock<CCriticalSection> */
class CCriticalBlock
{
public:
    explicit CCriticalBlock(CCriticalSection& cs) : lock_(cs) {}

    operator bool() const { return lock_.owns_lock(); }

private:
    std::unique_lock<CCriticalSection> lock_;
};

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) CCriticalBlock PASTE2(criticalblock, __COUNTER__)(cs)

#endif // CARDVAULT_SYNC_H
