// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_SYNC_H
#define CREDITCORE_SYNC_H

#include <mutex>

/**
 * Wrapped mutex: supports recursive locking. Engines that call back into
 * their own public read paths while holding the lock rely on this.
 */
typedef std::recursive_mutex CCriticalSection;

typedef std::unique_lock<CCriticalSection> CCriticalBlock;

#define PASTE(x, y) x ## y
#define PASTE2(x, y) PASTE(x, y)

#define LOCK(cs) CCriticalBlock PASTE2(criticalblock, __COUNTER__)(cs)
#define LOCK2(cs1, cs2) \
    CCriticalBlock criticalblock1(cs1); \
    CCriticalBlock criticalblock2(cs2)

#endif // CREDITCORE_SYNC_H
