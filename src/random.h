// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_RANDOM_H
#define CREDITCORE_RANDOM_H

#include <uint256.h>

#include <stdint.h>

/**
 * Functions to gather random data via the OpenSSL PRNG
 */
void GetRandBytes(unsigned char* buf, int num);
void GetStrongRandBytes(unsigned char* buf, int num);
uint64_t GetRand(uint64_t nMax);
uint256 GetRandHash();

/**
 * Fast randomness source. This is seeded once with secure random data, but
 * is completely deterministic and insecure after that.
 * This class is not thread-safe.
 */
class FastRandomContext {
private:
    uint64_t state;

    uint64_t Next()
    {
        uint64_t z = (state += 0x9e3779b97f4a7c15ULL);
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
        return z ^ (z >> 31);
    }

public:
    explicit FastRandomContext(bool fDeterministic = false);

    /** Initialize with explicit seed (only for testing) */
    explicit FastRandomContext(const uint256& seed);

    /** Generate a random 64-bit integer. */
    uint64_t rand64() { return Next(); }

    /** Generate a random 32-bit integer. */
    uint32_t rand32() { return (uint32_t)(Next() >> 32); }

    /** Generate a random integer in the range [0..range). */
    uint64_t randrange(uint64_t range)
    {
        if (range == 0) return 0;
        return rand64() % range;
    }

    /** generate a random uint256. */
    uint256 rand256();

    /** generate a random uint160. */
    uint160 rand160();

    /** Generate a random boolean. */
    bool randbool() { return (Next() & 1) != 0; }
};

#endif // CREDITCORE_RANDOM_H
