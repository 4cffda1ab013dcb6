// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <random.h>

#include <util.h>

#include <openssl/rand.h>

#include <cstring>
#include <limits>
#include <stdexcept>

[[noreturn]] static void RandFailure()
{
    LogPrintf("Failed to read randomness, aborting\n");
    throw std::runtime_error("Failed to read randomness");
}

void GetRandBytes(unsigned char* buf, int num)
{
    if (RAND_bytes(buf, num) != 1) {
        RandFailure();
    }
}

void GetStrongRandBytes(unsigned char* out, int num)
{
    if (RAND_priv_bytes(out, num) != 1) {
        RandFailure();
    }
}

uint64_t GetRand(uint64_t nMax)
{
    if (nMax == 0)
        return 0;

    // The range of the random source must be a multiple of the modulus
    // to give every possible output value an equal possibility
    uint64_t nRange = (std::numeric_limits<uint64_t>::max() / nMax) * nMax;
    uint64_t nRand = 0;
    do {
        GetRandBytes((unsigned char*)&nRand, sizeof(nRand));
    } while (nRand >= nRange);
    return (nRand % nMax);
}

uint256 GetRandHash()
{
    uint256 hash;
    GetRandBytes((unsigned char*)&hash, sizeof(hash));
    return hash;
}

FastRandomContext::FastRandomContext(bool fDeterministic) : state(0)
{
    if (!fDeterministic) {
        GetRandBytes((unsigned char*)&state, sizeof(state));
    }
}

FastRandomContext::FastRandomContext(const uint256& seed) : state(seed.GetUint64(0))
{
}

uint256 FastRandomContext::rand256()
{
    uint256 ret;
    for (int i = 0; i < 4; ++i) {
        uint64_t r = rand64();
        memcpy(ret.begin() + i * 8, &r, 8);
    }
    return ret;
}

uint160 FastRandomContext::rand160()
{
    uint160 ret;
    for (int i = 0; i < 5; ++i) {
        uint32_t r = rand32();
        memcpy(ret.begin() + i * 4, &r, 4);
    }
    return ret;
}
