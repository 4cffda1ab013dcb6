// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CREDITCORE_HASH_H
#define CREDITCORE_HASH_H

#include <uint256.h>

#include <stdint.h>
#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

/** A hasher class for SHA-256, backed by OpenSSL's libcrypto. */
class CSHA256
{
private:
    EVP_MD_CTX* ctx;

public:
    static const size_t OUTPUT_SIZE = 32;

    CSHA256();
    ~CSHA256();
    CSHA256(const CSHA256&) = delete;
    CSHA256& operator=(const CSHA256&) = delete;

    CSHA256& Write(const unsigned char* data, size_t len);
    void Finalize(unsigned char hash[OUTPUT_SIZE]);
    CSHA256& Reset();
};

/** A hasher class for the double SHA-256 used for message digests. */
class CHash256 {
private:
    CSHA256 sha;
public:
    static const size_t OUTPUT_SIZE = CSHA256::OUTPUT_SIZE;

    void Finalize(unsigned char hash[OUTPUT_SIZE]) {
        unsigned char buf[CSHA256::OUTPUT_SIZE];
        sha.Finalize(buf);
        sha.Reset().Write(buf, CSHA256::OUTPUT_SIZE).Finalize(hash);
    }

    CHash256& Write(const unsigned char *data, size_t len) {
        sha.Write(data, len);
        return *this;
    }

    CHash256& Reset() {
        sha.Reset();
        return *this;
    }
};

/** Compute the 256-bit hash of an object. */
template<typename T1>
inline uint256 Hash(const T1 pbegin, const T1 pend)
{
    static const unsigned char pblank[1] = {};
    uint256 result;
    CHash256().Write(pbegin == pend ? pblank : (const unsigned char*)&pbegin[0], (pend - pbegin) * sizeof(pbegin[0]))
              .Finalize((unsigned char*)&result);
    return result;
}

/** Single SHA-256 of a byte range. */
uint256 SHA256Hash(const unsigned char* data, size_t len);

/**
 * Accumulates fixed-width little-endian fields and 160/256-bit blobs, then
 * produces their double SHA-256. Used to build the digests that identity
 * proofs and score attestations commit to.
 */
class CHashWriter
{
private:
    CHash256 ctx;

public:
    CHashWriter& write(const unsigned char* pch, size_t size) {
        ctx.Write(pch, size);
        return (*this);
    }

    CHashWriter& operator<<(const std::string& str);
    CHashWriter& operator<<(int64_t n);
    CHashWriter& operator<<(uint64_t n);
    CHashWriter& operator<<(uint32_t n);
    CHashWriter& operator<<(const uint160& blob) { return write(blob.begin(), blob.size()); }
    CHashWriter& operator<<(const uint256& blob) { return write(blob.begin(), blob.size()); }

    // invalidates the object
    uint256 GetHash() {
        uint256 result;
        ctx.Finalize((unsigned char*)&result);
        return result;
    }
};

#endif // CREDITCORE_HASH_H
