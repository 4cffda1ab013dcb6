// Copyright (c) 2013-2016 The Bitcoin Core developers
// Copyright (c) 2025 The CreditCore developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <hash.h>

#include <openssl/evp.h>

#include <stdexcept>

CSHA256::CSHA256() : ctx(EVP_MD_CTX_new())
{
    if (ctx == nullptr) {
        throw std::runtime_error("CSHA256: EVP_MD_CTX_new failed");
    }
    Reset();
}

CSHA256::~CSHA256()
{
    EVP_MD_CTX_free(ctx);
}

CSHA256& CSHA256::Write(const unsigned char* data, size_t len)
{
    if (EVP_DigestUpdate(ctx, data, len) != 1) {
        throw std::runtime_error("CSHA256: EVP_DigestUpdate failed");
    }
    return *this;
}

void CSHA256::Finalize(unsigned char hash[OUTPUT_SIZE])
{
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, hash, &len) != 1 || len != OUTPUT_SIZE) {
        throw std::runtime_error("CSHA256: EVP_DigestFinal_ex failed");
    }
}

CSHA256& CSHA256::Reset()
{
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("CSHA256: EVP_DigestInit_ex failed");
    }
    return *this;
}

uint256 SHA256Hash(const unsigned char* data, size_t len)
{
    uint256 result;
    CSHA256().Write(data, len).Finalize(result.begin());
    return result;
}

static void WriteLE64(unsigned char* ptr, uint64_t x)
{
    for (int i = 0; i < 8; ++i) {
        ptr[i] = (unsigned char)(x >> (8 * i));
    }
}

CHashWriter& CHashWriter::operator<<(const std::string& str)
{
    *this << (uint64_t)str.size();
    return write((const unsigned char*)str.data(), str.size());
}

CHashWriter& CHashWriter::operator<<(int64_t n)
{
    return *this << (uint64_t)n;
}

CHashWriter& CHashWriter::operator<<(uint64_t n)
{
    unsigned char buf[8];
    WriteLE64(buf, n);
    return write(buf, sizeof(buf));
}

CHashWriter& CHashWriter::operator<<(uint32_t n)
{
    unsigned char buf[4];
    for (int i = 0; i < 4; ++i) {
        buf[i] = (unsigned char)(n >> (8 * i));
    }
    return write(buf, sizeof(buf));
}
