// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_HASH_H
#define ANCHORING_HASH_H

#include "serialize.h"
#include "uint256.h"

#include <openssl/sha.h>

#include <string>
#include <vector>

/** A hasher class for double SHA-256. */
class CHash256
{
private:
    SHA256_CTX ctx;

public:
    static const size_t OUTPUT_SIZE = SHA256_DIGEST_LENGTH;

    CHash256() { Reset(); }

    void Finalize(unsigned char hash[OUTPUT_SIZE])
    {
        unsigned char buf[OUTPUT_SIZE];
        SHA256_Final(buf, &ctx);
        SHA256(buf, OUTPUT_SIZE, hash);
    }

    CHash256& Write(const unsigned char* data, size_t len)
    {
        SHA256_Update(&ctx, data, len);
        return *this;
    }

    CHash256& Reset()
    {
        SHA256_Init(&ctx);
        return *this;
    }
};

/** Compute the 256-bit hash of an object. */
template<typename T1>
inline uint256 Hash(const T1 pbegin, const T1 pend)
{
    static const unsigned char pblank[1] = {};
    uint256 result;
    CHash256().Write(pbegin == pend ? pblank : (const unsigned char*)&pbegin[0], (pend - pbegin) * sizeof(pbegin[0])).Finalize((unsigned char*)&result);
    return result;
}

/** Compute the 256-bit hash of the concatenation of two objects. */
template<typename T1, typename T2>
inline uint256 Hash(const T1 p1begin, const T1 p1end, const T2 p2begin, const T2 p2end)
{
    static const unsigned char pblank[1] = {};
    uint256 result;
    CHash256()
        .Write(p1begin == p1end ? pblank : (const unsigned char*)&p1begin[0], (p1end - p1begin) * sizeof(p1begin[0]))
        .Write(p2begin == p2end ? pblank : (const unsigned char*)&p2begin[0], (p2end - p2begin) * sizeof(p2begin[0]))
        .Finalize((unsigned char*)&result);
    return result;
}

/** Compute the 160-bit hash RIPEMD160(SHA256(data)). */
uint160 Hash160(const unsigned char* data, size_t len);

template<typename T1>
inline uint160 Hash160(const T1 pbegin, const T1 pend)
{
    static const unsigned char pblank[1] = {};
    return Hash160(pbegin == pend ? pblank : (const unsigned char*)&pbegin[0], (pend - pbegin) * sizeof(pbegin[0]));
}

inline uint160 Hash160(const std::vector<unsigned char>& vch)
{
    return Hash160(vch.begin(), vch.end());
}

/** Single SHA-256, used by BIP340 tagged hashes and checksums. */
uint256 SingleSha256(const unsigned char* data, size_t len);

/** A writer stream (for serialization) that computes a 256-bit hash. */
class CHashWriter
{
private:
    CHash256 ctx;

    const int nType;
    const int nVersion;

public:
    CHashWriter(int nTypeIn, int nVersionIn) : nType(nTypeIn), nVersion(nVersionIn) {}

    int GetType() const { return nType; }
    int GetVersion() const { return nVersion; }

    void write(const char* pch, size_t size)
    {
        ctx.Write((const unsigned char*)pch, size);
    }

    // invalidates the object
    uint256 GetHash()
    {
        uint256 result;
        ctx.Finalize((unsigned char*)&result);
        return result;
    }

    template<typename T>
    CHashWriter& operator<<(const T& obj)
    {
        // Serialize to this stream
        ::Serialize(*this, obj);
        return (*this);
    }
};

/** Compute the 256-bit hash of an object's serialization. */
template<typename T>
uint256 SerializeHash(const T& obj, int nType = SER_GETHASH, int nVersion = PROTOCOL_VERSION)
{
    CHashWriter ss(nType, nVersion);
    ss << obj;
    return ss.GetHash();
}

#endif // ANCHORING_HASH_H
