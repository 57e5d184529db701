// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_CRYPTO_COMMON_H
#define ANCHORING_CRYPTO_COMMON_H

#include <cstdint>
#include <cstring>

static inline uint16_t ReadLE16(const unsigned char* ptr)
{
    return (uint16_t)ptr[0] | ((uint16_t)ptr[1] << 8);
}

static inline uint32_t ReadLE32(const unsigned char* ptr)
{
    return (uint32_t)ptr[0] | ((uint32_t)ptr[1] << 8) | ((uint32_t)ptr[2] << 16) | ((uint32_t)ptr[3] << 24);
}

static inline uint64_t ReadLE64(const unsigned char* ptr)
{
    return (uint64_t)ReadLE32(ptr) | ((uint64_t)ReadLE32(ptr + 4) << 32);
}

static inline void WriteLE16(unsigned char* ptr, uint16_t x)
{
    ptr[0] = x & 0xff;
    ptr[1] = (x >> 8) & 0xff;
}

static inline void WriteLE32(unsigned char* ptr, uint32_t x)
{
    for (int i = 0; i < 4; i++) {
        ptr[i] = (x >> (8 * i)) & 0xff;
    }
}

static inline void WriteLE64(unsigned char* ptr, uint64_t x)
{
    WriteLE32(ptr, (uint32_t)x);
    WriteLE32(ptr + 4, (uint32_t)(x >> 32));
}

static inline uint32_t ReadBE32(const unsigned char* ptr)
{
    return ((uint32_t)ptr[0] << 24) | ((uint32_t)ptr[1] << 16) | ((uint32_t)ptr[2] << 8) | (uint32_t)ptr[3];
}

static inline uint64_t ReadBE64(const unsigned char* ptr)
{
    return ((uint64_t)ReadBE32(ptr) << 32) | (uint64_t)ReadBE32(ptr + 4);
}

static inline void WriteBE32(unsigned char* ptr, uint32_t x)
{
    ptr[0] = (x >> 24) & 0xff;
    ptr[1] = (x >> 16) & 0xff;
    ptr[2] = (x >> 8) & 0xff;
    ptr[3] = x & 0xff;
}

static inline void WriteBE64(unsigned char* ptr, uint64_t x)
{
    WriteBE32(ptr, (uint32_t)(x >> 32));
    WriteBE32(ptr + 4, (uint32_t)x);
}

#endif // ANCHORING_CRYPTO_COMMON_H
