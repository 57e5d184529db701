// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "random.h"

#include <openssl/rand.h>

#include <limits>
#include <stdexcept>

void GetStrongRandBytes(unsigned char* buf, int num)
{
    if (RAND_bytes(buf, num) != 1) {
        throw std::runtime_error("GetStrongRandBytes(): RAND_bytes failed");
    }
}

void GetRandBytes(unsigned char* buf, int num)
{
    GetStrongRandBytes(buf, num);
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
