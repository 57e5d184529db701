// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_RANDOM_H
#define ANCHORING_RANDOM_H

#include "uint256.h"

#include <cstdint>

/**
 * Gather random data from the OpenSSL CSPRNG.
 * Throws std::runtime_error if the generator cannot be seeded.
 */
void GetStrongRandBytes(unsigned char* buf, int num);
void GetRandBytes(unsigned char* buf, int num);
uint64_t GetRand(uint64_t nMax);
uint256 GetRandHash();

#endif // ANCHORING_RANDOM_H
