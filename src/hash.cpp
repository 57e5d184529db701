// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.h"

#include <openssl/ripemd.h>

uint160 Hash160(const unsigned char* data, size_t len)
{
    unsigned char sha[SHA256_DIGEST_LENGTH];
    SHA256(data, len, sha);
    uint160 result;
    RIPEMD160(sha, sizeof(sha), result.begin());
    return result;
}

uint256 SingleSha256(const unsigned char* data, size_t len)
{
    uint256 result;
    SHA256(data, len, result.begin());
    return result;
}
