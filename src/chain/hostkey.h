// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_CHAIN_HOSTKEY_H
#define ANCHORING_CHAIN_HOSTKEY_H

#include "uint256.h"

#include <algorithm>
#include <array>
#include <string>
#include <vector>

namespace chain {

static const size_t HOST_PUBKEY_SIZE = 32;
static const size_t HOST_SIGNATURE_SIZE = 64;

typedef std::array<unsigned char, HOST_SIGNATURE_SIZE> HostSignature;

/**
 * Validator identity on the host chain: a BIP340 x-only public key.
 */
class CHostPubKey
{
private:
    std::array<unsigned char, HOST_PUBKEY_SIZE> vch{};

public:
    CHostPubKey() {}
    explicit CHostPubKey(const unsigned char* data) { std::copy(data, data + HOST_PUBKEY_SIZE, vch.begin()); }

    const unsigned char* begin() const { return vch.data(); }
    const unsigned char* end() const { return vch.data() + vch.size(); }
    const unsigned char* data() const { return vch.data(); }
    static constexpr size_t size() { return HOST_PUBKEY_SIZE; }

    bool IsNull() const;

    /** Check a BIP340 signature over a 32-byte message hash. */
    bool Verify(const uint256& hash, const unsigned char* sig) const;

    std::string GetHex() const;
    static bool FromHex(const std::string& hex, CHostPubKey& key);

    friend bool operator==(const CHostPubKey& a, const CHostPubKey& b) { return a.vch == b.vch; }
    friend bool operator!=(const CHostPubKey& a, const CHostPubKey& b) { return a.vch != b.vch; }
    friend bool operator<(const CHostPubKey& a, const CHostPubKey& b) { return a.vch < b.vch; }
};

/** Secret half of a validator's host identity. */
class CHostKey
{
private:
    std::array<unsigned char, 32> secret{};
    bool fValid{false};

public:
    void MakeNewKey();
    bool Set(const std::vector<unsigned char>& data);
    bool IsValid() const { return fValid; }

    CHostPubKey GetPubKey() const;

    /** Deterministic BIP340 signature over a 32-byte hash. */
    HostSignature Sign(const uint256& hash) const;

    std::string GetHex() const;
};

} // namespace chain

#endif // ANCHORING_CHAIN_HOSTKEY_H
