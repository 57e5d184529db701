// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/hostkey.h"

#include "btc/key.h"
#include "random.h"
#include "utilstrencodings.h"

#include <secp256k1.h>
#include <secp256k1_extrakeys.h>
#include <secp256k1_schnorrsig.h>

#include <stdexcept>

namespace chain {

bool CHostPubKey::IsNull() const
{
    for (unsigned char c : vch)
        if (c != 0) return false;
    return true;
}

bool CHostPubKey::Verify(const uint256& hash, const unsigned char* sig) const
{
    secp256k1_xonly_pubkey pubkey;
    if (!secp256k1_xonly_pubkey_parse(btc::ECC_Context(), &pubkey, vch.data())) {
        return false;
    }
    return secp256k1_schnorrsig_verify(btc::ECC_Context(), sig, hash.begin(), 32, &pubkey);
}

std::string CHostPubKey::GetHex() const
{
    return HexStr(begin(), end());
}

bool CHostPubKey::FromHex(const std::string& hex, CHostPubKey& key)
{
    if (!IsHex(hex)) return false;
    std::vector<unsigned char> data = ParseHex(hex);
    if (data.size() != HOST_PUBKEY_SIZE) return false;
    key = CHostPubKey(data.data());
    secp256k1_xonly_pubkey pubkey;
    return secp256k1_xonly_pubkey_parse(btc::ECC_Context(), &pubkey, key.data());
}

void CHostKey::MakeNewKey()
{
    do {
        GetStrongRandBytes(secret.data(), secret.size());
    } while (!secp256k1_ec_seckey_verify(btc::ECC_Context(), secret.data()));
    fValid = true;
}

bool CHostKey::Set(const std::vector<unsigned char>& data)
{
    fValid = false;
    if (data.size() != secret.size()) return false;
    if (!secp256k1_ec_seckey_verify(btc::ECC_Context(), data.data())) return false;
    std::copy(data.begin(), data.end(), secret.begin());
    fValid = true;
    return true;
}

CHostPubKey CHostKey::GetPubKey() const
{
    if (!fValid) throw std::logic_error("CHostKey::GetPubKey(): invalid key");
    secp256k1_keypair keypair;
    secp256k1_xonly_pubkey xonly;
    unsigned char out[HOST_PUBKEY_SIZE];
    if (!secp256k1_keypair_create(btc::ECC_Context(), &keypair, secret.data()) ||
        !secp256k1_keypair_xonly_pub(btc::ECC_Context(), &xonly, nullptr, &keypair) ||
        !secp256k1_xonly_pubkey_serialize(btc::ECC_Context(), out, &xonly)) {
        throw std::runtime_error("CHostKey::GetPubKey(): key derivation failed");
    }
    return CHostPubKey(out);
}

HostSignature CHostKey::Sign(const uint256& hash) const
{
    if (!fValid) throw std::logic_error("CHostKey::Sign(): invalid key");
    secp256k1_keypair keypair;
    HostSignature sig;
    if (!secp256k1_keypair_create(btc::ECC_Context(), &keypair, secret.data()) ||
        !secp256k1_schnorrsig_sign32(btc::ECC_Context(), sig.data(), hash.begin(), &keypair, nullptr)) {
        throw std::runtime_error("CHostKey::Sign(): signing failed");
    }
    return sig;
}

std::string CHostKey::GetHex() const
{
    return HexStr(secret.begin(), secret.end());
}

} // namespace chain
