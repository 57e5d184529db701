// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "btc/key.h"

#include "btc/base58.h"
#include "hash.h"
#include "random.h"
#include "utilstrencodings.h"

#include <secp256k1.h>

#include <cassert>
#include <stdexcept>

namespace btc {

static secp256k1_context* secp256k1_context_anchoring = nullptr;

static const unsigned char WIF_PREFIX_MAINNET = 0x80;
static const unsigned char WIF_PREFIX_TESTNET = 0xef;

secp256k1_context* ECC_Context()
{
    if (secp256k1_context_anchoring == nullptr) {
        throw std::logic_error("ECC_Context(): elliptic curve support not started");
    }
    return secp256k1_context_anchoring;
}

void ECC_Start()
{
    assert(secp256k1_context_anchoring == nullptr);

    secp256k1_context* ctx = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    assert(ctx != nullptr);

    {
        // Pass in a random blinding seed to the secp256k1 context.
        std::vector<unsigned char> vseed(32);
        GetRandBytes(vseed.data(), 32);
        bool ret = secp256k1_context_randomize(ctx, vseed.data());
        assert(ret);
    }

    secp256k1_context_anchoring = ctx;
}

void ECC_Stop()
{
    secp256k1_context* ctx = secp256k1_context_anchoring;
    secp256k1_context_anchoring = nullptr;

    if (ctx) {
        secp256k1_context_destroy(ctx);
    }
}

bool ECC_InitSanityCheck()
{
    CKey key;
    key.MakeNewKey();
    CPubKey pubkey = key.GetPubKey();
    return key.VerifyPubKey(pubkey);
}

bool CPubKey::IsFullyValid() const
{
    if (!IsValid())
        return false;
    secp256k1_pubkey pubkey;
    return secp256k1_ec_pubkey_parse(ECC_Context(), &pubkey, vch, size());
}

std::string CPubKey::GetHex() const
{
    return HexStr(begin(), end());
}

bool CPubKey::Verify(const uint256& hash, const std::vector<unsigned char>& vchSig) const
{
    if (!IsValid())
        return false;
    secp256k1_pubkey pubkey;
    secp256k1_ecdsa_signature sig;
    if (!secp256k1_ec_pubkey_parse(ECC_Context(), &pubkey, vch, size())) {
        return false;
    }
    if (vchSig.empty() || !secp256k1_ecdsa_signature_parse_der(ECC_Context(), &sig, vchSig.data(), vchSig.size())) {
        return false;
    }
    /* libsecp256k1's ECDSA verification requires lower-S signatures, which have
     * not historically been enforced in Bitcoin, so normalize them first. */
    secp256k1_ecdsa_signature_normalize(ECC_Context(), &sig, &sig);
    return secp256k1_ecdsa_verify(ECC_Context(), &sig, hash.begin(), &pubkey);
}

bool CPubKey::FromHex(const std::string& hex, CPubKey& pubkey)
{
    if (!IsHex(hex))
        return false;
    std::vector<unsigned char> data = ParseHex(hex);
    pubkey.Set(data.begin(), data.end());
    return pubkey.IsFullyValid();
}

bool CKey::Check(const unsigned char* vch)
{
    return secp256k1_ec_seckey_verify(ECC_Context(), vch);
}

void CKey::MakeNewKey()
{
    do {
        GetStrongRandBytes(keydata.data(), keydata.size());
    } while (!Check(keydata.data()));
    fValid = true;
}

CPubKey CKey::GetPubKey() const
{
    assert(fValid);
    secp256k1_pubkey pubkey;
    size_t clen = CPubKey::COMPRESSED_SIZE;
    unsigned char out[CPubKey::COMPRESSED_SIZE];
    int ret = secp256k1_ec_pubkey_create(ECC_Context(), &pubkey, begin());
    assert(ret);
    secp256k1_ec_pubkey_serialize(ECC_Context(), out, &clen, &pubkey, SECP256K1_EC_COMPRESSED);
    assert(clen == CPubKey::COMPRESSED_SIZE);
    CPubKey result(out, out + clen);
    assert(result.IsValid());
    return result;
}

bool CKey::Sign(const uint256& hash, std::vector<unsigned char>& vchSig) const
{
    if (!fValid)
        return false;
    vchSig.resize(72);
    size_t nSigLen = 72;
    secp256k1_ecdsa_signature sig;
    int ret = secp256k1_ecdsa_sign(ECC_Context(), &sig, hash.begin(), begin(), secp256k1_nonce_function_rfc6979, nullptr);
    if (!ret)
        return false;
    secp256k1_ecdsa_signature_serialize_der(ECC_Context(), vchSig.data(), &nSigLen, &sig);
    vchSig.resize(nSigLen);
    return true;
}

bool CKey::VerifyPubKey(const CPubKey& pubkey) const
{
    unsigned char rnd[8];
    std::string str = "Anchoring key verification\n";
    GetRandBytes(rnd, sizeof(rnd));
    uint256 hash = Hash(str.begin(), str.end(), rnd, rnd + 8);
    std::vector<unsigned char> vchSig;
    Sign(hash, vchSig);
    return pubkey.Verify(hash, vchSig);
}

std::string EncodeSecret(const CKey& key, bool testnet)
{
    assert(key.IsValid());
    std::vector<unsigned char> data;
    data.push_back(testnet ? WIF_PREFIX_TESTNET : WIF_PREFIX_MAINNET);
    data.insert(data.end(), key.begin(), key.end());
    data.push_back(1);
    return EncodeBase58Check(data);
}

bool DecodeSecret(const std::string& str, CKey& key)
{
    std::vector<unsigned char> data;
    if (!DecodeBase58Check(str, data))
        return false;
    if (data.empty() || (data[0] != WIF_PREFIX_MAINNET && data[0] != WIF_PREFIX_TESTNET))
        return false;
    // Only compressed keys: prefix, 32 bytes, 0x01 marker
    if (data.size() != 1 + CKey::SIZE + 1 || data.back() != 1)
        return false;
    key.Set(data.begin() + 1, data.begin() + 1 + CKey::SIZE);
    return key.IsValid();
}

} // namespace btc
