// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_BTC_KEY_H
#define ANCHORING_BTC_KEY_H

#include "serialize.h"
#include "uint256.h"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

struct secp256k1_context_struct;
typedef struct secp256k1_context_struct secp256k1_context;

namespace btc {

/** Initialize the elliptic curve support. May not be called twice without calling ECC_Stop first. */
void ECC_Start();

/** Deinitialize the elliptic curve support. No-op if ECC_Start wasn't called first. */
void ECC_Stop();

/** Check that required EC support is available at runtime. */
bool ECC_InitSanityCheck();

/** Shared signing/verification context; throws std::logic_error before ECC_Start(). */
secp256k1_context* ECC_Context();

/** A compressed secp256k1 public key (33 bytes). */
class CPubKey
{
public:
    static constexpr unsigned int COMPRESSED_SIZE = 33;

private:
    unsigned char vch[COMPRESSED_SIZE];
    bool fValid;

public:
    CPubKey() : fValid(false) { memset(vch, 0, sizeof(vch)); }

    template<typename T>
    CPubKey(const T pbegin, const T pend)
    {
        Set(pbegin, pend);
    }

    explicit CPubKey(const std::vector<unsigned char>& _vch)
    {
        Set(_vch.begin(), _vch.end());
    }

    /** Initialize a public key using begin/end iterators to byte data. Only compressed keys are accepted. */
    template<typename T>
    void Set(const T pbegin, const T pend)
    {
        fValid = size_t(pend - pbegin) == COMPRESSED_SIZE && (pbegin[0] == 0x02 || pbegin[0] == 0x03);
        if (fValid) {
            memcpy(vch, (unsigned char*)&pbegin[0], COMPRESSED_SIZE);
        } else {
            memset(vch, 0, sizeof(vch));
        }
    }

    unsigned int size() const { return COMPRESSED_SIZE; }
    const unsigned char* data() const { return vch; }
    const unsigned char* begin() const { return vch; }
    const unsigned char* end() const { return vch + size(); }

    bool IsValid() const { return fValid; }

    /** fully validate whether this is a valid public key (more expensive than IsValid()) */
    bool IsFullyValid() const;

    std::vector<unsigned char> Raw() const { return std::vector<unsigned char>(begin(), end()); }
    std::string GetHex() const;

    //! Comparator implementation.
    friend bool operator==(const CPubKey& a, const CPubKey& b)
    {
        return a.fValid == b.fValid && memcmp(a.vch, b.vch, COMPRESSED_SIZE) == 0;
    }
    friend bool operator!=(const CPubKey& a, const CPubKey& b)
    {
        return !(a == b);
    }
    friend bool operator<(const CPubKey& a, const CPubKey& b)
    {
        return memcmp(a.vch, b.vch, COMPRESSED_SIZE) < 0;
    }

    /**
     * Verify a DER signature (~72 bytes).
     * If this public key is not fully valid, the return value will be false.
     * High-S signatures are normalized before verification.
     */
    bool Verify(const uint256& hash, const std::vector<unsigned char>& vchSig) const;

    /** Parse a hex-encoded compressed key. */
    static bool FromHex(const std::string& hex, CPubKey& pubkey);
};

/** An encapsulated private key. */
class CKey
{
public:
    static const unsigned int SIZE = 32;

private:
    //! Whether this private key is valid. We check for correctness when modifying the key
    //! data, so fValid should always correspond to the actual state.
    bool fValid;

    //! The actual byte data
    std::vector<unsigned char> keydata;

    //! Check whether the 32-byte array pointed to by vch is valid keydata.
    static bool Check(const unsigned char* vch);

public:
    //! Construct an invalid private key.
    CKey() : fValid(false)
    {
        // Important: vch must be 32 bytes in length to not break serialization
        keydata.resize(32);
    }

    friend bool operator==(const CKey& a, const CKey& b)
    {
        return a.size() == b.size() &&
               memcmp(a.keydata.data(), b.keydata.data(), a.size()) == 0;
    }

    //! Initialize using begin and end iterators to byte data.
    template<typename T>
    void Set(const T pbegin, const T pend)
    {
        if (size_t(pend - pbegin) != keydata.size()) {
            fValid = false;
        } else if (Check(&pbegin[0])) {
            memcpy(keydata.data(), (unsigned char*)&pbegin[0], keydata.size());
            fValid = true;
        } else {
            fValid = false;
        }
    }

    //! Simple read-only vector-like interface.
    unsigned int size() const { return (fValid ? keydata.size() : 0); }
    const unsigned char* begin() const { return keydata.data(); }
    const unsigned char* end() const { return keydata.data() + size(); }

    //! Check whether this private key is valid.
    bool IsValid() const { return fValid; }

    //! Generate a new private key using a cryptographic PRNG.
    void MakeNewKey();

    /**
     * Compute the public key from a private key.
     * This is expensive.
     */
    CPubKey GetPubKey() const;

    /**
     * Create a DER-serialized signature (low-S, RFC6979 nonce).
     */
    bool Sign(const uint256& hash, std::vector<unsigned char>& vchSig) const;

    //! Verify thoroughly whether a private key and a public key match.
    bool VerifyPubKey(const CPubKey& vchPubKey) const;
};

/** Wallet import format, always with the compressed-key marker. */
std::string EncodeSecret(const CKey& key, bool testnet);
bool DecodeSecret(const std::string& str, CKey& key);

} // namespace btc

#endif // ANCHORING_BTC_KEY_H
