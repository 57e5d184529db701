// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "btc/interpreter.h"

#include "hash.h"

namespace btc {

namespace {

/**
 * Wrapper that serializes like CTransaction, but with the modifications
 *  required for the signature hash done in-place
 */
class CTransactionSignatureSerializer
{
private:
    const CTransaction& txTo;  //!< reference to the spending transaction (the one being serialized)
    const CScript& scriptCode; //!< output script being consumed
    const unsigned int nIn;    //!< input index of txTo being signed

public:
    CTransactionSignatureSerializer(const CTransaction& txToIn, const CScript& scriptCodeIn, unsigned int nInIn) : txTo(txToIn), scriptCode(scriptCodeIn), nIn(nInIn) {}

    /** Serialize an input of txTo */
    template<typename S>
    void SerializeInput(S& s, unsigned int nInput) const
    {
        // Serialize the prevout
        ::Serialize(s, txTo.vin[nInput].prevout);
        // Serialize the script
        if (nInput != nIn)
            // Blank out other inputs' signatures
            ::Serialize(s, CScript());
        else
            ::Serialize(s, scriptCode);
        // Serialize the nSequence
        ::Serialize(s, txTo.vin[nInput].nSequence);
    }

    /** Serialize txTo */
    template<typename S>
    void Serialize(S& s) const
    {
        // Serialize nVersion
        ::Serialize(s, txTo.nVersion);
        // Serialize vin
        unsigned int nInputs = txTo.vin.size();
        ::WriteCompactSize(s, nInputs);
        for (unsigned int nInput = 0; nInput < nInputs; nInput++)
            SerializeInput(s, nInput);
        // Serialize vout
        ::WriteCompactSize(s, txTo.vout.size());
        for (const CTxOut& out : txTo.vout)
            ::Serialize(s, out);
        // Serialize nLockTime
        ::Serialize(s, txTo.nLockTime);
    }
};

} // namespace

uint256 SignatureHash(const CScript& scriptCode, const CTransaction& txTo, unsigned int nIn, int nHashType)
{
    static const uint256 one(uint256S("0000000000000000000000000000000000000000000000000000000000000001"));

    // Check for invalid use of SIGHASH_SINGLE or an out of range input
    if (nIn >= txTo.vin.size() || (nHashType & 0x1f) != SIGHASH_ALL) {
        return one;
    }

    // Wrapper to serialize only the necessary parts of the transaction being signed
    CTransactionSignatureSerializer txTmp(txTo, scriptCode, nIn);

    // Serialize and hash
    CHashWriter ss(SER_GETHASH, 0);
    ss << txTmp << nHashType;
    return ss.GetHash();
}

} // namespace btc
