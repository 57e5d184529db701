// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_ANCHORING_MULTISIG_H
#define ANCHORING_ANCHORING_MULTISIG_H

#include "anchoring/transactions.h"
#include "btc/address.h"
#include "btc/key.h"
#include "btc/script.h"
#include "uint256.h"

#include <map>
#include <string>
#include <vector>

namespace anchoring {

/**
 * m-of-n redeem script over compressed keys sorted by their serialization.
 * The sort makes the script, and so the address, independent of the
 * validator order.
 */
class CRedeemScript
{
private:
    int nRequired{0};
    std::vector<btc::CPubKey> keys;
    btc::CScript script;

public:
    CRedeemScript() {}

    /** Throws std::runtime_error unless 1 <= m <= n <= 16 and all keys are valid. */
    static CRedeemScript FromPubKeys(int m, std::vector<btc::CPubKey> pubkeys);
    static bool FromScript(const btc::CScript& scriptIn, CRedeemScript& redeem);

    int Required() const { return nRequired; }
    const std::vector<btc::CPubKey>& Keys() const { return keys; }
    const btc::CScript& Script() const { return script; }

    uint160 ScriptHash() const;
    btc::CScript ScriptPubKey() const;
    std::string Address(btc::Network network) const;

    /** Position of the key in the script, or -1 when it is not a signer. */
    int KeyPosition(const btc::CPubKey& pubkey) const;

    friend bool operator==(const CRedeemScript& a, const CRedeemScript& b) { return a.script == b.script; }
    friend bool operator!=(const CRedeemScript& a, const CRedeemScript& b) { return !(a == b); }
};

/** DER signature of one input with SIGHASH_ALL appended. */
bool SignInput(const CBitcoinTx& tx, uint32_t input, const CRedeemScript& redeem, const btc::CKey& key,
               std::vector<unsigned char>& sig);

/** Check an input signature produced by SignInput; any other hash type fails. */
bool VerifyInput(const CBitcoinTx& tx, uint32_t input, const CRedeemScript& redeem, const btc::CPubKey& pubkey,
                 const std::vector<unsigned char>& sig);

/** input index -> key position -> signature */
typedef std::map<uint32_t, std::map<int, std::vector<unsigned char>>> InputSignatures;

/**
 * Assemble the P2SH scriptSig of every input from the first m signatures
 * in key order: OP_0 <sig...> <redeemScript>. Returns false if some input
 * has fewer than m signatures.
 */
bool FinalizeTransaction(const CBitcoinTx& tx, const CRedeemScript& redeem, const InputSignatures& signatures,
                         CBitcoinTx& finalized);

} // namespace anchoring

#endif // ANCHORING_ANCHORING_MULTISIG_H
