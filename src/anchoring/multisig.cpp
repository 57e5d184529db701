// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "anchoring/multisig.h"

#include "btc/interpreter.h"
#include "logging.h"

#include <algorithm>
#include <stdexcept>

namespace anchoring {

CRedeemScript CRedeemScript::FromPubKeys(int m, std::vector<btc::CPubKey> pubkeys)
{
    if (pubkeys.empty() || pubkeys.size() > 16)
        throw std::runtime_error(strprintf("redeem script: %u keys, expected 1 to 16", pubkeys.size()));
    if (m < 1 || m > (int)pubkeys.size())
        throw std::runtime_error(strprintf("redeem script: threshold %d out of range for %u keys", m, pubkeys.size()));
    for (const btc::CPubKey& key : pubkeys) {
        if (!key.IsValid())
            throw std::runtime_error("redeem script: invalid public key");
    }

    std::sort(pubkeys.begin(), pubkeys.end());

    CRedeemScript redeem;
    redeem.nRequired = m;
    redeem.keys = std::move(pubkeys);
    std::vector<std::vector<unsigned char>> raw;
    for (const btc::CPubKey& key : redeem.keys) {
        raw.push_back(key.Raw());
    }
    redeem.script = btc::GetScriptForMultisig(m, raw);
    return redeem;
}

bool CRedeemScript::FromScript(const btc::CScript& scriptIn, CRedeemScript& redeem)
{
    int m;
    std::vector<std::vector<unsigned char>> raw;
    if (!btc::ParseMultisigScript(scriptIn, m, raw)) return false;

    std::vector<btc::CPubKey> pubkeys;
    for (const auto& vch : raw) {
        btc::CPubKey key(vch);
        if (!key.IsValid()) return false;
        pubkeys.push_back(key);
    }
    if (!std::is_sorted(pubkeys.begin(), pubkeys.end())) return false;

    redeem.nRequired = m;
    redeem.keys = std::move(pubkeys);
    redeem.script = scriptIn;
    return true;
}

uint160 CRedeemScript::ScriptHash() const
{
    return btc::ScriptHash(script);
}

btc::CScript CRedeemScript::ScriptPubKey() const
{
    return btc::GetScriptForP2SH(ScriptHash());
}

std::string CRedeemScript::Address(btc::Network network) const
{
    return btc::EncodeScriptAddress(ScriptHash(), network);
}

int CRedeemScript::KeyPosition(const btc::CPubKey& pubkey) const
{
    for (size_t i = 0; i < keys.size(); i++) {
        if (keys[i] == pubkey) return (int)i;
    }
    return -1;
}

bool SignInput(const CBitcoinTx& tx, uint32_t input, const CRedeemScript& redeem, const btc::CKey& key,
               std::vector<unsigned char>& sig)
{
    if (input >= tx->vin.size()) {
        return error("SignInput: input %u out of range for %s", input, tx.GetId().ToString());
    }
    uint256 hash = btc::SignatureHash(redeem.Script(), tx.Get(), input, btc::SIGHASH_ALL);
    if (!key.Sign(hash, sig)) {
        return error("SignInput: signing failed for %s:%u", tx.GetId().ToString(), input);
    }
    sig.push_back((unsigned char)btc::SIGHASH_ALL);
    return true;
}

bool VerifyInput(const CBitcoinTx& tx, uint32_t input, const CRedeemScript& redeem, const btc::CPubKey& pubkey,
                 const std::vector<unsigned char>& sig)
{
    if (input >= tx->vin.size() || sig.empty()) return false;
    if (sig.back() != btc::SIGHASH_ALL) return false;

    std::vector<unsigned char> der(sig.begin(), sig.end() - 1);
    uint256 hash = btc::SignatureHash(redeem.Script(), tx.Get(), input, btc::SIGHASH_ALL);
    return pubkey.Verify(hash, der);
}

bool FinalizeTransaction(const CBitcoinTx& tx, const CRedeemScript& redeem, const InputSignatures& signatures,
                         CBitcoinTx& finalized)
{
    btc::CMutableTransaction mtx(tx.Get());
    for (uint32_t i = 0; i < mtx.vin.size(); i++) {
        auto it = signatures.find(i);
        if (it == signatures.end() || (int)it->second.size() < redeem.Required()) {
            return false;
        }

        btc::CScript scriptSig;
        scriptSig << btc::OP_0;
        int count = 0;
        for (const auto& entry : it->second) {
            if (count == redeem.Required()) break;
            scriptSig << entry.second;
            count++;
        }
        scriptSig << std::vector<unsigned char>(redeem.Script().begin(), redeem.Script().end());
        mtx.vin[i].scriptSig = scriptSig;
    }
    finalized = CBitcoinTx(mtx);
    return true;
}

} // namespace anchoring
