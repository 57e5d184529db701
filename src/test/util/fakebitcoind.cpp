// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test/util/fakebitcoind.h"

#include "anchoring/multisig.h"
#include "btc/address.h"
#include "btc/key.h"
#include "hash.h"
#include "random.h"
#include "test/test_anchoring.h"
#include "tinyformat.h"
#include "utilstrencodings.h"

using namespace anchoring;

void CFakeBitcoind::BeginCall(const std::string& method)
{
    mapCalls[method]++;
    if (nFailCalls > 0) {
        nFailCalls--;
        throw BitcoinRpcError(RPC_CLIENT_CONNECT_ERROR, "couldn't connect to server");
    }
}

uint64_t CFakeBitcoind::ConfirmationsOf(const TxEntry& entry) const
{
    return entry.height < 0 ? 0 : (uint64_t)(nHeight - entry.height + 1);
}

CBitcoinTx CFakeBitcoind::Deposit(const btc::CScript& scriptPubKey, CAmount value, int confirmations)
{
    CBitcoinTx tx(CreateDepositTx(scriptPubKey, value));
    AddTransaction(tx, confirmations);
    return tx;
}

void CFakeBitcoind::AddTransaction(const CBitcoinTx& tx, int confirmations)
{
    LOCK(cs);
    TxEntry entry{tx, confirmations > 0 ? nHeight - confirmations + 1 : -1};
    mapTx[tx.GetId()] = entry;
    for (const btc::CTxIn& in : tx->vin) {
        setSpent.insert(in.prevout);
    }
}

void CFakeBitcoind::Mine(int n)
{
    LOCK(cs);
    for (int i = 0; i < n; i++) {
        nHeight++;
        for (auto& entry : mapTx) {
            if (entry.second.height < 0) entry.second.height = nHeight;
        }
    }
}

CBitcoinTx CFakeBitcoind::SpendOutside(const btc::COutPoint& outpoint)
{
    btc::CMutableTransaction mtx;
    mtx.vin.emplace_back(outpoint);
    mtx.vout.emplace_back(1000, RandomScriptPubKey());
    CBitcoinTx tx(mtx);
    AddTransaction(tx, 1);
    return tx;
}

void CFakeBitcoind::Forget(const uint256& txid)
{
    LOCK(cs);
    auto it = mapTx.find(txid);
    if (it == mapTx.end()) return;
    for (const btc::CTxIn& in : it->second.tx->vin) {
        setSpent.erase(in.prevout);
    }
    mapTx.erase(it);
}

void CFakeBitcoind::FailNextCalls(int n)
{
    LOCK(cs);
    nFailCalls = n;
}

int CFakeBitcoind::CallCount(const std::string& method) const
{
    LOCK(cs);
    auto it = mapCalls.find(method);
    return it == mapCalls.end() ? 0 : it->second;
}

bool CFakeBitcoind::IsWatched(const std::string& address) const
{
    LOCK(cs);
    return setWatched.count(address) > 0;
}

bool CFakeBitcoind::IsSpent(const btc::COutPoint& outpoint) const
{
    LOCK(cs);
    return setSpent.count(outpoint) > 0;
}

bool CFakeBitcoind::InMempool(const uint256& txid) const
{
    LOCK(cs);
    auto it = mapTx.find(txid);
    return it != mapTx.end() && it->second.height < 0;
}

uint64_t CFakeBitcoind::Confirmations(const uint256& txid) const
{
    LOCK(cs);
    auto it = mapTx.find(txid);
    return it == mapTx.end() ? 0 : ConfirmationsOf(it->second);
}

int64_t CFakeBitcoind::Height() const
{
    LOCK(cs);
    return nHeight;
}

std::vector<BitcoinUnspent> CFakeBitcoind::ListUnspent(const std::string& address, uint64_t minConf, uint64_t maxConf)
{
    LOCK(cs);
    BeginCall("listunspent");
    std::vector<BitcoinUnspent> unspent;
    if (!setWatched.count(address)) return unspent;

    uint160 scriptHash;
    if (!btc::DecodeScriptAddress(address, btc::Network::TESTNET, scriptHash) &&
        !btc::DecodeScriptAddress(address, btc::Network::MAINNET, scriptHash)) {
        throw BitcoinRpcError(RPC_INVALID_ADDRESS_OR_KEY, "Invalid Bitcoin address: " + address);
    }
    const btc::CScript scriptPubKey = btc::GetScriptForP2SH(scriptHash);

    for (const auto& entry : mapTx) {
        const CBitcoinTx& tx = entry.second.tx;
        uint64_t confirmations = ConfirmationsOf(entry.second);
        if (confirmations < minConf || confirmations > maxConf) continue;
        for (uint32_t n = 0; n < tx->vout.size(); n++) {
            if (tx->vout[n].scriptPubKey != scriptPubKey) continue;
            if (setSpent.count(btc::COutPoint(entry.first, n))) continue;
            BitcoinUnspent utxo;
            utxo.txid = entry.first;
            utxo.vout = n;
            utxo.amount = tx->vout[n].nValue;
            utxo.confirmations = confirmations;
            unspent.push_back(utxo);
        }
    }
    return unspent;
}

Optional<CBitcoinTx> CFakeBitcoind::GetRawTransaction(const uint256& txid)
{
    LOCK(cs);
    BeginCall("getrawtransaction");
    auto it = mapTx.find(txid);
    if (it == mapTx.end()) return nullopt;
    return it->second.tx;
}

Optional<BitcoinTxInfo> CFakeBitcoind::GetTransactionInfo(const uint256& txid)
{
    LOCK(cs);
    BeginCall("getrawtransaction");
    auto it = mapTx.find(txid);
    if (it == mapTx.end()) return nullopt;
    BitcoinTxInfo info;
    info.confirmations = ConfirmationsOf(it->second);
    if (info.confirmations > 0) {
        CHashWriter ss(SER_GETHASH, 0);
        ss << it->second.height;
        info.blockhash = ss.GetHash();
    }
    return info;
}

bool CFakeBitcoind::CheckMultisigInput(const CBitcoinTx& tx, unsigned int nIn, const btc::CScript& prevScript,
                                       std::string& strError) const
{
    const btc::CScript& scriptSig = tx->vin[nIn].scriptSig;
    std::vector<std::vector<unsigned char>> pushes;
    btc::CScript::const_iterator pc = scriptSig.begin();
    while (pc < scriptSig.end()) {
        btc::opcodetype opcode;
        std::vector<unsigned char> data;
        if (!scriptSig.GetOp(pc, opcode, data) || opcode > btc::OP_PUSHDATA4) {
            strError = "scriptsig-not-pushonly";
            return false;
        }
        pushes.push_back(data);
    }
    if (pushes.size() < 3 || !pushes.front().empty()) {
        strError = "mandatory-script-verify-flag-failed (Operation not valid with the current stack size)";
        return false;
    }

    CRedeemScript redeem;
    btc::CScript redeemScript(pushes.back().data(), pushes.back().data() + pushes.back().size());
    if (!CRedeemScript::FromScript(redeemScript, redeem) || redeem.ScriptPubKey() != prevScript) {
        strError = "mandatory-script-verify-flag-failed (Script evaluated without error but finished with a false/empty top stack element)";
        return false;
    }

    std::vector<std::vector<unsigned char>> sigs(pushes.begin() + 1, pushes.end() - 1);
    if ((int)sigs.size() != redeem.Required()) {
        strError = "mandatory-script-verify-flag-failed (Signature count is incorrect)";
        return false;
    }
    size_t k = 0;
    for (const auto& sig : sigs) {
        while (k < redeem.Keys().size() && !VerifyInput(tx, nIn, redeem, redeem.Keys()[k], sig)) k++;
        if (k == redeem.Keys().size()) {
            strError = "mandatory-script-verify-flag-failed (Signature must be zero for failed CHECK(MULTI)SIG operation)";
            return false;
        }
        k++;
    }
    return true;
}

uint256 CFakeBitcoind::SendRawTransaction(const CBitcoinTx& tx)
{
    LOCK(cs);
    BeginCall("sendrawtransaction");
    auto known = mapTx.find(tx.GetId());
    if (known != mapTx.end()) {
        if (known->second.height >= 0)
            throw BitcoinRpcError(RPC_VERIFY_ALREADY_IN_CHAIN, "Transaction already in block chain");
        throw BitcoinRpcError(RPC_VERIFY_REJECTED, "txn-already-in-mempool");
    }

    for (unsigned int i = 0; i < tx->vin.size(); i++) {
        const btc::COutPoint& prevout = tx->vin[i].prevout;
        auto prev = mapTx.find(prevout.hash);
        if (prev == mapTx.end() || prevout.n >= prev->second.tx->vout.size() || setSpent.count(prevout)) {
            throw BitcoinRpcError(RPC_VERIFY_ERROR, "bad-txns-inputs-missingorspent");
        }
        std::string strError;
        if (!CheckMultisigInput(tx, i, prev->second.tx->vout[prevout.n].scriptPubKey, strError)) {
            throw BitcoinRpcError(RPC_VERIFY_REJECTED, strprintf("%s (code 16)", strError));
        }
    }

    AddTransaction(tx, 0);
    return tx.GetId();
}

void CFakeBitcoind::ImportAddress(const std::string& address)
{
    LOCK(cs);
    BeginCall("importaddress");
    setWatched.insert(address);
}

BitcoinKeypair CFakeBitcoind::GenKeypair(const std::string& account)
{
    LOCK(cs);
    BeginCall("getnewaddress");
    BitcoinKeypair keypair;
    keypair.privkey.MakeNewKey();
    keypair.pubkey = keypair.privkey.GetPubKey();
    std::vector<unsigned char> raw = keypair.pubkey.Raw();
    uint160 id = Hash160(raw.begin(), raw.end());
    keypair.address = strprintf("%s-%d-%s", account, ++nKeys, id.GetHex());
    return keypair;
}
