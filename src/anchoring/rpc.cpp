// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "anchoring/rpc.h"

#include "logging.h"
#include "utilmoneystr.h"
#include "utilstrencodings.h"

namespace anchoring {

static uint256 ParseTxid(const UniValue& value)
{
    if (!value.isStr() || value.get_str().size() != 64 || !IsHex(value.get_str()))
        throw BitcoinRpcError(RPC_CLIENT_PARSE_ERROR, "expected a transaction id");
    return uint256S(value.get_str());
}

static CAmount ParseAmount(const UniValue& value)
{
    CAmount amount;
    if (!value.isNum() || !ParseMoney(value.getValStr(), amount))
        throw BitcoinRpcError(RPC_CLIENT_PARSE_ERROR, "expected an amount");
    return amount;
}

std::vector<BitcoinUnspent> ParseUnspent(const UniValue& result)
{
    if (!result.isArray())
        throw BitcoinRpcError(RPC_CLIENT_PARSE_ERROR, "listunspent: expected an array");
    std::vector<BitcoinUnspent> unspent;
    for (size_t i = 0; i < result.size(); i++) {
        const UniValue& entry = result[i];
        if (!entry.isObject())
            throw BitcoinRpcError(RPC_CLIENT_PARSE_ERROR, "listunspent: expected objects");
        BitcoinUnspent utxo;
        utxo.txid = ParseTxid(find_value(entry, "txid"));
        const UniValue& vout = find_value(entry, "vout");
        const UniValue& confirmations = find_value(entry, "confirmations");
        if (!vout.isNum() || !confirmations.isNum())
            throw BitcoinRpcError(RPC_CLIENT_PARSE_ERROR, "listunspent: malformed entry");
        utxo.vout = vout.get_int();
        utxo.confirmations = confirmations.get_int64();
        utxo.amount = ParseAmount(find_value(entry, "amount"));
        unspent.push_back(utxo);
    }
    return unspent;
}

BitcoinTxInfo ParseTransactionInfo(const UniValue& result)
{
    if (!result.isObject())
        throw BitcoinRpcError(RPC_CLIENT_PARSE_ERROR, "getrawtransaction: expected an object");
    BitcoinTxInfo info;
    const UniValue& confirmations = find_value(result, "confirmations");
    if (confirmations.isNum() && confirmations.get_int64() > 0) {
        info.confirmations = confirmations.get_int64();
    }
    const UniValue& blockhash = find_value(result, "blockhash");
    if (!blockhash.isNull()) {
        info.blockhash = ParseTxid(blockhash);
    }
    return info;
}

CAnchoringRpc::CAnchoringRpc(const AnchoringRpcConfig& cfgIn, int64_t timeoutSeconds)
    : cfg(cfgIn), client(new CBitcoinRpcClient(cfgIn, timeoutSeconds))
{
}

std::vector<BitcoinUnspent> CAnchoringRpc::ListUnspent(const std::string& address, uint64_t minConf, uint64_t maxConf)
{
    UniValue params(UniValue::VARR);
    params.push_back((int64_t)minConf);
    params.push_back((int64_t)maxConf);
    UniValue addresses(UniValue::VARR);
    addresses.push_back(address);
    params.push_back(addresses);
    return ParseUnspent(client->Call("listunspent", params));
}

Optional<CBitcoinTx> CAnchoringRpc::GetRawTransaction(const uint256& txid)
{
    UniValue params(UniValue::VARR);
    params.push_back(txid.GetHex());
    UniValue result;
    try {
        result = client->Call("getrawtransaction", params);
    } catch (const BitcoinRpcError& e) {
        if (e.GetCode() == RPC_INVALID_ADDRESS_OR_KEY) return nullopt;
        throw;
    }
    CBitcoinTx tx;
    if (!result.isStr() || !CBitcoinTx::FromHex(result.get_str(), tx))
        throw BitcoinRpcError(RPC_CLIENT_PARSE_ERROR, "getrawtransaction: malformed transaction");
    return tx;
}

Optional<BitcoinTxInfo> CAnchoringRpc::GetTransactionInfo(const uint256& txid)
{
    UniValue params(UniValue::VARR);
    params.push_back(txid.GetHex());
    params.push_back(1);
    try {
        return ParseTransactionInfo(client->Call("getrawtransaction", params));
    } catch (const BitcoinRpcError& e) {
        if (e.GetCode() == RPC_INVALID_ADDRESS_OR_KEY) return nullopt;
        throw;
    }
}

uint256 CAnchoringRpc::SendRawTransaction(const CBitcoinTx& tx)
{
    UniValue params(UniValue::VARR);
    params.push_back(tx.ToHex());
    return ParseTxid(client->Call("sendrawtransaction", params));
}

void CAnchoringRpc::ImportAddress(const std::string& address)
{
    UniValue params(UniValue::VARR);
    params.push_back(address);
    params.push_back("multisig");
    params.push_back(false);
    params.push_back(false);
    client->Call("importaddress", params);
    LogPrint(BCLog::RPC, "btcrpc: imported %s\n", address);
}

BitcoinKeypair CAnchoringRpc::GenKeypair(const std::string& account)
{
    BitcoinKeypair keypair;

    UniValue params(UniValue::VARR);
    params.push_back(account);
    UniValue address = client->Call("getnewaddress", params);
    if (!address.isStr())
        throw BitcoinRpcError(RPC_CLIENT_PARSE_ERROR, "getnewaddress: expected an address");
    keypair.address = address.get_str();

    UniValue addrParams(UniValue::VARR);
    addrParams.push_back(keypair.address);
    UniValue info;
    try {
        info = client->Call("getaddressinfo", addrParams);
    } catch (const BitcoinRpcError& e) {
        if (e.GetCode() != RPC_METHOD_NOT_FOUND) throw;
        // nodes before 0.17 only know validateaddress
        info = client->Call("validateaddress", addrParams);
    }
    const UniValue& pubkey = find_value(info, "pubkey");
    if (!pubkey.isStr() || !btc::CPubKey::FromHex(pubkey.get_str(), keypair.pubkey))
        throw BitcoinRpcError(RPC_CLIENT_PARSE_ERROR, "address info without a compressed public key");

    UniValue secret = client->Call("dumpprivkey", addrParams);
    if (!secret.isStr() || !btc::DecodeSecret(secret.get_str(), keypair.privkey))
        throw BitcoinRpcError(RPC_CLIENT_PARSE_ERROR, "dumpprivkey: malformed key");
    if (!keypair.privkey.VerifyPubKey(keypair.pubkey))
        throw BitcoinRpcError(RPC_CLIENT_PARSE_ERROR, "dumpprivkey: key does not match the address");
    return keypair;
}

CBitcoinTx CAnchoringRpc::SendToAddress(const std::string& address, CAmount amount)
{
    UniValue params(UniValue::VARR);
    params.push_back(address);
    params.push_back(FormatMoney(amount));
    uint256 txid = ParseTxid(client->Call("sendtoaddress", params));
    Optional<CBitcoinTx> tx = GetRawTransaction(txid);
    if (!tx)
        throw BitcoinRpcError(RPC_INVALID_ADDRESS_OR_KEY, "sendtoaddress: transaction " + txid.GetHex() + " is unknown");
    return *tx;
}

std::string CAnchoringRpc::CreateMultisigAddress(const CRedeemScript& redeem, btc::Network network)
{
    std::string address = redeem.Address(network);
    ImportAddress(address);
    return address;
}

std::vector<CBitcoinTx> CAnchoringRpc::UnspentTransactions(const CRedeemScript& redeem, btc::Network network)
{
    std::vector<CBitcoinTx> txs;
    for (const BitcoinUnspent& utxo : ListUnspent(redeem.Address(network), 0, MAX_UNSPENT_CONFIRMATIONS)) {
        Optional<CBitcoinTx> tx = GetRawTransaction(utxo.txid);
        if (!tx) continue;
        if (ClassifyTransaction(*tx, redeem.Script()) != TxKind::OTHER) {
            txs.push_back(*tx);
        }
    }
    return txs;
}

} // namespace anchoring
