// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "anchoring/config.h"
#include "anchoring/multisig.h"
#include "anchoring/relay.h"
#include "anchoring/rpc.h"
#include "anchoring/rpcclient.h"
#include "random.h"
#include "test/test_anchoring.h"
#include "test/util/fakebitcoind.h"

#include <boost/test/unit_test.hpp>

#include <functional>
#include <sstream>

using namespace anchoring;

static int RpcErrorCode(const std::function<void()>& fn)
{
    try {
        fn();
    } catch (const BitcoinRpcError& e) {
        return e.GetCode();
    }
    return 0;
}

static UniValue WithField(const UniValue& obj, const std::string& key, const UniValue& value)
{
    UniValue out(UniValue::VOBJ);
    for (const std::string& name : obj.getKeys()) {
        out.pushKV(name, name == key ? value : find_value(obj, name));
    }
    return out;
}

BOOST_FIXTURE_TEST_SUITE(anchoring_rpc_tests, BasicTestingSetup)

// =============================================================================
// JSON-RPC transport
// =============================================================================
BOOST_AUTO_TEST_CASE(parse_rpc_url)
{
    std::string host, path;
    int port;
    BOOST_CHECK(ParseRpcUrl("http://127.0.0.1:18332", host, port, path));
    BOOST_CHECK_EQUAL(host, "127.0.0.1");
    BOOST_CHECK_EQUAL(port, 18332);
    BOOST_CHECK_EQUAL(path, "/");

    BOOST_CHECK(ParseRpcUrl("node.example/wallet/anchoring", host, port, path));
    BOOST_CHECK_EQUAL(host, "node.example");
    BOOST_CHECK_EQUAL(port, DEFAULT_BTCRPC_PORT);
    BOOST_CHECK_EQUAL(path, "/wallet/anchoring");

    BOOST_CHECK(!ParseRpcUrl("https://127.0.0.1:8332", host, port, path));
    BOOST_CHECK(!ParseRpcUrl("http://127.0.0.1:0", host, port, path));
    BOOST_CHECK(!ParseRpcUrl("http://:8332", host, port, path));

    AnchoringRpcConfig cfg;
    cfg.host = "ftp://nowhere";
    BOOST_CHECK_THROW(CBitcoinRpcClient client(cfg), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(read_http_reply)
{
    std::istringstream stream("HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 14\r\n\r\n"
                              "{\"result\":1}\n\nextra");
    std::map<std::string, std::string> headers;
    std::string body;
    BOOST_CHECK_EQUAL(ReadHTTP(stream, headers, body), 200);
    BOOST_CHECK_EQUAL(headers["content-type"], "application/json");
    BOOST_CHECK_EQUAL(body, "{\"result\":1}\n\n");

    std::istringstream unauthorized("HTTP/1.1 401 Unauthorized\r\n\r\n");
    BOOST_CHECK_EQUAL(ReadHTTP(unauthorized, headers, body), 401);
    BOOST_CHECK(body.empty());
}

BOOST_AUTO_TEST_CASE(json_rpc_request_and_reply)
{
    UniValue params(UniValue::VARR);
    params.push_back("abc");
    UniValue request;
    BOOST_REQUIRE(request.read(JSONRPCRequest("getrawtransaction", params, 7)));
    BOOST_CHECK_EQUAL(find_value(request, "method").get_str(), "getrawtransaction");
    BOOST_CHECK_EQUAL(find_value(request, "id").get_int(), 7);
    BOOST_CHECK_EQUAL(find_value(request, "params")[0].get_str(), "abc");

    UniValue result = ParseJSONRPCReply(200, "{\"result\":{\"a\":1},\"error\":null,\"id\":7}");
    BOOST_CHECK_EQUAL(find_value(result, "a").get_int(), 1);

    BOOST_CHECK_EQUAL(RpcErrorCode([] {
        ParseJSONRPCReply(500, "{\"result\":null,\"error\":{\"code\":-5,\"message\":\"No such mempool or blockchain transaction\"},\"id\":1}");
    }), RPC_INVALID_ADDRESS_OR_KEY);
    BOOST_CHECK_EQUAL(RpcErrorCode([] { ParseJSONRPCReply(401, ""); }), RPC_CLIENT_HTTP_ERROR);
    BOOST_CHECK_EQUAL(RpcErrorCode([] { ParseJSONRPCReply(502, "<html>bad gateway</html>"); }), RPC_CLIENT_HTTP_ERROR);
    BOOST_CHECK_EQUAL(RpcErrorCode([] { ParseJSONRPCReply(500, "{\"error\":\"boom\"}"); }), RPC_MISC_ERROR);
}

// =============================================================================
// Reply decoding
// =============================================================================
BOOST_AUTO_TEST_CASE(parse_listunspent)
{
    const uint256 txid = GetRandHash();
    UniValue result;
    BOOST_REQUIRE(result.read(strprintf("[{\"txid\":\"%s\",\"vout\":1,\"address\":\"2N\",\"amount\":0.00100000,"
                                        "\"confirmations\":6,\"spendable\":false}]",
                                        txid.GetHex())));
    std::vector<BitcoinUnspent> unspent = ParseUnspent(result);
    BOOST_REQUIRE_EQUAL(unspent.size(), 1U);
    BOOST_CHECK(unspent[0].txid == txid);
    BOOST_CHECK_EQUAL(unspent[0].vout, 1U);
    BOOST_CHECK_EQUAL(unspent[0].amount, 100000);
    BOOST_CHECK_EQUAL(unspent[0].confirmations, 6U);

    UniValue bad;
    BOOST_REQUIRE(bad.read("[{\"txid\":\"00\",\"vout\":0,\"amount\":1,\"confirmations\":1}]"));
    BOOST_CHECK_EQUAL(RpcErrorCode([&] { ParseUnspent(bad); }), RPC_CLIENT_PARSE_ERROR);
    BOOST_CHECK_EQUAL(RpcErrorCode([] { ParseUnspent(UniValue(UniValue::VOBJ)); }), RPC_CLIENT_PARSE_ERROR);
}

BOOST_AUTO_TEST_CASE(parse_transaction_info)
{
    const uint256 blockhash = GetRandHash();
    UniValue confirmed;
    BOOST_REQUIRE(confirmed.read(strprintf("{\"hex\":\"00\",\"confirmations\":3,\"blockhash\":\"%s\"}", blockhash.GetHex())));
    BitcoinTxInfo info = ParseTransactionInfo(confirmed);
    BOOST_CHECK_EQUAL(info.confirmations, 3U);
    BOOST_REQUIRE(info.blockhash);
    BOOST_CHECK(*info.blockhash == blockhash);

    UniValue pending;
    BOOST_REQUIRE(pending.read("{\"hex\":\"00\"}"));
    info = ParseTransactionInfo(pending);
    BOOST_CHECK_EQUAL(info.confirmations, 0U);
    BOOST_CHECK(!info.blockhash);
}

// =============================================================================
// Submission outcomes
// =============================================================================
BOOST_AUTO_TEST_CASE(submit_transaction_outcomes)
{
    CFakeBitcoind bitcoind;
    CBitcoinTx deposit = bitcoind.Deposit(RandomScriptPubKey(), 5000, 1);

    // already in the chain
    BOOST_CHECK(SubmitTransaction(bitcoind, deposit) == SubmitResult::ALREADY_KNOWN);

    // spending an unknown output
    btc::CMutableTransaction orphan;
    orphan.vin.emplace_back(btc::COutPoint(GetRandHash(), 0));
    orphan.vout.emplace_back(1000, RandomScriptPubKey());
    BOOST_CHECK(SubmitTransaction(bitcoind, CBitcoinTx(orphan)) == SubmitResult::INPUTS_MISSING);

    // faults other than the outcome of the submission propagate
    bitcoind.FailNextCalls(1);
    BOOST_CHECK_EQUAL(RpcErrorCode([&] { SubmitTransaction(bitcoind, deposit); }), RPC_CLIENT_CONNECT_ERROR);
    BOOST_CHECK_EQUAL(bitcoind.CallCount("sendrawtransaction"), 3);
}

BOOST_AUTO_TEST_CASE(fake_node_relay_view)
{
    CFakeBitcoind bitcoind;
    std::vector<btc::CPubKey> pubkeys;
    for (int i = 0; i < 3; i++) {
        btc::CKey key;
        key.MakeNewKey();
        pubkeys.push_back(key.GetPubKey());
    }
    CRedeemScript redeem = CRedeemScript::FromPubKeys(2, pubkeys);
    const std::string address = redeem.Address(btc::Network::TESTNET);
    CBitcoinTx deposit = bitcoind.Deposit(redeem.ScriptPubKey(), 7000, 2);

    // unwatched addresses have no outputs
    BOOST_CHECK(bitcoind.ListUnspent(address, 0, MAX_UNSPENT_CONFIRMATIONS).empty());
    bitcoind.ImportAddress(address);
    std::vector<BitcoinUnspent> unspent = bitcoind.ListUnspent(address, 0, MAX_UNSPENT_CONFIRMATIONS);
    BOOST_REQUIRE_EQUAL(unspent.size(), 1U);
    BOOST_CHECK(unspent[0].txid == deposit.GetId());
    BOOST_CHECK_EQUAL(unspent[0].amount, 7000);
    BOOST_CHECK_EQUAL(unspent[0].confirmations, 2U);
    BOOST_CHECK(bitcoind.ListUnspent(address, 3, MAX_UNSPENT_CONFIRMATIONS).empty());

    BOOST_CHECK(*bitcoind.GetRawTransaction(deposit.GetId()) == deposit);
    BOOST_CHECK(!bitcoind.GetRawTransaction(GetRandHash()));
    BOOST_CHECK_EQUAL(bitcoind.GetTransactionInfo(deposit.GetId())->confirmations, 2U);

    bitcoind.SpendOutside(btc::COutPoint(deposit.GetId(), 0));
    BOOST_CHECK(bitcoind.ListUnspent(address, 0, MAX_UNSPENT_CONFIRMATIONS).empty());
}

// =============================================================================
// Configuration files
// =============================================================================
BOOST_AUTO_TEST_CASE(anchoring_config_json)
{
    AnchoringConfig cfg;
    for (int i = 0; i < 4; i++) {
        btc::CKey key;
        key.MakeNewKey();
        cfg.validators.push_back(key.GetPubKey());
    }
    cfg.threshold = AnchoringConfig::DefaultThreshold(cfg.validators.size());
    BOOST_CHECK_EQUAL(cfg.threshold, 3U);
    BOOST_CHECK_EQUAL(AnchoringConfig::DefaultThreshold(1), 1U);
    BOOST_CHECK_EQUAL(AnchoringConfig::DefaultThreshold(10), 7U);

    // a configuration without funding is still valid
    AnchoringConfig parsed = AnchoringConfig::FromJSON(cfg.ToJSON());
    BOOST_CHECK(parsed.funding_tx.IsNull());
    BOOST_CHECK(parsed.validators == cfg.validators);
    BOOST_CHECK_EQUAL(parsed.Address(), cfg.Address());

    cfg.funding_tx = CBitcoinTx(CreateDepositTx(cfg.RedeemScript().ScriptPubKey(), 100000));
    parsed = AnchoringConfig::FromJSON(cfg.ToJSON());
    BOOST_CHECK(parsed.funding_tx == cfg.funding_tx);
    BOOST_CHECK_EQUAL(parsed.frequency, DEFAULT_ANCHORING_FREQUENCY);
    BOOST_CHECK_EQUAL(parsed.utxo_confirmations, DEFAULT_UTXO_CONFIRMATIONS);

    const UniValue json = cfg.ToJSON();
    BOOST_CHECK_THROW(AnchoringConfig::FromJSON(WithField(json, "threshold", 5)), std::runtime_error);
    BOOST_CHECK_THROW(AnchoringConfig::FromJSON(WithField(json, "frequency", 0)), std::runtime_error);
    BOOST_CHECK_THROW(AnchoringConfig::FromJSON(WithField(json, "network", "moonnet")), std::runtime_error);
    BOOST_CHECK_THROW(AnchoringConfig::FromJSON(WithField(json, "funding_tx", "zz")), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(node_config_keys)
{
    btc::CKey key;
    key.MakeNewKey();
    AnchoringNodeConfig node;
    node.rpc.host = "http://127.0.0.1:18332";
    node.rpc.username = "user";
    node.private_keys["2Naddress"] = btc::EncodeSecret(key, true);

    AnchoringNodeConfig parsed = AnchoringNodeConfig::FromJSON(node.ToJSON());
    BOOST_CHECK_EQUAL(parsed.rpc.host, node.rpc.host);
    BOOST_CHECK_EQUAL(parsed.check_lect_frequency, DEFAULT_CHECK_LECT_FREQUENCY);
    btc::CKey decoded;
    BOOST_REQUIRE(parsed.GetPrivateKey("2Naddress", decoded));
    BOOST_CHECK(decoded.GetPubKey() == key.GetPubKey());
    BOOST_CHECK(!parsed.GetPrivateKey("2Nother", decoded));
}

BOOST_AUTO_TEST_SUITE_END()
