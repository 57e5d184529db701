// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "amount.h"
#include "anchoring/config.h"
#include "anchoring/messages.h"
#include "anchoring/rpc.h"
#include "anchoring/transactions.h"
#include "btc/key.h"
#include "chain/config.h"
#include "chain/hostkey.h"
#include "fs.h"
#include "logging.h"
#include "util/system.h"
#include "utilstrencodings.h"

#include <univalue.h>

#include <cstdio>
#include <stdexcept>
#include <string>
#include <vector>

using namespace anchoring;

static const int CONTINUE_EXECUTION = -1;

static void PrintUsage()
{
    fprintf(stdout,
            "Usage: anchoring-util [options] <command> [params]\n"
            "Provision the Bitcoin side of the anchoring service.\n"
            "\n"
            "Commands:\n"
            "  genkeypair <account>                 new key pair from the bitcoind wallet\n"
            "  multisig <anchoring.json>            print the redeem script and address, watch the address\n"
            "  fund <anchoring.json> <satoshis>     pay the multisig address and store the funding tx\n"
            "  gentestnet <n> <satoshis> [dir]      keys, funded configuration and node configs for n validators\n"
            "  decode <hex> [anchoring.json]        classify a raw transaction and print its payload\n"
            "\n"
            "Options:\n"
            "  -btcrpcconnect=<url>      bitcoind JSON-RPC endpoint (default: http://127.0.0.1:%d)\n"
            "  -btcrpcuser=<user>        bitcoind JSON-RPC user\n"
            "  -btcrpcpassword=<pw>      bitcoind JSON-RPC password\n"
            "  -btcrpctimeout=<n>        seconds to wait for bitcoind (default: %d)\n"
            "  -network=<net>            mainnet, testnet or regtest (default: testnet)\n"
            "  -frequency=<n>            anchoring interval in host blocks (default: %u)\n"
            "  -fee=<satoshis>           anchoring transaction fee (default: %d)\n"
            "  -printtoconsole           log to stdout\n"
            "  -debug=<category>         log a category (anchoring, rpc, db, chain)\n",
            DEFAULT_BTCRPC_PORT, (int)DEFAULT_BTCRPC_TIMEOUT, (unsigned)DEFAULT_ANCHORING_FREQUENCY,
            (int)DEFAULT_ANCHORING_FEE);
}

static int AppInitUtil(int argc, char* argv[], std::vector<std::string>& args)
{
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return EXIT_FAILURE;
    }
    int i = 1;
    while (i < argc && argv[i][0] == '-') i++;
    for (; i < argc; i++) {
        args.push_back(argv[i]);
    }

    if (args.empty() || gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        PrintUsage();
        return args.empty() ? EXIT_FAILURE : EXIT_SUCCESS;
    }

    BCLog::Logger& logger = GetLogger();
    logger.m_print_to_console = gArgs.GetBoolArg("-printtoconsole", false);
    for (const std::string& cat : gArgs.GetArgs("-debug")) {
        if (!logger.EnableCategory(cat)) {
            fprintf(stderr, "Unsupported logging category -debug=%s\n", cat.c_str());
        }
    }
    return CONTINUE_EXECUTION;
}

static btc::Network NetworkFromArgs()
{
    btc::Network network;
    std::string name = gArgs.GetArg("-network", "testnet");
    if (!btc::NetworkFromString(name, network))
        throw std::runtime_error("unknown network " + name);
    return network;
}

static AnchoringRpcConfig RpcConfigFromArgs()
{
    AnchoringRpcConfig cfg;
    cfg.host = gArgs.GetArg("-btcrpcconnect", strprintf("http://127.0.0.1:%d", DEFAULT_BTCRPC_PORT));
    cfg.username = gArgs.GetArg("-btcrpcuser", "");
    cfg.password = gArgs.GetArg("-btcrpcpassword", "");
    return cfg;
}

static CAmount ParseSatoshis(const std::string& str)
{
    int64_t amount;
    if (!ParseInt64(str, &amount) || !MoneyRange(amount) || amount <= 0)
        throw std::runtime_error("invalid amount " + str);
    return amount;
}

static void WriteJSON(const fs::path& path, const UniValue& value)
{
    WriteFileContents(path, value.write(4) + "\n");
}

static UniValue KeypairToJSON(const BitcoinKeypair& keypair, btc::Network network)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", keypair.address);
    obj.pushKV("pubkey", keypair.pubkey.GetHex());
    obj.pushKV("privkey", btc::EncodeSecret(keypair.privkey, network != btc::Network::MAINNET));
    return obj;
}

static UniValue CommandGenKeypair(CAnchoringRpc& rpc, const std::vector<std::string>& params)
{
    if (params.size() != 1) throw std::runtime_error("genkeypair <account>");
    return KeypairToJSON(rpc.GenKeypair(params[0]), NetworkFromArgs());
}

static UniValue CommandMultisig(CAnchoringRpc& rpc, const std::vector<std::string>& params)
{
    if (params.size() != 1) throw std::runtime_error("multisig <anchoring.json>");
    AnchoringConfig cfg = AnchoringConfig::FromJSON(ReadJSONFile(params[0]));
    CRedeemScript redeem = cfg.RedeemScript();

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("redeem_script", HexStr(redeem.Script().begin(), redeem.Script().end()));
    obj.pushKV("address", rpc.CreateMultisigAddress(redeem, cfg.network));
    obj.pushKV("threshold", (int64_t)cfg.threshold);
    return obj;
}

static UniValue CommandFund(CAnchoringRpc& rpc, const std::vector<std::string>& params)
{
    if (params.size() != 2) throw std::runtime_error("fund <anchoring.json> <satoshis>");
    AnchoringConfig cfg = AnchoringConfig::FromJSON(ReadJSONFile(params[0]));
    CAmount amount = ParseSatoshis(params[1]);

    rpc.CreateMultisigAddress(cfg.RedeemScript(), cfg.network);
    cfg.funding_tx = rpc.SendToAddress(cfg.Address(), amount);
    WriteJSON(params[0], cfg.ToJSON());
    LogPrintf("anchoring-util: funded %s with %d satoshis in %s\n", cfg.Address(), amount,
              cfg.funding_tx.GetId().ToString());

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", cfg.Address());
    obj.pushKV("funding_tx", cfg.funding_tx.GetId().GetHex());
    return obj;
}

static UniValue CommandGenTestnet(CAnchoringRpc& rpc, const std::vector<std::string>& params)
{
    if (params.size() < 2 || params.size() > 3) throw std::runtime_error("gentestnet <n> <satoshis> [dir]");
    int n = atoi(params[0]);
    if (n < 1 || n > 16) throw std::runtime_error("the number of validators must be in [1, 16]");
    CAmount amount = ParseSatoshis(params[1]);
    fs::path dir = params.size() == 3 ? fs::path(params[2]) : fs::current_path();
    fs::create_directories(dir);

    AnchoringConfig cfg;
    cfg.network = NetworkFromArgs();
    cfg.frequency = gArgs.GetArg("-frequency", (int64_t)DEFAULT_ANCHORING_FREQUENCY);
    cfg.fee = gArgs.GetArg("-fee", (int64_t)DEFAULT_ANCHORING_FEE);

    std::vector<BitcoinKeypair> keypairs;
    for (int i = 0; i < n; i++) {
        keypairs.push_back(rpc.GenKeypair(strprintf("anchoring-%d", i)));
        cfg.validators.push_back(keypairs.back().pubkey);
    }
    cfg.threshold = AnchoringConfig::DefaultThreshold(cfg.validators.size());

    std::string address = rpc.CreateMultisigAddress(cfg.RedeemScript(), cfg.network);
    cfg.funding_tx = rpc.SendToAddress(address, amount);

    std::string strError;
    if (!cfg.IsValid(strError)) throw std::runtime_error(strError);

    chain::CStoredConfiguration genesis;
    std::vector<chain::CHostKey> hostKeys(n);
    for (int i = 0; i < n; i++) {
        hostKeys[i].MakeNewKey();
        genesis.validator_keys.push_back(hostKeys[i].GetPubKey());
    }
    genesis.services[ANCHORING_SERVICE_ID] = cfg.ToJSON();

    WriteJSON(dir / "anchoring.json", cfg.ToJSON());
    WriteFileContents(dir / "genesis.json", genesis.ToJSON() + "\n");
    for (int i = 0; i < n; i++) {
        AnchoringNodeConfig node;
        node.rpc = rpc.Config();
        node.private_keys[address] = btc::EncodeSecret(keypairs[i].privkey, cfg.network != btc::Network::MAINNET);
        WriteJSON(dir / strprintf("node_%d.json", i), node.ToJSON());
        WriteFileContents(dir / strprintf("validator_%d.key", i), hostKeys[i].GetHex() + "\n");
    }

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("address", address);
    obj.pushKV("threshold", (int64_t)cfg.threshold);
    obj.pushKV("funding_tx", cfg.funding_tx.GetId().GetHex());
    obj.pushKV("dir", dir.string());
    return obj;
}

static UniValue CommandDecode(const std::vector<std::string>& params)
{
    if (params.empty() || params.size() > 2) throw std::runtime_error("decode <hex> [anchoring.json]");
    CBitcoinTx tx;
    if (!CBitcoinTx::FromHex(params[0], tx)) throw std::runtime_error("not a raw transaction");

    UniValue obj(UniValue::VOBJ);
    obj.pushKV("txid", tx.GetId().GetHex());
    if (params.size() == 2) {
        AnchoringConfig cfg = AnchoringConfig::FromJSON(ReadJSONFile(params[1]));
        obj.pushKV("kind", TxKindToString(ClassifyTransaction(tx, cfg.RedeemScript().Script())));
    }
    AnchoringPayload payload;
    if (IsAnchoringShape(tx, &payload)) {
        UniValue p(UniValue::VOBJ);
        p.pushKV("block_height", (int64_t)payload.block_height);
        p.pushKV("block_hash", payload.block_hash.GetHex());
        obj.pushKV("payload", p);
    }
    return obj;
}

static int CommandLineUtil(const std::vector<std::string>& args)
{
    const std::string& command = args[0];
    std::vector<std::string> params(args.begin() + 1, args.end());

    UniValue result;
    if (command == "decode") {
        result = CommandDecode(params);
    } else {
        CAnchoringRpc rpc(RpcConfigFromArgs(), gArgs.GetArg("-btcrpctimeout", DEFAULT_BTCRPC_TIMEOUT));
        if (command == "genkeypair") {
            result = CommandGenKeypair(rpc, params);
        } else if (command == "multisig") {
            result = CommandMultisig(rpc, params);
        } else if (command == "fund") {
            result = CommandFund(rpc, params);
        } else if (command == "gentestnet") {
            result = CommandGenTestnet(rpc, params);
        } else {
            fprintf(stderr, "error: unknown command %s\n", command.c_str());
            return EXIT_FAILURE;
        }
    }
    fprintf(stdout, "%s\n", result.write(4).c_str());
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[])
{
    std::vector<std::string> args;
    int ret = AppInitUtil(argc, argv, args);
    if (ret != CONTINUE_EXECUTION) return ret;

    btc::ECC_Start();
    ret = EXIT_FAILURE;
    try {
        ret = CommandLineUtil(args);
    } catch (const BitcoinRpcError& e) {
        fprintf(stderr, "error: bitcoind returned %d: %s\n", e.GetCode(), e.what());
    } catch (const std::exception& e) {
        fprintf(stderr, "error: %s\n", e.what());
    }
    btc::ECC_Stop();
    return ret;
}
