// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "anchoring/config.h"

#include "fs.h"
#include "logging.h"

#include <stdexcept>

namespace anchoring {

static uint64_t GetUnsigned(const UniValue& obj, const std::string& key, uint64_t nDefault)
{
    const UniValue& value = find_value(obj, key);
    if (value.isNull()) return nDefault;
    if (!value.isNum() || value.get_int64() < 0)
        throw std::runtime_error(strprintf("anchoring config: %s must be a non-negative integer", key));
    return value.get_int64();
}

CRedeemScript AnchoringConfig::RedeemScript() const
{
    return CRedeemScript::FromPubKeys(threshold, validators);
}

std::string AnchoringConfig::Address() const
{
    return RedeemScript().Address(network);
}

bool AnchoringConfig::IsValid(std::string& strError) const
{
    if (validators.empty()) {
        strError = "no validators";
        return false;
    }
    if (validators.size() > 16) {
        strError = strprintf("%u validators, at most 16 fit a multisig script", validators.size());
        return false;
    }
    if (threshold < 1 || threshold > validators.size()) {
        strError = strprintf("threshold %u out of range [1, %u]", threshold, validators.size());
        return false;
    }
    for (const btc::CPubKey& key : validators) {
        if (!key.IsFullyValid()) {
            strError = "invalid validator key " + key.GetHex();
            return false;
        }
    }
    if (frequency == 0) {
        strError = "frequency must be positive";
        return false;
    }
    if (!MoneyRange(fee)) {
        strError = "fee out of range";
        return false;
    }
    return true;
}

UniValue AnchoringConfig::ToJSON() const
{
    UniValue obj(UniValue::VOBJ);
    UniValue keys(UniValue::VARR);
    for (const btc::CPubKey& key : validators) {
        keys.push_back(key.GetHex());
    }
    obj.pushKV("validators", keys);
    obj.pushKV("threshold", (int64_t)threshold);
    obj.pushKV("network", btc::NetworkToString(network));
    obj.pushKV("funding_tx", funding_tx.IsNull() ? std::string() : funding_tx.ToHex());
    obj.pushKV("fee", (int64_t)fee);
    obj.pushKV("frequency", (int64_t)frequency);
    obj.pushKV("utxo_confirmations", (int64_t)utxo_confirmations);
    return obj;
}

AnchoringConfig AnchoringConfig::FromJSON(const UniValue& value)
{
    if (!value.isObject())
        throw std::runtime_error("anchoring config: expected a JSON object");

    AnchoringConfig cfg;
    const UniValue& keys = find_value(value, "validators");
    if (!keys.isArray())
        throw std::runtime_error("anchoring config: validators must be an array");
    for (size_t i = 0; i < keys.size(); i++) {
        btc::CPubKey key;
        if (!keys[i].isStr() || !btc::CPubKey::FromHex(keys[i].get_str(), key))
            throw std::runtime_error(strprintf("anchoring config: invalid validator key #%u", i));
        cfg.validators.push_back(key);
    }

    cfg.threshold = GetUnsigned(value, "threshold", DefaultThreshold(cfg.validators.size()));

    const UniValue& network = find_value(value, "network");
    if (!network.isNull()) {
        if (!network.isStr() || !btc::NetworkFromString(network.get_str(), cfg.network))
            throw std::runtime_error("anchoring config: unknown network");
    }

    const UniValue& funding = find_value(value, "funding_tx");
    if (!funding.isNull()) {
        if (!funding.isStr())
            throw std::runtime_error("anchoring config: funding_tx must be a hex string");
        if (!funding.get_str().empty() && !CBitcoinTx::FromHex(funding.get_str(), cfg.funding_tx))
            throw std::runtime_error("anchoring config: funding_tx is not a valid transaction");
    }

    cfg.fee = GetUnsigned(value, "fee", DEFAULT_ANCHORING_FEE);
    cfg.frequency = GetUnsigned(value, "frequency", DEFAULT_ANCHORING_FREQUENCY);
    cfg.utxo_confirmations = GetUnsigned(value, "utxo_confirmations", DEFAULT_UTXO_CONFIRMATIONS);

    std::string strError;
    if (!cfg.IsValid(strError))
        throw std::runtime_error("anchoring config: " + strError);
    return cfg;
}

UniValue AnchoringRpcConfig::ToJSON() const
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("host", host);
    obj.pushKV("username", username);
    obj.pushKV("password", password);
    return obj;
}

AnchoringRpcConfig AnchoringRpcConfig::FromJSON(const UniValue& value)
{
    if (!value.isObject())
        throw std::runtime_error("rpc config: expected a JSON object");
    AnchoringRpcConfig cfg;
    const UniValue& host = find_value(value, "host");
    if (!host.isStr() || host.get_str().empty())
        throw std::runtime_error("rpc config: host is required");
    cfg.host = host.get_str();
    const UniValue& username = find_value(value, "username");
    if (username.isStr()) cfg.username = username.get_str();
    const UniValue& password = find_value(value, "password");
    if (password.isStr()) cfg.password = password.get_str();
    return cfg;
}

bool AnchoringNodeConfig::GetPrivateKey(const std::string& address, btc::CKey& key) const
{
    auto it = private_keys.find(address);
    if (it == private_keys.end()) return false;
    return btc::DecodeSecret(it->second, key);
}

UniValue AnchoringNodeConfig::ToJSON() const
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("rpc", rpc.ToJSON());
    UniValue keys(UniValue::VOBJ);
    for (const auto& entry : private_keys) {
        keys.pushKV(entry.first, entry.second);
    }
    obj.pushKV("private_keys", keys);
    obj.pushKV("check_lect_frequency", (int64_t)check_lect_frequency);
    return obj;
}

AnchoringNodeConfig AnchoringNodeConfig::FromJSON(const UniValue& value)
{
    if (!value.isObject())
        throw std::runtime_error("node config: expected a JSON object");
    AnchoringNodeConfig cfg;
    cfg.rpc = AnchoringRpcConfig::FromJSON(find_value(value, "rpc"));

    const UniValue& keys = find_value(value, "private_keys");
    if (!keys.isNull()) {
        if (!keys.isObject())
            throw std::runtime_error("node config: private_keys must be an object");
        const std::vector<std::string>& addresses = keys.getKeys();
        const std::vector<UniValue>& secrets = keys.getValues();
        for (size_t i = 0; i < addresses.size(); i++) {
            btc::CKey key;
            if (!secrets[i].isStr() || !btc::DecodeSecret(secrets[i].get_str(), key))
                throw std::runtime_error(strprintf("node config: invalid private key for %s", addresses[i]));
            cfg.private_keys[addresses[i]] = secrets[i].get_str();
        }
    }

    const UniValue& frequency = find_value(value, "check_lect_frequency");
    if (!frequency.isNull()) {
        if (!frequency.isNum() || frequency.get_int64() <= 0)
            throw std::runtime_error("node config: check_lect_frequency must be positive");
        cfg.check_lect_frequency = frequency.get_int64();
    }
    return cfg;
}

UniValue ReadJSONFile(const std::string& path)
{
    std::string contents = ReadFileContents(fs::path(path));
    UniValue value;
    if (!value.read(contents))
        throw std::runtime_error(strprintf("%s: JSON parse error", path));
    return value;
}

} // namespace anchoring
