// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/config.h"

#include "hash.h"
#include "logging.h"
#include "utilstrencodings.h"

#include <stdexcept>

namespace chain {

UniValue CStoredConfiguration::ToUniValue() const
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("previous_cfg_hash", previous_cfg_hash.GetHex());
    obj.pushKV("actual_from", (int64_t)actual_from);

    UniValue keys(UniValue::VARR);
    for (const CHostPubKey& key : validator_keys) {
        keys.push_back(key.GetHex());
    }
    obj.pushKV("validator_keys", keys);

    UniValue servicesObj(UniValue::VOBJ);
    for (const auto& entry : services) {
        servicesObj.pushKV(std::to_string(entry.first), entry.second);
    }
    obj.pushKV("services", servicesObj);
    return obj;
}

std::string CStoredConfiguration::ToJSON() const
{
    return ToUniValue().write();
}

CStoredConfiguration CStoredConfiguration::FromUniValue(const UniValue& value)
{
    if (!value.isObject())
        throw std::runtime_error("stored configuration: expected a JSON object");

    CStoredConfiguration cfg;

    const UniValue& prev = find_value(value, "previous_cfg_hash");
    if (!prev.isStr() || prev.get_str().size() != 64 || !IsHex(prev.get_str()))
        throw std::runtime_error("stored configuration: previous_cfg_hash must be a 32-byte hex string");
    cfg.previous_cfg_hash.SetHex(prev.get_str());

    const UniValue& actualFrom = find_value(value, "actual_from");
    if (!actualFrom.isNum() || actualFrom.get_int64() < 0)
        throw std::runtime_error("stored configuration: actual_from must be a non-negative integer");
    cfg.actual_from = actualFrom.get_int64();

    const UniValue& keys = find_value(value, "validator_keys");
    if (!keys.isArray() || keys.empty())
        throw std::runtime_error("stored configuration: validator_keys must be a non-empty array");
    for (size_t i = 0; i < keys.size(); i++) {
        CHostPubKey key;
        if (!keys[i].isStr() || !CHostPubKey::FromHex(keys[i].get_str(), key))
            throw std::runtime_error(strprintf("stored configuration: invalid validator key #%u", i));
        cfg.validator_keys.push_back(key);
    }

    const UniValue& servicesObj = find_value(value, "services");
    if (!servicesObj.isNull()) {
        if (!servicesObj.isObject())
            throw std::runtime_error("stored configuration: services must be an object");
        const std::vector<std::string>& ids = servicesObj.getKeys();
        const std::vector<UniValue>& sections = servicesObj.getValues();
        for (size_t i = 0; i < ids.size(); i++) {
            int64_t id;
            if (!ParseInt64(ids[i], &id) || id < 0 || id > 0xffff)
                throw std::runtime_error(strprintf("stored configuration: bad service id '%s'", ids[i]));
            cfg.services[(uint16_t)id] = sections[i];
        }
    }
    return cfg;
}

CStoredConfiguration CStoredConfiguration::FromJSON(const std::string& json)
{
    UniValue value;
    if (!value.read(json))
        throw std::runtime_error("stored configuration: JSON parse error");
    return FromUniValue(value);
}

uint256 CStoredConfiguration::GetHash() const
{
    std::string json = ToJSON();
    return Hash(json.begin(), json.end());
}

int CStoredConfiguration::FindValidator(const CHostPubKey& key) const
{
    for (size_t i = 0; i < validator_keys.size(); i++) {
        if (validator_keys[i] == key) return (int)i;
    }
    return -1;
}

UniValue CStoredConfiguration::GetServiceConfig(uint16_t serviceId) const
{
    auto it = services.find(serviceId);
    if (it == services.end()) return NullUniValue;
    return it->second;
}

} // namespace chain
