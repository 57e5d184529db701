// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_CHAIN_CONFIG_H
#define ANCHORING_CHAIN_CONFIG_H

#include "chain/hostkey.h"
#include "uint256.h"

#include <univalue.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace chain {

/**
 * Host chain configuration as stored on chain.
 *
 * A configuration names the validators of the host chain and carries one
 * JSON object per service. The genesis configuration has a null
 * previous_cfg_hash and actual_from == 0; every later one points at the
 * configuration it replaces and becomes active at actual_from.
 */
class CStoredConfiguration
{
public:
    uint256 previous_cfg_hash;
    uint64_t actual_from{0};
    std::vector<CHostPubKey> validator_keys;
    std::map<uint16_t, UniValue> services;

    /** Canonical JSON text; the configuration hash is computed over it. */
    std::string ToJSON() const;
    UniValue ToUniValue() const;

    /** Parse a stored configuration; throws std::runtime_error on malformed input. */
    static CStoredConfiguration FromJSON(const std::string& json);
    static CStoredConfiguration FromUniValue(const UniValue& value);

    uint256 GetHash() const;

    /** Position of a validator key, or -1. */
    int FindValidator(const CHostPubKey& key) const;

    /** Service section; a null UniValue when the service is not configured. */
    UniValue GetServiceConfig(uint16_t serviceId) const;
};

} // namespace chain

#endif // ANCHORING_CHAIN_CONFIG_H
