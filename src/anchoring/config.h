// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_ANCHORING_CONFIG_H
#define ANCHORING_ANCHORING_CONFIG_H

#include "amount.h"
#include "anchoring/multisig.h"
#include "anchoring/transactions.h"
#include "btc/address.h"
#include "btc/key.h"

#include <univalue.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace anchoring {

static const uint64_t DEFAULT_ANCHORING_FREQUENCY = 500;
static const uint64_t DEFAULT_UTXO_CONFIRMATIONS = 5;
static const CAmount DEFAULT_ANCHORING_FEE = 1000;
static const uint64_t DEFAULT_CHECK_LECT_FREQUENCY = 30;

/**
 * Anchoring section of the host chain configuration. Shared by all
 * validators; validators[i] is the Bitcoin key of host validator i.
 */
struct AnchoringConfig {
    std::vector<btc::CPubKey> validators;
    uint32_t threshold{0};
    btc::Network network{btc::Network::TESTNET};
    CBitcoinTx funding_tx;
    CAmount fee{DEFAULT_ANCHORING_FEE};
    uint64_t frequency{DEFAULT_ANCHORING_FREQUENCY};
    uint64_t utxo_confirmations{DEFAULT_UTXO_CONFIRMATIONS};

    /** 2n/3 + 1 */
    static uint32_t DefaultThreshold(size_t n) { return (uint32_t)(n * 2 / 3 + 1); }

    CRedeemScript RedeemScript() const;
    std::string Address() const;

    bool IsValid(std::string& strError) const;

    UniValue ToJSON() const;

    /** Parse and validate; throws std::runtime_error with a description. A missing funding_tx leaves it null. */
    static AnchoringConfig FromJSON(const UniValue& value);
};

/** Session parameters of the Bitcoin node. */
struct AnchoringRpcConfig {
    std::string host;
    std::string username;
    std::string password;

    UniValue ToJSON() const;
    static AnchoringRpcConfig FromJSON(const UniValue& value);
};

/** Node-local anchoring settings; never stored on chain. */
struct AnchoringNodeConfig {
    AnchoringRpcConfig rpc;
    //! multisig address -> WIF private key of this validator for that address
    std::map<std::string, std::string> private_keys;
    uint64_t check_lect_frequency{DEFAULT_CHECK_LECT_FREQUENCY};

    /** Key that signs for the given multisig address. */
    bool GetPrivateKey(const std::string& address, btc::CKey& key) const;

    UniValue ToJSON() const;
    static AnchoringNodeConfig FromJSON(const UniValue& value);
};

/** Read a JSON document from a file; throws std::runtime_error. */
UniValue ReadJSONFile(const std::string& path);

} // namespace anchoring

#endif // ANCHORING_ANCHORING_CONFIG_H
