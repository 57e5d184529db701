// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_BTC_ADDRESS_H
#define ANCHORING_BTC_ADDRESS_H

#include "btc/script.h"
#include "uint256.h"

#include <string>

namespace btc {

/** Bitcoin network the anchoring chain is written to. */
enum class Network {
    MAINNET,
    TESTNET,
    REGTEST,
};

std::string NetworkToString(Network network);

/** Parse "mainnet", "testnet" or "regtest" (also "bitcoin" for mainnet). */
bool NetworkFromString(const std::string& str, Network& network);

/** Base58 version byte of pay-to-script-hash addresses. */
unsigned char ScriptAddressPrefix(Network network);

/** True for the networks whose WIF keys use the testnet prefix. */
inline bool IsTestNetwork(Network network) { return network != Network::MAINNET; }

/** Base58check P2SH address of a script hash. */
std::string EncodeScriptAddress(const uint160& scriptHash, Network network);

/** Decode a P2SH address of the given network. */
bool DecodeScriptAddress(const std::string& address, Network network, uint160& scriptHash);

} // namespace btc

#endif // ANCHORING_BTC_ADDRESS_H
