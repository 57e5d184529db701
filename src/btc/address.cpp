// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "btc/address.h"

#include "btc/base58.h"

#include <cstring>

namespace btc {

std::string NetworkToString(Network network)
{
    switch (network) {
    case Network::MAINNET:
        return "mainnet";
    case Network::TESTNET:
        return "testnet";
    case Network::REGTEST:
        return "regtest";
    }
    return "unknown";
}

bool NetworkFromString(const std::string& str, Network& network)
{
    if (str == "mainnet" || str == "bitcoin") {
        network = Network::MAINNET;
    } else if (str == "testnet") {
        network = Network::TESTNET;
    } else if (str == "regtest") {
        network = Network::REGTEST;
    } else {
        return false;
    }
    return true;
}

unsigned char ScriptAddressPrefix(Network network)
{
    return network == Network::MAINNET ? 0x05 : 0xc4;
}

std::string EncodeScriptAddress(const uint160& scriptHash, Network network)
{
    std::vector<unsigned char> data;
    data.push_back(ScriptAddressPrefix(network));
    data.insert(data.end(), scriptHash.begin(), scriptHash.end());
    return EncodeBase58Check(data);
}

bool DecodeScriptAddress(const std::string& address, Network network, uint160& scriptHash)
{
    std::vector<unsigned char> data;
    if (!DecodeBase58Check(address, data))
        return false;
    if (data.size() != 1 + uint160::size() || data[0] != ScriptAddressPrefix(network))
        return false;
    memcpy(scriptHash.begin(), data.data() + 1, uint160::size());
    return true;
}

} // namespace btc
