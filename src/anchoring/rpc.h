// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_ANCHORING_RPC_H
#define ANCHORING_ANCHORING_RPC_H

#include "anchoring/config.h"
#include "anchoring/relay.h"
#include "anchoring/rpcclient.h"

#include <univalue.h>

#include <memory>
#include <string>
#include <vector>

namespace anchoring {

/** The Bitcoin relay backed by a bitcoind wallet over JSON-RPC. */
class CAnchoringRpc : public CBitcoinRelay
{
private:
    AnchoringRpcConfig cfg;
    std::unique_ptr<CBitcoinRpcClient> client;

public:
    explicit CAnchoringRpc(const AnchoringRpcConfig& cfgIn, int64_t timeoutSeconds = DEFAULT_BTCRPC_TIMEOUT);

    const AnchoringRpcConfig& Config() const { return cfg; }

    std::vector<BitcoinUnspent> ListUnspent(const std::string& address, uint64_t minConf, uint64_t maxConf) override;
    Optional<CBitcoinTx> GetRawTransaction(const uint256& txid) override;
    Optional<BitcoinTxInfo> GetTransactionInfo(const uint256& txid) override;
    uint256 SendRawTransaction(const CBitcoinTx& tx) override;
    void ImportAddress(const std::string& address) override;
    BitcoinKeypair GenKeypair(const std::string& account) override;

    /** Pay the address from the node's wallet and return the paying transaction. */
    CBitcoinTx SendToAddress(const std::string& address, CAmount amount);

    /** Import the multisig address of the redeem script as watch-only. */
    std::string CreateMultisigAddress(const CRedeemScript& redeem, btc::Network network);

    /** Unspent anchoring and funding transactions of the address; other kinds are dropped. */
    std::vector<CBitcoinTx> UnspentTransactions(const CRedeemScript& redeem, btc::Network network);
};

/** Parse the result of listunspent; throws BitcoinRpcError on unexpected shapes. */
std::vector<BitcoinUnspent> ParseUnspent(const UniValue& result);

/** Parse the result of getrawtransaction with verbose output. */
BitcoinTxInfo ParseTransactionInfo(const UniValue& result);

} // namespace anchoring

#endif // ANCHORING_ANCHORING_RPC_H
