// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_ANCHORING_RELAY_H
#define ANCHORING_ANCHORING_RELAY_H

#include "amount.h"
#include "anchoring/transactions.h"
#include "btc/key.h"
#include "optional.h"
#include "uint256.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace anchoring {

/** bitcoind JSON-RPC error codes the anchoring service reacts to. */
enum BitcoinRpcErrorCode {
    RPC_MISC_ERROR = -1,
    RPC_TYPE_ERROR = -3,
    RPC_INVALID_ADDRESS_OR_KEY = -5,
    RPC_DESERIALIZATION_ERROR = -22,
    RPC_VERIFY_ERROR = -25,
    RPC_VERIFY_REJECTED = -26,
    RPC_VERIFY_ALREADY_IN_CHAIN = -27,
    RPC_IN_WARMUP = -28,
    RPC_METHOD_NOT_FOUND = -32601,
    //! transport failures of the client itself
    RPC_CLIENT_CONNECT_ERROR = -1001,
    RPC_CLIENT_HTTP_ERROR = -1002,
    RPC_CLIENT_PARSE_ERROR = -1003,
};

/** Failure reported by the Bitcoin node or by the transport to it. */
class BitcoinRpcError : public std::runtime_error
{
private:
    int code;

public:
    BitcoinRpcError(int codeIn, const std::string& message)
        : std::runtime_error(message), code(codeIn) {}

    int GetCode() const { return code; }
};

//! upper bound for listunspent that includes every confirmed output
static const uint64_t MAX_UNSPENT_CONFIRMATIONS = 9999999;

struct BitcoinUnspent {
    uint256 txid;
    uint32_t vout{0};
    CAmount amount{0};
    uint64_t confirmations{0};
};

struct BitcoinTxInfo {
    uint64_t confirmations{0};
    Optional<uint256> blockhash;
};

struct BitcoinKeypair {
    std::string address;
    btc::CPubKey pubkey;
    btc::CKey privkey;
};

/**
 * Operations the coordinator needs from a Bitcoin node, and nothing more.
 * Every method may throw BitcoinRpcError.
 */
class CBitcoinRelay
{
public:
    virtual ~CBitcoinRelay() {}

    /** Unspent outputs paying the address with confirmations in [minConf, maxConf]. */
    virtual std::vector<BitcoinUnspent> ListUnspent(const std::string& address, uint64_t minConf, uint64_t maxConf) = 0;

    /** Raw transaction by id; empty if the node does not know it. */
    virtual Optional<CBitcoinTx> GetRawTransaction(const uint256& txid) = 0;

    /** Confirmation info; empty if the node does not know the transaction. */
    virtual Optional<BitcoinTxInfo> GetTransactionInfo(const uint256& txid) = 0;

    virtual uint256 SendRawTransaction(const CBitcoinTx& tx) = 0;

    /** Watch an address without a key, so its outputs show up in ListUnspent. */
    virtual void ImportAddress(const std::string& address) = 0;

    /** New key pair owned by the node's wallet under the account label. */
    virtual BitcoinKeypair GenKeypair(const std::string& account) = 0;
};

enum class SubmitResult {
    SENT,
    ALREADY_KNOWN,   //!< already in the mempool or in the chain
    INPUTS_MISSING,  //!< an input is spent or unknown
};

const char* SubmitResultToString(SubmitResult result);

/**
 * Send a finalized transaction. Duplicate submissions are success;
 * missing or spent inputs are reported; any other failure is rethrown.
 */
SubmitResult SubmitTransaction(CBitcoinRelay& relay, const CBitcoinTx& tx);

} // namespace anchoring

#endif // ANCHORING_ANCHORING_RELAY_H
