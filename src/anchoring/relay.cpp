// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "anchoring/relay.h"

#include "logging.h"
#include "utilstrencodings.h"

namespace anchoring {

const char* SubmitResultToString(SubmitResult result)
{
    switch (result) {
    case SubmitResult::SENT: return "sent";
    case SubmitResult::ALREADY_KNOWN: return "already-known";
    case SubmitResult::INPUTS_MISSING: return "inputs-missing";
    }
    return "unknown";
}

SubmitResult SubmitTransaction(CBitcoinRelay& relay, const CBitcoinTx& tx)
{
    try {
        relay.SendRawTransaction(tx);
        LogPrint(BCLog::ANCHORING, "anchoring: sent %s\n", tx.GetId().ToString());
        return SubmitResult::SENT;
    } catch (const BitcoinRpcError& e) {
        const std::string message = ToLower(e.what());
        if (e.GetCode() == RPC_VERIFY_ALREADY_IN_CHAIN ||
            message.find("already in") != std::string::npos ||
            message.find("txn-already-in-mempool") != std::string::npos ||
            message.find("txn-already-known") != std::string::npos) {
            LogPrint(BCLog::ANCHORING, "anchoring: %s is already known: %s\n", tx.GetId().ToString(), e.what());
            return SubmitResult::ALREADY_KNOWN;
        }
        if (message.find("missing") != std::string::npos) {
            LogPrintf("anchoring: %s has missing inputs: %s\n", tx.GetId().ToString(), e.what());
            return SubmitResult::INPUTS_MISSING;
        }
        throw;
    }
}

} // namespace anchoring
