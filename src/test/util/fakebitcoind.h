// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_TEST_UTIL_FAKEBITCOIND_H
#define ANCHORING_TEST_UTIL_FAKEBITCOIND_H

#include "anchoring/relay.h"
#include "btc/transaction.h"
#include "sync.h"

#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * In-memory Bitcoin node behind the relay interface.
 *
 * Keeps a chain height, confirmed and mempool transactions and the set of
 * spent outpoints. Submitted transactions must spend known unspent
 * outputs, and P2SH multisig inputs must carry a valid OP_0 <sigs>
 * <redeemScript> scriptSig. Only watched addresses show up in ListUnspent,
 * as with a real wallet.
 */
class CFakeBitcoind : public anchoring::CBitcoinRelay
{
private:
    struct TxEntry {
        anchoring::CBitcoinTx tx;
        //! block height, or -1 while in the mempool
        int64_t height;
    };

    mutable RecursiveMutex cs;
    int64_t nHeight{100};
    std::map<uint256, TxEntry> mapTx;
    std::set<btc::COutPoint> setSpent;
    std::set<std::string> setWatched;
    std::map<std::string, int> mapCalls;
    int nFailCalls{0};
    int nKeys{0};

    void BeginCall(const std::string& method);
    uint64_t ConfirmationsOf(const TxEntry& entry) const;
    bool CheckMultisigInput(const anchoring::CBitcoinTx& tx, unsigned int nIn, const btc::CScript& prevScript,
                            std::string& strError) const;

public:
    // Test controls

    /** Confirmed deposit to scriptPubKey with the given number of confirmations. */
    anchoring::CBitcoinTx Deposit(const btc::CScript& scriptPubKey, CAmount value, int confirmations = 1);

    /** Insert an arbitrary transaction as confirmed (confirmations > 0) or pending. */
    void AddTransaction(const anchoring::CBitcoinTx& tx, int confirmations);

    /** Mine n blocks; the first one takes the whole mempool. */
    void Mine(int n = 1);

    /** Spend an output with a confirmed transaction the service does not know about. */
    anchoring::CBitcoinTx SpendOutside(const btc::COutPoint& outpoint);

    /** Drop a transaction as a deep reorg would, releasing the outputs it spent. */
    void Forget(const uint256& txid);

    /** The next n relay calls fail with a connection error. */
    void FailNextCalls(int n);

    int CallCount(const std::string& method) const;
    bool IsWatched(const std::string& address) const;
    bool IsSpent(const btc::COutPoint& outpoint) const;
    bool InMempool(const uint256& txid) const;
    uint64_t Confirmations(const uint256& txid) const;
    int64_t Height() const;

    // CBitcoinRelay

    std::vector<anchoring::BitcoinUnspent> ListUnspent(const std::string& address, uint64_t minConf, uint64_t maxConf) override;
    Optional<anchoring::CBitcoinTx> GetRawTransaction(const uint256& txid) override;
    Optional<anchoring::BitcoinTxInfo> GetTransactionInfo(const uint256& txid) override;
    uint256 SendRawTransaction(const anchoring::CBitcoinTx& tx) override;
    void ImportAddress(const std::string& address) override;
    anchoring::BitcoinKeypair GenKeypair(const std::string& account) override;
};

#endif // ANCHORING_TEST_UTIL_FAKEBITCOIND_H
