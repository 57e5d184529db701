// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_TEST_UTIL_TESTNETWORK_H
#define ANCHORING_TEST_UTIL_TESTNETWORK_H

#include "anchoring/config.h"
#include "anchoring/handler.h"
#include "btc/key.h"
#include "chain/blockchain.h"
#include "chain/config.h"
#include "chain/hostkey.h"
#include "chain/txmempool.h"
#include "dbwrapper.h"
#include "fs.h"
#include "test/util/fakebitcoind.h"

#include <memory>
#include <set>
#include <utility>
#include <vector>

/** One validator node: host identity, Bitcoin key, chain and coordinator. */
struct CTestValidator {
    chain::CHostKey hostKey;
    btc::CKey btcKey;
    anchoring::AnchoringNodeConfig nodeCfg;
    std::unique_ptr<CDBWrapper> db;
    std::unique_ptr<chain::CBlockchain> blockchain;
    std::unique_ptr<anchoring::CAnchoringHandler> handler;
};

/**
 * Host network of N validators sharing one fake bitcoind.
 *
 * Host consensus is a loop: the shared mempool becomes the next block,
 * every validator applies it (their block hashes must agree), then every
 * coordinator runs on its own snapshot and its messages go back into the
 * mempool. Messages of muted (validator, type) pairs are dropped.
 */
class CTestNetwork
{
private:
    fs::path dir;
    std::set<std::pair<uint32_t, uint16_t>> setMuted;
    std::shared_ptr<chain::CService> service;

    void ResetHandler(CTestValidator& validator);

public:
    CFakeBitcoind bitcoind;
    chain::CTxMemPool mempool;
    std::vector<std::unique_ptr<CTestValidator>> validators;
    anchoring::AnchoringConfig cfg;
    chain::CStoredConfiguration genesis;

    /** Genesis with n validators, the given interval and one funding deposit. */
    CTestNetwork(const fs::path& dirIn, size_t n, uint64_t frequency, CAmount funding = 100000);

    size_t Size() const { return validators.size(); }
    CTestValidator& Validator(uint32_t v) { return *validators[v]; }

    void Mute(uint32_t validator, uint16_t messageType) { setMuted.insert(std::make_pair(validator, messageType)); }
    void Unmute(uint32_t validator, uint16_t messageType) { setMuted.erase(std::make_pair(validator, messageType)); }

    /** Commit the pending messages as the next block on every validator; coordinators do not run. */
    std::vector<chain::CMessageResult> ApplyBlock(const Optional<chain::CStoredConfiguration>& config = nullopt);

    /** Run every coordinator on the current tip and queue its messages. Returns the number queued. */
    size_t RunHandlers();

    /** ApplyBlock followed by RunHandlers. */
    std::vector<chain::CMessageResult> NextBlock(const Optional<chain::CStoredConfiguration>& config = nullopt);

    /** Produce blocks until the chain reaches the height. */
    void RunUntil(uint64_t height);

    uint64_t Height() const;
    uint256 BlockHash(uint64_t height) const;
    std::unique_ptr<chain::CStorageView> Snapshot(uint32_t v = 0) const;

    /** Multisig script of the active anchoring configuration. */
    btc::CScript ScriptPubKey() const;

    /**
     * Give the listed validators new Bitcoin keys and return the next stored
     * configuration, active from actualFrom. Node configurations learn the
     * new keys right away.
     */
    chain::CStoredConfiguration PrepareRekey(const std::vector<uint32_t>& rekeyed, uint64_t actualFrom,
                                             anchoring::AnchoringConfig& next);
};

#endif // ANCHORING_TEST_UTIL_TESTNETWORK_H
