// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_ANCHORING_WORKER_H
#define ANCHORING_ANCHORING_WORKER_H

#include "anchoring/handler.h"
#include "chain/blockchain.h"
#include "chain/txmempool.h"

#include <univalue.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

namespace anchoring {

//! seconds before the first retry after a Bitcoin node failure
static const int64_t DEFAULT_ANCHORING_RETRY_MIN = 1;
//! upper bound of the retry delay in seconds
static const int64_t DEFAULT_ANCHORING_RETRY_MAX = 300;

struct AnchoringWorkerStatus {
    bool active{false};
    int64_t lastRunTime{0};
    int64_t lastSuccessTime{0};
    uint32_t failures{0};
    uint64_t messagesSent{0};
    int64_t retryDelay{0};
    std::string lastError;

    UniValue ToJSON() const;
};

/**
 * Auxiliary anchoring task of one validator.
 *
 * Runs the coordinator on a snapshot of the committed chain whenever a
 * block arrives and puts the resulting messages into the local mempool.
 * Bitcoin node faults never reach block application: they are recorded
 * and the next run is delayed by an exponential backoff
 * (-anchoringretrymin, doubling, at most -anchoringretrymax seconds).
 */
class CAnchoringWorker
{
private:
    chain::CBlockchain& blockchain;
    chain::CTxMemPool& mempool;
    CAnchoringHandler& handler;
    const int64_t nRetryMin;
    const int64_t nRetryMax;

    mutable std::mutex mutex;
    std::condition_variable cond;
    std::thread thread;
    std::atomic<bool> fRunning{false};
    bool fNewBlock{false};

    int64_t nLastRunTime{0};
    int64_t nLastSuccessTime{0};
    uint32_t nFailures{0};
    uint64_t nMessagesSent{0};
    int64_t nRetryDelay{0};
    std::string strLastError;

    void RecordFailure(const std::string& strError);
    void ThreadMain();

public:
    CAnchoringWorker(chain::CBlockchain& chainIn, chain::CTxMemPool& mempoolIn, CAnchoringHandler& handlerIn);
    ~CAnchoringWorker();

    void Start();
    void Stop();
    bool IsRunning() const { return fRunning.load(); }

    /** Wake the worker for a newly committed block. */
    void NotifyBlock();

    /**
     * Evaluate the coordinator once on the current tip. Returns false if
     * the Bitcoin node failed; the retry delay grows until a run succeeds.
     */
    bool RunOnce();

    /** Seconds to wait before the next attempt; 0 while the node is healthy. */
    int64_t GetRetryDelay() const;

    AnchoringWorkerStatus GetStatus() const;
    UniValue GetStatusJSON() const;
};

} // namespace anchoring

#endif // ANCHORING_ANCHORING_WORKER_H
