// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "anchoring/worker.h"

#include "logging.h"
#include "util/system.h"
#include "utiltime.h"

#include <algorithm>
#include <chrono>

namespace anchoring {

UniValue AnchoringWorkerStatus::ToJSON() const
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("active", active);
    obj.pushKV("last_run", lastRunTime);
    obj.pushKV("last_success", lastSuccessTime);
    obj.pushKV("failures", (int64_t)failures);
    obj.pushKV("messages_sent", (int64_t)messagesSent);
    obj.pushKV("retry_delay", retryDelay);
    obj.pushKV("last_error", lastError);
    return obj;
}

CAnchoringWorker::CAnchoringWorker(chain::CBlockchain& chainIn, chain::CTxMemPool& mempoolIn, CAnchoringHandler& handlerIn)
    : blockchain(chainIn), mempool(mempoolIn), handler(handlerIn),
      nRetryMin(std::max<int64_t>(1, gArgs.GetArg("-anchoringretrymin", DEFAULT_ANCHORING_RETRY_MIN))),
      nRetryMax(std::max(nRetryMin, gArgs.GetArg("-anchoringretrymax", DEFAULT_ANCHORING_RETRY_MAX)))
{
}

CAnchoringWorker::~CAnchoringWorker()
{
    Stop();
}

void CAnchoringWorker::RecordFailure(const std::string& strError)
{
    std::lock_guard<std::mutex> lock(mutex);
    nFailures++;
    nRetryDelay = nRetryDelay == 0 ? nRetryMin : std::min(nRetryDelay * 2, nRetryMax);
    strLastError = strError;
    LogPrintf("anchoring: %s, retrying in %d s\n", strError, nRetryDelay);
}

bool CAnchoringWorker::RunOnce()
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        nLastRunTime = GetTime();
    }

    std::vector<chain::CRawMessage> messages;
    try {
        std::unique_ptr<chain::CStorageView> snapshot = blockchain.Snapshot();
        messages = handler.Process(*snapshot);
    } catch (const BitcoinRpcError& e) {
        RecordFailure(strprintf("bitcoin node error %d: %s", e.GetCode(), e.what()));
        return false;
    }

    uint64_t nAdded = 0;
    for (const chain::CRawMessage& raw : messages) {
        if (mempool.Add(raw)) nAdded++;
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (nRetryDelay != 0) {
        LogPrintf("anchoring: bitcoin node is back after %u failures\n", nFailures);
    }
    nRetryDelay = 0;
    strLastError.clear();
    nMessagesSent += nAdded;
    nLastSuccessTime = GetTime();
    if (nAdded > 0) {
        LogPrint(BCLog::ANCHORING, "anchoring: %u new messages in the mempool\n", nAdded);
    }
    return true;
}

void CAnchoringWorker::ThreadMain()
{
    while (fRunning.load()) {
        {
            std::unique_lock<std::mutex> lock(mutex);
            if (nRetryDelay > 0) {
                // blocks that arrive during the backoff are covered by the retry
                cond.wait_for(lock, std::chrono::seconds(nRetryDelay), [this] { return !fRunning.load(); });
            } else {
                cond.wait(lock, [this] { return fNewBlock || !fRunning.load(); });
            }
            fNewBlock = false;
        }
        if (!fRunning.load()) break;

        try {
            RunOnce();
        } catch (const std::exception& e) {
            RecordFailure(strprintf("exception: %s", e.what()));
        }
    }
    LogPrintf("anchoring: worker stopped\n");
}

void CAnchoringWorker::Start()
{
    if (fRunning.load()) {
        LogPrint(BCLog::ANCHORING, "anchoring: worker already running\n");
        return;
    }
    fRunning.store(true);
    {
        std::lock_guard<std::mutex> lock(mutex);
        fNewBlock = true;
    }
    LogPrintf("anchoring: worker started, retry delay %d..%d s\n", nRetryMin, nRetryMax);
    thread = std::thread([this]() { ThreadMain(); });
}

void CAnchoringWorker::Stop()
{
    if (!fRunning.load()) return;
    {
        std::lock_guard<std::mutex> lock(mutex);
        fRunning.store(false);
    }
    cond.notify_all();
    if (thread.joinable()) {
        thread.join();
    }
}

void CAnchoringWorker::NotifyBlock()
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        fNewBlock = true;
    }
    cond.notify_all();
}

int64_t CAnchoringWorker::GetRetryDelay() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return nRetryDelay;
}

AnchoringWorkerStatus CAnchoringWorker::GetStatus() const
{
    std::lock_guard<std::mutex> lock(mutex);
    AnchoringWorkerStatus status;
    status.active = fRunning.load();
    status.lastRunTime = nLastRunTime;
    status.lastSuccessTime = nLastSuccessTime;
    status.failures = nFailures;
    status.messagesSent = nMessagesSent;
    status.retryDelay = nRetryDelay;
    status.lastError = strLastError;
    return status;
}

UniValue CAnchoringWorker::GetStatusJSON() const
{
    UniValue obj = GetStatus().ToJSON();
    obj.pushKV("coordinator", handler.GetStatus());
    return obj;
}

} // namespace anchoring
