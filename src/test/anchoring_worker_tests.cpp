// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "anchoring/handler.h"
#include "anchoring/worker.h"
#include "chain/txmempool.h"
#include "test/test_anchoring.h"
#include "test/util/testnetwork.h"
#include "util/system.h"
#include "utiltime.h"

#include <boost/test/unit_test.hpp>

using namespace anchoring;

struct WorkerTestingSetup : public BasicTestingSetup {
    CTestNetwork net;
    chain::CTxMemPool mempool;

    WorkerTestingSetup() : net(pathTemp, 4, 100) {}

    /** Fresh coordinator of validator v, so its first run talks to the node. */
    std::unique_ptr<CAnchoringHandler> MakeHandler(uint32_t v)
    {
        CTestValidator& validator = net.Validator(v);
        return std::unique_ptr<CAnchoringHandler>(new CAnchoringHandler(validator.hostKey, validator.nodeCfg, net.bitcoind));
    }
};

BOOST_FIXTURE_TEST_SUITE(anchoring_worker_tests, WorkerTestingSetup)

// =============================================================================
// Backoff
// =============================================================================
BOOST_AUTO_TEST_CASE(retry_delay_doubles_and_resets)
{
    std::unique_ptr<CAnchoringHandler> handler = MakeHandler(0);
    CAnchoringWorker worker(*net.Validator(0).blockchain, mempool, *handler);
    BOOST_CHECK_EQUAL(worker.GetRetryDelay(), 0);

    net.bitcoind.FailNextCalls(3);
    BOOST_CHECK(!worker.RunOnce());
    BOOST_CHECK_EQUAL(worker.GetRetryDelay(), DEFAULT_ANCHORING_RETRY_MIN);
    BOOST_CHECK(!worker.RunOnce());
    BOOST_CHECK_EQUAL(worker.GetRetryDelay(), 2 * DEFAULT_ANCHORING_RETRY_MIN);
    BOOST_CHECK(!worker.RunOnce());
    BOOST_CHECK_EQUAL(worker.GetRetryDelay(), 4 * DEFAULT_ANCHORING_RETRY_MIN);

    AnchoringWorkerStatus status = worker.GetStatus();
    BOOST_CHECK_EQUAL(status.failures, 3U);
    BOOST_CHECK(status.lastError.find("couldn't connect") != std::string::npos);
    BOOST_CHECK_EQUAL(status.lastSuccessTime, 0);

    BOOST_CHECK(worker.RunOnce());
    BOOST_CHECK_EQUAL(worker.GetRetryDelay(), 0);
    status = worker.GetStatus();
    BOOST_CHECK(status.lastError.empty());
    BOOST_CHECK_EQUAL(status.lastSuccessTime, GetTime());
    BOOST_CHECK(net.bitcoind.IsWatched(net.cfg.Address()));
}

BOOST_AUTO_TEST_CASE(retry_delay_is_capped)
{
    gArgs.ForceSetArg("-anchoringretrymin", "2");
    gArgs.ForceSetArg("-anchoringretrymax", "5");
    std::unique_ptr<CAnchoringHandler> handler = MakeHandler(0);
    CAnchoringWorker worker(*net.Validator(0).blockchain, mempool, *handler);

    net.bitcoind.FailNextCalls(5);
    const int64_t expected[] = {2, 4, 5, 5, 5};
    for (int64_t delay : expected) {
        BOOST_CHECK(!worker.RunOnce());
        BOOST_CHECK_EQUAL(worker.GetRetryDelay(), delay);
    }
    BOOST_CHECK(worker.RunOnce());
    BOOST_CHECK_EQUAL(worker.GetRetryDelay(), 0);
}

BOOST_AUTO_TEST_CASE(node_faults_do_not_reach_the_chain)
{
    net.RunUntil(99);
    net.ApplyBlock();
    net.mempool.Clear();

    // the proposer of height 100 cannot reach its node
    std::unique_ptr<CAnchoringHandler> handler = MakeHandler(1);
    CAnchoringWorker worker(*net.Validator(1).blockchain, mempool, *handler);
    net.bitcoind.FailNextCalls(1);
    BOOST_CHECK(!worker.RunOnce());
    BOOST_CHECK(mempool.Empty());
    BOOST_CHECK_EQUAL(net.Height(), 100U);

    // the next run proposes, and a repeated run adds nothing new
    BOOST_CHECK(worker.RunOnce());
    BOOST_CHECK_EQUAL(mempool.Size(), 1U);
    BOOST_CHECK(worker.RunOnce());
    BOOST_CHECK_EQUAL(mempool.Size(), 1U);
    BOOST_CHECK_EQUAL(worker.GetStatus().messagesSent, 1U);
    BOOST_CHECK(handler->GetState() == AnchoringState::COLLECTING_SIGNATURES);

    UniValue json = worker.GetStatusJSON();
    BOOST_CHECK_EQUAL(find_value(json, "messages_sent").get_int64(), 1);
    BOOST_CHECK_EQUAL(find_value(find_value(json, "coordinator"), "state").get_str(), "collecting-signatures");
}

// =============================================================================
// Background thread
// =============================================================================
BOOST_AUTO_TEST_CASE(worker_thread_runs_on_new_blocks)
{
    std::unique_ptr<CAnchoringHandler> handler = MakeHandler(1);
    CAnchoringWorker worker(*net.Validator(1).blockchain, mempool, *handler);
    worker.Start();
    BOOST_CHECK(worker.IsRunning());

    net.RunUntil(99);
    net.ApplyBlock();
    worker.NotifyBlock();
    for (int i = 0; i < 500 && mempool.Empty(); i++) {
        MilliSleep(10);
    }
    BOOST_CHECK_EQUAL(mempool.Size(), 1U);

    worker.Stop();
    BOOST_CHECK(!worker.IsRunning());
    BOOST_CHECK(!worker.GetStatus().active);
}

BOOST_AUTO_TEST_SUITE_END()
