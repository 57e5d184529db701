// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "anchoring/messages.h"
#include "anchoring/multisig.h"
#include "anchoring/schema.h"
#include "anchoring/service.h"
#include "consensus/validation.h"
#include "test/test_anchoring.h"
#include "test/util/testnetwork.h"

#include <boost/test/unit_test.hpp>

using namespace anchoring;

struct ServiceTestingSetup : public BasicTestingSetup {
    CTestNetwork net;
    CBitcoinTx proposal;

    ServiceTestingSetup() : net(pathTemp, 4, 100)
    {
        // validator 1 proposes for height 100 and its signature is pending
        net.RunUntil(100);
        std::vector<chain::CRawMessage> pending = net.mempool.GetMessages();
        BOOST_REQUIRE_EQUAL(pending.size(), 1U);
        CAnchoringSignature sig;
        BOOST_REQUIRE(CAnchoringSignature::Decode(pending[0], sig) == chain::MessageError::OK);
        proposal = sig.Tx();
        net.mempool.Clear();
    }

    chain::CRawMessage SignatureFrom(uint32_t v, uint32_t input = 0)
    {
        std::vector<unsigned char> sig;
        BOOST_REQUIRE(SignInput(proposal, input, net.cfg.RedeemScript(), net.Validator(v).btcKey, sig));
        return CAnchoringSignature::Create(net.Validator(v).hostKey, v, proposal, input, sig).Raw();
    }

    chain::CMessageResult Submit(const chain::CRawMessage& raw)
    {
        BOOST_REQUIRE(net.mempool.Add(raw));
        std::vector<chain::CMessageResult> results = net.ApplyBlock();
        BOOST_REQUIRE_EQUAL(results.size(), 1U);
        return results[0];
    }

    size_t SignatureCount()
    {
        std::unique_ptr<chain::CStorageView> snapshot = net.Snapshot();
        return CAnchoringSchema(*snapshot).Signatures(proposal.GetId()).Len();
    }
};

BOOST_FIXTURE_TEST_SUITE(anchoring_service_tests, ServiceTestingSetup)

// =============================================================================
// Signature execution
// =============================================================================
BOOST_AUTO_TEST_CASE(signature_binds_proposal_to_signer_lect)
{
    chain::CMessageResult result = Submit(SignatureFrom(0));
    BOOST_CHECK(result.status == chain::MessageStatus::COMMITTED);
    BOOST_CHECK_EQUAL(SignatureCount(), 1U);

    std::unique_ptr<chain::CStorageView> snapshot = net.Snapshot();
    CAnchoringSchema schema(*snapshot);
    BOOST_CHECK(*schema.ProposalLect(proposal.GetId()) == net.cfg.funding_tx.GetId());
    std::vector<uint256> proposals = schema.Proposals(net.cfg.funding_tx.GetId()).Values();
    BOOST_REQUIRE_EQUAL(proposals.size(), 1U);
    BOOST_CHECK(proposals[0] == proposal.GetId());
}

BOOST_AUTO_TEST_CASE(duplicate_signatures_are_kept_once)
{
    const chain::CRawMessage raw = SignatureFrom(0);

    // the mempool keeps one copy
    BOOST_CHECK(net.mempool.Add(raw));
    BOOST_CHECK(!net.mempool.Add(raw));
    BOOST_CHECK_EQUAL(net.mempool.Size(), 1U);
    net.mempool.Clear();

    // the same bytes twice in one block
    chain::CBlockTemplate block;
    block.messages = {raw, raw};
    std::vector<chain::CMessageResult> results;
    net.Validator(0).blockchain->ApplyBlock(block, &results);
    BOOST_REQUIRE_EQUAL(results.size(), 2U);
    BOOST_CHECK(results[0].status == chain::MessageStatus::COMMITTED);
    BOOST_CHECK(results[1].status == chain::MessageStatus::DUPLICATE);

    // executed again by the service itself
    CAnchoringSignature sig;
    BOOST_REQUIRE(CAnchoringSignature::Decode(raw, sig) == chain::MessageError::OK);
    {
        chain::CStorageView view(*net.Validator(0).db);
        CAnchoringService service;
        CValidationState state;
        BOOST_CHECK(service.ExecuteSignature(sig, view, state));
        BOOST_CHECK(state.IsValid());
        BOOST_CHECK_EQUAL(CAnchoringSchema(view).Signatures(proposal.GetId()).Len(), 1U);
    }
}

BOOST_AUTO_TEST_CASE(signature_sender_checks)
{
    std::vector<unsigned char> sig;
    BOOST_REQUIRE(SignInput(proposal, 0, net.cfg.RedeemScript(), net.Validator(0).btcKey, sig));

    chain::CMessageResult result = Submit(CAnchoringSignature::Create(net.Validator(0).hostKey, 7, proposal, 0, sig).Raw());
    BOOST_CHECK(result.status == chain::MessageStatus::REJECTED);
    BOOST_CHECK_EQUAL(result.reason, "bad-validator-index");

    result = Submit(CAnchoringSignature::Create(net.Validator(0).hostKey, 2, proposal, 0, sig).Raw());
    BOOST_CHECK(result.status == chain::MessageStatus::REJECTED);
    BOOST_CHECK_EQUAL(result.reason, "bad-validator-key");

    result = Submit(CAnchoringSignature::Create(net.Validator(0).hostKey, 0, proposal, 3, sig).Raw());
    BOOST_CHECK(result.status == chain::MessageStatus::REJECTED);
    BOOST_CHECK_EQUAL(result.reason, "bad-input-index");

    CBitcoinTx deposit(CreateDepositTx(net.ScriptPubKey(), 1000));
    result = Submit(CAnchoringSignature::Create(net.Validator(0).hostKey, 0, deposit, 0, sig).Raw());
    BOOST_CHECK(result.status == chain::MessageStatus::REJECTED);
    BOOST_CHECK_EQUAL(result.reason, "bad-anchoring-tx");

    // a signature made by another validator's key is ignored
    std::vector<unsigned char> foreign;
    BOOST_REQUIRE(SignInput(proposal, 0, net.cfg.RedeemScript(), net.Validator(3).btcKey, foreign));
    result = Submit(CAnchoringSignature::Create(net.Validator(0).hostKey, 0, proposal, 0, foreign).Raw());
    BOOST_CHECK(result.status == chain::MessageStatus::COMMITTED);
    BOOST_CHECK_EQUAL(SignatureCount(), 0U);
}

BOOST_AUTO_TEST_CASE(stale_signature_is_ignored)
{
    BOOST_CHECK(Submit(SignatureFrom(1)).status == chain::MessageStatus::COMMITTED);
    BOOST_CHECK_EQUAL(SignatureCount(), 1U);

    // validator 2 has already moved on to another lect
    CBitcoinTx other(CreateDepositTx(net.ScriptPubKey(), 3000));
    chain::CRawMessage update = CAnchoringUpdateLatest::Create(net.Validator(2).hostKey, 2, other, 2).Raw();
    BOOST_CHECK(Submit(update).status == chain::MessageStatus::COMMITTED);

    chain::CMessageResult result = Submit(SignatureFrom(2));
    BOOST_CHECK(result.status == chain::MessageStatus::COMMITTED);
    BOOST_CHECK_EQUAL(SignatureCount(), 1U);

    BOOST_CHECK(Submit(SignatureFrom(0)).status == chain::MessageStatus::COMMITTED);
    BOOST_CHECK_EQUAL(SignatureCount(), 2U);
}

// =============================================================================
// UpdateLatest execution
// =============================================================================
BOOST_AUTO_TEST_CASE(update_latest_counts)
{
    CBitcoinTx next(CreateDepositTx(net.ScriptPubKey(), 3000));
    chain::CHostKey& key = net.Validator(0).hostKey;

    chain::CMessageResult result = Submit(CAnchoringUpdateLatest::Create(key, 0, next, 1).Raw());
    BOOST_CHECK(result.status == chain::MessageStatus::REJECTED);
    BOOST_CHECK_EQUAL(result.reason, "bad-lect-count");

    result = Submit(CAnchoringUpdateLatest::Create(key, 0, next, 3).Raw());
    BOOST_CHECK(result.status == chain::MessageStatus::REJECTED);
    BOOST_CHECK_EQUAL(result.reason, "bad-lect-count");

    result = Submit(CAnchoringUpdateLatest::Create(key, 0, net.cfg.funding_tx, 2).Raw());
    BOOST_CHECK(result.status == chain::MessageStatus::REJECTED);
    BOOST_CHECK_EQUAL(result.reason, "lect-already-known");

    result = Submit(CAnchoringUpdateLatest::Create(key, 0, next, 2).Raw());
    BOOST_CHECK(result.status == chain::MessageStatus::COMMITTED);

    std::unique_ptr<chain::CStorageView> snapshot = net.Snapshot();
    CAnchoringSchema schema(*snapshot);
    BOOST_CHECK_EQUAL(schema.Lects(0).Len(), 2U);
    BOOST_CHECK(*schema.Lect(0) == next);
    BOOST_CHECK(*schema.PrevLect(0) == net.cfg.funding_tx);
    BOOST_CHECK_EQUAL(*schema.FindLectPosition(0, next.GetId()), 1U);
    BOOST_CHECK_EQUAL(schema.Lects(1).Len(), 1U);

    // one validator is not a majority
    BOOST_CHECK(*schema.CollectLects(net.cfg) == net.cfg.funding_tx);
}

BOOST_AUTO_TEST_CASE(majority_lect_needs_threshold)
{
    CBitcoinTx next(CreateDepositTx(net.ScriptPubKey(), 3000));
    for (uint32_t v = 0; v < 2; v++) {
        Submit(CAnchoringUpdateLatest::Create(net.Validator(v).hostKey, v, next, 2).Raw());
    }
    {
        std::unique_ptr<chain::CStorageView> snapshot = net.Snapshot();
        // two on each side, threshold three
        BOOST_CHECK(!CAnchoringSchema(*snapshot).CollectLects(net.cfg));
    }
    Submit(CAnchoringUpdateLatest::Create(net.Validator(2).hostKey, 2, next, 2).Raw());
    std::unique_ptr<chain::CStorageView> snapshot = net.Snapshot();
    BOOST_CHECK(*CAnchoringSchema(*snapshot).CollectLects(net.cfg) == next);
}

BOOST_AUTO_TEST_CASE(state_hash_follows_lects)
{
    std::unique_ptr<chain::CStorageView> before = net.Snapshot();
    std::vector<uint256> hashes = CAnchoringSchema(*before).StateHash();
    BOOST_REQUIRE_EQUAL(hashes.size(), 4U);
    BOOST_CHECK(hashes[0] == hashes[1]);

    CBitcoinTx next(CreateDepositTx(net.ScriptPubKey(), 3000));
    Submit(CAnchoringUpdateLatest::Create(net.Validator(0).hostKey, 0, next, 2).Raw());
    std::unique_ptr<chain::CStorageView> after = net.Snapshot();
    std::vector<uint256> changed = CAnchoringSchema(*after).StateHash();
    BOOST_CHECK(changed[0] != hashes[0]);
    BOOST_CHECK(changed[1] == hashes[1]);
}

BOOST_AUTO_TEST_SUITE_END()
