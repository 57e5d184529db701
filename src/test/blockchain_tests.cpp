// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/blockchain.h"
#include "chain/config.h"
#include "chain/hostkey.h"
#include "chain/message.h"
#include "chain/schema.h"
#include "chain/txmempool.h"
#include "hash.h"
#include "random.h"
#include "test/test_anchoring.h"

#include <boost/test/unit_test.hpp>

using namespace chain;

static CStoredConfiguration MakeGenesis(size_t n)
{
    CStoredConfiguration cfg;
    for (size_t i = 0; i < n; i++) {
        CHostKey key;
        key.MakeNewKey();
        cfg.validator_keys.push_back(key.GetPubKey());
    }
    return cfg;
}

static CRawMessage MakeMessage(uint16_t serviceId)
{
    CHostKey key;
    key.MakeNewKey();
    CMessageWriter writer(serviceId, 0, 8);
    writer.WriteU64(0, GetRand(1000000));
    return writer.Sign(key);
}

BOOST_FIXTURE_TEST_SUITE(blockchain_tests, DBTestingSetup)

// =============================================================================
// Genesis and blocks
// =============================================================================
BOOST_AUTO_TEST_CASE(genesis_and_heights)
{
    CBlockchain blockchain(*db, {});
    BOOST_CHECK(!blockchain.IsInitialized());
    BOOST_CHECK_THROW(blockchain.ApplyBlock(CBlockTemplate()), std::runtime_error);

    CStoredConfiguration genesis = MakeGenesis(3);
    CBlockHeader header = blockchain.CreateGenesisBlock(genesis);
    BOOST_CHECK(blockchain.IsInitialized());
    BOOST_CHECK_EQUAL(header.height, 0U);
    BOOST_CHECK_EQUAL(blockchain.Height(), 0U);
    BOOST_CHECK(blockchain.LastBlockHash() == header.GetHash());
    BOOST_CHECK_THROW(blockchain.CreateGenesisBlock(genesis), std::runtime_error);

    CBlockHeader next = blockchain.ApplyBlock(CBlockTemplate());
    BOOST_CHECK_EQUAL(next.height, 1U);
    BOOST_CHECK(next.prev_hash == header.GetHash());
    BOOST_CHECK(next.tx_hash.IsNull());
    BOOST_CHECK(next.state_hash == header.state_hash);

    std::unique_ptr<CStorageView> snapshot = blockchain.Snapshot();
    CCoreSchema core(*snapshot);
    BOOST_CHECK_EQUAL(core.BlockCount(), 2U);
    BOOST_CHECK(*core.BlockHash(1) == next.GetHash());
    BOOST_CHECK(!core.BlockHash(2));
    BOOST_CHECK(core.GetActualConfiguration().GetHash() == genesis.GetHash());
    BOOST_CHECK_EQUAL(core.GetActualConfiguration().FindValidator(genesis.validator_keys[2]), 2);
}

BOOST_AUTO_TEST_CASE(unknown_service_is_rejected)
{
    CBlockchain blockchain(*db, {});
    blockchain.CreateGenesisBlock(MakeGenesis(1));

    CBlockTemplate block;
    block.messages.push_back(MakeMessage(42));
    std::vector<CMessageResult> results;
    CBlockHeader header = blockchain.ApplyBlock(block, &results);
    BOOST_REQUIRE_EQUAL(results.size(), 1U);
    BOOST_CHECK(results[0].status == MessageStatus::REJECTED);
    BOOST_CHECK_EQUAL(results[0].reason, MessageErrorString(MessageError::IncorrectServiceId));
    BOOST_CHECK(header.tx_hash.IsNull());
    BOOST_CHECK(!blockchain.IsCommitted(results[0].hash));
}

BOOST_AUTO_TEST_CASE(configuration_schedule)
{
    CBlockchain blockchain(*db, {});
    CStoredConfiguration genesis = MakeGenesis(2);
    blockchain.CreateGenesisBlock(genesis);

    CStoredConfiguration next = MakeGenesis(3);
    next.actual_from = 5;

    // must name its predecessor
    CBlockTemplate block;
    block.config = next;
    BOOST_CHECK_THROW(blockchain.ApplyBlock(block), std::runtime_error);
    BOOST_CHECK_EQUAL(blockchain.Height(), 0U);

    next.previous_cfg_hash = genesis.GetHash();
    block.config = next;
    blockchain.ApplyBlock(block);
    {
        std::unique_ptr<CStorageView> snapshot = blockchain.Snapshot();
        CCoreSchema core(*snapshot);
        BOOST_CHECK(core.GetActualConfiguration().GetHash() == genesis.GetHash());
        BOOST_CHECK(core.GetFollowingConfiguration()->GetHash() == next.GetHash());
    }

    // actual_from has to grow
    CStoredConfiguration stale = MakeGenesis(1);
    stale.previous_cfg_hash = next.GetHash();
    stale.actual_from = 5;
    block.config = stale;
    BOOST_CHECK_THROW(blockchain.ApplyBlock(block), std::runtime_error);

    while (blockchain.Height() < 4) {
        blockchain.ApplyBlock(CBlockTemplate());
    }
    std::unique_ptr<CStorageView> snapshot = blockchain.Snapshot();
    CCoreSchema core(*snapshot);
    BOOST_CHECK(core.GetActualConfiguration().GetHash() == next.GetHash());
    BOOST_CHECK(!core.GetFollowingConfiguration());
}

BOOST_AUTO_TEST_CASE(stored_configuration_json)
{
    CStoredConfiguration cfg = MakeGenesis(2);
    cfg.actual_from = 10;
    cfg.previous_cfg_hash = GetRandHash();
    UniValue section(UniValue::VOBJ);
    section.pushKV("frequency", 100);
    cfg.services[3] = section;

    CStoredConfiguration parsed = CStoredConfiguration::FromJSON(cfg.ToJSON());
    BOOST_CHECK(parsed.GetHash() == cfg.GetHash());
    BOOST_CHECK_EQUAL(parsed.actual_from, 10U);
    BOOST_CHECK(parsed.validator_keys == cfg.validator_keys);
    BOOST_CHECK_EQUAL(parsed.GetServiceConfig(3)["frequency"].get_int(), 100);
    BOOST_CHECK(parsed.GetServiceConfig(4).isNull());
    BOOST_CHECK_THROW(CStoredConfiguration::FromJSON("{\"actual_from\": \"x\"}"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(merkle_root_of_message_hashes)
{
    BOOST_CHECK(ComputeMerkleRoot({}).IsNull());
    uint256 a = GetRandHash(), b = GetRandHash(), c = GetRandHash();
    BOOST_CHECK(ComputeMerkleRoot({a}) == a);
    uint256 ab = Hash(a.begin(), a.end(), b.begin(), b.end());
    BOOST_CHECK(ComputeMerkleRoot({a, b}) == ab);
    uint256 cc = Hash(c.begin(), c.end(), c.begin(), c.end());
    BOOST_CHECK(ComputeMerkleRoot({a, b, c}) == Hash(ab.begin(), ab.end(), cc.begin(), cc.end()));
}

// =============================================================================
// Mempool
// =============================================================================
BOOST_AUTO_TEST_CASE(mempool_order_and_removal)
{
    CTxMemPool mempool;
    CRawMessage first = MakeMessage(3), second = MakeMessage(3), third = MakeMessage(3);
    BOOST_CHECK(mempool.Add(first));
    BOOST_CHECK(mempool.Add(second));
    BOOST_CHECK(!mempool.Add(first));
    BOOST_CHECK(mempool.Add(third));
    BOOST_CHECK_EQUAL(mempool.Size(), 3U);

    std::vector<CRawMessage> messages = mempool.GetMessages();
    BOOST_REQUIRE_EQUAL(messages.size(), 3U);
    BOOST_CHECK(messages[0] == first);
    BOOST_CHECK(messages[2] == third);
    BOOST_CHECK_EQUAL(mempool.GetMessages(2).size(), 2U);

    mempool.RemoveForBlock({first.GetHash(), third.GetHash()});
    BOOST_CHECK_EQUAL(mempool.Size(), 1U);
    BOOST_CHECK(mempool.Contains(second.GetHash()));
    BOOST_CHECK(!mempool.Contains(first.GetHash()));

    mempool.Clear();
    BOOST_CHECK(mempool.Empty());
}

BOOST_AUTO_TEST_SUITE_END()
