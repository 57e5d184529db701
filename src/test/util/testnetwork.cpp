// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "test/util/testnetwork.h"

#include "anchoring/messages.h"
#include "anchoring/service.h"
#include "chain/schema.h"
#include "tinyformat.h"

#include <stdexcept>

using namespace anchoring;

CTestNetwork::CTestNetwork(const fs::path& dirIn, size_t n, uint64_t frequency, CAmount funding)
    : dir(dirIn), service(std::make_shared<CAnchoringService>())
{
    for (size_t i = 0; i < n; i++) {
        std::unique_ptr<CTestValidator> validator(new CTestValidator());
        validator->hostKey.MakeNewKey();
        validator->btcKey.MakeNewKey();
        validator->nodeCfg.rpc.host = "http://127.0.0.1:18332";
        genesis.validator_keys.push_back(validator->hostKey.GetPubKey());
        cfg.validators.push_back(validator->btcKey.GetPubKey());
        validators.push_back(std::move(validator));
    }
    cfg.threshold = AnchoringConfig::DefaultThreshold(n);
    cfg.network = btc::Network::TESTNET;
    cfg.frequency = frequency;
    cfg.funding_tx = bitcoind.Deposit(cfg.RedeemScript().ScriptPubKey(), funding, 1);
    genesis.services[ANCHORING_SERVICE_ID] = cfg.ToJSON();

    const std::string address = cfg.Address();
    for (size_t i = 0; i < n; i++) {
        CTestValidator& validator = *validators[i];
        validator.nodeCfg.private_keys[address] = btc::EncodeSecret(validator.btcKey, true);
        validator.db.reset(new CDBWrapper(dir / strprintf("validator%u", i), 1 << 20, true, true));
        validator.blockchain.reset(new chain::CBlockchain(*validator.db, {service}));
        validator.blockchain->CreateGenesisBlock(genesis);
        ResetHandler(validator);
    }
}

void CTestNetwork::ResetHandler(CTestValidator& validator)
{
    validator.handler.reset(new CAnchoringHandler(validator.hostKey, validator.nodeCfg, bitcoind));
}

std::vector<chain::CMessageResult> CTestNetwork::ApplyBlock(const Optional<chain::CStoredConfiguration>& config)
{
    chain::CBlockTemplate block;
    block.messages = mempool.GetMessages();
    block.config = config;

    std::vector<chain::CMessageResult> results;
    Optional<uint256> hash;
    for (size_t i = 0; i < validators.size(); i++) {
        std::vector<chain::CMessageResult> local;
        chain::CBlockHeader header = validators[i]->blockchain->ApplyBlock(block, &local);
        if (!hash) {
            hash = header.GetHash();
            results = local;
        } else if (*hash != header.GetHash()) {
            throw std::runtime_error(strprintf("validator %u diverged at height %u", i, header.height));
        }
    }

    std::vector<uint256> hashes;
    for (const chain::CRawMessage& raw : block.messages) {
        hashes.push_back(raw.GetHash());
    }
    mempool.RemoveForBlock(hashes);
    return results;
}

size_t CTestNetwork::RunHandlers()
{
    size_t nQueued = 0;
    for (uint32_t v = 0; v < validators.size(); v++) {
        std::unique_ptr<chain::CStorageView> snapshot = validators[v]->blockchain->Snapshot();
        for (const chain::CRawMessage& raw : validators[v]->handler->Process(*snapshot)) {
            if (setMuted.count(std::make_pair(v, raw.MessageType()))) continue;
            if (mempool.Add(raw)) nQueued++;
        }
    }
    return nQueued;
}

std::vector<chain::CMessageResult> CTestNetwork::NextBlock(const Optional<chain::CStoredConfiguration>& config)
{
    std::vector<chain::CMessageResult> results = ApplyBlock(config);
    RunHandlers();
    return results;
}

void CTestNetwork::RunUntil(uint64_t height)
{
    while (Height() < height) {
        NextBlock();
    }
}

uint64_t CTestNetwork::Height() const
{
    return validators[0]->blockchain->Height();
}

uint256 CTestNetwork::BlockHash(uint64_t height) const
{
    std::unique_ptr<chain::CStorageView> snapshot = Snapshot();
    Optional<uint256> hash = chain::CCoreSchema(*snapshot).BlockHash(height);
    if (!hash) throw std::runtime_error(strprintf("no block at height %u", height));
    return *hash;
}

std::unique_ptr<chain::CStorageView> CTestNetwork::Snapshot(uint32_t v) const
{
    return validators[v]->blockchain->Snapshot();
}

btc::CScript CTestNetwork::ScriptPubKey() const
{
    std::unique_ptr<chain::CStorageView> snapshot = Snapshot();
    return CAnchoringSchema(*snapshot).CurrentAnchoringConfig().RedeemScript().ScriptPubKey();
}

chain::CStoredConfiguration CTestNetwork::PrepareRekey(const std::vector<uint32_t>& rekeyed, uint64_t actualFrom,
                                                       AnchoringConfig& next)
{
    std::unique_ptr<chain::CStorageView> snapshot = Snapshot();
    chain::CCoreSchema core(*snapshot);
    chain::CStoredConfiguration current = core.GetActualConfiguration();

    next = CAnchoringSchema(*snapshot).CurrentAnchoringConfig();
    next.funding_tx = CBitcoinTx();
    std::vector<btc::CKey> keys;
    for (uint32_t v = 0; v < validators.size(); v++) {
        keys.push_back(validators[v]->btcKey);
    }
    for (uint32_t v : rekeyed) {
        keys[v].MakeNewKey();
        next.validators[v] = keys[v].GetPubKey();
    }

    const std::string address = next.Address();
    for (uint32_t v = 0; v < validators.size(); v++) {
        CTestValidator& validator = *validators[v];
        validator.btcKey = keys[v];
        validator.nodeCfg.private_keys[address] = btc::EncodeSecret(keys[v], true);
        ResetHandler(validator);
    }

    chain::CStoredConfiguration following = current;
    following.previous_cfg_hash = current.GetHash();
    following.actual_from = actualFrom;
    following.services[ANCHORING_SERVICE_ID] = next.ToJSON();
    return following;
}
