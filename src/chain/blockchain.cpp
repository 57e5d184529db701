// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/blockchain.h"

#include "consensus/validation.h"
#include "hash.h"
#include "logging.h"

#include <set>
#include <stdexcept>

namespace chain {

CBlockchain::CBlockchain(CDBWrapper& dbIn, std::vector<std::shared_ptr<CService>> servicesIn)
    : db(dbIn), services(std::move(servicesIn))
{
    std::set<uint16_t> ids;
    for (const auto& service : services) {
        if (!ids.insert(service->GetServiceId()).second) {
            throw std::logic_error(strprintf("CBlockchain: service id %d registered twice", service->GetServiceId()));
        }
        if (service->GetServiceId() == CORE_SERVICE_TAG) {
            throw std::logic_error("CBlockchain: service id 0 is reserved for the core schema");
        }
    }
}

const CService* CBlockchain::FindService(uint16_t serviceId) const
{
    for (const auto& service : services) {
        if (service->GetServiceId() == serviceId) return service.get();
    }
    return nullptr;
}

uint256 CBlockchain::ComputeStateHash(CStorageView& view) const
{
    CHashWriter ss(SER_GETHASH, PROTOCOL_VERSION);
    CCoreSchema core(view);
    ss << core.ConfigSchedule().Len();
    for (const auto& service : services) {
        ss << service->GetServiceId() << service->StateHashes(view);
    }
    return ss.GetHash();
}

bool CBlockchain::IsInitialized() const
{
    LOCK(cs_chain);
    CStorageView root(db);
    return CCoreSchema(root).BlockCount() > 0;
}

CBlockHeader CBlockchain::CreateGenesisBlock(const CStoredConfiguration& cfg)
{
    LOCK(cs_chain);

    CStorageView root(db);
    CCoreSchema core(root);
    if (core.BlockCount() > 0)
        throw std::runtime_error("CreateGenesisBlock: the chain already has a genesis block");

    std::string strError;
    if (!core.CommitConfiguration(cfg, strError))
        throw std::runtime_error("CreateGenesisBlock: " + strError);

    for (const auto& service : services) {
        service->HandleGenesis(root, cfg.GetServiceConfig(service->GetServiceId()));
    }

    CBlockHeader header;
    header.height = 0;
    header.tx_hash = ComputeMerkleRoot({});
    header.state_hash = ComputeStateHash(root);

    uint256 hash = header.GetHash();
    core.BlockHashes().Append(hash);
    core.BlockHeaders().Put(header.height, header);
    root.Flush(true);

    LogPrintf("Genesis block %s created with %u validators\n", hash.ToString(), cfg.validator_keys.size());
    return header;
}

CBlockHeader CBlockchain::ApplyBlock(const CBlockTemplate& block, std::vector<CMessageResult>* results)
{
    LOCK(cs_chain);

    CStorageView root(db);
    CStorageView fork(root);
    CCoreSchema core(fork);

    Optional<CBlockHeader> prev = core.LastBlock();
    if (!prev)
        throw std::runtime_error("ApplyBlock: the chain has no genesis block");

    const uint64_t height = prev->height + 1;
    std::vector<uint256> committed;
    std::set<uint256> seen;

    for (const CRawMessage& raw : block.messages) {
        CMessageResult result;
        result.hash = raw.GetHash();

        if (core.IsCommitted(result.hash) || seen.count(result.hash)) {
            result.status = MessageStatus::DUPLICATE;
            LogPrint(BCLog::CHAIN, "ApplyBlock: skipping duplicate message %s\n", result.hash.ToString());
            if (results) results->push_back(result);
            continue;
        }
        seen.insert(result.hash);

        const CService* service = FindService(raw.ServiceId());
        MessageError err = service ? service->VerifyMessage(raw) : MessageError::IncorrectServiceId;
        if (err != MessageError::OK) {
            result.status = MessageStatus::REJECTED;
            result.reason = MessageErrorString(err);
            LogPrint(BCLog::CHAIN, "ApplyBlock: message %s rejected: %s\n", result.hash.ToString(), result.reason);
            if (results) results->push_back(result);
            continue;
        }

        CStorageView messageFork(fork);
        CValidationState state;
        if (service->ExecuteMessage(raw, messageFork, state) && state.IsValid()) {
            messageFork.Merge();
            core.AddCommittedMessage(result.hash, height);
            committed.push_back(result.hash);
            result.status = MessageStatus::COMMITTED;
        } else {
            messageFork.Rollback();
            result.status = MessageStatus::REJECTED;
            result.reason = state.GetRejectReason();
            LogPrintf("ApplyBlock: %s message %s rejected: %s\n", service->GetServiceName(),
                      result.hash.ToString(), state.GetRejectReason());
        }
        if (results) results->push_back(result);
    }

    if (block.config) {
        std::string strError;
        if (!core.CommitConfiguration(*block.config, strError))
            throw std::runtime_error("ApplyBlock: invalid configuration: " + strError);
        LogPrintf("Configuration %s scheduled from height %d\n", block.config->GetHash().ToString(), block.config->actual_from);
    }

    CBlockHeader header;
    header.height = height;
    header.prev_hash = prev->GetHash();
    header.tx_hash = ComputeMerkleRoot(committed);
    header.state_hash = ComputeStateHash(fork);

    uint256 hash = header.GetHash();
    core.BlockHashes().Append(hash);
    core.BlockHeaders().Put(header.height, header);

    fork.Merge();
    root.Flush(true);

    LogPrint(BCLog::CHAIN, "Block %d %s committed (%u of %u messages)\n", height, hash.ToString(),
             committed.size(), block.messages.size());
    return header;
}

uint64_t CBlockchain::Height() const
{
    LOCK(cs_chain);
    CStorageView root(db);
    return CCoreSchema(root).Height();
}

uint256 CBlockchain::LastBlockHash() const
{
    LOCK(cs_chain);
    CStorageView root(db);
    Optional<CBlockHeader> last = CCoreSchema(root).LastBlock();
    return last ? last->GetHash() : uint256();
}

bool CBlockchain::IsCommitted(const uint256& messageHash) const
{
    LOCK(cs_chain);
    CStorageView root(db);
    return CCoreSchema(root).IsCommitted(messageHash);
}

std::unique_ptr<CStorageView> CBlockchain::Snapshot() const
{
    LOCK(cs_chain);
    return CStorageView::Snapshot(db);
}

} // namespace chain
