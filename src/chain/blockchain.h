// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_CHAIN_BLOCKCHAIN_H
#define ANCHORING_CHAIN_BLOCKCHAIN_H

#include "chain/config.h"
#include "chain/message.h"
#include "chain/schema.h"
#include "chain/service.h"
#include "chain/storage.h"
#include "dbwrapper.h"
#include "optional.h"
#include "sync.h"

#include <memory>
#include <string>
#include <vector>

namespace chain {

/** Proposed block contents, as agreed by host consensus. */
struct CBlockTemplate {
    std::vector<CRawMessage> messages;
    //! configuration to schedule in this block, if any
    Optional<CStoredConfiguration> config;
};

enum class MessageStatus {
    COMMITTED,
    REJECTED,     //!< failed decoding, signature check or execution; no writes kept
    DUPLICATE,    //!< already committed in an earlier block or earlier in this one
};

struct CMessageResult {
    uint256 hash;
    MessageStatus status;
    std::string reason;
};

/**
 * The host chain as seen by one validator.
 *
 * Consensus is out of scope: blocks arrive already agreed and every
 * validator applies the same sequence. Application is deterministic, and
 * the block hash commits to the resulting service state.
 */
class CBlockchain
{
private:
    CDBWrapper& db;
    std::vector<std::shared_ptr<CService>> services;
    mutable RecursiveMutex cs_chain;

    const CService* FindService(uint16_t serviceId) const;
    uint256 ComputeStateHash(CStorageView& view) const;

public:
    CBlockchain(CDBWrapper& dbIn, std::vector<std::shared_ptr<CService>> servicesIn);

    bool IsInitialized() const;

    /**
     * Commit block 0: store the genesis configuration and let every service
     * initialise its tables from its configuration section. Throws
     * std::runtime_error when the chain already has a genesis block or the
     * configuration is not a valid genesis configuration.
     */
    CBlockHeader CreateGenesisBlock(const CStoredConfiguration& cfg);

    /**
     * Apply and commit the next block. Every message is executed on its own
     * fork; a rejected message leaves no trace while the block goes on.
     * Storage faults propagate and leave the database untouched.
     */
    CBlockHeader ApplyBlock(const CBlockTemplate& block, std::vector<CMessageResult>* results = nullptr);

    uint64_t Height() const;
    uint256 LastBlockHash() const;
    bool IsCommitted(const uint256& messageHash) const;

    /** Read-only view of the committed state, unaffected by later blocks. */
    std::unique_ptr<CStorageView> Snapshot() const;
};

} // namespace chain

#endif // ANCHORING_CHAIN_BLOCKCHAIN_H
