// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_CHAIN_SCHEMA_H
#define ANCHORING_CHAIN_SCHEMA_H

#include "chain/config.h"
#include "chain/tables.h"
#include "optional.h"
#include "serialize.h"
#include "uint256.h"

#include <cstdint>
#include <string>
#include <vector>

namespace chain {

static const uint8_t CORE_SERVICE_TAG = 0;

/** Entry of the configuration activation schedule. */
struct CConfigReference {
    uint64_t actual_from{0};
    uint256 cfg_hash;

    CConfigReference() {}
    CConfigReference(uint64_t actualFromIn, const uint256& cfgHashIn) : actual_from(actualFromIn), cfg_hash(cfgHashIn) {}

    SERIALIZE_METHODS(CConfigReference, obj) { READWRITE(obj.actual_from, obj.cfg_hash); }
};

/** Header of a committed host block. */
struct CBlockHeader {
    uint64_t height{0};
    uint256 prev_hash;
    uint256 tx_hash;     //!< merkle root of the committed message hashes
    uint256 state_hash;  //!< hash of all service state hashes after the block

    SERIALIZE_METHODS(CBlockHeader, obj) { READWRITE(obj.height, obj.prev_hash, obj.tx_hash, obj.state_hash); }

    uint256 GetHash() const;
};

/**
 * Tables the host chain keeps for itself, under service tag 0:
 *   00 01  block hashes by height (list)
 *   00 02  committed message hash -> height
 *   00 03  configuration hash -> configuration JSON
 *   00 04  activation schedule (list of CConfigReference, ascending actual_from)
 *   00 05  block headers by height
 */
class CCoreSchema
{
private:
    CStorageView& view;

public:
    explicit CCoreSchema(CStorageView& viewIn) : view(viewIn) {}

    CListTable<uint256> BlockHashes() const;
    CMapTable<uint256, uint64_t> CommittedMessages() const;
    CMapTable<uint256, std::string> Configurations() const;
    CListTable<CConfigReference> ConfigSchedule() const;
    CMapTable<uint64_t, CBlockHeader> BlockHeaders() const;

    /** Number of committed blocks, which is also the height of the next block. */
    uint64_t BlockCount() const;

    /** Height of the last committed block; 0 before genesis. */
    uint64_t Height() const;

    Optional<uint256> BlockHash(uint64_t height) const;
    Optional<CBlockHeader> LastBlock() const;

    /** Configuration in force for the next block. Throws std::logic_error before genesis. */
    CStoredConfiguration GetActualConfiguration() const;

    /** The first configuration scheduled after the actual one, if any. */
    Optional<CStoredConfiguration> GetFollowingConfiguration() const;

    Optional<CStoredConfiguration> GetConfiguration(const uint256& hash) const;

    /**
     * Store a configuration and append it to the schedule. The schedule must
     * stay ordered: actual_from has to exceed the last scheduled one, and
     * previous_cfg_hash has to name the last scheduled configuration.
     */
    bool CommitConfiguration(const CStoredConfiguration& cfg, std::string& strError);

    bool IsCommitted(const uint256& messageHash) const;
    void AddCommittedMessage(const uint256& messageHash, uint64_t height);
};

/** Bitcoin-style merkle root over a list of hashes; zero for an empty list. */
uint256 ComputeMerkleRoot(std::vector<uint256> hashes);

} // namespace chain

#endif // ANCHORING_CHAIN_SCHEMA_H
