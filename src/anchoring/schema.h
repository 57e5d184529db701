// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_ANCHORING_SCHEMA_H
#define ANCHORING_ANCHORING_SCHEMA_H

#include "anchoring/config.h"
#include "anchoring/messages.h"
#include "anchoring/transactions.h"
#include "chain/schema.h"
#include "chain/storage.h"
#include "chain/tables.h"
#include "optional.h"
#include "uint256.h"

#include <cstdint>
#include <vector>

namespace anchoring {

static const uint8_t ANCHORING_SERVICE_TAG = (uint8_t)ANCHORING_SERVICE_ID;

/** Stable table discriminators of the anchoring service. */
enum AnchoringTable : uint8_t {
    TABLE_SIGNATURES = 0x02,     //!< [txid] -> list of Signature messages
    TABLE_LECTS = 0x03,          //!< [validator] -> merkleized list of LECTs
    TABLE_LECT_INDEXES = 0x04,   //!< [validator] txid -> position in lects
    TABLE_PROPOSALS = 0x05,      //!< [lect txid] -> list of proposal txids built on it
    TABLE_PROPOSAL_LECT = 0x06,  //!< proposal txid -> lect txid it was built on
};

/** Anchoring configuration scheduled after the current one. */
struct FollowingConfig {
    AnchoringConfig cfg;
    uint64_t actual_from{0};
};

/**
 * Anchoring tables over a host storage view.
 *
 * Storage faults raised by the view propagate unchanged.
 */
class CAnchoringSchema
{
private:
    chain::CStorageView& view;

public:
    explicit CAnchoringSchema(chain::CStorageView& viewIn) : view(viewIn) {}

    chain::CListTable<CAnchoringSignature> Signatures(const uint256& txid) const;
    chain::CMerkleTable<CBitcoinTx> Lects(uint32_t validator) const;
    chain::CMapTable<uint256, uint64_t> LectIndexes(uint32_t validator) const;
    chain::CListTable<uint256> Proposals(const uint256& lectId) const;
    chain::CMapTable<uint256, uint256> ProposalLects() const;

    /** Append a Signature message to the list of its transaction. */
    void AddSignature(const CAnchoringSignature& sig);

    /** Append to lects(v) and record the position in lect_indexes(v). */
    void AddLect(uint32_t validator, const CBitcoinTx& tx);

    Optional<CBitcoinTx> Lect(uint32_t validator) const;
    Optional<CBitcoinTx> PrevLect(uint32_t validator) const;
    Optional<uint64_t> FindLectPosition(uint32_t validator, const uint256& txid) const;

    /** The LECT shared by at least cfg.threshold validators, if any. */
    Optional<CBitcoinTx> CollectLects(const AnchoringConfig& cfg) const;

    /** Bind a proposal to the LECT it was built on, once. */
    void BindProposal(const uint256& proposalId, const uint256& lectId);
    Optional<uint256> ProposalLect(const uint256& proposalId) const;

    AnchoringConfig CurrentAnchoringConfig() const;
    Optional<FollowingConfig> FollowingAnchoringConfig() const;

    /** Seed lects(v) with the funding transaction for every validator. */
    void CreateGenesisConfig(const AnchoringConfig& cfg);

    /** Merkle roots of lects(v) for the validators of the current configuration. */
    std::vector<uint256> StateHash() const;
};

/** Extract the anchoring section of a stored configuration; throws std::runtime_error. */
AnchoringConfig AnchoringConfigFrom(const chain::CStoredConfiguration& stored);

} // namespace anchoring

#endif // ANCHORING_ANCHORING_SCHEMA_H
