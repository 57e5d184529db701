// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "anchoring/schema.h"

#include "logging.h"

#include <map>
#include <stdexcept>

namespace anchoring {

using chain::MakeTablePrefix;
using chain::MakeValidatorPrefix;

static std::string TxidPrefix(uint8_t table, const uint256& txid)
{
    return MakeTablePrefix(ANCHORING_SERVICE_TAG, table) + std::string((const char*)txid.begin(), txid.size());
}

AnchoringConfig AnchoringConfigFrom(const chain::CStoredConfiguration& stored)
{
    UniValue section = stored.GetServiceConfig(ANCHORING_SERVICE_ID);
    if (section.isNull())
        throw std::runtime_error("stored configuration has no anchoring section");
    AnchoringConfig cfg = AnchoringConfig::FromJSON(section);
    if (cfg.validators.size() != stored.validator_keys.size())
        throw std::runtime_error(strprintf("anchoring config lists %u validators, host chain has %u",
                                           cfg.validators.size(), stored.validator_keys.size()));
    return cfg;
}

chain::CListTable<CAnchoringSignature> CAnchoringSchema::Signatures(const uint256& txid) const
{
    return chain::CListTable<CAnchoringSignature>(view, TxidPrefix(TABLE_SIGNATURES, txid));
}

chain::CMerkleTable<CBitcoinTx> CAnchoringSchema::Lects(uint32_t validator) const
{
    return chain::CMerkleTable<CBitcoinTx>(view, MakeValidatorPrefix(ANCHORING_SERVICE_TAG, TABLE_LECTS, validator));
}

chain::CMapTable<uint256, uint64_t> CAnchoringSchema::LectIndexes(uint32_t validator) const
{
    return chain::CMapTable<uint256, uint64_t>(view, MakeValidatorPrefix(ANCHORING_SERVICE_TAG, TABLE_LECT_INDEXES, validator));
}

chain::CListTable<uint256> CAnchoringSchema::Proposals(const uint256& lectId) const
{
    return chain::CListTable<uint256>(view, TxidPrefix(TABLE_PROPOSALS, lectId));
}

chain::CMapTable<uint256, uint256> CAnchoringSchema::ProposalLects() const
{
    return chain::CMapTable<uint256, uint256>(view, MakeTablePrefix(ANCHORING_SERVICE_TAG, TABLE_PROPOSAL_LECT));
}

void CAnchoringSchema::AddSignature(const CAnchoringSignature& sig)
{
    Signatures(sig.Tx().GetId()).Append(sig);
}

void CAnchoringSchema::AddLect(uint32_t validator, const CBitcoinTx& tx)
{
    chain::CMerkleTable<CBitcoinTx> lects = Lects(validator);
    uint64_t position = lects.Len();
    lects.Append(tx);
    LectIndexes(validator).Put(tx.GetId(), position);
}

Optional<CBitcoinTx> CAnchoringSchema::Lect(uint32_t validator) const
{
    return Lects(validator).Last();
}

Optional<CBitcoinTx> CAnchoringSchema::PrevLect(uint32_t validator) const
{
    chain::CMerkleTable<CBitcoinTx> lects = Lects(validator);
    uint64_t len = lects.Len();
    if (len < 2) return nullopt;
    return lects.Get(len - 2);
}

Optional<uint64_t> CAnchoringSchema::FindLectPosition(uint32_t validator, const uint256& txid) const
{
    return LectIndexes(validator).Get(txid);
}

Optional<CBitcoinTx> CAnchoringSchema::CollectLects(const AnchoringConfig& cfg) const
{
    std::map<uint256, std::pair<uint32_t, CBitcoinTx>> votes;
    for (uint32_t v = 0; v < cfg.validators.size(); v++) {
        Optional<CBitcoinTx> lect = Lect(v);
        if (!lect) continue;
        auto it = votes.find(lect->GetId());
        if (it == votes.end()) {
            votes.emplace(lect->GetId(), std::make_pair(1u, *lect));
        } else {
            it->second.first++;
        }
    }
    for (const auto& entry : votes) {
        if (entry.second.first >= cfg.threshold) return entry.second.second;
    }
    return nullopt;
}

void CAnchoringSchema::BindProposal(const uint256& proposalId, const uint256& lectId)
{
    chain::CMapTable<uint256, uint256> bindings = ProposalLects();
    if (bindings.Contains(proposalId)) return;
    bindings.Put(proposalId, lectId);
    Proposals(lectId).Append(proposalId);
}

Optional<uint256> CAnchoringSchema::ProposalLect(const uint256& proposalId) const
{
    return ProposalLects().Get(proposalId);
}

AnchoringConfig CAnchoringSchema::CurrentAnchoringConfig() const
{
    return AnchoringConfigFrom(chain::CCoreSchema(view).GetActualConfiguration());
}

Optional<FollowingConfig> CAnchoringSchema::FollowingAnchoringConfig() const
{
    Optional<chain::CStoredConfiguration> stored = chain::CCoreSchema(view).GetFollowingConfiguration();
    if (!stored) return nullopt;
    FollowingConfig following;
    following.cfg = AnchoringConfigFrom(*stored);
    following.actual_from = stored->actual_from;
    return following;
}

void CAnchoringSchema::CreateGenesisConfig(const AnchoringConfig& cfg)
{
    if (cfg.funding_tx.IsNull())
        throw std::runtime_error("anchoring genesis: funding_tx is not set");
    if (ClassifyTransaction(cfg.funding_tx, cfg.RedeemScript().Script()) == TxKind::OTHER)
        throw std::runtime_error("anchoring genesis: funding_tx does not pay the multisig address " + cfg.Address());
    for (uint32_t v = 0; v < cfg.validators.size(); v++) {
        AddLect(v, cfg.funding_tx);
    }
}

std::vector<uint256> CAnchoringSchema::StateHash() const
{
    AnchoringConfig cfg = CurrentAnchoringConfig();
    std::vector<uint256> hashes;
    for (uint32_t v = 0; v < cfg.validators.size(); v++) {
        hashes.push_back(Lects(v).RootHash());
    }
    return hashes;
}

} // namespace anchoring
