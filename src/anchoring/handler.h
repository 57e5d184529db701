// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_ANCHORING_HANDLER_H
#define ANCHORING_ANCHORING_HANDLER_H

#include "anchoring/config.h"
#include "anchoring/multisig.h"
#include "anchoring/relay.h"
#include "anchoring/schema.h"
#include "chain/hostkey.h"
#include "chain/message.h"
#include "chain/storage.h"
#include "optional.h"
#include "sync.h"

#include <univalue.h>

#include <set>
#include <string>
#include <vector>

namespace anchoring {

enum class AnchoringState {
    IDLE,
    COLLECTING_SIGNATURES,
    AWAITING_CONFIRMATION,
    TRANSFERRING,
};

const char* AnchoringStateToString(AnchoringState state);

/** Everything one evaluation needs, read from a single snapshot. */
struct AnchoringContext {
    uint64_t height{0};
    uint32_t validator{0};
    AnchoringConfig cfg;
    CRedeemScript redeem;
    std::string address;
    Optional<FollowingConfig> following;
    CRedeemScript nextRedeem;
    std::string nextAddress;
    bool fTransferring{false};
    CBitcoinTx lect;
    uint64_t lectHeight{0};
    uint64_t lectCount{0};

    //! multisig script the next anchoring transaction pays
    const CRedeemScript& Destination() const { return fTransferring ? nextRedeem : redeem; }
};

/**
 * Node-local coordinator of one validator.
 *
 * Evaluated after every committed host block on a snapshot of the chain.
 * It reads the Bitcoin node through the relay and answers with host
 * messages (Signature, UpdateLatest) for the local mempool; nothing it
 * learns from Bitcoin reaches the chain state any other way. Relay faults
 * propagate as BitcoinRpcError and the evaluation is simply repeated later:
 * messages are deterministic, so a repeated evaluation produces the same
 * bytes and the mempool drops the copies.
 */
class CAnchoringHandler
{
private:
    mutable RecursiveMutex cs_handler;

    chain::CHostKey hostKey;
    AnchoringNodeConfig nodeCfg;
    CBitcoinRelay& relay;

    std::set<std::string> setImported;
    //! proposals whose submission failed for missing inputs, and their anchoring heights
    std::set<uint256> setAbandoned;
    std::set<uint64_t> setAbandonedHeights;

    AnchoringState state{AnchoringState::IDLE};
    uint64_t nLastHeight{0};
    Optional<uint256> proposalId;

    bool LoadContext(chain::CStorageView& view, AnchoringContext& ctx) const;
    void ImportOnce(const std::string& address);
    void CheckLect(const AnchoringContext& ctx);

    bool UpdateFromMajority(const AnchoringContext& ctx, CAnchoringSchema& schema, std::vector<chain::CRawMessage>& out);
    bool CompleteProposals(const AnchoringContext& ctx, CAnchoringSchema& schema, std::vector<chain::CRawMessage>& out,
                           std::vector<CBitcoinTx>& pending);
    void SignOrPropose(const AnchoringContext& ctx, chain::CStorageView& view, CAnchoringSchema& schema,
                       const std::vector<CBitcoinTx>& pending, std::vector<chain::CRawMessage>& out);
    void Abandon(const uint256& proposal, const CBitcoinTx& tx);

    bool SignProposal(const AnchoringContext& ctx, CAnchoringSchema& schema, const CBitcoinTx& tx,
                      std::vector<chain::CRawMessage>& out);
    chain::CRawMessage MakeUpdateLatest(const AnchoringContext& ctx, const CBitcoinTx& tx) const;

public:
    CAnchoringHandler(const chain::CHostKey& hostKeyIn, const AnchoringNodeConfig& nodeCfgIn, CBitcoinRelay& relayIn);

    /**
     * Run the coordinator on a committed snapshot and return the messages to
     * broadcast. Throws BitcoinRpcError on relay faults.
     */
    std::vector<chain::CRawMessage> Process(chain::CStorageView& snapshot);

    /**
     * Build the canonical proposal for anchoring height ha from the
     * relay's view of the multisig outputs. Returns false with strError
     * when nothing can be spent.
     */
    bool BuildProposal(const AnchoringContext& ctx, uint64_t ha, const uint256& blockHash, CBitcoinTx& tx,
                       std::string& strError);

    /** Check a proposal against the local reconstruction before signing it. */
    bool ValidateProposal(const AnchoringContext& ctx, uint64_t ha, const uint256& blockHash, const CBitcoinTx& tx,
                          std::string& strError);

    AnchoringState GetState() const;
    bool IsAbandoned(const uint256& proposal) const;
    UniValue GetStatus() const;

    /** Index of the proposer for anchoring height ha. */
    static uint32_t ProposerFor(uint64_t ha, uint64_t frequency, size_t validators);
};

} // namespace anchoring

#endif // ANCHORING_ANCHORING_HANDLER_H
