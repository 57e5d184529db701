// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "anchoring/handler.h"

#include "anchoring/messages.h"
#include "chain/schema.h"
#include "logging.h"
#include "utilmoneystr.h"

#include <map>

namespace anchoring {

const char* AnchoringStateToString(AnchoringState state)
{
    switch (state) {
    case AnchoringState::IDLE: return "idle";
    case AnchoringState::COLLECTING_SIGNATURES: return "collecting-signatures";
    case AnchoringState::AWAITING_CONFIRMATION: return "awaiting-confirmation";
    case AnchoringState::TRANSFERRING: return "transferring";
    }
    return "unknown";
}

CAnchoringHandler::CAnchoringHandler(const chain::CHostKey& hostKeyIn, const AnchoringNodeConfig& nodeCfgIn,
                                     CBitcoinRelay& relayIn)
    : hostKey(hostKeyIn), nodeCfg(nodeCfgIn), relay(relayIn)
{
}

uint32_t CAnchoringHandler::ProposerFor(uint64_t ha, uint64_t frequency, size_t validators)
{
    return (uint32_t)((ha / frequency) % validators);
}

bool CAnchoringHandler::LoadContext(chain::CStorageView& view, AnchoringContext& ctx) const
{
    chain::CCoreSchema core(view);
    if (core.BlockCount() == 0) return false;

    int validator = core.GetActualConfiguration().FindValidator(hostKey.GetPubKey());
    if (validator < 0) return false;

    CAnchoringSchema schema(view);
    ctx.height = core.Height();
    ctx.validator = (uint32_t)validator;
    ctx.cfg = schema.CurrentAnchoringConfig();
    ctx.redeem = ctx.cfg.RedeemScript();
    ctx.address = ctx.redeem.Address(ctx.cfg.network);
    ctx.following = schema.FollowingAnchoringConfig();
    if (ctx.following) {
        ctx.nextRedeem = ctx.following->cfg.RedeemScript();
        ctx.nextAddress = ctx.nextRedeem.Address(ctx.following->cfg.network);
        ctx.fTransferring = ctx.nextRedeem != ctx.redeem;
    }

    Optional<CBitcoinTx> lect = schema.Lect(ctx.validator);
    if (!lect)
        throw std::runtime_error(strprintf("anchoring: validator %u has no lect", ctx.validator));
    ctx.lect = *lect;
    ctx.lectCount = schema.Lects(ctx.validator).Len();
    AnchoringPayload payload;
    ctx.lectHeight = IsAnchoringShape(ctx.lect, &payload) ? payload.block_height : 0;
    return true;
}

void CAnchoringHandler::ImportOnce(const std::string& address)
{
    if (setImported.count(address)) return;
    relay.ImportAddress(address);
    setImported.insert(address);
    LogPrintf("anchoring: watching multisig address %s\n", address);
}

void CAnchoringHandler::CheckLect(const AnchoringContext& ctx)
{
    const uint256 id = ctx.lect.GetId();
    if (relay.GetTransactionInfo(id)) return;

    // the Bitcoin node lost our lect (mempool eviction or reorg), announce it again
    SubmitResult result = SubmitTransaction(relay, ctx.lect);
    if (result == SubmitResult::INPUTS_MISSING) {
        LogPrintf("ERROR: anchoring: lect %s of validator %u is unknown to bitcoind and cannot be resent\n",
                  id.ToString(), ctx.validator);
        return;
    }
    LogPrintf("anchoring: lect %s of validator %u resent (%s)\n", id.ToString(), ctx.validator,
              SubmitResultToString(result));
}

void CAnchoringHandler::Abandon(const uint256& proposal, const CBitcoinTx& tx)
{
    setAbandoned.insert(proposal);
    AnchoringPayload payload;
    if (IsAnchoringShape(tx, &payload)) {
        setAbandonedHeights.insert(payload.block_height);
    }
}

chain::CRawMessage CAnchoringHandler::MakeUpdateLatest(const AnchoringContext& ctx, const CBitcoinTx& tx) const
{
    return CAnchoringUpdateLatest::Create(hostKey, ctx.validator, tx, ctx.lectCount + 1).Raw();
}

std::vector<chain::CRawMessage> CAnchoringHandler::Process(chain::CStorageView& snapshot)
{
    LOCK(cs_handler);
    std::vector<chain::CRawMessage> out;

    AnchoringContext ctx;
    if (!LoadContext(snapshot, ctx)) {
        state = AnchoringState::IDLE;
        return out;
    }
    nLastHeight = ctx.height;
    proposalId = nullopt;
    state = ctx.fTransferring ? AnchoringState::TRANSFERRING : AnchoringState::IDLE;

    ImportOnce(ctx.address);
    if (ctx.fTransferring) ImportOnce(ctx.nextAddress);
    if (ctx.height % nodeCfg.check_lect_frequency == 0) CheckLect(ctx);

    CAnchoringSchema schema(snapshot);
    if (UpdateFromMajority(ctx, schema, out)) return out;

    std::vector<CBitcoinTx> pending;
    if (CompleteProposals(ctx, schema, out, pending)) return out;

    if (!FindOutput(ctx.lect, ctx.redeem.ScriptPubKey())) {
        if (ctx.fTransferring && FindOutput(ctx.lect, ctx.nextRedeem.ScriptPubKey())) {
            LogPrint(BCLog::ANCHORING, "anchoring: transition %s done, new address %s active from %u\n",
                     ctx.lect.GetId().ToString(), ctx.nextAddress, ctx.following->actual_from);
        } else {
            LogPrintf("ERROR: anchoring: lect %s of validator %u does not pay the multisig address %s\n",
                      ctx.lect.GetId().ToString(), ctx.validator, ctx.address);
        }
        return out;
    }

    SignOrPropose(ctx, snapshot, schema, pending, out);
    return out;
}

bool CAnchoringHandler::UpdateFromMajority(const AnchoringContext& ctx, CAnchoringSchema& schema,
                                           std::vector<chain::CRawMessage>& out)
{
    Optional<CBitcoinTx> majority = schema.CollectLects(ctx.cfg);
    if (!majority || *majority == ctx.lect) return false;
    // an older lect of ours that the others have not left yet
    if (schema.FindLectPosition(ctx.validator, majority->GetId())) return false;

    Optional<BitcoinTxInfo> info = relay.GetTransactionInfo(majority->GetId());
    if (!info || info->confirmations == 0) {
        LogPrint(BCLog::ANCHORING, "anchoring: lect %s of the majority is not confirmed yet\n",
                 majority->GetId().ToString());
        return false;
    }
    LogPrintf("anchoring: validator %u follows the majority to lect %s\n", ctx.validator, majority->GetId().ToString());
    out.push_back(MakeUpdateLatest(ctx, *majority));
    return true;
}

bool CAnchoringHandler::CompleteProposals(const AnchoringContext& ctx, CAnchoringSchema& schema,
                                          std::vector<chain::CRawMessage>& out, std::vector<CBitcoinTx>& pending)
{
    for (const uint256& id : schema.Proposals(ctx.lect.GetId()).Values()) {
        if (setAbandoned.count(id)) continue;
        std::vector<CAnchoringSignature> sigs = schema.Signatures(id).Values();
        if (sigs.empty()) continue;
        const CBitcoinTx tx = sigs.front().Tx();

        InputSignatures collected;
        for (const CAnchoringSignature& sig : sigs) {
            if (sig.Validator() >= ctx.cfg.validators.size()) continue;
            int pos = ctx.redeem.KeyPosition(ctx.cfg.validators[sig.Validator()]);
            if (pos < 0) continue;
            collected[sig.Input()][pos] = sig.Signature();
        }

        CBitcoinTx finalized;
        if (!FinalizeTransaction(tx, ctx.redeem, collected, finalized)) {
            pending.push_back(tx);
            continue;
        }

        proposalId = id;
        state = AnchoringState::AWAITING_CONFIRMATION;
        const uint256 finalId = finalized.GetId();
        Optional<BitcoinTxInfo> info = relay.GetTransactionInfo(finalId);
        if (!info) {
            SubmitResult result = SubmitTransaction(relay, finalized);
            if (result == SubmitResult::INPUTS_MISSING) {
                LogPrintf("anchoring: proposal %s abandoned, its inputs are spent or unknown\n", id.ToString());
                Abandon(id, tx);
                proposalId = nullopt;
                state = ctx.fTransferring ? AnchoringState::TRANSFERRING : AnchoringState::IDLE;
                continue;
            }
            LogPrint(BCLog::ANCHORING, "anchoring: submitted %s for proposal %s (%s)\n", finalId.ToString(),
                     id.ToString(), SubmitResultToString(result));
            return true;
        }
        if (info->confirmations == 0) return true;

        LogPrintf("anchoring: %s confirmed, validator %u lect #%u\n", finalId.ToString(), ctx.validator, ctx.lectCount);
        out.push_back(MakeUpdateLatest(ctx, finalized));
        return true;
    }
    return false;
}

void CAnchoringHandler::SignOrPropose(const AnchoringContext& ctx, chain::CStorageView& view, CAnchoringSchema& schema,
                                      const std::vector<CBitcoinTx>& pending, std::vector<chain::CRawMessage>& out)
{
    const uint64_t frequency = ctx.cfg.frequency;
    const uint64_t ha = ctx.height - ctx.height % frequency;
    if (ha == 0) return;

    bool fDue = ha > ctx.lectHeight;
    if (ctx.fTransferring && !fDue) {
        // the transition cannot wait for the next interval when it would come after the activation
        fDue = ha >= ctx.lectHeight && ha + frequency >= ctx.following->actual_from;
    }
    if (!fDue || setAbandonedHeights.count(ha)) return;

    Optional<uint256> blockHash = chain::CCoreSchema(view).BlockHash(ha);
    if (!blockHash)
        throw std::runtime_error(strprintf("anchoring: no host block at height %u", ha));
    const uint32_t proposer = ProposerFor(ha, frequency, ctx.cfg.validators.size());
    const AnchoringState collecting = ctx.fTransferring ? AnchoringState::TRANSFERRING
                                                        : AnchoringState::COLLECTING_SIGNATURES;

    for (const CBitcoinTx& tx : pending) {
        AnchoringPayload payload;
        if (!IsAnchoringShape(tx, &payload) || payload.block_height != ha) continue;
        bool fFromProposer = false;
        for (const CAnchoringSignature& sig : schema.Signatures(tx.GetId()).Values()) {
            if (sig.Validator() == proposer) fFromProposer = true;
        }
        if (!fFromProposer) continue;

        proposalId = tx.GetId();
        state = collecting;
        std::string strError;
        if (!ValidateProposal(ctx, ha, *blockHash, tx, strError)) {
            LogPrintf("anchoring: validator %u does not sign %s: %s\n", ctx.validator, tx.GetId().ToString(), strError);
            continue;
        }
        SignProposal(ctx, schema, tx, out);
        return;
    }

    if (ctx.validator != proposer) return;

    CBitcoinTx proposal;
    std::string strError;
    if (!BuildProposal(ctx, ha, *blockHash, proposal, strError)) {
        LogPrint(BCLog::ANCHORING, "anchoring: nothing to propose for height %u: %s\n", ha, strError);
        return;
    }
    LogPrintf("anchoring: validator %u proposes %s for height %u%s\n", ctx.validator, proposal.GetId().ToString(), ha,
              ctx.fTransferring ? strprintf(", moving funds to %s", ctx.nextAddress) : std::string());
    proposalId = proposal.GetId();
    state = collecting;
    SignProposal(ctx, schema, proposal, out);
}

bool CAnchoringHandler::BuildProposal(const AnchoringContext& ctx, uint64_t ha, const uint256& blockHash,
                                      CBitcoinTx& tx, std::string& strError)
{
    const btc::CScript scriptPubKey = ctx.redeem.ScriptPubKey();
    Optional<uint32_t> lectOut = FindOutput(ctx.lect, scriptPubKey);
    const uint256 lectId = ctx.lect.GetId();

    std::map<btc::COutPoint, CAmount> inputs;
    for (const BitcoinUnspent& utxo : relay.ListUnspent(ctx.address, 0, MAX_UNSPENT_CONFIRMATIONS)) {
        if (utxo.txid == lectId) {
            if (lectOut && utxo.vout == *lectOut) {
                inputs.emplace(btc::COutPoint(utxo.txid, utxo.vout), utxo.amount);
            }
            continue;
        }
        if (utxo.confirmations < ctx.cfg.utxo_confirmations) continue;
        Optional<CBitcoinTx> prev = relay.GetRawTransaction(utxo.txid);
        if (!prev) continue;
        if (ClassifyTransaction(*prev, ctx.redeem.Script()) == TxKind::FUNDING) {
            inputs.emplace(btc::COutPoint(utxo.txid, utxo.vout), utxo.amount);
        }
    }
    if (inputs.empty()) {
        strError = strprintf("no spendable outputs of %s", ctx.address);
        return false;
    }

    CAnchoringTxBuilder builder(ctx.Destination().ScriptPubKey());
    for (const auto& input : inputs) {
        builder.AddInput(input.first, input.second);
    }
    builder.SetPayload(ha, blockHash).SetFee(ctx.cfg.fee);
    return builder.Build(tx, strError);
}

bool CAnchoringHandler::ValidateProposal(const AnchoringContext& ctx, uint64_t ha, const uint256& blockHash,
                                         const CBitcoinTx& tx, std::string& strError)
{
    AnchoringPayload payload;
    if (!IsAnchoringShape(tx, &payload)) {
        strError = "not an anchoring transaction";
        return false;
    }
    if (payload != AnchoringPayload(ha, blockHash)) {
        strError = strprintf("payload (%u, %s) instead of (%u, %s)", payload.block_height,
                             payload.block_hash.ToString(), ha, blockHash.ToString());
        return false;
    }
    if (tx->vout[0].scriptPubKey != ctx.Destination().ScriptPubKey()) {
        strError = strprintf("does not pay %s", ctx.fTransferring ? ctx.nextAddress : ctx.address);
        return false;
    }

    std::map<btc::COutPoint, CAmount> spendable;
    for (const BitcoinUnspent& utxo : relay.ListUnspent(ctx.address, 0, MAX_UNSPENT_CONFIRMATIONS)) {
        spendable[btc::COutPoint(utxo.txid, utxo.vout)] = utxo.amount;
    }
    CAmount sum = 0;
    for (const btc::CTxIn& in : tx->vin) {
        auto it = spendable.find(in.prevout);
        if (it == spendable.end()) {
            strError = strprintf("input %s is not an unspent output of %s", in.prevout.ToString(), ctx.address);
            return false;
        }
        sum += it->second;
    }
    if (sum - tx->vout[0].nValue != ctx.cfg.fee) {
        strError = strprintf("fee %s instead of %s", FormatMoney(sum - tx->vout[0].nValue), FormatMoney(ctx.cfg.fee));
        return false;
    }
    return true;
}

bool CAnchoringHandler::SignProposal(const AnchoringContext& ctx, CAnchoringSchema& schema, const CBitcoinTx& tx,
                                     std::vector<chain::CRawMessage>& out)
{
    btc::CKey key;
    if (!nodeCfg.GetPrivateKey(ctx.address, key)) {
        LogPrintf("ERROR: anchoring: no private key for %s\n", ctx.address);
        return false;
    }
    if (key.GetPubKey() != ctx.cfg.validators[ctx.validator]) {
        LogPrintf("ERROR: anchoring: the key for %s is not the key of validator %u\n", ctx.address, ctx.validator);
        return false;
    }

    std::set<uint32_t> setSigned;
    for (const CAnchoringSignature& sig : schema.Signatures(tx.GetId()).Values()) {
        if (sig.Validator() == ctx.validator) setSigned.insert(sig.Input());
    }
    for (uint32_t input = 0; input < tx->vin.size(); input++) {
        if (setSigned.count(input)) continue;
        std::vector<unsigned char> signature;
        if (!SignInput(tx, input, ctx.redeem, key, signature)) {
            LogPrintf("ERROR: anchoring: signing input %u of %s failed\n", input, tx.GetId().ToString());
            return false;
        }
        out.push_back(CAnchoringSignature::Create(hostKey, ctx.validator, tx, input, signature).Raw());
    }
    return true;
}

AnchoringState CAnchoringHandler::GetState() const
{
    LOCK(cs_handler);
    return state;
}

bool CAnchoringHandler::IsAbandoned(const uint256& proposal) const
{
    LOCK(cs_handler);
    return setAbandoned.count(proposal) > 0;
}

UniValue CAnchoringHandler::GetStatus() const
{
    LOCK(cs_handler);
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("state", AnchoringStateToString(state));
    obj.pushKV("height", (int64_t)nLastHeight);
    if (proposalId) obj.pushKV("proposal", proposalId->GetHex());
    obj.pushKV("abandoned", (int64_t)setAbandoned.size());
    UniValue imported(UniValue::VARR);
    for (const std::string& address : setImported) {
        imported.push_back(address);
    }
    obj.pushKV("watching", imported);
    return obj;
}

} // namespace anchoring
