// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "anchoring/service.h"

#include "anchoring/multisig.h"
#include "chain/schema.h"
#include "consensus/validation.h"
#include "logging.h"

namespace anchoring {

/** Sender checks shared by both messages. */
static bool CheckSender(const CAnchoringMessage& msg, chain::CStorageView& view, CValidationState& state)
{
    chain::CStoredConfiguration stored = chain::CCoreSchema(view).GetActualConfiguration();
    if (msg.Validator() >= stored.validator_keys.size()) {
        return state.Invalid(false, REJECT_INVALID, "bad-validator-index",
                             strprintf("validator %u of %u", msg.Validator(), stored.validator_keys.size()));
    }
    if (stored.validator_keys[msg.Validator()] != msg.From()) {
        return state.Invalid(false, REJECT_INVALID, "bad-validator-key",
                             strprintf("validator %u is not %s", msg.Validator(), msg.From().GetHex()));
    }
    return true;
}

chain::MessageError CAnchoringService::VerifyMessage(const chain::CRawMessage& raw) const
{
    CAnchoringMessage msg;
    return CAnchoringMessage::Decode(raw, msg, true);
}

bool CAnchoringService::ExecuteMessage(const chain::CRawMessage& raw, chain::CStorageView& view, CValidationState& state) const
{
    CAnchoringMessage msg;
    chain::MessageError err = CAnchoringMessage::Decode(raw, msg, false);
    if (err != chain::MessageError::OK) {
        return state.Invalid(false, REJECT_MALFORMED, chain::MessageErrorString(err));
    }
    if (!CheckSender(msg, view, state)) return false;

    if (const CAnchoringSignature* sig = msg.AsSignature()) {
        return ExecuteSignature(*sig, view, state);
    }
    return ExecuteUpdateLatest(*msg.AsUpdateLatest(), view, state);
}

bool CAnchoringService::ExecuteSignature(const CAnchoringSignature& msg, chain::CStorageView& view, CValidationState& state) const
{
    CAnchoringSchema schema(view);
    AnchoringConfig cfg = schema.CurrentAnchoringConfig();
    const CBitcoinTx& tx = msg.Tx();
    const uint256 txid = tx.GetId();

    if (!IsAnchoringShape(tx)) {
        return state.Invalid(false, REJECT_INVALID, "bad-anchoring-tx",
                             strprintf("%s is not an anchoring transaction", txid.ToString()));
    }
    if (msg.Input() >= tx->vin.size()) {
        return state.Invalid(false, REJECT_INVALID, "bad-input-index",
                             strprintf("input %u of %u", msg.Input(), tx->vin.size()));
    }

    CRedeemScript redeem = cfg.RedeemScript();
    if (!VerifyInput(tx, msg.Input(), redeem, cfg.validators[msg.Validator()], msg.Signature())) {
        LogPrintf("WARNING: anchoring: invalid signature from validator %u for %s:%u, ignored\n",
                  msg.Validator(), txid.ToString(), msg.Input());
        return true;
    }

    for (const CAnchoringSignature& known : schema.Signatures(txid).Values()) {
        if (known.Validator() == msg.Validator() && known.Input() == msg.Input()) {
            LogPrint(BCLog::ANCHORING, "anchoring: duplicate signature from validator %u for %s:%u\n",
                     msg.Validator(), txid.ToString(), msg.Input());
            return true;
        }
    }

    Optional<CBitcoinTx> signerLect = schema.Lect(msg.Validator());
    if (!signerLect) {
        throw dbwrapper_error(strprintf("anchoring: validator %u has no lect", msg.Validator()));
    }
    Optional<uint256> bound = schema.ProposalLect(txid);
    if (bound && *bound != signerLect->GetId()) {
        LogPrintf("WARNING: anchoring: stale signature from validator %u for %s: proposal is built on %s, signer's lect is %s\n",
                  msg.Validator(), txid.ToString(), bound->ToString(), signerLect->GetId().ToString());
        return true;
    }
    if (!bound) {
        schema.BindProposal(txid, signerLect->GetId());
    }

    schema.AddSignature(msg);
    LogPrint(BCLog::ANCHORING, "anchoring: signature from validator %u for %s:%u accepted\n",
             msg.Validator(), txid.ToString(), msg.Input());
    return true;
}

bool CAnchoringService::ExecuteUpdateLatest(const CAnchoringUpdateLatest& msg, chain::CStorageView& view, CValidationState& state) const
{
    CAnchoringSchema schema(view);
    const uint256 txid = msg.Tx().GetId();
    uint64_t len = schema.Lects(msg.Validator()).Len();

    if (msg.LectCount() != len + 1) {
        LogPrintf("anchoring: UpdateLatest from validator %u rejected: lect_count %u, expected %u\n",
                  msg.Validator(), msg.LectCount(), len + 1);
        return state.Invalid(false, REJECT_INVALID, "bad-lect-count",
                             strprintf("lect_count %u, expected %u", msg.LectCount(), len + 1));
    }
    if (schema.FindLectPosition(msg.Validator(), txid)) {
        LogPrintf("anchoring: UpdateLatest from validator %u rejected: %s is already a lect\n",
                  msg.Validator(), txid.ToString());
        return state.Invalid(false, REJECT_DUPLICATE, "lect-already-known", txid.ToString());
    }

    schema.AddLect(msg.Validator(), msg.Tx());
    LogPrint(BCLog::ANCHORING, "anchoring: validator %u lect #%u is %s\n", msg.Validator(), len, txid.ToString());
    return true;
}

void CAnchoringService::HandleGenesis(chain::CStorageView& view, const UniValue& serviceConfig) const
{
    if (serviceConfig.isNull())
        throw std::runtime_error("anchoring genesis: configuration has no anchoring section");
    AnchoringConfig cfg = AnchoringConfig::FromJSON(serviceConfig);
    CAnchoringSchema(view).CreateGenesisConfig(cfg);
    LogPrintf("anchoring: genesis with %u validators, threshold %u, address %s\n",
              cfg.validators.size(), cfg.threshold, cfg.Address());
}

std::vector<uint256> CAnchoringService::StateHashes(chain::CStorageView& view) const
{
    return CAnchoringSchema(view).StateHash();
}

} // namespace anchoring
