// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_ANCHORING_SERVICE_H
#define ANCHORING_ANCHORING_SERVICE_H

#include "anchoring/messages.h"
#include "anchoring/schema.h"
#include "chain/service.h"

class CValidationState;

namespace anchoring {

/**
 * Deterministic part of the anchoring service: decoding, verification and
 * execution of the Signature and UpdateLatest messages, and the genesis
 * hook that seeds every LECT history with the funding transaction.
 */
class CAnchoringService : public chain::CService
{
public:
    uint16_t GetServiceId() const override { return ANCHORING_SERVICE_ID; }
    std::string GetServiceName() const override { return "anchoring"; }

    chain::MessageError VerifyMessage(const chain::CRawMessage& raw) const override;
    bool ExecuteMessage(const chain::CRawMessage& raw, chain::CStorageView& view, CValidationState& state) const override;
    void HandleGenesis(chain::CStorageView& view, const UniValue& serviceConfig) const override;
    std::vector<uint256> StateHashes(chain::CStorageView& view) const override;

    bool ExecuteSignature(const CAnchoringSignature& msg, chain::CStorageView& view, CValidationState& state) const;
    bool ExecuteUpdateLatest(const CAnchoringUpdateLatest& msg, chain::CStorageView& view, CValidationState& state) const;
};

} // namespace anchoring

#endif // ANCHORING_ANCHORING_SERVICE_H
