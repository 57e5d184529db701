// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_CHAIN_SERVICE_H
#define ANCHORING_CHAIN_SERVICE_H

#include "chain/message.h"
#include "chain/storage.h"
#include "uint256.h"

#include <univalue.h>

#include <cstdint>
#include <string>
#include <vector>

class CValidationState;

namespace chain {

/**
 * A service plugged into the host chain.
 *
 * Everything reachable from VerifyMessage, ExecuteMessage, HandleGenesis and
 * StateHashes runs during block application and must be a deterministic
 * function of the message and the storage view.
 */
class CService
{
public:
    virtual ~CService() {}

    virtual uint16_t GetServiceId() const = 0;
    virtual std::string GetServiceName() const = 0;

    /**
     * Decode the message and check its signature. Malformed messages never
     * reach ExecuteMessage.
     */
    virtual MessageError VerifyMessage(const CRawMessage& raw) const = 0;

    /**
     * Apply a verified message. Returning false with an invalid state
     * rejects the message and discards its writes; storage faults are
     * thrown and abort the block.
     */
    virtual bool ExecuteMessage(const CRawMessage& raw, CStorageView& view, CValidationState& state) const = 0;

    /** Initialise the service tables from its section of the genesis configuration. */
    virtual void HandleGenesis(CStorageView& view, const UniValue& serviceConfig) const = 0;

    /** Hashes that summarise the service state; folded into the block state hash. */
    virtual std::vector<uint256> StateHashes(CStorageView& view) const = 0;
};

} // namespace chain

#endif // ANCHORING_CHAIN_SERVICE_H
