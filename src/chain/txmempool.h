// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_CHAIN_TXMEMPOOL_H
#define ANCHORING_CHAIN_TXMEMPOOL_H

#include "chain/message.h"
#include "sync.h"
#include "uint256.h"

#include <cstdint>
#include <map>
#include <set>
#include <vector>

namespace chain {

/**
 * Host messages waiting for a block, in arrival order.
 *
 * Messages are identified by the hash of their raw bytes, so a message that
 * is broadcast twice is kept once.
 */
class CTxMemPool
{
private:
    mutable RecursiveMutex cs;
    uint64_t nSequence{0};
    std::map<uint64_t, CRawMessage> mapSequence;
    std::map<uint256, uint64_t> mapHashes;

public:
    /** Returns false if an identical message is already pending. */
    bool Add(const CRawMessage& raw);

    bool Contains(const uint256& hash) const;
    size_t Size() const;
    bool Empty() const { return Size() == 0; }

    /** Pending messages in arrival order; at most nMax when nMax > 0. */
    std::vector<CRawMessage> GetMessages(size_t nMax = 0) const;

    /** Drop messages that made it into a block (committed or rejected). */
    void RemoveForBlock(const std::vector<uint256>& hashes);

    void Clear();
};

} // namespace chain

#endif // ANCHORING_CHAIN_TXMEMPOOL_H
