// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/txmempool.h"

#include "logging.h"

namespace chain {

bool CTxMemPool::Add(const CRawMessage& raw)
{
    LOCK(cs);
    uint256 hash = raw.GetHash();
    if (mapHashes.count(hash)) {
        return false;
    }
    mapSequence.emplace(nSequence, raw);
    mapHashes.emplace(hash, nSequence);
    nSequence++;
    LogPrint(BCLog::CHAIN, "CTxMemPool: accepted message %s (type %d, service %d)\n", hash.ToString(),
             raw.MessageType(), raw.ServiceId());
    return true;
}

bool CTxMemPool::Contains(const uint256& hash) const
{
    LOCK(cs);
    return mapHashes.count(hash) > 0;
}

size_t CTxMemPool::Size() const
{
    LOCK(cs);
    return mapSequence.size();
}

std::vector<CRawMessage> CTxMemPool::GetMessages(size_t nMax) const
{
    LOCK(cs);
    std::vector<CRawMessage> messages;
    for (const auto& entry : mapSequence) {
        if (nMax > 0 && messages.size() >= nMax) break;
        messages.push_back(entry.second);
    }
    return messages;
}

void CTxMemPool::RemoveForBlock(const std::vector<uint256>& hashes)
{
    LOCK(cs);
    for (const uint256& hash : hashes) {
        auto it = mapHashes.find(hash);
        if (it == mapHashes.end()) continue;
        mapSequence.erase(it->second);
        mapHashes.erase(it);
    }
}

void CTxMemPool::Clear()
{
    LOCK(cs);
    mapSequence.clear();
    mapHashes.clear();
}

} // namespace chain
