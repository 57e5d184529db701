// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/schema.h"

#include "hash.h"
#include "logging.h"

#include <stdexcept>

namespace chain {

uint256 CBlockHeader::GetHash() const
{
    return SerializeHash(*this);
}

CListTable<uint256> CCoreSchema::BlockHashes() const
{
    return CListTable<uint256>(view, MakeTablePrefix(CORE_SERVICE_TAG, 1));
}

CMapTable<uint256, uint64_t> CCoreSchema::CommittedMessages() const
{
    return CMapTable<uint256, uint64_t>(view, MakeTablePrefix(CORE_SERVICE_TAG, 2));
}

CMapTable<uint256, std::string> CCoreSchema::Configurations() const
{
    return CMapTable<uint256, std::string>(view, MakeTablePrefix(CORE_SERVICE_TAG, 3));
}

CListTable<CConfigReference> CCoreSchema::ConfigSchedule() const
{
    return CListTable<CConfigReference>(view, MakeTablePrefix(CORE_SERVICE_TAG, 4));
}

CMapTable<uint64_t, CBlockHeader> CCoreSchema::BlockHeaders() const
{
    return CMapTable<uint64_t, CBlockHeader>(view, MakeTablePrefix(CORE_SERVICE_TAG, 5));
}

uint64_t CCoreSchema::BlockCount() const
{
    return BlockHashes().Len();
}

uint64_t CCoreSchema::Height() const
{
    uint64_t count = BlockCount();
    return count == 0 ? 0 : count - 1;
}

Optional<uint256> CCoreSchema::BlockHash(uint64_t height) const
{
    return BlockHashes().Get(height);
}

Optional<CBlockHeader> CCoreSchema::LastBlock() const
{
    uint64_t count = BlockCount();
    if (count == 0) return nullopt;
    return BlockHeaders().Get(count - 1);
}

Optional<CStoredConfiguration> CCoreSchema::GetConfiguration(const uint256& hash) const
{
    Optional<std::string> json = Configurations().Get(hash);
    if (!json) return nullopt;
    try {
        return CStoredConfiguration::FromJSON(*json);
    } catch (const std::runtime_error& e) {
        throw dbwrapper_error(std::string("corrupted stored configuration: ") + e.what());
    }
}

CStoredConfiguration CCoreSchema::GetActualConfiguration() const
{
    uint64_t next = BlockCount();
    std::vector<CConfigReference> schedule = ConfigSchedule().Values();
    Optional<CConfigReference> actual;
    for (const CConfigReference& ref : schedule) {
        if (ref.actual_from > next) break;
        actual = ref;
    }
    if (!actual)
        throw std::logic_error("GetActualConfiguration(): no configuration is active yet");

    Optional<CStoredConfiguration> cfg = GetConfiguration(actual->cfg_hash);
    if (!cfg)
        throw dbwrapper_error("scheduled configuration is missing from storage");
    return *cfg;
}

Optional<CStoredConfiguration> CCoreSchema::GetFollowingConfiguration() const
{
    uint64_t next = BlockCount();
    for (const CConfigReference& ref : ConfigSchedule().Values()) {
        if (ref.actual_from > next) {
            Optional<CStoredConfiguration> cfg = GetConfiguration(ref.cfg_hash);
            if (!cfg)
                throw dbwrapper_error("scheduled configuration is missing from storage");
            return cfg;
        }
    }
    return nullopt;
}

bool CCoreSchema::CommitConfiguration(const CStoredConfiguration& cfg, std::string& strError)
{
    CListTable<CConfigReference> schedule = ConfigSchedule();
    Optional<CConfigReference> last = schedule.Last();
    if (last) {
        if (cfg.actual_from <= last->actual_from) {
            strError = strprintf("actual_from %d does not follow the last scheduled configuration (%d)",
                                 cfg.actual_from, last->actual_from);
            return false;
        }
        if (cfg.previous_cfg_hash != last->cfg_hash) {
            strError = "previous_cfg_hash does not name the last scheduled configuration";
            return false;
        }
        if (cfg.actual_from < BlockCount()) {
            strError = strprintf("actual_from %d is already in the past", cfg.actual_from);
            return false;
        }
    } else if (!cfg.previous_cfg_hash.IsNull() || cfg.actual_from != 0) {
        strError = "the genesis configuration must have no predecessor and actual_from 0";
        return false;
    }

    uint256 hash = cfg.GetHash();
    Configurations().Put(hash, cfg.ToJSON());
    schedule.Append(CConfigReference(cfg.actual_from, hash));
    return true;
}

bool CCoreSchema::IsCommitted(const uint256& messageHash) const
{
    return CommittedMessages().Contains(messageHash);
}

void CCoreSchema::AddCommittedMessage(const uint256& messageHash, uint64_t height)
{
    CommittedMessages().Put(messageHash, height);
}

uint256 ComputeMerkleRoot(std::vector<uint256> hashes)
{
    if (hashes.empty()) return uint256();
    while (hashes.size() > 1) {
        if (hashes.size() & 1) {
            hashes.push_back(hashes.back());
        }
        for (size_t i = 0; i < hashes.size() / 2; i++) {
            hashes[i] = Hash(hashes[2 * i].begin(), hashes[2 * i].end(), hashes[2 * i + 1].begin(), hashes[2 * i + 1].end());
        }
        hashes.resize(hashes.size() / 2);
    }
    return hashes[0];
}

} // namespace chain
