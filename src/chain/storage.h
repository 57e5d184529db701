// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_CHAIN_STORAGE_H
#define ANCHORING_CHAIN_STORAGE_H

#include "dbwrapper.h"
#include "optional.h"

#include <map>
#include <memory>
#include <string>

namespace leveldb {
class Snapshot;
}

namespace chain {

/**
 * Layered key/value view over the host chain database.
 *
 * A root view reads from the database (optionally through a LevelDB
 * snapshot). A fork reads through its parent and keeps its own writes in
 * memory until they are merged into the parent or rolled back. Block
 * application runs each message on a fork of the block fork, so a rejected
 * message leaves no trace.
 *
 * Keys are raw byte strings laid out as [service_tag, table_disc, ...key].
 * Storage failures surface as dbwrapper_error and are never caught here.
 */
class CStorageView
{
private:
    CDBWrapper* db;
    CStorageView* parent;
    std::shared_ptr<const leveldb::Snapshot> snapshot;

    //! pending writes; an empty Optional marks an erased key
    std::map<std::string, Optional<std::string>> changes;

public:
    /** Root view over the live database. */
    explicit CStorageView(CDBWrapper& dbIn);

    /** Fork over a parent view. The parent must outlive the fork. */
    explicit CStorageView(CStorageView& parentIn);

    CStorageView(const CStorageView&) = delete;
    CStorageView& operator=(const CStorageView&) = delete;

    /** Read-only root view pinned to the current database contents. */
    static std::unique_ptr<CStorageView> Snapshot(CDBWrapper& dbIn);

    bool Get(const std::string& key, std::string& value) const;
    bool Exists(const std::string& key) const;
    void Put(const std::string& key, const std::string& value);
    void Erase(const std::string& key);

    /** Discard all pending writes of this view. */
    void Rollback();

    /** Move pending writes of a fork into its parent. */
    void Merge();

    /** Write pending writes of a root view into the database atomically. */
    void Flush(bool fSync = false);

    bool IsFork() const { return parent != nullptr; }
    size_t PendingChanges() const { return changes.size(); }
};

} // namespace chain

#endif // ANCHORING_CHAIN_STORAGE_H
