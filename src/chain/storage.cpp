// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "chain/storage.h"

#include "logging.h"

#include <leveldb/db.h>

#include <stdexcept>

namespace chain {

CStorageView::CStorageView(CDBWrapper& dbIn) : db(&dbIn), parent(nullptr) {}

CStorageView::CStorageView(CStorageView& parentIn) : db(parentIn.db), parent(&parentIn) {}

std::unique_ptr<CStorageView> CStorageView::Snapshot(CDBWrapper& dbIn)
{
    std::unique_ptr<CStorageView> view(new CStorageView(dbIn));
    CDBWrapper* pdb = &dbIn;
    view->snapshot.reset(dbIn.NewSnapshot(), [pdb](const leveldb::Snapshot* s) { pdb->ReleaseSnapshot(s); });
    return view;
}

bool CStorageView::Get(const std::string& key, std::string& value) const
{
    auto it = changes.find(key);
    if (it != changes.end()) {
        if (!it->second) return false;
        value = *it->second;
        return true;
    }
    if (parent) {
        return parent->Get(key, value);
    }
    return db->ReadRaw(key, value, snapshot.get());
}

bool CStorageView::Exists(const std::string& key) const
{
    std::string value;
    return Get(key, value);
}

void CStorageView::Put(const std::string& key, const std::string& value)
{
    if (snapshot) {
        throw std::logic_error("CStorageView::Put(): snapshot views are read-only");
    }
    changes[key] = value;
}

void CStorageView::Erase(const std::string& key)
{
    if (snapshot) {
        throw std::logic_error("CStorageView::Erase(): snapshot views are read-only");
    }
    changes[key] = nullopt;
}

void CStorageView::Rollback()
{
    changes.clear();
}

void CStorageView::Merge()
{
    if (!parent) {
        throw std::logic_error("CStorageView::Merge(): root view has no parent");
    }
    for (auto& entry : changes) {
        parent->changes[entry.first] = std::move(entry.second);
    }
    changes.clear();
}

void CStorageView::Flush(bool fSync)
{
    if (parent || snapshot) {
        throw std::logic_error("CStorageView::Flush(): only a live root view can be flushed");
    }
    if (changes.empty()) return;

    CDBBatch batch;
    for (const auto& entry : changes) {
        if (entry.second) {
            batch.WriteRaw(entry.first, *entry.second);
        } else {
            batch.EraseRaw(entry.first);
        }
    }
    LogPrint(BCLog::DB, "CStorageView::Flush: %u changes\n", changes.size());
    db->WriteBatch(batch, fSync);
    changes.clear();
}

} // namespace chain
