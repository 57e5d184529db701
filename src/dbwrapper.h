// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_DBWRAPPER_H
#define ANCHORING_DBWRAPPER_H

#include "fs.h"
#include "serialize.h"
#include "streams.h"

#include <leveldb/db.h>
#include <leveldb/write_batch.h>

#include <memory>
#include <stdexcept>
#include <string>

static const size_t DBWRAPPER_PREALLOC_KEY_SIZE = 64;
static const size_t DBWRAPPER_PREALLOC_VALUE_SIZE = 1024;

/** Storage failure. Never caught by execution code: it aborts block application. */
class dbwrapper_error : public std::runtime_error
{
public:
    explicit dbwrapper_error(const std::string& msg) : std::runtime_error(msg) {}
};

class CDBWrapper;

/** These should be considered an implementation detail of the specific database.
 */
namespace dbwrapper_private {

/** Handle database error by throwing dbwrapper_error exception.
 */
void HandleError(const leveldb::Status& status);

} // namespace dbwrapper_private

/** Batch of changes queued to be written to a CDBWrapper */
class CDBBatch
{
    friend class CDBWrapper;

private:
    leveldb::WriteBatch batch;

    CDataStream ssKey;
    CDataStream ssValue;

    size_t size_estimate;

public:
    CDBBatch() : ssKey(SER_DISK, PROTOCOL_VERSION), ssValue(SER_DISK, PROTOCOL_VERSION), size_estimate(0) {}

    void Clear()
    {
        batch.Clear();
        size_estimate = 0;
    }

    template<typename K, typename V>
    void Write(const K& key, const V& value)
    {
        ssKey.reserve(DBWRAPPER_PREALLOC_KEY_SIZE);
        ssKey << key;
        ssValue.reserve(DBWRAPPER_PREALLOC_VALUE_SIZE);
        ssValue << value;
        WriteRaw(ssKey.str(), ssValue.str());
        ssKey.clear();
        ssValue.clear();
    }

    template<typename K>
    void Erase(const K& key)
    {
        ssKey.reserve(DBWRAPPER_PREALLOC_KEY_SIZE);
        ssKey << key;
        EraseRaw(ssKey.str());
        ssKey.clear();
    }

    /** Write an already-encoded key/value pair. */
    void WriteRaw(const std::string& key, const std::string& value)
    {
        batch.Put(key, value);
        // - varint: key length (1 byte up to 127B, 2 bytes up to 16383B, ...)
        // - varint: value length
        size_estimate += 3 + (key.size() > 127) + key.size() + (value.size() > 127) + value.size();
    }

    void EraseRaw(const std::string& key)
    {
        batch.Delete(key);
        size_estimate += 2 + (key.size() > 127) + key.size();
    }

    size_t SizeEstimate() const { return size_estimate; }
};

class CDBWrapper
{
private:
    //! custom environment this database is using (may be nullptr in case of default environment)
    std::unique_ptr<leveldb::Env> penv;

    //! database options used
    leveldb::Options options;

    //! options used when reading from the database
    leveldb::ReadOptions readoptions;

    //! options used when iterating over values of the database
    leveldb::ReadOptions iteroptions;

    //! options used when writing to the database
    leveldb::WriteOptions writeoptions;

    //! options used when sync writing to the database
    leveldb::WriteOptions syncoptions;

    //! the database itself
    std::unique_ptr<leveldb::DB> pdb;

    template<typename K>
    static std::string EncodeKey(const K& key)
    {
        CDataStream ssKey(SER_DISK, PROTOCOL_VERSION);
        ssKey.reserve(DBWRAPPER_PREALLOC_KEY_SIZE);
        ssKey << key;
        return ssKey.str();
    }

public:
    /**
     * @param[in] path        Location in the filesystem where leveldb data will be stored.
     * @param[in] nCacheSize  Configures various leveldb cache settings.
     * @param[in] fMemory     If true, use leveldb's memory environment.
     * @param[in] fWipe       If true, remove all existing data.
     */
    CDBWrapper(const fs::path& path, size_t nCacheSize, bool fMemory = false, bool fWipe = false);
    ~CDBWrapper();

    CDBWrapper(const CDBWrapper&) = delete;
    CDBWrapper& operator=(const CDBWrapper&) = delete;

    /**
     * Read an encoded value. Returns false when the key is absent, throws on storage failure.
     * With a snapshot, the read observes the database as of the snapshot.
     */
    bool ReadRaw(const std::string& key, std::string& value, const leveldb::Snapshot* snapshot = nullptr) const;

    /** Consistent read-only view of the current contents; release with ReleaseSnapshot(). */
    const leveldb::Snapshot* NewSnapshot() const { return pdb->GetSnapshot(); }
    void ReleaseSnapshot(const leveldb::Snapshot* snapshot) const { pdb->ReleaseSnapshot(snapshot); }

    template<typename K, typename V>
    bool Read(const K& key, V& value) const
    {
        std::string strValue;
        if (!ReadRaw(EncodeKey(key), strValue)) {
            return false;
        }
        try {
            CDataStream ssValue(strValue.data(), strValue.data() + strValue.size(), SER_DISK, PROTOCOL_VERSION);
            ssValue >> value;
        } catch (const std::exception&) {
            return false;
        }
        return true;
    }

    template<typename K, typename V>
    bool Write(const K& key, const V& value, bool fSync = false)
    {
        CDBBatch batch;
        batch.Write(key, value);
        return WriteBatch(batch, fSync);
    }

    template<typename K>
    bool Exists(const K& key) const
    {
        std::string strValue;
        return ReadRaw(EncodeKey(key), strValue);
    }

    template<typename K>
    bool Erase(const K& key, bool fSync = false)
    {
        CDBBatch batch;
        batch.Erase(key);
        return WriteBatch(batch, fSync);
    }

    bool WriteBatch(CDBBatch& batch, bool fSync = false);

    /**
     * Return true if the database managed by this class contains no entries.
     */
    bool IsEmpty();
};

#endif // ANCHORING_DBWRAPPER_H
