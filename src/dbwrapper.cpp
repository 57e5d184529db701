// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "dbwrapper.h"

#include "logging.h"

#include <leveldb/cache.h>
#include <leveldb/env.h>
#include <leveldb/filter_policy.h>
#include <leveldb/helpers/memenv.h>

static leveldb::Options GetOptions(size_t nCacheSize)
{
    leveldb::Options options;
    options.block_cache = leveldb::NewLRUCache(nCacheSize / 2);
    options.write_buffer_size = nCacheSize / 4; // up to two write buffers may be held in memory simultaneously
    options.filter_policy = leveldb::NewBloomFilterPolicy(10);
    options.compression = leveldb::kNoCompression;
    options.max_open_files = 64;
    return options;
}

CDBWrapper::CDBWrapper(const fs::path& path, size_t nCacheSize, bool fMemory, bool fWipe)
{
    readoptions.verify_checksums = true;
    iteroptions.verify_checksums = true;
    iteroptions.fill_cache = false;
    syncoptions.sync = true;
    options = GetOptions(nCacheSize);
    options.create_if_missing = true;
    if (fMemory) {
        penv.reset(leveldb::NewMemEnv(leveldb::Env::Default()));
        options.env = penv.get();
    } else {
        if (fWipe) {
            LogPrintf("Wiping LevelDB in %s\n", path.string());
            leveldb::Status result = leveldb::DestroyDB(path.string(), options);
            dbwrapper_private::HandleError(result);
        }
        fs::create_directories(path);
        LogPrintf("Opening LevelDB in %s\n", path.string());
    }
    leveldb::DB* raw = nullptr;
    leveldb::Status status = leveldb::DB::Open(options, path.string(), &raw);
    dbwrapper_private::HandleError(status);
    pdb.reset(raw);
    LogPrint(BCLog::DB, "Opened LevelDB successfully\n");
}

CDBWrapper::~CDBWrapper()
{
    pdb.reset();
    delete options.filter_policy;
    options.filter_policy = nullptr;
    delete options.block_cache;
    options.block_cache = nullptr;
    penv.reset();
    options.env = nullptr;
}

bool CDBWrapper::ReadRaw(const std::string& key, std::string& value, const leveldb::Snapshot* snapshot) const
{
    leveldb::ReadOptions options = readoptions;
    options.snapshot = snapshot;
    leveldb::Status status = pdb->Get(options, key, &value);
    if (!status.ok()) {
        if (status.IsNotFound())
            return false;
        LogPrintf("LevelDB read failure: %s\n", status.ToString());
        dbwrapper_private::HandleError(status);
    }
    return true;
}

bool CDBWrapper::WriteBatch(CDBBatch& batch, bool fSync)
{
    const bool log_memory = LogAcceptCategory(BCLog::DB);
    if (log_memory) {
        LogPrint(BCLog::DB, "WriteBatch: %zu bytes estimated\n", batch.SizeEstimate());
    }
    leveldb::Status status = pdb->Write(fSync ? syncoptions : writeoptions, &batch.batch);
    dbwrapper_private::HandleError(status);
    return true;
}

bool CDBWrapper::IsEmpty()
{
    std::unique_ptr<leveldb::Iterator> it(pdb->NewIterator(iteroptions));
    it->SeekToFirst();
    return !(it->Valid());
}

namespace dbwrapper_private {

void HandleError(const leveldb::Status& status)
{
    if (status.ok())
        return;
    const std::string errmsg = "Fatal LevelDB error: " + status.ToString();
    LogPrintf("%s\n", errmsg);
    LogPrintf("You can use -debug=db to get more complete diagnostic messages\n");
    throw dbwrapper_error(errmsg);
}

} // namespace dbwrapper_private
