// Copyright (c) 2012-2014 The Bitcoin developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "database/leveldbwrapper.h"
#include "helper.h"

#include <boost/filesystem.hpp>
#include <leveldb/cache.h>
#include <leveldb/env.h>
#include <leveldb/filter_policy.h>

void HandleError(const leveldb::Status &status)
{
    if (status.ok())
        return;
    if (status.IsCorruption())
        Log::e("(LevelDB) Database corrupted");
    else if (status.IsIOError())
        Log::e("(LevelDB) Database I/O error");
    else if (status.IsNotFound())
        Log::e("(LevelDB) Database entry missing");
    else
        Log::e("(LevelDB) Unknown database error");

    throw std::runtime_error("Database error: " + status.ToString());
}

static leveldb::Options GetOptions(size_t nCacheSize)
{
    leveldb::Options options;
    options.block_cache = leveldb::NewLRUCache(nCacheSize / 2);
    // up to two write buffers may be held in memory simultaneously
    options.write_buffer_size = nCacheSize / 4;
    options.filter_policy = leveldb::NewBloomFilterPolicy(10);
    options.compression = leveldb::kNoCompression;
    options.max_open_files = 64;
    return options;
}

// ====================================================================

LevelDBWrapper::LevelDBWrapper(const boost::filesystem::path &path, size_t nCacheSize, bool fWipe)
{
    pdb = NULL;
    readoptions.verify_checksums = true;
    iteroptions.verify_checksums = true;
    iteroptions.fill_cache = false;
    syncoptions.sync = true;
    options = GetOptions(nCacheSize);
    options.create_if_missing = true;

    if (fWipe)
    {
        Log::i("(LevelDB) Wiping %s", path.string().c_str());
        leveldb::DestroyDB(path.string(), options);
    }
    Helper::CreateDirectories(path);

    leveldb::Status status = leveldb::DB::Open(options, path.string(), &pdb);
    if (!status.ok())
    {
        delete options.filter_policy;
        delete options.block_cache;
    }
    HandleError(status);

    Log::i("(LevelDB) Opened %s", path.string().c_str());
}

LevelDBWrapper::~LevelDBWrapper()
{
    delete pdb;
    pdb = NULL;

    delete options.filter_policy;
    options.filter_policy = NULL;

    delete options.block_cache;
    options.block_cache = NULL;
}

bool LevelDBWrapper::WriteBatch(LevelDBBatch &batch, bool fSync)
{
    leveldb::Status status = pdb->Write(fSync ? syncoptions : writeoptions, &batch.batch);
    HandleError(status);
    return true;
}

void LevelDBWrapper::LogParseFailure(const char* what)
{
    Log::w("(LevelDB) Could not parse stored value: %s", what);
}
