/*=============================================================================

Base class to operate on a database. LevelDB works as a key/value database,
keys and values are serialized with boost text archives.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_LEVELDBWRAPPER_H
#define EKURA_LEVELDBWRAPPER_H

#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/archive/text_oarchive.hpp>
#include <boost/archive/text_iarchive.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/utility.hpp>

#include <leveldb/db.h>
#include <leveldb/write_batch.h>

// ----------------------------------------------------------------
// Log the error and throw, does nothing on success
void HandleError(const leveldb::Status &status);

// ----------------------------------------------------------------
// Serialize a key or value into its database representation
template<typename T>
std::string SerializeEntry(const T& entry)
{
    std::stringstream stream;
    boost::archive::text_oarchive oa(stream);
    oa << entry;
    return stream.str();
}

// ----------------------------------------------------------------
// Batch of changes queued to be written to a LevelDBWrapper
class LevelDBBatch
{
public:

    template<typename K, typename V>
    void Write(const K& key, const V& value)
    {
        std::string strKey = SerializeEntry(key);
        std::string strValue = SerializeEntry(value);
        batch.Put(leveldb::Slice(strKey), leveldb::Slice(strValue));
    }

    template<typename K>
    void Erase(const K& key)
    {
        std::string strKey = SerializeEntry(key);
        batch.Delete(leveldb::Slice(strKey));
    }

private:

    friend class LevelDBWrapper;

    leveldb::WriteBatch batch;
};

// ----------------------------------------------------------------
class LevelDBWrapper
{
public:

    LevelDBWrapper(const boost::filesystem::path &path, size_t nCacheSize, bool fWipe = false);
    ~LevelDBWrapper();

    // ----------------------------------------------------------------

    // Returns false if the key is missing or the value can not be parsed
    template<typename K, typename V>
    bool Read(const K& key, V& value)
    {
        std::string strKey = SerializeEntry(key);

        std::string strValue;
        leveldb::Status status = pdb->Get(readoptions, leveldb::Slice(strKey), &strValue);
        if (!status.ok())
        {
            if (status.IsNotFound())
                return false;
            HandleError(status);
        }

        try
        {
            std::stringstream inStream(strValue);
            boost::archive::text_iarchive ia(inStream);
            ia >> value;
        }
        catch(const boost::archive::archive_exception &e)
        {
            LogParseFailure(e.what());
            return false;
        }
        return true;
    }

    template<typename K>
    bool Exists(const K& key)
    {
        std::string strKey = SerializeEntry(key);

        std::string strValue;
        leveldb::Status status = pdb->Get(readoptions, leveldb::Slice(strKey), &strValue);
        if (!status.ok())
        {
            if (status.IsNotFound())
                return false;
            HandleError(status);
        }
        return true;
    }

    template<typename K, typename V>
    bool Write(const K& key, const V& value, bool fSync = false)
    {
        LevelDBBatch batch;
        batch.Write(key, value);
        return WriteBatch(batch, fSync);
    }

    template<typename K>
    bool Erase(const K& key, bool fSync = false)
    {
        LevelDBBatch batch;
        batch.Erase(key);
        return WriteBatch(batch, fSync);
    }

    bool WriteBatch(LevelDBBatch &batch, bool fSync = false);

    bool Sync()
    {
        LevelDBBatch batch;
        return WriteBatch(batch, true);
    }

    // ----------------------------------------------------------------

    // Caller takes ownership
    leveldb::Iterator *NewIterator()
    {
        return pdb->NewIterator(iteroptions);
    }

private:

    // Database options used
    leveldb::Options options;

    // Options used when reading from the database
    leveldb::ReadOptions readoptions;

    // Options used when iterating over values of the database
    leveldb::ReadOptions iteroptions;

    // Options used when writing to the database
    leveldb::WriteOptions writeoptions;

    // Options used when sync writing to the database
    leveldb::WriteOptions syncoptions;

    // The database itself
    leveldb::DB *pdb;

    static void LogParseFailure(const char* what);

    LevelDBWrapper(const LevelDBWrapper&) = delete;
    void operator=(const LevelDBWrapper&) = delete;
};

#endif // EKURA_LEVELDBWRAPPER_H
