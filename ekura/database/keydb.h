/*=============================================================================

Providing access to the database for signing keys. The client does not use
this interface directly, because the KeyStore handles all requests on key
operations and forwards them to this class if necessary.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_KEYDB_H
#define EKURA_KEYDB_H

#include "settings.h"
#include "crypto/key.h"
#include "database/leveldbwrapper.h"

#include <boost/filesystem/path.hpp>

class KeyDB : public LevelDBWrapper
{
private:

    // Use KeyStore as handler for keys to avoid DB requests
    friend class KeyStore;

    // Singleton
    KeyDB(const boost::filesystem::path databaseDir, const int64_t cacheSize = Settings::DEFAULT_DB_CACHE)
            : LevelDBWrapper(databaseDir, cacheSize)
    { }

    KeyDB(KeyDB const&)             = delete;
    void operator=(KeyDB const&)    = delete;

    static KeyDB& getInstance()
    {
        static KeyDB instance(boost::filesystem::path(Settings::GetDirectory()) / "databases" / "keys");
        return instance;
    }

    // Write a key pair to database
    static bool writeKey(const SignKeyPair &keyPair)
    {
        KeyDB &db = KeyDB::getInstance();
        return db.Write(keyPair.second.GetAddress(), keyPair, true);
    }

    // Erase a key pair from database
    static void eraseKey(const Address &address)
    {
        KeyDB &db = KeyDB::getInstance();
        db.Erase(address, true);
    }

    // Generate iterator for database
    static leveldb::Iterator* getIterator()
    {
        KeyDB &db = KeyDB::getInstance();
        return db.NewIterator();
    }
};

#endif // EKURA_KEYDB_H
