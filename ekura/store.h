/*=============================================================================

All signing keys are stored in a special database accessible by the class
KeyDB. This store reads in all keys and provides several operations to
handle these keys. Keys are identified by their address.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_STORE_H
#define EKURA_STORE_H

#include "helper.h"
#include "crypto/fixedbytes.h"
#include "crypto/key.h"
#include "database/keydb.h"

#include <map>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <boost/foreach.hpp>
#include <boost/scoped_ptr.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/serialization/utility.hpp>

// ----------------------------------------------------------------
template<class T>
class Store
{
public:

    Store() { this->map.clear(); }
    virtual ~Store() { this->map.clear(); }

protected:

    // Storage for elements
    typedef std::map<Address, T> Map;
    Map map;

    // Guards the map
    mutable boost::mutex mutex;

    // ----------------------------------------------------------------

    // Add an element to store
    void addElement(const Address &id, const T &element)
    {
        map[id] = element;
    }

    // Check if element exists
    bool containsElement(const Address &id) const
    {
        return map.count(id) > 0;
    }

    // Remove an element from store
    void removeElement(const Address &id)
    {
        map.erase(id);
    }
};

// ----------------------------------------------------------------
class KeyStore : public Store<SignKeyPair>
{
public:

    // Generate new key pair and add to store and database
    static bool genNewKeyPair(SignKeyPair &keyOut)
    {
        // generate key
        CKey key;
        key.MakeNewKey();

        // calculate public key
        CPubKey pubKey = key.GetPubKey();

        SignKeyPair result = std::make_pair(key, pubKey);

        // add key to store and database
        if (!addKeyPair(result))
            return false;

        keyOut = result;
        return true;
    }

    // Add a key pair to store and database
    static bool addKeyPair(const SignKeyPair &keypair)
    {
        KeyStore &instance = KeyStore::GetInstance();
        boost::mutex::scoped_lock lock(instance.mutex);

        // add key to database first
        if (!KeyDB::writeKey(keypair))
            return false;

        instance.addElement(keypair.second.GetAddress(), keypair);
        return true;
    }

    // Get a key pair from store
    static bool getKeyPair(const Address &address, SignKeyPair &keypairOut)
    {
        KeyStore &instance = KeyStore::GetInstance();
        boost::mutex::scoped_lock lock(instance.mutex);

        Map::const_iterator mi = instance.map.find(address);
        if (mi == instance.map.end())
            return false;

        keypairOut = mi->second;
        return true;
    }

    // Remove a key pair from store and database
    static void removeKeyPair(const Address &address)
    {
        KeyStore &instance = KeyStore::GetInstance();
        boost::mutex::scoped_lock lock(instance.mutex);

        instance.removeElement(address);
        KeyDB::eraseKey(address);
    }

    // Check if key pair is known
    static bool containsKeyPair(const Address &address)
    {
        KeyStore &instance = KeyStore::GetInstance();
        boost::mutex::scoped_lock lock(instance.mutex);
        return instance.containsElement(address);
    }

    // Get all addresses
    static void getAllAddresses(std::vector<Address> &addressesOut)
    {
        KeyStore &instance = KeyStore::GetInstance();
        boost::mutex::scoped_lock lock(instance.mutex);

        addressesOut.clear();
        BOOST_FOREACH(const Map::value_type& entry, instance.map)
            addressesOut.push_back(entry.first);
    }

    // Print all keys in store
    static std::string toString()
    {
        std::vector<Address> addresses;
        getAllAddresses(addresses);

        std::stringstream ss;
        ss << "KeyStore (" << addresses.size() << " keys)";
        BOOST_FOREACH(const Address& address, addresses)
            ss << "\n  " << address.ToString();
        return ss.str();
    }

private:

    // Singleton
    KeyStore() : Store<SignKeyPair>()
    {
        // load keys from database
        loadAllKeysFromDatabase();
    }

    KeyStore(KeyStore const&)           = delete;
    void operator=(KeyStore const&)     = delete;

    static KeyStore& GetInstance()
    {
        static KeyStore instance;
        return instance;
    }

    // Load all keys from database
    void loadAllKeysFromDatabase()
    {
        boost::scoped_ptr<leveldb::Iterator> iter(KeyDB::getIterator());

        for (iter->SeekToFirst(); iter->Valid(); iter->Next())
        {
            try
            {
                // read next item in database
                std::stringstream ssKey(iter->key().ToString());
                std::stringstream ssValue(iter->value().ToString());

                // key
                boost::archive::text_iarchive ia(ssKey);
                Address address;
                ia >> address;

                // value
                SignKeyPair keypair;
                boost::archive::text_iarchive iaValue(ssValue);
                iaValue >> keypair;

                // check key
                if (!keypair.first.IsValid() || !keypair.second.IsFullyValid() ||
                        keypair.first.GetPubKey() != keypair.second || address != keypair.second.GetAddress())
                {
                    Log::w("(Store) Could not verify key with address: %s", address.ToString().c_str());
                    continue;
                }

                // add to store
                addElement(address, keypair);
            }
            catch (const boost::archive::archive_exception& e)
            {
                Log::w("(Store) Skipping unreadable key entry: %s", e.what());
            }
        }

        // check for any errors found during the scan
        HandleError(iter->status());
    }
};

#endif // EKURA_STORE_H
