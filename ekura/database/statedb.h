/*=============================================================================

Persistently stores a deployed platform: the deployment metadata, the state
of the registry and the ballot store as well as the event log. A deployment
is always written as a whole in a single batch.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_STATEDB_H
#define EKURA_STATEDB_H

#include "settings.h"
#include "events.h"
#include "contracts/electionfactory.h"
#include "contracts/votestorage.h"
#include "crypto/fixedbytes.h"
#include "database/leveldbwrapper.h"

#include <stdint.h>
#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/serialization/access.hpp>
#include <boost/serialization/string.hpp>

// ==========================================================================

#define KEY_DEPLOYMENT  "deployment"
#define KEY_FACTORY     "factory"
#define KEY_STORAGE     "storage"
#define KEY_EVENTS      "events"

// ----------------------------------------------------------------
// Where and by whom the platform was deployed
class Deployment
{
public:
    std::string network;

    uint64_t chainId = 0;

    Address deployer;

    Address platformAdmin;

    Address factoryAddress;

    Address storageAddress;

    int64_t deployedAt = 0;

    // ----------------------------------------------------------------

    std::string toString() const;

private:
    friend class boost::serialization::access;

    template <typename Archive>
    void serialize(Archive& a, const unsigned int)
    {
        a & this->network;
        a & this->chainId;
        a & this->deployer;
        a & this->platformAdmin;
        a & this->factoryAddress;
        a & this->storageAddress;
        a & this->deployedAt;
    }
};

// ----------------------------------------------------------------
class StateDB : public LevelDBWrapper
{
public:
    StateDB(const boost::filesystem::path& databaseDir, bool fWipe = false):
        LevelDBWrapper(databaseDir, Settings::DEFAULT_DB_CACHE, fWipe) {}

    // Default location inside the data directory
    static boost::filesystem::path GetDefaultPath()
    {
        return boost::filesystem::path(Settings::GetDirectory()) / "databases" / "state";
    }

    // Check if a platform was deployed into this database
    bool HasDeployment();

    bool ReadDeployment(Deployment& deploymentOut);

    // Load everything into freshly constructed components and reattach
    // the ballot store to the registry
    bool Load(ElectionFactory& factory, VoteStorage& storage, EventLog& eventLog);

    // Write everything in one batch
    void Save(const Deployment& deployment, const ElectionFactory& factory,
              const VoteStorage& storage, const EventLog& eventLog);
};

#endif // EKURA_STATEDB_H
