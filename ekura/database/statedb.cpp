#include "database/statedb.h"
#include "helper.h"

#include <sstream>

// ================================================================

std::string
Deployment::toString() const
{
    std::stringstream ss;
    ss << "Deployment {network=" << network << ", chainId=" << chainId
       << ", deployer=" << deployer.ToString()
       << ", platformAdmin=" << platformAdmin.ToString()
       << ", factory=" << factoryAddress.ToString()
       << ", storage=" << storageAddress.ToString()
       << ", at=" << Helper::FormatTime("%Y-%m-%d %H:%M:%S", deployedAt) << "}";
    return ss.str();
}

// ================================================================

bool
StateDB::HasDeployment()
{
    return this->Exists(std::string(KEY_DEPLOYMENT));
}

// ----------------------------------------------------------------

bool
StateDB::ReadDeployment(Deployment& deploymentOut)
{
    return this->Read(std::string(KEY_DEPLOYMENT), deploymentOut);
}

// ----------------------------------------------------------------

bool
StateDB::Load(ElectionFactory& factory, VoteStorage& storage, EventLog& eventLog)
{
    if (!this->Read(std::string(KEY_FACTORY), factory))
    {
        Log::e("(StateDB) Could not load the registry");
        return false;
    }

    if (!this->Read(std::string(KEY_STORAGE), storage))
    {
        Log::e("(StateDB) Could not load the ballot store");
        return false;
    }

    if (!this->Read(std::string(KEY_EVENTS), eventLog))
    {
        Log::e("(StateDB) Could not load the event log");
        return false;
    }

    // a ballot store initialized without registry stays detached
    if (!storage.getElectionFactory().IsNull() && !storage.attachElectionFactory(&factory))
    {
        Log::e("(StateDB) Ballot store refers to unknown registry %s",
               storage.getElectionFactory().ToString().c_str());
        return false;
    }

    Log::i("(StateDB) Loaded %llu elections and %lu events",
           (unsigned long long) factory.getTotalElections(), (unsigned long) eventLog.size());
    return true;
}

// ----------------------------------------------------------------

void
StateDB::Save(const Deployment& deployment, const ElectionFactory& factory,
              const VoteStorage& storage, const EventLog& eventLog)
{
    LevelDBBatch batch;
    batch.Write(std::string(KEY_DEPLOYMENT), deployment);
    batch.Write(std::string(KEY_FACTORY), factory);
    batch.Write(std::string(KEY_STORAGE), storage);
    batch.Write(std::string(KEY_EVENTS), eventLog);

    this->WriteBatch(batch, true);
}
