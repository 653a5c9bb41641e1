/*=============================================================================

This class acts as controller of the command line client, handling and
delegating all commands. It deploys a platform into the data directory,
restores it for every later command, issues the requested operation as the
identity given by --from and stores the resulting state.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_CONTROLLER_H
#define EKURA_CONTROLLER_H

#include "clock.h"
#include "events.h"
#include "result.h"
#include "contracts/electionfactory.h"
#include "contracts/votestorage.h"
#include "crypto/fixedbytes.h"
#include "crypto/key.h"
#include "database/statedb.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

#include <boost/function.hpp>
#include <boost/scoped_ptr.hpp>

typedef std::vector<std::string> Arguments;

// ----------------------------------------------------------------
// Derive the address of a contract deployed by the given deployer
Address DeriveContractAddress(const Address& deployer, uint64_t chainId, const std::string& label);

// ----------------------------------------------------------------
class Controller
{
public:

    Controller();

    // Run the given command, returns false on any failure
    bool execute(const std::string& command, const Arguments& args);

    // Print all known commands
    std::string usage() const;

private:

    typedef boost::function<bool (const Arguments&)> Handler;

    struct Command
    {
        Handler handler;

        // Minimum number of arguments
        size_t minArgs;

        // Whether a deployed platform is needed
        bool needsPlatform;

        // Whether the platform state has to be stored afterwards
        bool mutates;

        std::string usage;
    };

    std::map<std::string, Command> commands;

    SystemClock clock;

    EventLog eventLog;

    Deployment deployment;

    boost::scoped_ptr<StateDB> stateDB;

    boost::scoped_ptr<ElectionFactory> factory;

    boost::scoped_ptr<VoteStorage> storage;

    // ----------------------------------------------------------------

    void add(const std::string& name, Handler handler, size_t minArgs,
             bool needsPlatform, bool mutates, const std::string& usage);

    // Open the state database and restore the deployed platform
    bool loadPlatform();

    void savePlatform();

    // Identity given by --from, its key has to be in the key store
    bool getCaller(SignKeyPair& keyOut);

    // Log a result, returns true for RC_OK
    bool report(const std::string& operation, ResultCode result);

    // ----- Commands -----

    bool onDeploy(const Arguments&);
    bool onGenKey(const Arguments&);
    bool onKeys(const Arguments&);
    bool onAddAdmin(const Arguments&);
    bool onRemoveAdmin(const Arguments&);
    bool onCreateElection(const Arguments&);
    bool onToggle(const Arguments&);
    bool onElection(const Arguments&);
    bool onOrganization(const Arguments&);
    bool onVote(const Arguments&);
    bool onSignVote(const Arguments&);
    bool onRelay(const Arguments&);
    bool onResults(const Arguments&);
    bool onVerify(const Arguments&);
    bool onPause(const Arguments&);
    bool onUnpause(const Arguments&);
    bool onSetFactory(const Arguments&);
    bool onTransferOwner(const Arguments&);
    bool onEvents(const Arguments&);
    bool onInfo(const Arguments&);
};

#endif // EKURA_CONTROLLER_H
