#include "controller.h"

#include "helper.h"
#include "settings.h"
#include "store.h"
#include "crypto/hash.h"
#include "crypto/typeddata.h"

#include <iostream>
#include <sstream>

#include <boost/bind/bind.hpp>
#include <boost/foreach.hpp>
#include <boost/lexical_cast.hpp>

using namespace boost::placeholders;

// ================================================================

static bool
ParseNumber(const std::string& str, uint64_t& out)
{
    if (str.empty() || str.find_first_not_of("0123456789") != std::string::npos)
    {
        Log::e("(Controller) Not a number: %s", str.c_str());
        return false;
    }

    try
    {
        out = boost::lexical_cast<uint64_t>(str);
    }
    catch (const boost::bad_lexical_cast&)
    {
        Log::e("(Controller) Number out of range: %s", str.c_str());
        return false;
    }

    return true;
}

// ----------------------------------------------------------------

static bool
ParseAddress(const std::string& str, Address& out)
{
    if (!out.SetHex(str))
    {
        Log::e("(Controller) Not an address: %s", str.c_str());
        return false;
    }

    return true;
}

// ----------------------------------------------------------------

Address
DeriveContractAddress(const Address& deployer, uint64_t chainId, const std::string& label)
{
    std::vector<unsigned char> buffer(deployer.begin(), deployer.end());
    for (int i = 7; i >= 0; i--)
        buffer.push_back(static_cast<unsigned char>(chainId >> (8 * i)));
    buffer.insert(buffer.end(), label.begin(), label.end());

    return Hash160(&buffer[0], &buffer[0] + buffer.size());
}

// ================================================================

Controller::Controller()
{
    // ----- Deployment & keys -----
    add("deploy", boost::bind(&Controller::onDeploy, this, _1), 0, false, false,
        "deploy                          deploy a fresh platform (admin = --from or a new key)");
    add("genkey", boost::bind(&Controller::onGenKey, this, _1), 0, false, false,
        "genkey                          generate a new signing key");
    add("keys", boost::bind(&Controller::onKeys, this, _1), 0, false, false,
        "keys                            list all stored addresses");
    add("info", boost::bind(&Controller::onInfo, this, _1), 0, true, false,
        "info                            print the deployment");

    // ----- Registry -----
    add("add-admin", boost::bind(&Controller::onAddAdmin, this, _1), 2, true, true,
        "add-admin ORG ADDR              grant org admin rights");
    add("remove-admin", boost::bind(&Controller::onRemoveAdmin, this, _1), 2, true, true,
        "remove-admin ORG ADDR           revoke org admin rights");
    add("create-election", boost::bind(&Controller::onCreateElection, this, _1), 6, true, true,
        "create-election ORG NAME DESC START END CAND...  (times: UNIX sec or +N)");
    add("toggle", boost::bind(&Controller::onToggle, this, _1), 1, true, true,
        "toggle ID                       toggle the election status");
    add("election", boost::bind(&Controller::onElection, this, _1), 1, true, false,
        "election ID                     print an election");
    add("org", boost::bind(&Controller::onOrganization, this, _1), 1, true, false,
        "org ORG                         print an organization");

    // ----- Ballot store -----
    add("vote", boost::bind(&Controller::onVote, this, _1), 2, true, true,
        "vote ID CAND                    vote as --from");
    add("sign-vote", boost::bind(&Controller::onSignVote, this, _1), 3, true, false,
        "sign-vote ID CAND DEADLINE      sign a vote payload as --from");
    add("relay", boost::bind(&Controller::onRelay, this, _1), 6, true, true,
        "relay VOTER ID CAND NONCE DEADLINE SIG  relay a signed vote as --from");
    add("results", boost::bind(&Controller::onResults, this, _1), 1, true, false,
        "results ID                      print all tallies");
    add("verify", boost::bind(&Controller::onVerify, this, _1), 3, true, false,
        "verify ID VOTER CAND            check a recorded vote");
    add("pause", boost::bind(&Controller::onPause, this, _1), 0, true, true,
        "pause                           pause voting (owner)");
    add("unpause", boost::bind(&Controller::onUnpause, this, _1), 0, true, true,
        "unpause                         resume voting (owner)");
    add("set-factory", boost::bind(&Controller::onSetFactory, this, _1), 1, true, true,
        "set-factory ADDR                set the registry (owner)");
    add("transfer-owner", boost::bind(&Controller::onTransferOwner, this, _1), 1, true, true,
        "transfer-owner ADDR             transfer ownership (owner)");
    add("events", boost::bind(&Controller::onEvents, this, _1), 0, true, false,
        "events                          print the event log");
}

// ----------------------------------------------------------------

void
Controller::add(const std::string& name, Handler handler, size_t minArgs,
                bool needsPlatform, bool mutates, const std::string& usage)
{
    Command command;
    command.handler = handler;
    command.minArgs = minArgs;
    command.needsPlatform = needsPlatform;
    command.mutates = mutates;
    command.usage = usage;
    this->commands[name] = command;
}

// ----------------------------------------------------------------

std::string
Controller::usage() const
{
    std::stringstream ss;
    ss << "Commands:";
    BOOST_FOREACH(const std::map<std::string, Command>::value_type& entry, this->commands)
        ss << "\n  " << entry.second.usage;
    return ss.str();
}

// ----------------------------------------------------------------

bool
Controller::execute(const std::string& name, const Arguments& args)
{
    std::map<std::string, Command>::const_iterator it = this->commands.find(name);
    if (it == this->commands.end())
    {
        Log::e("(Controller) Unknown command \"%s\"", name.c_str());
        std::cout << this->usage() << std::endl;
        return false;
    }

    const Command& command = it->second;
    if (args.size() < command.minArgs)
    {
        Log::e("(Controller) Missing arguments. Usage: %s", command.usage.c_str());
        return false;
    }

    if (command.needsPlatform && !this->loadPlatform())
        return false;

    if (!command.handler(args))
        return false;

    if (command.mutates)
        this->savePlatform();

    return true;
}

// ================================================================

bool
Controller::loadPlatform()
{
    this->stateDB.reset(new StateDB(StateDB::GetDefaultPath()));

    if (!this->stateDB->ReadDeployment(this->deployment))
    {
        Log::e("(Controller) No platform deployed in %s, run \"deploy\" first",
               Settings::GetDirectory().c_str());
        return false;
    }

    if (this->deployment.chainId != Settings::GetChainId())
        Log::w("(Controller) Platform was deployed for chain %llu, ignoring configured chain %llu",
               (unsigned long long) this->deployment.chainId,
               (unsigned long long) Settings::GetChainId());

    this->factory.reset(new ElectionFactory(this->deployment.factoryAddress, this->deployment.platformAdmin,
                                            this->clock, this->eventLog));
    this->storage.reset(new VoteStorage(this->deployment.storageAddress, this->deployment.chainId,
                                        this->clock, this->eventLog));

    return this->stateDB->Load(*this->factory, *this->storage, this->eventLog);
}

// ----------------------------------------------------------------

void
Controller::savePlatform()
{
    this->stateDB->Save(this->deployment, *this->factory, *this->storage, this->eventLog);
    Log::i("(Controller) Platform state stored");
}

// ----------------------------------------------------------------

bool
Controller::getCaller(SignKeyPair& keyOut)
{
    std::string from = Settings::GetFrom();
    if (from.empty())
    {
        Log::e("(Controller) No identity given, use --from ADDRESS");
        return false;
    }

    Address address;
    if (!ParseAddress(from, address))
        return false;

    if (!KeyStore::getKeyPair(address, keyOut))
    {
        Log::e("(Controller) No key stored for %s", address.ToString().c_str());
        return false;
    }

    return true;
}

// ----------------------------------------------------------------

bool
Controller::report(const std::string& operation, ResultCode result)
{
    if (result == RC_OK)
    {
        std::cout << operation << ": OK" << std::endl;
        return true;
    }

    Log::e("(Controller) %s failed: %s (%s)", operation.c_str(),
           resultName(result).c_str(), printResultCode(result).c_str());
    std::cout << operation << ": " << resultName(result) << std::endl;
    return false;
}

// ================================================================
// Deployment & keys

bool
Controller::onDeploy(const Arguments&)
{
    this->stateDB.reset(new StateDB(StateDB::GetDefaultPath()));
    if (this->stateDB->HasDeployment())
    {
        Log::e("(Controller) A platform is already deployed in %s", Settings::GetDirectory().c_str());
        return false;
    }

    // the deployer becomes platform admin and ballot store owner
    SignKeyPair deployer;
    if (Settings::GetFrom().empty())
    {
        if (!KeyStore::genNewKeyPair(deployer))
        {
            Log::e("(Controller) Could not store a new deployer key");
            return false;
        }
        Log::i("(Controller) Generated deployer key %s", deployer.second.GetAddress().ToString().c_str());
    }
    else if (!this->getCaller(deployer))
        return false;

    Address deployerAddress = deployer.second.GetAddress();
    uint64_t chainId = Settings::GetChainId();

    this->deployment.network = Settings::GetNetwork();
    this->deployment.chainId = chainId;
    this->deployment.deployer = deployerAddress;
    this->deployment.platformAdmin = deployerAddress;
    this->deployment.factoryAddress = DeriveContractAddress(deployerAddress, chainId, "ElectionFactory");
    this->deployment.storageAddress = DeriveContractAddress(deployerAddress, chainId, "VoteStorage");
    this->deployment.deployedAt = this->clock.now();

    Log::i("(Controller) Deploying to %s (chain %llu)", this->deployment.network.c_str(),
           (unsigned long long) chainId);

    this->factory.reset(new ElectionFactory(this->deployment.factoryAddress, deployerAddress,
                                            this->clock, this->eventLog));
    this->storage.reset(new VoteStorage(this->deployment.storageAddress, chainId,
                                        this->clock, this->eventLog));

    if (!this->report("initialize", this->storage->initialize(deployerAddress, this->factory.get())))
        return false;

    this->savePlatform();

    std::cout << this->deployment.toString() << std::endl;
    return true;
}

// ----------------------------------------------------------------

bool
Controller::onGenKey(const Arguments&)
{
    SignKeyPair keyPair;
    if (!KeyStore::genNewKeyPair(keyPair))
    {
        Log::e("(Controller) Could not store the new key");
        return false;
    }

    std::cout << keyPair.second.GetAddress().ToString() << std::endl;
    return true;
}

// ----------------------------------------------------------------

bool
Controller::onKeys(const Arguments&)
{
    std::cout << KeyStore::toString() << std::endl;
    return true;
}

// ----------------------------------------------------------------

bool
Controller::onInfo(const Arguments&)
{
    std::cout << this->deployment.toString() << std::endl;
    std::cout << "owner=" << this->storage->getOwner().ToString()
              << " paused=" << (this->storage->isPaused() ? "true" : "false")
              << " elections=" << this->factory->getTotalElections()
              << " events=" << this->eventLog.size() << std::endl;
    std::cout << "domainSeparator=0x" << this->storage->getDomainSeparator().GetHex() << std::endl;
    return true;
}

// ================================================================
// Registry

bool
Controller::onAddAdmin(const Arguments& args)
{
    SignKeyPair caller;
    uint64_t orgId;
    Address admin;
    if (!this->getCaller(caller) || !ParseNumber(args[0], orgId) || !ParseAddress(args[1], admin))
        return false;

    return this->report("add-admin", this->factory->addOrgAdmin(caller.second.GetAddress(), orgId, admin));
}

// ----------------------------------------------------------------

bool
Controller::onRemoveAdmin(const Arguments& args)
{
    SignKeyPair caller;
    uint64_t orgId;
    Address admin;
    if (!this->getCaller(caller) || !ParseNumber(args[0], orgId) || !ParseAddress(args[1], admin))
        return false;

    return this->report("remove-admin", this->factory->removeOrgAdmin(caller.second.GetAddress(), orgId, admin));
}

// ----------------------------------------------------------------

bool
Controller::onCreateElection(const Arguments& args)
{
    SignKeyPair caller;
    uint64_t orgId;
    if (!this->getCaller(caller) || !ParseNumber(args[0], orgId))
        return false;

    int64_t now = this->clock.now();
    int64_t startTime, endTime;
    if (!Helper::ParseTime(args[3], now, startTime) || !Helper::ParseTime(args[4], now, endTime))
    {
        Log::e("(Controller) Times must be UNIX seconds or +N");
        return false;
    }

    Candidates candidates(args.begin() + 5, args.end());

    uint64_t electionId = 0;
    ResultCode result = this->factory->createElection(caller.second.GetAddress(), orgId,
                                                      args[1], args[2], startTime, endTime,
                                                      candidates, electionId);
    if (!this->report("create-election", result))
        return false;

    std::cout << "electionId=" << electionId << std::endl;
    return true;
}

// ----------------------------------------------------------------

bool
Controller::onToggle(const Arguments& args)
{
    SignKeyPair caller;
    uint64_t electionId;
    if (!this->getCaller(caller) || !ParseNumber(args[0], electionId))
        return false;

    return this->report("toggle", this->factory->toggleElectionStatus(caller.second.GetAddress(), electionId));
}

// ----------------------------------------------------------------

bool
Controller::onElection(const Arguments& args)
{
    uint64_t electionId;
    if (!ParseNumber(args[0], electionId))
        return false;

    Election election;
    ResultCode result = this->factory->getElection(electionId, election);
    if (result != RC_OK)
        return this->report("election", result);

    bool active = false;
    if (this->factory->isElectionActive(electionId, active) != RC_OK)
        active = false;

    std::cout << "Election " << election.id << " (org " << election.orgId << ")" << std::endl;
    std::cout << "  name:        " << election.name << std::endl;
    std::cout << "  description: " << election.description << std::endl;
    std::cout << "  window:      " << Helper::FormatTime("%Y-%m-%d %H:%M:%S", election.startTime)
              << " - " << Helper::FormatTime("%Y-%m-%d %H:%M:%S", election.endTime) << std::endl;
    std::cout << "  enabled:     " << (election.isActive ? "yes" : "no")
              << ", open now: " << (active ? "yes" : "no") << std::endl;
    std::cout << "  creator:     " << election.creator.ToString() << std::endl;
    for (size_t i = 0; i < election.candidates.size(); i++)
        std::cout << "  [" << i << "] " << election.candidates[i] << std::endl;

    return true;
}

// ----------------------------------------------------------------

bool
Controller::onOrganization(const Arguments& args)
{
    uint64_t orgId;
    if (!ParseNumber(args[0], orgId))
        return false;

    Organization organization;
    if (!this->factory->getOrganization(orgId, organization))
    {
        std::cout << "Organization " << orgId << " is unknown" << std::endl;
        return true;
    }

    std::cout << "Organization " << orgId << std::endl;
    BOOST_FOREACH(const Address& admin, organization.admins)
        std::cout << "  admin:    " << admin.ToString() << std::endl;
    BOOST_FOREACH(uint64_t electionId, organization.electionIds)
        std::cout << "  election: " << electionId << std::endl;

    return true;
}

// ================================================================
// Ballot store

bool
Controller::onVote(const Arguments& args)
{
    SignKeyPair caller;
    uint64_t electionId, candidateId;
    if (!this->getCaller(caller) || !ParseNumber(args[0], electionId) || !ParseNumber(args[1], candidateId))
        return false;

    Address voter = caller.second.GetAddress();
    if (!this->report("vote", this->storage->vote(voter, electionId, candidateId)))
        return false;

    std::cout << "voteHash=0x" << this->storage->getVoteHash(electionId, voter).GetHex() << std::endl;
    return true;
}

// ----------------------------------------------------------------

bool
Controller::onSignVote(const Arguments& args)
{
    SignKeyPair caller;
    uint64_t electionId, candidateId;
    if (!this->getCaller(caller) || !ParseNumber(args[0], electionId) || !ParseNumber(args[1], candidateId))
        return false;

    VoteData data;
    data.voter = caller.second.GetAddress();
    data.electionId = electionId;
    data.candidateId = candidateId;
    data.nonce = this->storage->getNonce(data.voter);
    if (!Helper::ParseTime(args[2], this->clock.now(), data.deadline))
    {
        Log::e("(Controller) Deadline must be UNIX seconds or +N");
        return false;
    }

    std::vector<unsigned char> signature;
    if (!this->storage->getSigningDomain().Sign(caller.first, data, signature))
    {
        Log::e("(Controller) Could not sign %s", data.toString().c_str());
        return false;
    }

    Log::i("(Controller) Signed %s", data.toString().c_str());

    // ready to be passed to "relay"
    std::cout << data.voter.ToString() << " " << data.electionId << " " << data.candidateId << " "
              << data.nonce << " " << data.deadline << " 0x" << EncodeHex(signature) << std::endl;
    return true;
}

// ----------------------------------------------------------------

bool
Controller::onRelay(const Arguments& args)
{
    SignKeyPair caller;
    VoteData data;
    uint64_t deadline;
    if (!this->getCaller(caller) || !ParseAddress(args[0], data.voter) ||
            !ParseNumber(args[1], data.electionId) || !ParseNumber(args[2], data.candidateId) ||
            !ParseNumber(args[3], data.nonce) || !ParseNumber(args[4], deadline))
        return false;
    data.deadline = static_cast<int64_t>(deadline);

    std::vector<unsigned char> signature;
    if (!DecodeHex(args[5], signature))
    {
        Log::e("(Controller) Signature is no hex string");
        return false;
    }

    return this->report("relay", this->storage->voteWithSignature(caller.second.GetAddress(), data, signature));
}

// ----------------------------------------------------------------

bool
Controller::onResults(const Arguments& args)
{
    uint64_t electionId;
    if (!ParseNumber(args[0], electionId))
        return false;

    Election election;
    ResultCode result = this->factory->getElection(electionId, election);
    if (result != RC_OK)
        return this->report("results", result);

    std::vector<uint64_t> counts;
    result = this->storage->getAllVoteCounts(electionId, counts);
    if (result != RC_OK)
        return this->report("results", result);

    std::cout << "Results of election " << electionId << " \"" << election.name << "\"" << std::endl;
    for (size_t i = 0; i < counts.size(); i++)
        std::cout << "  [" << i << "] " << election.candidates[i] << ": " << counts[i] << std::endl;

    return true;
}

// ----------------------------------------------------------------

bool
Controller::onVerify(const Arguments& args)
{
    uint64_t electionId, candidateId;
    Address voter;
    if (!ParseNumber(args[0], electionId) || !ParseAddress(args[1], voter) || !ParseNumber(args[2], candidateId))
        return false;

    bool verified = this->storage->verifyVoteHash(electionId, voter, candidateId);
    std::cout << "verified=" << (verified ? "true" : "false") << std::endl;
    return verified;
}

// ----------------------------------------------------------------

bool
Controller::onPause(const Arguments&)
{
    SignKeyPair caller;
    if (!this->getCaller(caller))
        return false;

    return this->report("pause", this->storage->pause(caller.second.GetAddress()));
}

// ----------------------------------------------------------------

bool
Controller::onUnpause(const Arguments&)
{
    SignKeyPair caller;
    if (!this->getCaller(caller))
        return false;

    return this->report("unpause", this->storage->unpause(caller.second.GetAddress()));
}

// ----------------------------------------------------------------

bool
Controller::onSetFactory(const Arguments& args)
{
    SignKeyPair caller;
    Address address;
    if (!this->getCaller(caller) || !ParseAddress(args[0], address))
        return false;

    // only the registry of this deployment can be attached
    const ElectionLookup* lookup = NULL;
    if (address == this->factory->getAddress())
        lookup = this->factory.get();
    else if (!address.IsNull())
    {
        Log::e("(Controller) Unknown registry %s", address.ToString().c_str());
        return false;
    }

    return this->report("set-factory", this->storage->setElectionFactory(caller.second.GetAddress(), lookup));
}

// ----------------------------------------------------------------

bool
Controller::onTransferOwner(const Arguments& args)
{
    SignKeyPair caller;
    Address newOwner;
    if (!this->getCaller(caller) || !ParseAddress(args[0], newOwner))
        return false;

    return this->report("transfer-owner", this->storage->transferOwnership(caller.second.GetAddress(), newOwner));
}

// ----------------------------------------------------------------

bool
Controller::onEvents(const Arguments&)
{
    BOOST_FOREACH(const EventPtr& event, this->eventLog.getAll())
        std::cout << "#" << event->getSequence() << " " << event->toString() << std::endl;

    return true;
}
