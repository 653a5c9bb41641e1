#include "tests/test_controller.h"
#include "tests/test_settings.h"

#include "controller.h"
#include "helper.h"
#include "store.h"
#include "database/statedb.h"

#include <cassert>
#include <iostream>
#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/foreach.hpp>
#include <boost/thread/thread.hpp>

// ----------------------------------------------------------------------------

// Run a single command as the given identity, like one invocation of the client
static bool run(const Address& from, const std::string& command, const std::string& arguments = "")
{
    std::vector<std::string> extra;
    if (!from.IsNull())
    {
        extra.push_back("--from");
        extra.push_back(from.ToString());
    }
    assert(parseTestArguments(extra));

    Arguments args;
    if (!arguments.empty())
        boost::split(args, arguments, boost::is_any_of(" "));

    Controller controller;
    return controller.execute(command, args);
}

// Same as run() but captures everything printed to stdout
static bool runCaptured(const Address& from, const std::string& command, const std::string& arguments,
                        std::string& output)
{
    std::stringstream buffer;
    std::streambuf* old = std::cout.rdbuf(buffer.rdbuf());

    bool result = false;
    try
    {
        result = run(from, command, arguments);
    }
    catch (const std::exception&)
    {
        std::cout.rdbuf(old);
        throw;
    }

    std::cout.rdbuf(old);
    output = buffer.str();
    return result;
}

// ----------------------------------------------------------------------------

void test_controller_addresses()
{
    Log::i("(Test) - Contract addresses");

    Address deployer;
    assert(deployer.SetHex("0x00000000000000000000000000000000000000a1"));

    Address factory = DeriveContractAddress(deployer, 31337, "ElectionFactory");
    assert(!factory.IsNull());
    assert(factory == DeriveContractAddress(deployer, 31337, "ElectionFactory"));
    assert(factory != DeriveContractAddress(deployer, 31337, "VoteStorage"));
    assert(factory != DeriveContractAddress(deployer, 84532, "ElectionFactory"));
}

// ----------------------------------------------------------------------------

void test_controller_commands()
{
    Log::i("(Test) - Command line client");

    // start from an empty deployment
    assert(parseTestArguments());
    {
        StateDB wipe(StateDB::GetDefaultPath(), true);
    }

    SignKeyPair admin, orgAdmin, voter, relayed, relayer;
    assert(KeyStore::genNewKeyPair(admin));
    assert(KeyStore::genNewKeyPair(orgAdmin));
    assert(KeyStore::genNewKeyPair(voter));
    assert(KeyStore::genNewKeyPair(relayed));
    assert(KeyStore::genNewKeyPair(relayer));

    Address adminAddress = admin.second.GetAddress();
    Address orgAdminAddress = orgAdmin.second.GetAddress();
    Address voterAddress = voter.second.GetAddress();
    Address relayedAddress = relayed.second.GetAddress();
    Address relayerAddress = relayer.second.GetAddress();

    // nothing deployed yet
    assert(!run(adminAddress, "info"));

    assert(run(adminAddress, "deploy"));
    assert(!run(adminAddress, "deploy"));
    assert(run(Address(), "info"));

    // unknown commands, missing arguments, unknown identities
    assert(!run(adminAddress, "frobnicate"));
    assert(!run(adminAddress, "add-admin", "1"));
    assert(!run(Address(), "add-admin", "1 " + orgAdminAddress.ToString()));

    Address unknown;
    assert(unknown.SetHex("0x00000000000000000000000000000000000000ee"));
    assert(!run(unknown, "add-admin", "1 " + orgAdminAddress.ToString()));

    // registry
    assert(!run(orgAdminAddress, "add-admin", "1 " + orgAdminAddress.ToString()));
    assert(run(adminAddress, "add-admin", "1 " + orgAdminAddress.ToString()));
    assert(!run(adminAddress, "add-admin", "x " + orgAdminAddress.ToString()));
    assert(run(Address(), "org", "1"));

    assert(!run(voterAddress, "create-election", "1 Board Annual +1 +86400 Alice Bob"));
    assert(!run(orgAdminAddress, "create-election", "1 Board Annual +1 later Alice Bob"));
    assert(run(orgAdminAddress, "create-election", "1 Board Annual +1 +86400 Alice Bob Carol"));
    assert(run(Address(), "election", "1"));
    assert(!run(Address(), "election", "2"));

    // wait for the window to open
    boost::this_thread::sleep(boost::posix_time::seconds(2));

    // direct votes
    assert(run(voterAddress, "vote", "1 2"));
    assert(!run(voterAddress, "vote", "1 0"));
    assert(!run(orgAdminAddress, "vote", "1 7"));

    // relayed votes
    std::string signedVote;
    assert(runCaptured(relayedAddress, "sign-vote", "1 1 +3600", signedVote));
    boost::trim(signedVote);
    assert(boost::starts_with(signedVote, relayedAddress.ToString()));

    assert(!run(relayerAddress, "relay", "1 2 3"));
    assert(run(relayerAddress, "relay", signedVote));
    assert(!run(relayerAddress, "relay", signedVote));

    // results and verification
    std::string results;
    assert(runCaptured(Address(), "results", "1", results));
    assert(results.find("Alice: 0") != std::string::npos);
    assert(results.find("Bob: 1") != std::string::npos);
    assert(results.find("Carol: 1") != std::string::npos);

    assert(run(Address(), "verify", "1 " + voterAddress.ToString() + " 2"));
    assert(!run(Address(), "verify", "1 " + voterAddress.ToString() + " 1"));
    assert(run(Address(), "verify", "1 " + relayedAddress.ToString() + " 1"));

    // owner operations
    assert(!run(voterAddress, "pause"));
    assert(run(adminAddress, "pause"));
    assert(!run(orgAdminAddress, "vote", "1 0"));
    assert(!run(adminAddress, "pause"));
    assert(run(adminAddress, "unpause"));
    assert(run(orgAdminAddress, "vote", "1 0"));

    assert(!run(adminAddress, "set-factory", unknown.ToString()));
    assert(!run(adminAddress, "set-factory", Address().ToString()));

    std::string info;
    assert(runCaptured(Address(), "info", "", info));
    std::string::size_type pos = info.find("factory=");
    assert(pos != std::string::npos);
    std::string factoryAddress = info.substr(pos + 8, 42);
    assert(run(adminAddress, "set-factory", factoryAddress));

    assert(run(adminAddress, "transfer-owner", voterAddress.ToString()));
    assert(!run(adminAddress, "pause"));
    assert(run(voterAddress, "pause"));

    std::string events;
    assert(runCaptured(Address(), "events", "", events));
    assert(events.find("MetaTransactionExecuted") != std::string::npos);
    assert(events.find("OwnershipTransferred") != std::string::npos);

    // ----- Cleanup -----
    KeyStore::removeKeyPair(adminAddress);
    KeyStore::removeKeyPair(orgAdminAddress);
    KeyStore::removeKeyPair(voterAddress);
    KeyStore::removeKeyPair(relayedAddress);
    KeyStore::removeKeyPair(relayerAddress);

    assert(parseTestArguments());
}

// ----------------------------------------------------------------------------

void test_controller()
{
    Log::i("(Test) # Test: Command line client");
    test_controller_addresses();
    test_controller_commands();
}
