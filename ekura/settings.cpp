#include "settings.h"
#include "helper.h"

#include <iostream>
#include <fstream>
#include <stdexcept>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

// ================================================================

namespace po = boost::program_options;

po::variables_map vm;

// ================================================================

bool
Settings::ParseArguments(int argc, char** argv)
{
    // start over, the test driver parses more than once
    vm.clear();

    // Declare a group of options that will be
    // allowed only on command line
    po::options_description generic("Generic options");
    generic.add_options()
            ("help,h", "produce help message")
            ("data-dir,d", po::value<std::string>(),
             "path to the data directory (default ~/.ekura)");

    // Declare a group of options that will be
    // allowed both on command line and in
    // config file
    po::options_description config("Configuration");
    config.add_options()
            ("network,n", po::value<std::string>(),
             "target network: local, base-sepolia, eth-sepolia (default local)")
            ("chain-id", po::value<uint64_t>(),
             "chain id used for signatures (overrides the network's id)")
            ("from,f", po::value<std::string>(),
             "address of the identity issuing the command")
            ("log-cli", po::value<bool>(),
             "if application should log to console (default yes)")
            ("log-file", po::value<bool>(),
             "if application should log to log file (default yes)");

    // Hidden options, will be allowed only on command line
    po::options_description hidden("Hidden options");
    hidden.add_options()
            ("command", po::value<std::string>(),
             "command to execute")
            ("args", po::value< std::vector<std::string> >()->composing(),
             "arguments of the command");

    // assemble options
    po::options_description cmdline_options;
    cmdline_options.add(generic).add(config).add(hidden);

    po::options_description config_file_options;
    config_file_options.add(config);

    po::options_description visible("Allowed options");
    visible.add(generic).add(config);

    po::positional_options_description p;
    p.add("command", 1);
    p.add("args", -1);

    // actual parsing
    po::store(po::command_line_parser(argc, argv).
              options(cmdline_options).positional(p).run(), vm);
    po::notify(vm);

    // print help if requested
    if (vm.count("help"))
    {
        std::cout << "Usage: ekura [options] <command> [args...]" << std::endl;
        std::cout << visible << std::endl;
        return false;
    }

    boost::filesystem::path configDir = Settings::GetDirectory();
    Helper::CreateDirectories(configDir);

    std::string configFile = configDir.string() + "/config.cfg";

    // check for the presence of a config file
    std::ifstream ifs(configFile.c_str());
    if (ifs)
    {
        po::store(parse_config_file(ifs, config_file_options), vm);
        po::notify(vm);
    }

    // reject unknown networks early
    uint64_t chainId;
    if (!Settings::GetNetworkChainId(Settings::GetNetwork(), chainId))
        throw std::invalid_argument("Unknown network: " + Settings::GetNetwork());

    Log::i("(Settings) Directory: \t\t%s", configDir.string().c_str());
    Log::i("(Settings) Network: \t\t%s", Settings::GetNetwork().c_str());
    Log::i("(Settings) Chain Id: \t\t%llu", (unsigned long long) Settings::GetChainId());
    Log::i("(Settings) Log to File: \t\t%d", Settings::GetPrintToFile());

    return true;
}

// ----------------------------------------------------------------

bool
Settings::GetNetworkChainId(const std::string& network, uint64_t& chainIdOut)
{
    if (network == "local")
        chainIdOut = Settings::CHAIN_ID_LOCAL;
    else if (network == "base-sepolia")
        chainIdOut = Settings::CHAIN_ID_BASE_SEPOLIA;
    else if (network == "eth-sepolia")
        chainIdOut = Settings::CHAIN_ID_ETH_SEPOLIA;
    else
        return false;

    return true;
}

// ----------------------------------------------------------------

std::string
Settings::GetDirectory()
{
    if (vm.count("data-dir"))
        return vm["data-dir"].as<std::string>();

    return Helper::GetHomeDir().string() + "/" + Settings::defaultDirectory;
}

// ----------------------------------------------------------------

std::string
Settings::GetNetwork()
{
    if (vm.count("network"))
        return vm["network"].as<std::string>();

    return Settings::defaultNetwork;
}

// ----------------------------------------------------------------

uint64_t
Settings::GetChainId()
{
    if (vm.count("chain-id"))
        return vm["chain-id"].as<uint64_t>();

    uint64_t chainId = Settings::CHAIN_ID_LOCAL;
    Settings::GetNetworkChainId(Settings::GetNetwork(), chainId);
    return chainId;
}

// ----------------------------------------------------------------

std::string
Settings::GetFrom()
{
    if (vm.count("from"))
        return vm["from"].as<std::string>();

    return std::string();
}

// ----------------------------------------------------------------

std::string
Settings::GetCommand()
{
    if (vm.count("command"))
        return vm["command"].as<std::string>();

    return std::string();
}

// ----------------------------------------------------------------

std::vector<std::string>
Settings::GetCommandArguments()
{
    if (vm.count("args"))
        return vm["args"].as< std::vector<std::string> >();

    return std::vector<std::string>();
}

// ----------------------------------------------------------------

bool
Settings::GetPrintToConsole()
{
    if (vm.count("log-cli"))
        return vm["log-cli"].as<bool>();

    return Settings::defaultLogToConsole;
}

// ----------------------------------------------------------------

bool
Settings::GetPrintToFile()
{
    if (vm.count("log-file"))
        return vm["log-file"].as<bool>();

    return Settings::defaultLogToFile;
}
