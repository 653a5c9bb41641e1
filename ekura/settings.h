/*=============================================================================

This namespace provides global settings as well as reading command-line
arguments and parameters from a given config file.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_SETTINGS_H
#define EKURA_SETTINGS_H

#include <stdint.h>
#include <string>
#include <vector>

// ==========================================================================

/* Major version */
#define CLIENT_VERSION_MAJOR    0

/* Minor version */
#define CLIENT_VERSION_MINOR    1

/* Build revision */
#define CLIENT_VERSION_REVISION 0

namespace Settings
{
    // ----------------------------------------------------------------
    // Constants

    // The version of this client
    const int CLIENT_VERSION =
                           1000000 * CLIENT_VERSION_MAJOR
                         +   10000 * CLIENT_VERSION_MINOR
                         +     100 * CLIENT_VERSION_REVISION;

    // Default database cache size (in bytes)
    const int64_t DEFAULT_DB_CACHE = 8 * 1024 * 1024;

    // Chain ids of the known networks
    const uint64_t CHAIN_ID_LOCAL = 31337;
    const uint64_t CHAIN_ID_BASE_SEPOLIA = 84532;
    const uint64_t CHAIN_ID_ETH_SEPOLIA = 11155111;

    // ----------------------------------------------------------------
    // CLI/Config default arguments

    const std::string defaultDirectory = ".ekura";
    const std::string defaultNetwork = "local";
    const bool defaultLogToConsole = true;
    const bool defaultLogToFile = true;

    // ----------------------------------------------------------------

    // Parse CLI & Config arguments
    bool ParseArguments(int, char**);

    // Resolve a network name to its chain id, false if unknown
    bool GetNetworkChainId(const std::string&, uint64_t&);

    // ----------------------------------------------------------------
    // Getter for CLI / Config arguments:

    std::string GetDirectory();
    std::string GetNetwork();
    uint64_t GetChainId();
    std::string GetFrom();
    std::string GetCommand();
    std::vector<std::string> GetCommandArguments();
    bool GetPrintToConsole();
    bool GetPrintToFile();
}

#endif // EKURA_SETTINGS_H
