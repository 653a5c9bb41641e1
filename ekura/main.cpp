/*=============================================================================

eKura Main

Author   : eKura developers
=============================================================================*/
#include "helper.h"
#include "settings.h"
#include "controller.h"
#include "crypto/key.h"

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/interprocess/exceptions.hpp>

// ==========================================================================
// Main entry point:

int main(int argc, char* argv[])
{
    try
    {
        // parse arguments from command line and config file
        if (!Settings::ParseArguments(argc, argv))
            return 1;
    }
    catch (const std::exception& e)
    {
        Log::e("(Main) Could not parse arguments: %s", e.what());
        return 1;
    }

    // initialize data directory
    const boost::filesystem::path &dataDir = Helper::GetDataDir();
    std::string dataDirStr = dataDir.string();

    if (!boost::filesystem::is_directory(dataDir))
    {
        Log::e("(Main) Specified data directory \"%s\" does not exist.", dataDirStr.c_str());
        return 1;
    }

    // make sure only a single process is using the data directory.
    boost::filesystem::path pathLockFile = dataDir / ".lock";
    FILE* file = fopen(pathLockFile.string().c_str(), "a"); // empty lock file; created if it doesn't exist.
    if (file) fclose(file);

    try
    {
        static boost::interprocess::file_lock lock(pathLockFile.string().c_str());
        if (!lock.try_lock())
        {
            Log::e("(Main) Cannot obtain a lock on data directory %s. Another command is probably running.", dataDirStr.c_str());
            return 1;
        }
    }
    catch(const boost::interprocess::interprocess_exception& e)
    {
        Log::e("(Main) Cannot obtain a lock on data directory %s.\n%s", dataDirStr.c_str(), e.what());
        return 1;
    }

    if (!ECC_InitSanityCheck())
    {
        Log::e("(Main) Elliptic curve cryptography sanity check failed.");
        return 1;
    }

    try
    {
        Controller controller;

        std::string command = Settings::GetCommand();
        if (command.empty())
        {
            std::cout << "Usage: ekura [options] <command> [args...]" << std::endl;
            std::cout << controller.usage() << std::endl;
            return 1;
        }

        if (!controller.execute(command, Settings::GetCommandArguments()))
            return 1;

        return 0;
    }
    catch (const std::exception& e)
    {
        Log::e("(Main) Critical Exception: %s", e.what());
        return 1;
    }
}
