#ifndef TEST_SETTINGS_H
#define TEST_SETTINGS_H

void test_settings();

// ============================================================================
// Command line used by all test drivers:

#include "settings.h"

#include <string>
#include <vector>

const std::string TEST_DATA_DIR = "/tmp/ekura_tests";

// Parse the test command line followed by the given extra arguments
inline bool parseTestArguments(const std::vector<std::string>& extra = std::vector<std::string>())
{
    std::vector<std::string> args;
    args.push_back("ekura_tests");
    args.push_back("--data-dir");
    args.push_back(TEST_DATA_DIR);
    args.push_back("--log-file");
    args.push_back("0");
    args.insert(args.end(), extra.begin(), extra.end());

    std::vector<char*> argv;
    for (size_t i = 0; i < args.size(); i++)
        argv.push_back(const_cast<char*>(args[i].c_str()));

    return Settings::ParseArguments(static_cast<int>(argv.size()), &argv[0]);
}

#endif // TEST_SETTINGS_H
