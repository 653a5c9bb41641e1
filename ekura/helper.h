/*=============================================================================

Provides helper and logging functionalities.

Author   : eKura developers
=============================================================================*/
#ifndef EKURA_HELPER_H
#define EKURA_HELPER_H

#include "crypto/fixedbytes.h"

#include <cstdarg>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <stdint.h>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/archive/text_oarchive.hpp>
#include <boost/archive/text_iarchive.hpp>

// ==========================================================================

enum LogCategory
{
    UNKNOWN,
    INFO,
    WARNING,
    ERROR
};

// ==========================================================================

class Log
{
public:
    // Wrapper for logging INFO
    static inline void i(const char* s, ...)
    {
        va_list args;
        va_start(args, s);
        Log::log_(INFO, s, args);
        va_end(args);
    }

    // Wrapper for logging WARNING
    static inline void w(const char* s, ...)
    {
        va_list args;
        va_start(args, s);
        Log::log_(WARNING, s, args);
        va_end(args);
    }

    // Wrapper for logging ERROR
    static inline void e(const char* s, ...)
    {
        va_list args;
        va_start(args, s);
        Log::log_(ERROR, s, args);
        va_end(args);
    }

    // Generic logging wrapper
    static inline void log(LogCategory c, const char* s, ...)
    {
        va_list args;
        va_start(args, s);
        Log::log_(c, s, args);
        va_end(args);
    }

private:
    // Internal logging helper method
    static void log_(LogCategory, const char*, va_list);

    // Print log to the given stream
    static void print(FILE*, LogCategory, const char*);

    // Get logging header
    static std::string getHeader(LogCategory);

    // Get category as string
    static std::string getCategoryString(LogCategory);
};

// ================================================================

class Helper
{
public:
    // Format time in the given format
    static std::string FormatTime(const char*, int64_t);

    // Obtain the data directory for ekura
    static const boost::filesystem::path& GetDataDir();

    // Obtain user's home directory
    static const boost::filesystem::path GetHomeDir();

    // Get current UNIX timestamp (sec)
    static int64_t GetUNIXTimestamp();

    // Recursively create given directory
    static bool CreateDirectories(const boost::filesystem::path&);

    // Generate 256 random bits from the OpenSSL CSPRNG
    static Hash256 GenerateRandom256();

    // Parse an absolute UNIX time or a "+N" offset (sec) relative to now
    static bool ParseTime(const std::string&, int64_t now, int64_t&);

    // Serialize a given object to file
    template<typename T>
    static void SaveToFile(const T&, std::string);

    // Deserialize a given file into an existing object
    template<typename T>
    static void LoadFromFile(std::string, T&);
};

// ==========================================================================
// These need to be defined here in the header!

template<typename T>
void
Helper::SaveToFile(const T& data, std::string file)
{
    std::ofstream ofs(file.c_str());
    if (!ofs)
        throw std::runtime_error("Could not open " + file + " for writing");

    // serialize to text
    boost::archive::text_oarchive oa(ofs);
    oa << data;
}

// ----------------------------------------------------------------

template<typename T>
void
Helper::LoadFromFile(std::string file, T& data)
{
    std::ifstream ifs(file.c_str());
    if (!ifs)
        throw std::runtime_error("Could not open " + file + " for reading");

    // parse from text
    boost::archive::text_iarchive ia(ifs);
    ia >> data;
}

#endif // EKURA_HELPER_H
