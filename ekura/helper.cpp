#include "helper.h"
#include "settings.h"

#include <cstdlib>
#include <cstring>
#include <ctime>
#include <limits>
#include <stdexcept>

#include <openssl/rand.h>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/thread/mutex.hpp>

// ================================================================

static boost::filesystem::path logPath;
static boost::mutex logMutex;

void
Log::log_(LogCategory c, const char* s, va_list args)
{
    // format arguments into buffer
    char buffer[1024];
    vsnprintf(buffer, sizeof(buffer), s, args);

    boost::mutex::scoped_lock lock(logMutex);

    // print to console
    if (Settings::GetPrintToConsole())
    {
        // set target stream
        FILE* target = stdout;
        if (c == ERROR)
            target = stderr;

        Log::print(target, c, buffer);
    }

    // print to log file
    if (!Settings::GetPrintToFile())
        return;

    if (logPath.empty())
    {
        logPath = Settings::GetDirectory();
        logPath /= "log.txt";
    }

    // open log file
    FILE* logFile = fopen(logPath.string().c_str(), "a");

    if (!logFile)
        return;

    setbuf(logFile, NULL); // unbuffered

    Log::print(logFile, c, buffer);

    fclose(logFile);
}

// ----------------------------------------------------------------

void
Log::print(FILE* target, LogCategory c, const char* s)
{
    // print header, data and new line
    fprintf(target, "%s %s\n", Log::getHeader(c).c_str(), s);
}

// ----------------------------------------------------------------

std::string
Log::getHeader(LogCategory c)
{
    // format category and current time
    return ("[" + Log::getCategoryString(c) + "] " + Helper::FormatTime("%Y-%m-%d %H:%M:%S", time(NULL)));
}

// ----------------------------------------------------------------

std::string
Log::getCategoryString(LogCategory c)
{
    switch (c)
    {
        case INFO: return "INF";
        case WARNING: return "WRN";
        case ERROR: return "ERR";
        default: break;
    }

    return "---";
}

// ================================================================

std::string
Helper::FormatTime(const char* pszFormat, int64_t nTime)
{
    // std::locale takes ownership of the pointer
    std::locale loc(std::locale::classic(), new boost::posix_time::time_facet(pszFormat));
    std::stringstream ss;
    ss.imbue(loc);
    ss << boost::posix_time::from_time_t(static_cast<std::time_t>(nTime));
    return ss.str();
}

// ----------------------------------------------------------------

static boost::filesystem::path pathCached;

const boost::filesystem::path&
Helper::GetDataDir()
{
    boost::filesystem::path &path = pathCached;

    // check if path is already cached
    if (!path.empty())
        return path;

    path = Settings::GetDirectory();

    // create directory if necessary
    Helper::CreateDirectories(path);

    return path;
}

// ----------------------------------------------------------------

const boost::filesystem::path
Helper::GetHomeDir()
{
    // determine user home directory
    char* pszHome = getenv("HOME");
    if (pszHome == NULL || strlen(pszHome) == 0)
        return boost::filesystem::path("/");
    else
        return boost::filesystem::path(pszHome);
}

// ----------------------------------------------------------------

int64_t
Helper::GetUNIXTimestamp()
{
    return static_cast<int64_t>(time(NULL));
}

// ----------------------------------------------------------------

bool
Helper::CreateDirectories(const boost::filesystem::path& p)
{
    try
    {
        return boost::filesystem::create_directories(p);
    }
    catch (const boost::filesystem::filesystem_error&)
    {
        if (!boost::filesystem::exists(p) || !boost::filesystem::is_directory(p))
            throw;
    }

    // create_directory didn't create the directory, it had to have existed already
    return false;
}

// ----------------------------------------------------------------

Hash256
Helper::GenerateRandom256()
{
    Hash256 result;
    if (RAND_bytes(result.begin(), result.size()) != 1)
        throw std::runtime_error("Could not obtain random bytes");
    return result;
}

// ----------------------------------------------------------------

bool
Helper::ParseTime(const std::string& value, int64_t now, int64_t& out)
{
    if (value.empty())
        return false;

    bool relative = (value[0] == '+');
    std::string digits = relative ? value.substr(1) : value;

    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos)
        return false;

    int64_t parsed = 0;
    try
    {
        parsed = boost::lexical_cast<int64_t>(digits);
    }
    catch (const boost::bad_lexical_cast&)
    {
        return false;
    }

    if (relative && now > 0 && parsed > std::numeric_limits<int64_t>::max() - now)
        return false;

    out = relative ? now + parsed : parsed;
    return true;
}
