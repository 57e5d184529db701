// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ANCHORING_LOGGING_H
#define ANCHORING_LOGGING_H

#include "sync.h"

#include <tinyformat.h>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

static const bool DEFAULT_LOGTIMESTAMPS = true;
extern const char* const DEFAULT_DEBUGLOGFILE;

struct CLogCategoryActive {
    std::string category;
    bool active;
};

namespace BCLog {

enum LogFlags : uint32_t {
    NONE        = 0,
    ANCHORING   = (1 << 0),
    RPC         = (1 << 1),
    DB          = (1 << 2),
    CHAIN       = (1 << 3),
    ALL         = ~(uint32_t)0,
};

class Logger
{
private:
    FILE* m_fileout = nullptr;
    RecursiveMutex m_file_mutex;
    std::vector<std::string> m_msgs_before_open;

    /**
     * m_started_new_line is a state variable that will suppress printing of
     * the timestamp when multiple calls are made that don't end in a
     * newline.
     */
    std::atomic_bool m_started_new_line{true};

    /** Log categories bitfield. */
    std::atomic<uint32_t> m_categories{0};

    std::string LogTimestampStr(const std::string& str);

public:
    bool m_print_to_console = false;
    bool m_print_to_file = false;
    bool m_log_timestamps = DEFAULT_LOGTIMESTAMPS;

    boost::filesystem::path m_file_path;

    /** Send a string to the log output */
    void LogPrintStr(const std::string& str);

    /** Returns whether logs will be written to any output */
    bool Enabled() const { return m_print_to_console || m_print_to_file; }

    bool OpenDebugLog();
    void Close();

    uint32_t GetCategoryMask() const { return m_categories.load(); }

    void EnableCategory(LogFlags flag);
    bool EnableCategory(const std::string& str);
    void DisableCategory(LogFlags flag);
    bool DisableCategory(const std::string& str);

    bool WillLogCategory(LogFlags category) const;
};

} // namespace BCLog

#ifndef strprintf
/** Format arguments and return the string, throwing tinyformat::format_error on mismatch. */
template<typename... Args>
std::string strprintf(const char* fmt, const Args&... args)
{
    return tfm::format(fmt, args...);
}
#endif

BCLog::Logger& GetLogger();

/** Return true if log accepts specified category */
static inline bool LogAcceptCategory(BCLog::LogFlags category)
{
    return GetLogger().WillLogCategory(category);
}

/** Returns a string with the log categories. */
std::string ListLogCategories();

/** Returns a vector of the active log categories. */
std::vector<CLogCategoryActive> ListActiveLogCategories();

/** Return true if str parses as a log category and set the flag */
bool GetLogCategory(BCLog::LogFlags& flag, const std::string& str);

/** Configure console/file output and categories from gArgs (-debug, -printtoconsole, -debuglogfile). */
void InitLogging();

template<typename... Args>
static inline void LogPrintf(const char* fmt, const Args&... args)
{
    if (GetLogger().Enabled()) {
        std::string log_msg;
        try {
            log_msg = tfm::format(fmt, args...);
        } catch (tinyformat::format_error& fmterr) {
            /* Original format string will have newline so don't add one here */
            log_msg = "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + fmt;
        }
        GetLogger().LogPrintStr(log_msg);
    }
}

// Use a macro instead of a function for conditional logging to prevent
// evaluating arguments when logging for the category is not enabled.
#define LogPrint(category, ...)              \
    do {                                     \
        if (LogAcceptCategory((category))) { \
            LogPrintf(__VA_ARGS__);          \
        }                                    \
    } while (0)

template<typename... Args>
bool error(const char* fmt, const Args&... args)
{
    LogPrintf("ERROR: %s\n", tfm::format(fmt, args...));
    return false;
}

#endif // ANCHORING_LOGGING_H
