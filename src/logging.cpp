// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.h"

#include "util/system.h"
#include "utiltime.h"

#include <cassert>
#include <stdexcept>

const char* const DEFAULT_DEBUGLOGFILE = "debug.log";

BCLog::Logger& GetLogger()
{
    // Never destroyed, so that logging from static destructors keeps working.
    static BCLog::Logger* logger = new BCLog::Logger();
    return *logger;
}

struct CLogCategoryDesc {
    BCLog::LogFlags flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] = {
    {BCLog::NONE, "0"},
    {BCLog::NONE, "none"},
    {BCLog::ANCHORING, "anchoring"},
    {BCLog::RPC, "rpc"},
    {BCLog::DB, "db"},
    {BCLog::CHAIN, "chain"},
    {BCLog::ALL, "1"},
    {BCLog::ALL, "all"},
};

bool GetLogCategory(BCLog::LogFlags& flag, const std::string& str)
{
    if (str.empty()) {
        flag = BCLog::ALL;
        return true;
    }
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        if (category_desc.category == str) {
            flag = category_desc.flag;
            return true;
        }
    }
    return false;
}

std::string ListLogCategories()
{
    std::string ret;
    int outcount = 0;
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        // Omit the special cases.
        if (category_desc.flag != BCLog::NONE && category_desc.flag != BCLog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += category_desc.category;
            outcount++;
        }
    }
    return ret;
}

std::vector<CLogCategoryActive> ListActiveLogCategories()
{
    std::vector<CLogCategoryActive> ret;
    for (const CLogCategoryDesc& category_desc : LogCategories) {
        // Omit the special cases.
        if (category_desc.flag != BCLog::NONE && category_desc.flag != BCLog::ALL) {
            CLogCategoryActive catActive;
            catActive.category = category_desc.category;
            catActive.active = LogAcceptCategory(category_desc.flag);
            ret.push_back(catActive);
        }
    }
    return ret;
}

void BCLog::Logger::EnableCategory(BCLog::LogFlags flag)
{
    m_categories |= flag;
}

bool BCLog::Logger::EnableCategory(const std::string& str)
{
    BCLog::LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    EnableCategory(flag);
    return true;
}

void BCLog::Logger::DisableCategory(BCLog::LogFlags flag)
{
    m_categories &= ~flag;
}

bool BCLog::Logger::DisableCategory(const std::string& str)
{
    BCLog::LogFlags flag;
    if (!GetLogCategory(flag, str)) return false;
    DisableCategory(flag);
    return true;
}

bool BCLog::Logger::WillLogCategory(BCLog::LogFlags category) const
{
    return (m_categories.load(std::memory_order_relaxed) & category) != 0;
}

bool BCLog::Logger::OpenDebugLog()
{
    LOCK(m_file_mutex);

    assert(m_fileout == nullptr);
    assert(!m_file_path.empty());

    m_fileout = fopen(m_file_path.string().c_str(), "a");
    if (!m_fileout) {
        return false;
    }

    setbuf(m_fileout, nullptr); // unbuffered
    // dump buffered messages from before we opened the log
    for (const std::string& msg : m_msgs_before_open) {
        fwrite(msg.data(), 1, msg.size(), m_fileout);
    }
    m_msgs_before_open.clear();

    return true;
}

void BCLog::Logger::Close()
{
    LOCK(m_file_mutex);
    if (m_fileout) {
        fclose(m_fileout);
        m_fileout = nullptr;
    }
}

std::string BCLog::Logger::LogTimestampStr(const std::string& str)
{
    std::string strStamped;

    if (!m_log_timestamps)
        return str;

    if (m_started_new_line) {
        strStamped = FormatISO8601DateTime(GetTime()) + ' ' + str;
    } else
        strStamped = str;

    if (!str.empty() && str[str.size() - 1] == '\n')
        m_started_new_line = true;
    else
        m_started_new_line = false;

    return strStamped;
}

void BCLog::Logger::LogPrintStr(const std::string& str)
{
    std::string strTimestamped = LogTimestampStr(str);

    if (m_print_to_console) {
        // print to console
        fwrite(strTimestamped.data(), 1, strTimestamped.size(), stdout);
        fflush(stdout);
    }
    if (m_print_to_file) {
        LOCK(m_file_mutex);

        // buffer if we haven't opened the log yet
        if (m_fileout == nullptr) {
            m_msgs_before_open.push_back(strTimestamped);
        } else {
            fwrite(strTimestamped.data(), 1, strTimestamped.size(), m_fileout);
        }
    }
}

void InitLogging()
{
    BCLog::Logger& logger = GetLogger();
    logger.m_print_to_console = gArgs.GetBoolArg("-printtoconsole", false);
    logger.m_print_to_file = !gArgs.IsArgNegated("-debuglogfile");
    logger.m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    if (gArgs.IsArgSet("-debug")) {
        for (const std::string& cat : gArgs.GetArgs("-debug")) {
            if (!logger.EnableCategory(cat)) {
                LogPrintf("Unsupported logging category -debug=%s.\n", cat);
            }
        }
    }

    if (logger.m_print_to_file) {
        fs::path path = gArgs.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE);
        if (!path.is_absolute()) {
            path = GetDataDir() / path;
        }
        logger.m_file_path = path;
        if (!logger.OpenDebugLog()) {
            throw std::runtime_error(strprintf("Could not open debug log file %s", path.string()));
        }
    }
}
