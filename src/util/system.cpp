// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "logging.h"
#include "utilstrencodings.h"

#include <cstdlib>
#include <cstring>
#include <fstream>

const char* const ANCHORING_CONF_FILENAME = "anchoring.conf";

ArgsManager gArgs;

static fs::path g_datadir_cached;
static RecursiveMutex cs_datadir;

/** Interpret a string argument as a boolean. An empty string means true. */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue) != 0);
}

/**
 * Turn -noX into -X=0. Records the negation so IsArgNegated() can report it.
 */
static bool InterpretNegatedOption(std::string& key, std::string& val)
{
    if (key.substr(0, 3) == "-no") {
        bool bool_val = InterpretBool(val);
        key.erase(1, 2);
        val = bool_val ? "0" : "1";
        return bool_val;
    }
    return false;
}

static fs::path GetDefaultDataDir()
{
    char* pszHome = getenv("HOME");
    fs::path pathRet;
    if (pszHome == nullptr || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".anchoring";
}

const fs::path& GetDataDir()
{
    LOCK(cs_datadir);

    if (!g_datadir_cached.empty())
        return g_datadir_cached;

    if (gArgs.IsArgSet("-datadir")) {
        g_datadir_cached = fs::system_complete(gArgs.GetArg("-datadir", ""));
    } else {
        g_datadir_cached = GetDefaultDataDir();
    }
    fs::create_directories(g_datadir_cached);
    return g_datadir_cached;
}

void ClearDatadirCache()
{
    LOCK(cs_datadir);
    g_datadir_cached = fs::path();
}

fs::path GetConfigFile(const std::string& confPath)
{
    fs::path pathConfigFile(confPath);
    if (!pathConfigFile.is_absolute())
        pathConfigFile = GetDataDir() / pathConfigFile;
    return pathConfigFile;
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    LOCK(cs_args);
    mapArgs.clear();
    m_negated_args.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        // Stop at the first positional argument (tool commands)
        if (key.empty() || key[0] != '-')
            break;

        // Transform --foo to -foo
        if (key.length() > 1 && key[1] == '-')
            key.erase(0, 1);

        if (key.size() <= 1) {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        if (InterpretNegatedOption(key, val)) {
            m_negated_args.insert(key);
        } else {
            m_negated_args.erase(key);
        }
        mapArgs[key].push_back(val);
    }
    return true;
}

bool ArgsManager::ReadConfigStream(std::istream& stream, std::string& error)
{
    LOCK(cs_args);
    std::string line;
    int linenr = 0;
    while (std::getline(stream, line)) {
        ++linenr;
        size_t comment = line.find('#');
        if (comment != std::string::npos)
            line.erase(comment);
        // trim
        size_t begin = line.find_first_not_of(" \t\r");
        if (begin == std::string::npos)
            continue;
        size_t end = line.find_last_not_of(" \t\r");
        line = line.substr(begin, end - begin + 1);

        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            error = strprintf("parse error on line %i: %s", linenr, line);
            return false;
        }
        std::string key = "-" + line.substr(0, pos);
        std::string val = line.substr(pos + 1);
        if (InterpretNegatedOption(key, val)) {
            m_negated_args.insert(key);
        }
        mapConfigArgs[key].push_back(val);
    }
    return true;
}

bool ArgsManager::ReadConfigFile(const std::string& confPath, std::string& error)
{
    {
        LOCK(cs_args);
        mapConfigArgs.clear();
    }

    std::ifstream stream(GetConfigFile(confPath).string());

    // ok to not have a config file
    if (stream.good()) {
        if (!ReadConfigStream(stream, error)) {
            return false;
        }
    }
    // The datadir may have been changed by the config file.
    ClearDatadirCache();
    return true;
}

bool ArgsManager::GetLastValue(const std::string& strArg, std::string& value) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end() && !it->second.empty()) {
        value = it->second.back();
        return true;
    }
    it = mapConfigArgs.find(strArg);
    if (it != mapConfigArgs.end() && !it->second.empty()) {
        value = it->second.back();
        return true;
    }
    return false;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    std::vector<std::string> result;
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    it = mapConfigArgs.find(strArg);
    if (it != mapConfigArgs.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    return result;
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::string value;
    return GetLastValue(strArg, value);
}

bool ArgsManager::IsArgNegated(const std::string& strArg) const
{
    LOCK(cs_args);
    return m_negated_args.count(strArg) > 0;
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::string value;
    if (GetLastValue(strArg, value))
        return value;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::string value;
    if (GetLastValue(strArg, value))
        return atoi64(value);
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::string value;
    if (GetLastValue(strArg, value))
        return InterpretBool(value);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
    ForceSetArg(strArg, strValue);
    return true;
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    mapArgs[strArg] = {strValue};
    m_negated_args.erase(strArg);
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    mapArgs.clear();
    mapConfigArgs.clear();
    m_negated_args.clear();
}
