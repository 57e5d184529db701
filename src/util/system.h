// Copyright (c) 2026 The Anchoring developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * data directory.
 */
#ifndef ANCHORING_UTIL_SYSTEM_H
#define ANCHORING_UTIL_SYSTEM_H

#include "fs.h"
#include "sync.h"

#include <cstdint>
#include <istream>
#include <map>
#include <set>
#include <string>
#include <vector>

extern const char* const ANCHORING_CONF_FILENAME;

const fs::path& GetDataDir();
void ClearDatadirCache();
fs::path GetConfigFile(const std::string& confPath);

class ArgsManager
{
protected:
    mutable RecursiveMutex cs_args;
    std::map<std::string, std::vector<std::string>> mapArgs;
    std::map<std::string, std::vector<std::string>> mapConfigArgs;
    std::set<std::string> m_negated_args;

    /** Returns the last value set for the argument, command line first. */
    bool GetLastValue(const std::string& strArg, std::string& value) const;

public:
    /** Parse -key[=value] style arguments. Returns false and sets error on a malformed argument. */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);

    /** Parse key=value lines of the config file; '#' starts a comment. */
    bool ReadConfigStream(std::istream& stream, std::string& error);
    bool ReadConfigFile(const std::string& confPath, std::string& error);

    /**
     * Return a vector of strings of the given argument
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return command-line arguments
     */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return true if the argument has been set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return true if the argument was originally passed as a negated option,
     * i.e. -nofoo.
     */
    bool IsArgNegated(const std::string& strArg) const;

    /**
     * Return string argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param strDefault (e.g. "1")
     * @return command-line argument or default value
     */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;

    /**
     * Return integer argument or default value
     */
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;

    /**
     * Return boolean argument or default value
     */
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    // Forces an arg setting. Called by SoftSetArg() if the arg hasn't already
    // been set. Also called directly in testing.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    /** Set an argument if it doesn't already have a value */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    void ClearArgs();
};

extern ArgsManager gArgs;

#endif // ANCHORING_UTIL_SYSTEM_H
