// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * data directory.
 */
#ifndef CROWDFUND_UTIL_SYSTEM_H
#define CROWDFUND_UTIL_SYSTEM_H

#include "fs.h"
#include "sync.h"

#include <istream>
#include <map>
#include <stdint.h>
#include <string>
#include <vector>

extern const char * const CROWDFUND_CONF_FILENAME;

/** Interpret a string argument as a boolean ("" and "1" are true, "0" is false). */
bool InterpretBool(const std::string& strValue);

const fs::path& GetDataDir();
void ClearDatadirCache();
fs::path GetDefaultDataDir();
fs::path GetConfigFile(const std::string& confPath);

class ArgsManager
{
protected:
    mutable RecursiveMutex cs_args;
    std::map<std::string, std::vector<std::string>> m_command_line_args GUARDED_BY(cs_args);
    std::map<std::string, std::vector<std::string>> m_config_args GUARDED_BY(cs_args);
    std::map<std::string, std::vector<std::string>> m_override_args GUARDED_BY(cs_args);

    /** Look up a setting; override > command line > config file. Returns false if unset. */
    bool GetSetting(const std::string& strArg, std::vector<std::string>& values) const;

public:
    /**
     * Parse "-name=value" and "-noname" style arguments. Values of "-noname"
     * are stored as "0". Returns false and sets error on a malformed argument.
     */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);

    /** Parse "name=value" lines; '#' starts a comment. */
    bool ReadConfigStream(std::istream& stream, const std::string& filepath, std::string& error);
    bool ReadConfigFiles(std::string& error);

    /** Return all values set for an argument, in order. */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    bool IsArgSet(const std::string& strArg) const;
    bool IsArgNegated(const std::string& strArg) const;

    /** Return the last value set for an argument, or strDefault */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /** Set an argument if it doesn't already have a value. Returns true if set. */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    /** Force an argument to a value, shadowing command line and config. */
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    /** Only for testing */
    void ClearArgs();
};

extern ArgsManager gArgs;

#endif // CROWDFUND_UTIL_SYSTEM_H
