// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "logging.h"

#include <algorithm>
#include <stdlib.h>
#include <string.h>

const char * const CROWDFUND_CONF_FILENAME = "crowdfund.conf";

ArgsManager gArgs;

static RecursiveMutex csPathCached;
static fs::path pathCached GUARDED_BY(csPathCached);

bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue.c_str()) != 0);
}

static std::string TrimString(const std::string& str, const std::string& pattern = " \f\n\r\t\v")
{
    std::string::size_type front = str.find_first_not_of(pattern);
    if (front == std::string::npos) {
        return std::string();
    }
    std::string::size_type end = str.find_last_not_of(pattern);
    return str.substr(front, end - front + 1);
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    LOCK(cs_args);
    m_command_line_args.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        if (key.empty() || key[0] != '-') {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        // Transform --foo to -foo
        if (key.length() > 1 && key[1] == '-')
            key = key.substr(1);

        if (key.length() < 2) {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        // Transform -nofoo to -foo=0
        if (key.compare(0, 3, "-no") == 0) {
            if (!val.empty()) {
                error = strprintf("Negated option %s cannot take a value", key);
                return false;
            }
            key = "-" + key.substr(3);
            val = "0";
        }

        m_command_line_args[key].push_back(val);
    }

    return true;
}

bool ArgsManager::ReadConfigStream(std::istream& stream, const std::string& filepath, std::string& error)
{
    LOCK(cs_args);
    std::string str;
    int linenr = 1;
    while (std::getline(stream, str)) {
        size_t pos;
        if ((pos = str.find('#')) != std::string::npos) {
            str = str.substr(0, pos);
        }
        str = TrimString(str);
        if (!str.empty()) {
            if ((pos = str.find('=')) == std::string::npos) {
                error = strprintf("parse error on line %i: %s, if you intended to specify a negated option, use -no%s=1 instead", linenr, str, str);
                return false;
            }
            std::string name = "-" + TrimString(str.substr(0, pos));
            std::string value = TrimString(str.substr(pos + 1));
            if (name.compare(0, 3, "-no") == 0) {
                name = "-" + name.substr(3);
                value = InterpretBool(value) ? "0" : "1";
            }
            m_config_args[name].push_back(value);
        }
        ++linenr;
    }
    LogPrintf("Config file: %s\n", filepath);
    return true;
}

bool ArgsManager::ReadConfigFiles(std::string& error)
{
    {
        LOCK(cs_args);
        m_config_args.clear();
    }

    const fs::path confPath = GetConfigFile(GetArg("-conf", CROWDFUND_CONF_FILENAME));
    fs::ifstream stream(confPath);

    // ok to not have a config file
    if (stream.good()) {
        if (!ReadConfigStream(stream, confPath.string(), error)) {
            return false;
        }
    }

    // -datadir may have been set in the config file
    ClearDatadirCache();
    return true;
}

bool ArgsManager::GetSetting(const std::string& strArg, std::vector<std::string>& values) const
{
    LOCK(cs_args);
    for (const auto* source : {&m_override_args, &m_command_line_args, &m_config_args}) {
        auto it = source->find(strArg);
        if (it != source->end() && !it->second.empty()) {
            values = it->second;
            return true;
        }
    }
    return false;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    std::vector<std::string> values;
    if (!GetSetting(strArg, values)) {
        return {};
    }
    // A negation (-nofoo) clears every value
    if (IsArgNegated(strArg)) {
        return {};
    }
    return values;
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::vector<std::string> values;
    return GetSetting(strArg, values);
}

bool ArgsManager::IsArgNegated(const std::string& strArg) const
{
    std::vector<std::string> values;
    if (!GetSetting(strArg, values)) {
        return false;
    }
    return values.back() == "0";
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::vector<std::string> values;
    if (!GetSetting(strArg, values)) {
        return strDefault;
    }
    return values.back();
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::vector<std::string> values;
    if (!GetSetting(strArg, values)) {
        return nDefault;
    }
    return atoll(values.back().c_str());
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::vector<std::string> values;
    if (!GetSetting(strArg, values)) {
        return fDefault;
    }
    return InterpretBool(values.back());
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
    m_override_args[strArg] = {strValue};
    return true;
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    m_override_args[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    m_command_line_args.clear();
    m_config_args.clear();
    m_override_args.clear();
}

fs::path GetDefaultDataDir()
{
    // Unix: ~/.crowdfund
    fs::path pathRet;
    char* pszHome = getenv("HOME");
    if (pszHome == nullptr || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".crowdfund";
}

const fs::path& GetDataDir()
{
    LOCK(csPathCached);

    // Cache the path to avoid calling fs::create_directories on every call
    if (!pathCached.empty())
        return pathCached;

    std::string strDatadir = gArgs.GetArg("-datadir", "");
    if (!strDatadir.empty()) {
        pathCached = fs::system_complete(strDatadir);
    } else {
        pathCached = GetDefaultDataDir();
    }

    fs::create_directories(pathCached);
    return pathCached;
}

void ClearDatadirCache()
{
    LOCK(csPathCached);
    pathCached = fs::path();
}

fs::path GetConfigFile(const std::string& confPath)
{
    fs::path pathConfigFile(confPath);
    if (!pathConfigFile.is_complete())
        pathConfigFile = GetDataDir() / pathConfigFile;
    return pathConfigFile;
}
