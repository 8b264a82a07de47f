// Copyright (c) 2025 The Cascoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util.h>
#include <utilstrencodings.h>
#include <utiltime.h>

#include <cstdio>
#include <fstream>

const char * const DEFAULT_DEBUGLOGFILE = "debug.log";

ArgsManager gArgs;
bool fPrintToConsole = false;
bool fLogTimestamps = DEFAULT_LOGTIMESTAMPS;

/** Log categories bitfield. */
std::atomic<uint32_t> logCategories(0);

namespace {

std::mutex g_log_mutex;
FILE* g_debug_log = nullptr;
/** Whether the last string written ended with a newline */
bool g_started_new_line = true;

struct CLogCategoryDesc
{
    uint32_t flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {BCLog::NONE, "0"},
    {BCLog::SCORING, "scoring"},
    {BCLog::FEATURES, "features"},
    {BCLog::PATTERNS, "patterns"},
    {BCLog::ORACLE, "oracle"},
    {BCLog::INDEX, "index"},
    {BCLog::LEDGER, "ledger"},
    {BCLog::HTTP, "http"},
    {BCLog::ALL, "1"},
    {BCLog::ALL, "all"},
};

std::string LogTimestampStr(const std::string& str)
{
    std::string strStamped;

    if (!fLogTimestamps)
        return str;

    if (g_started_new_line) {
        strStamped = FormatISO8601DateTime(GetTime()) + ' ' + str;
    } else {
        strStamped = str;
    }

    if (!str.empty() && str[str.size() - 1] == '\n')
        g_started_new_line = true;
    else
        g_started_new_line = false;

    return strStamped;
}

} // namespace

bool GetLogCategory(uint32_t *f, const std::string *str)
{
    if (f && str) {
        if (*str == "") {
            *f = BCLog::ALL;
            return true;
        }
        for (unsigned int i = 0; i < sizeof(LogCategories) / sizeof(LogCategories[0]); i++) {
            if (LogCategories[i].category == *str) {
                *f = LogCategories[i].flag;
                return true;
            }
        }
    }
    return false;
}

std::string ListLogCategories()
{
    std::string ret;
    int outcount = 0;
    for (unsigned int i = 0; i < sizeof(LogCategories) / sizeof(LogCategories[0]); i++) {
        // Omit the special cases.
        if (LogCategories[i].flag != BCLog::NONE && LogCategories[i].flag != BCLog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += LogCategories[i].category;
            outcount++;
        }
    }
    return ret;
}

int LogPrintStr(const std::string &str)
{
    int ret = 0;
    std::lock_guard<std::mutex> lock(g_log_mutex);

    std::string strTimestamped = LogTimestampStr(str);

    if (fPrintToConsole) {
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), stderr);
        fflush(stderr);
    }
    if (g_debug_log != nullptr) {
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), g_debug_log);
        fflush(g_debug_log);
    }
    return ret;
}

bool OpenDebugLog(const std::string& path)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_debug_log != nullptr) {
        fclose(g_debug_log);
    }
    g_debug_log = fopen(path.c_str(), "a");
    if (g_debug_log == nullptr) {
        return false;
    }
    setbuf(g_debug_log, nullptr); // unbuffered
    return true;
}

void CloseDebugLog()
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_debug_log != nullptr) {
        fclose(g_debug_log);
        g_debug_log = nullptr;
    }
}

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue) != 0);
}

/** Turn -noX into -X=0 */
static void InterpretNegativeSetting(std::string& strKey, std::string& strValue)
{
    if (strKey.length() > 3 && strKey[0] == '-' && strKey[1] == 'n' && strKey[2] == 'o') {
        strKey = "-" + strKey.substr(3);
        strValue = InterpretBool(strValue) ? "0" : "1";
    }
}

void ArgsManager::ParseParameters(int argc, const char* const argv[])
{
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();

    for (int i = 1; i < argc; i++) {
        std::string str(argv[i]);
        std::string strValue;
        size_t is_index = str.find('=');
        if (is_index != std::string::npos) {
            strValue = str.substr(is_index + 1);
            str = str.substr(0, is_index);
        }

        if (str.empty() || str[0] != '-')
            break;

        // Interpret --foo as -foo.
        if (str.length() > 1 && str[1] == '-')
            str = str.substr(1);
        InterpretNegativeSetting(str, strValue);

        mapArgs[str] = strValue;
        mapMultiArgs[str].push_back(strValue);
    }
}

bool ArgsManager::ReadConfigFile(const std::string& path, std::string& error)
{
    std::ifstream streamConfig(path);
    if (!streamConfig.good()) {
        error = tfm::format("Cannot read configuration file %s", path);
        return false;
    }

    std::lock_guard<std::mutex> lock(cs_args);
    std::string line;
    int lineno = 0;
    while (std::getline(streamConfig, line)) {
        ++lineno;
        std::string trimmed = TrimString(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        size_t pos = trimmed.find('=');
        if (pos == std::string::npos) {
            error = tfm::format("Parse error on line %d of %s: '%s'", lineno, path, trimmed);
            return false;
        }
        std::string strKey = "-" + TrimString(trimmed.substr(0, pos));
        std::string strValue = TrimString(trimmed.substr(pos + 1));
        InterpretNegativeSetting(strKey, strValue);
        // Don't overwrite existing settings so command line settings override the config file
        if (mapArgs.count(strKey) == 0) {
            mapArgs[strKey] = strValue;
        }
        mapMultiArgs[strKey].push_back(strValue);
    }
    return true;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = mapMultiArgs.find(strArg);
    if (it != mapMultiArgs.end()) return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    return mapArgs.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return it->second;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return atoi64(it->second);
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return InterpretBool(it->second);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    {
        std::lock_guard<std::mutex> lock(cs_args);
        if (mapArgs.count(strArg)) return false;
    }
    ForceSetArg(strArg, strValue);
    return true;
}

bool ArgsManager::SoftSetBoolArg(const std::string& strArg, bool fValue)
{
    if (fValue)
        return SoftSetArg(strArg, std::string("1"));
    else
        return SoftSetArg(strArg, std::string("0"));
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs[strArg] = strValue;
    mapMultiArgs[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string &message) {
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string &option, const std::string &message) {
    return std::string(optIndent,' ') + std::string(option) +
           std::string("\n") + std::string(msgIndent,' ') +
           FormatParagraph(message, screenWidth - msgIndent, msgIndent) +
           std::string("\n\n");
}

bool InitLogging(std::string& error)
{
    fPrintToConsole = gArgs.GetBoolArg("-printtoconsole", fPrintToConsole);
    fLogTimestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    if (gArgs.IsArgSet("-debug")) {
        // Special-case: if -debug=0/-nodebug is set, turn off debugging messages
        const std::vector<std::string> categories = gArgs.GetArgs("-debug");
        bool disabled = false;
        for (const auto& cat : categories) {
            if (cat == "0" || cat == "none") {
                disabled = true;
            }
        }
        if (!disabled) {
            for (const auto& cat : categories) {
                uint32_t flag = 0;
                if (!GetLogCategory(&flag, &cat)) {
                    error = tfm::format("Unsupported logging category -debug=%s. Valid categories: %s", cat, ListLogCategories());
                    return false;
                }
                logCategories |= flag;
            }
        }
    }

    if (gArgs.IsArgSet("-debuglogfile")) {
        std::string path = gArgs.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE);
        if (path.empty()) path = DEFAULT_DEBUGLOGFILE;
        if (!OpenDebugLog(path)) {
            error = tfm::format("Could not open debug log file %s", path);
            return false;
        }
    }
    return true;
}
