// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util.h>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/program_options/detail/config_file.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <set>

ArgsManager gArgs;
bool fPrintToConsole = false;
bool fLogTimestamps = true;

/** Log categories bitfield. */
std::atomic<uint32_t> logCategories(0);

static std::atomic<uint64_t> nLogLines(0);

/**
 * fStartedNewLine is a state variable held by the calling context that will
 * suppress printing of the timestamp when multiple calls are made that don't
 * end in a newline.
 */
static std::atomic_bool fStartedNewLine(true);

static CCriticalSection cs_log;

/** Debug log file, nullptr unless -debuglogfile is set. Guarded by cs_log. */
static FILE* fileout = nullptr;

struct CLogCategoryDesc
{
    uint32_t flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {BCLog::NONE, "0"},
    {BCLog::CARDS, "cards"},
    {BCLog::LEDGER, "ledger"},
    {BCLog::CONFIG, "config"},
    {BCLog::ALL, "1"},
    {BCLog::ALL, "all"},
};

bool GetLogCategory(uint32_t* f, const std::string* str)
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

static std::string LogTimestampStr(const std::string& str)
{
    std::string strStamped;

    if (!fLogTimestamps)
        return str;

    if (fStartedNewLine) {
        strStamped = boost::posix_time::to_iso_extended_string(
            boost::posix_time::second_clock::universal_time()) + "Z " + str;
    } else {
        strStamped = str;
    }

    if (!str.empty() && str[str.size() - 1] == '\n')
        fStartedNewLine = true;
    else
        fStartedNewLine = false;

    return strStamped;
}

int LogPrintStr(const std::string& str)
{
    int ret = 0; // Returns total number of characters written
    LOCK(cs_log);

    std::string strTimestamped = LogTimestampStr(str);
    ++nLogLines;

    if (fPrintToConsole) {
        // print to console
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), stdout);
        fflush(stdout);
    }
    if (fileout != nullptr) {
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), fileout);
    }
    return ret;
}

bool OpenDebugLog(const std::string& path)
{
    LOCK(cs_log);

    FILE* file = fopen(path.c_str(), "a");
    if (file == nullptr) {
        return false;
    }
    setbuf(file, nullptr); // unbuffered

    if (fileout != nullptr) {
        fclose(fileout);
    }
    fileout = file;
    return true;
}

void CloseDebugLog()
{
    LOCK(cs_log);

    if (fileout != nullptr) {
        fclose(fileout);
        fileout = nullptr;
    }
}

uint64_t GetLogLineCount()
{
    return nLogLines.load();
}

bool InitLogging()
{
    fPrintToConsole = gArgs.GetBoolArg("-printtoconsole", false);
    fLogTimestamps = gArgs.GetBoolArg("-logtimestamps", true);

    const std::string logPath = gArgs.GetArg("-debuglogfile", std::string());
    if (logPath.empty()) {
        CloseDebugLog();
    } else if (!OpenDebugLog(logPath)) {
        fprintf(stderr, "Could not open debug log file %s\n", logPath.c_str());
        return false;
    }

    uint32_t categories = BCLog::NONE;
    if (gArgs.IsArgSet("-debug")) {
        for (const auto& cat : gArgs.GetArgs("-debug")) {
            uint32_t flag = 0;
            if (!GetLogCategory(&flag, &cat)) {
                LogPrintf("Unsupported logging category -debug=%s.\n", cat);
                continue;
            }
            categories |= flag;
        }
    }
    for (const auto& cat : gArgs.GetArgs("-debugexclude")) {
        uint32_t flag = 0;
        if (!GetLogCategory(&flag, &cat)) {
            LogPrintf("Unsupported logging category -debugexclude=%s.\n", cat);
            continue;
        }
        categories &= ~flag;
    }
    logCategories = categories;
    return true;
}

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (std::strtoll(strValue.c_str(), nullptr, 10) != 0);
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
    LOCK(cs_args);
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
        // If both --foo and -foo are set, the last takes effect.
        if (str.length() > 1 && str[1] == '-')
            str = str.substr(1);
        InterpretNegativeSetting(str, strValue);

        mapArgs[str] = strValue;
        mapMultiArgs[str].push_back(strValue);
    }
}

void ArgsManager::ReadConfigFile(const std::string& confPath)
{
    std::ifstream streamConfig(confPath);
    if (!streamConfig.good()) {
        throw std::runtime_error(strprintf("Unable to open configuration file %s", confPath));
    }

    {
        LOCK(cs_args);
        std::set<std::string> setOptions;
        setOptions.insert("*");

        for (boost::program_options::detail::config_file_iterator it(streamConfig, setOptions), end; it != end; ++it)
        {
            // Don't overwrite existing settings so command line settings override the config file
            std::string strKey = std::string("-") + it->string_key;
            std::string strValue = it->value[0];
            InterpretNegativeSetting(strKey, strValue);
            if (mapArgs.count(strKey) == 0)
                mapArgs[strKey] = strValue;
            mapMultiArgs[strKey].push_back(strValue);
        }
    }
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    auto it = mapMultiArgs.find(strArg);
    if (it != mapMultiArgs.end()) return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    LOCK(cs_args);
    return mapArgs.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return it->second;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return std::strtoll(it->second.c_str(), nullptr, 10);
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return InterpretBool(it->second);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
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
    LOCK(cs_args);
    mapArgs[strArg] = strValue;
    mapMultiArgs[strArg] = {strValue};
}

void ArgsManager::AddArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (mapArgs.count(strArg) == 0)
        mapArgs[strArg] = strValue;
    mapMultiArgs[strArg].push_back(strValue);
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();
}

static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string& message) {
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string& option, const std::string& message) {
    return std::string(optIndent, ' ') + std::string(option) +
           std::string("\n") + std::string(msgIndent, ' ') +
           message +
           std::string("\n\n");
}
