// Copyright (c) 2024 The Cardvault developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * logging, thread wrappers.
 */
#ifndef CARDVAULT_UTIL_H
#define CARDVAULT_UTIL_H

#include <sync.h>

#include <stdexcept>

// Format errors surface as exceptions so a bad log line never aborts the process
#ifndef TINYFORMAT_ERROR
#define TINYFORMAT_ERROR(reasonString) throw std::runtime_error(reasonString)
#endif
#include <tinyformat.h>

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

extern bool fPrintToConsole;
extern bool fLogTimestamps;

extern std::atomic<uint32_t> logCategories;

namespace BCLog {
    enum LogFlags : uint32_t {
        NONE        = 0,
        CARDS       = (1 <<  0),
        LEDGER      = (1 <<  1),
        CONFIG      = (1 <<  2),
        ALL         = ~(uint32_t)0,
    };
}

/** Return true if log accepts specified category */
static inline bool LogAcceptCategory(uint32_t category)
{
    return (logCategories.load(std::memory_order_relaxed) & category) != 0;
}

/** Returns a string with the log categories. */
std::string ListLogCategories();

/** Return true if str parses as a log category and set the flags in f */
bool GetLogCategory(uint32_t* f, const std::string* str);

/** Send a string to the log output */
int LogPrintStr(const std::string& str);

/**
 * Also write log lines to the file at path, appending. Replaces any
 * previously opened log file.
 * @return false if the file cannot be opened
 */
bool OpenDebugLog(const std::string& path);

void CloseDebugLog();

/** Number of lines accepted by LogPrintStr since start-up */
uint64_t GetLogLineCount();

/** Get format string from VA_ARGS for error reporting */
template<typename... Args> std::string FormatStringFromLogArgs(const char* fmt, const Args&... args) { return fmt; }

#define strprintf tfm::format

#define LogPrintf(...) do { \
    std::string _log_msg_; /* Unlikely name to avoid shadowing variables */ \
    try { \
        _log_msg_ = tfm::format(__VA_ARGS__); \
    } catch (const std::runtime_error& fmterr) { \
        /* Original format string will have newline so don't add one here */ \
        _log_msg_ = "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + FormatStringFromLogArgs(__VA_ARGS__); \
    } \
    LogPrintStr(_log_msg_); \
} while(0)

#define LogPrint(category, ...) do { \
    if (LogAcceptCategory((category))) { \
        LogPrintf(__VA_ARGS__); \
    } \
} while(0)

/**
 * Apply -debug, -debugexclude, -printtoconsole, -logtimestamps and
 * -debuglogfile from gArgs. Unknown categories are reported and ignored.
 * Without -debuglogfile, log lines only reach the console, and only with
 * -printtoconsole.
 * @return false if -debuglogfile names a file that cannot be opened
 */
bool InitLogging();

class ArgsManager
{
protected:
    mutable CCriticalSection cs_args;
    std::map<std::string, std::string> mapArgs;
    std::map<std::string, std::vector<std::string>> mapMultiArgs;

public:
    void ParseParameters(int argc, const char* const argv[]);

    /**
     * Read key=value lines from a config file. Values already given on the
     * command line win. Throws std::runtime_error on an unreadable file.
     */
    void ReadConfigFile(const std::string& confPath);

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
     * Return string argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param strDefault (e.g. "1")
     * @return command-line argument or default value
     */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;

    /**
     * Return integer argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param nDefault (e.g. 1)
     * @return command-line argument (0 if invalid number) or default value
     */
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;

    /**
     * Return boolean argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param fDefault (true or false)
     * @return command-line argument or default value
     */
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /**
     * Set an argument if it doesn't already have a value
     *
     * @param strArg Argument to set (e.g. "-foo")
     * @param strValue Value (e.g. "1")
     * @return true if argument gets set, false if it already had a value
     */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    /**
     * Set a boolean argument if it doesn't already have a value
     *
     * @param strArg Argument to set (e.g. "-foo")
     * @param fValue Value (e.g. false)
     * @return true if argument gets set, false if it already had a value
     */
    bool SoftSetBoolArg(const std::string& strArg, bool fValue);

    // Forces an arg setting. Called by SoftSetArg() if the arg hasn't already
    // been set. Also called directly in testing.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    // Adds one more value to a multi-valued arg such as -leveluri.
    void AddArg(const std::string& strArg, const std::string& strValue);

    void ClearArgs();
};

extern ArgsManager gArgs;

/**
 * Format a string to be used as group of options in help messages
 *
 * @param message Group name (e.g. "RPC server options:")
 * @return the formatted string
 */
std::string HelpMessageGroup(const std::string& message);

/**
 * Format a string to be used as option description in help messages
 *
 * @param option Option message (e.g. "-rpcuser=<user>")
 * @param message Option description (e.g. "Username for JSON-RPC connections")
 * @return the formatted string
 */
std::string HelpMessageOpt(const std::string& option, const std::string& message);

#endif // CARDVAULT_UTIL_H
