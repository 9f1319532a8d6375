// Copyright (c) 2026 The Crowdfund developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CROWDFUND_LOGGING_H
#define CROWDFUND_LOGGING_H

#include "fs.h"
#include "util/format.h"

#include <atomic>
#include <list>
#include <mutex>
#include <stdint.h>
#include <string>

static const bool DEFAULT_LOGTIMESTAMPS = true;
//! Pre-start buffer limit; the oldest messages are dropped beyond it
static const size_t DEFAULT_MAX_LOG_BUFFER = 1000000;
extern const char * const DEFAULT_DEBUGLOGFILE;

namespace BCLog {

enum LogFlags : uint32_t {
    NONE        = 0,
    LEDGER      = (1 <<  0),
    DB          = (1 <<  1),
    TRANSFER    = (1 <<  2),
    NOTIFY      = (1 <<  3),
    ALL         = ~(uint32_t)0,
};

class Logger
{
private:
    mutable std::mutex m_cs;
    FILE* m_fileout = nullptr;
    fs::path m_fileout_path;  //!< Path m_fileout was opened on
    std::list<std::string> m_msgs_before_open;
    size_t m_buffer_bytes{0};
    size_t m_buffer_lines_discarded{0};
    bool m_buffering{true}; //!< Buffer messages before logging can be started

    bool OpenDebugLog();

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
    size_t m_max_buffer_bytes = DEFAULT_MAX_LOG_BUFFER;

    fs::path m_file_path;

    ~Logger();

    /** Send a string to the log output */
    void LogPrintStr(const std::string& str);

    /** Returns whether logs will be written to any output */
    bool Enabled() const
    {
        std::lock_guard<std::mutex> scoped_lock(m_cs);
        return m_buffering || m_print_to_console || m_print_to_file;
    }

    /**
     * Start logging (and flush all buffered messages). Safe to call again
     * after a reconfiguration: opens m_file_path if file output was enabled
     * or the path changed.
     */
    bool StartLogging();

    uint32_t GetCategoryMask() const { return m_categories.load(); }

    void EnableCategory(LogFlags flag);
    bool EnableCategory(const std::string& str);
    void DisableCategory(LogFlags flag);
    bool DisableCategory(const std::string& str);

    bool WillLogCategory(LogFlags category) const;
};

} // namespace BCLog

BCLog::Logger& LogInstance();

/** Return true if log accepts specified category */
static inline bool LogAcceptCategory(BCLog::LogFlags category)
{
    return LogInstance().WillLogCategory(category);
}

/** Returns a string with the log categories. */
std::string ListLogCategories();

/** Return true if str parses as a log category and set the flag */
bool GetLogCategory(BCLog::LogFlags& flag, const std::string& str);

template <typename... Args>
static inline void LogPrintf(const char* fmt, const Args&... args)
{
    if (LogInstance().Enabled()) {
        std::string log_msg;
        try {
            log_msg = tfm::format(fmt, args...);
        } catch (const std::runtime_error& fmterr) {
            /* Original format string will have newline so don't add one here */
            log_msg = "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + fmt;
        }
        LogInstance().LogPrintStr(log_msg);
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

#endif // CROWDFUND_LOGGING_H
