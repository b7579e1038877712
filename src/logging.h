// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2022 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef ZKVERIFY_LOGGING_H
#define ZKVERIFY_LOGGING_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace ZKVLog {
class format_error : public std::runtime_error
{
public:
    explicit format_error(const std::string& what) : std::runtime_error(what) {}
};
} // namespace ZKVLog

// Report bad format strings as exceptions instead of tinyformat's default assert().
#define TINYFORMAT_ERROR(reason) throw ZKVLog::format_error(reason)
#include <tinyformat.h>

namespace ZKVLog {
enum LogFlags : uint32_t {
    NONE        = 0,
    CODEC       = (1 << 0),
    VERIFY      = (1 << 1),
    ABI         = (1 << 2),
    ALL         = ~(uint32_t)0,
};

class Logger
{
private:
    mutable std::mutex m_cs;

    /** Slots that connect to the print signal */
    std::list<std::function<void(const std::string&)>> m_print_callbacks;

    /** Log categories bitfield. */
    std::atomic<uint32_t> m_categories{0};

public:
    //! Toggled at runtime through zkverify_log_enable(), so readers may be on other threads.
    std::atomic<bool> m_print_to_console{false};

    /** Send a string to the log output */
    void LogPrintStr(const std::string& str);

    /** Returns whether logs will be written to any output */
    bool Enabled() const
    {
        std::lock_guard<std::mutex> lock(m_cs);
        return m_print_to_console || !m_print_callbacks.empty();
    }

    /** Connect a slot to the print signal and return the connection.
     *  Callbacks run with m_cs held and must not log themselves. */
    std::list<std::function<void(const std::string&)>>::iterator PushBackCallback(std::function<void(const std::string&)> fun)
    {
        std::lock_guard<std::mutex> lock(m_cs);
        m_print_callbacks.push_back(std::move(fun));
        return --m_print_callbacks.end();
    }

    /** Delete a connection */
    void DeleteCallback(std::list<std::function<void(const std::string&)>>::iterator it)
    {
        std::lock_guard<std::mutex> lock(m_cs);
        m_print_callbacks.erase(it);
    }

    void EnableCategory(LogFlags flag);
    bool EnableCategory(const std::string& str);
    void DisableCategory(LogFlags flag);
    bool DisableCategory(const std::string& str);

    uint32_t GetCategoryMask() const { return m_categories.load(); }

    bool WillLogCategory(LogFlags category) const;

    /** Returns a string with the log categories in alphabetical order. */
    std::string LogCategoriesString() const;
};

} // namespace ZKVLog

ZKVLog::Logger& LogInstance();

/** Return true if log accepts specified category */
static inline bool LogAcceptCategory(ZKVLog::LogFlags category)
{
    return LogInstance().WillLogCategory(category);
}

/** Return true if str parses as a log category and set the flag */
bool GetLogCategory(ZKVLog::LogFlags& flag, const std::string& str);

template <typename... Args>
static inline void LogPrintf_(const char* fmt, const Args&... args)
{
    if (LogInstance().Enabled()) {
        std::string log_msg;
        try {
            log_msg = tfm::format(fmt, args...);
        } catch (ZKVLog::format_error& fmterr) {
            /* Original format string will have newline so don't add one here */
            log_msg = "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + fmt;
        }
        LogInstance().LogPrintStr(log_msg);
    }
}

#define LogPrintf(...) LogPrintf_(__VA_ARGS__)

// Use a macro instead of a function for conditional logging to prevent
// evaluating arguments when logging for the category is not enabled.
#define LogPrint(category, ...)              \
    do {                                     \
        if (LogAcceptCategory((category))) { \
            LogPrintf(__VA_ARGS__);          \
        }                                    \
    } while (0)

#endif // ZKVERIFY_LOGGING_H
