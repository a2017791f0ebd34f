/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * Copyright the cspheader contributors.
 *
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#pragma once

#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <map>
#include <sstream>
#include <string>

namespace Log
{
    /// The values match Poco::Message::Priority.
    enum Level : std::uint8_t
    {
        FTL = 1, // Fatal
        CTL,     // Critical
        ERR,     // Error
        WRN,     // Warning
        NTC,     // Notice
        INF,     // Information
        DBG,     // Debug
        TRC,     // Trace
        MAX
    };

    /// Different logging domains.
    enum class Area : std::uint8_t
    {
        Generic,
        Http,
        Config,
        Max
    };

    /// Initialize the logging system.
    /// When @logToFile is set, @config holds the Poco::FileChannel properties.
    void initialize(const std::string& name,
                    const std::string& logLevel,
                    bool withColor = false,
                    bool logToFile = false,
                    const std::map<std::string, std::string>& config = {});

    /// Shutdown and release the logging system.
    void shutdown();

    /// Generates log entry prefix. Example follows (without the vertical bars).
    /// |csp-07272-07298 2020-04-25 17:29:28.928697 -0400 [ main ] TRC  |
    /// Buffer must be at least 128 bytes.
    char* prefix(const std::chrono::time_point<std::chrono::system_clock>& tp,
                 char* buffer,
                 const char* level);

    template <int Size> inline char* prefix(char buffer[Size], const char* level)
    {
        static_assert(Size >= 128, "Buffer size must be at least 128 bytes.");

        const auto tp = std::chrono::system_clock::now();
        return prefix(tp, buffer, level);
    }

    /// is a certain level of logging enabled ?
    bool isEnabled(Level l, Area a = Area::Generic);

    inline bool traceEnabled()
    {
        return isEnabled(Log::Level::TRC);
    }

    /// Main entry function for all logging
    void log(Level l, const std::string &text);

    /// Setting the logging level
    void setLevel(const std::string &l);

    /// Getting the logging level
    Level getLevel();

    /// Getting the logging level as a string
    const std::string& getLevelName();

    /// Disable the given area for levels more verbose than warning.
    void setAreaDisabled(Area a, bool disabled);

} // namespace Log

/// A default implementation that is a NOP.
/// Any context can implement this to prefix its log entries.
inline void logPrefix(std::ostream&) {}

/// Strip the path prefix ("./") that is noisy.
template <std::size_t N>
static constexpr std::size_t skipPathPrefix(const char (&s)[N], std::size_t n = 0)
{
    return s[n] == '.' || s[n] == '/' ? skipPathPrefix(s, n + 1) : n;
}

#define LOG_FILE_NAME(f) (&f[skipPathPrefix(f)])

// Macro expansion doesn't happen when # or ## operators are used,
// so we need an indirection to expand macros before using the result.
#define CONCATINATE_IMPL(X, Y) X##Y
#define CONCATINATE(X, Y) CONCATINATE_IMPL(X, Y)
#define UNIQUE_VAR(X) CONCATINATE(X, __LINE__)
#define STRINGIFY(X) #X
#define STRING(X) STRINGIFY(X)

#define LOG_LOG(LVL, STR)  Log::log(Log::LVL, STR)

#define LOG_END(LOG) LOG << "| " << LOG_FILE_NAME(__FILE__) << ":" STRING(__LINE__)

#define LOG_MESSAGE_(LVL, A, X, PREFIX, SUFFIX)  \
    do                                          \
    {                                           \
        if (LOG_CONDITIONAL(LVL, A))              \
        {                                       \
            LOG_BODY_(LVL, X, PREFIX, SUFFIX);    \
        }                                       \
    } while (false)

#define LOG_BODY_(LVL, X, PREFIX, END)                                                             \
    char UNIQUE_VAR(buffer)[1024];                                                                 \
    std::ostringstream oss_(Log::prefix<sizeof(UNIQUE_VAR(buffer)) - 1>(UNIQUE_VAR(buffer), #LVL), \
                            std::ostringstream::ate);                                              \
    PREFIX(oss_);                                                                                  \
    oss_ << std::boolalpha << X;                                                                   \
    END(oss_);                                                                                     \
    LOG_LOG(LVL, oss_.str())

/// Unconditionally log. LVL can be anything converted to string.
#define LOG_UNCONDITIONAL(LVL, X)                                                                  \
    do                                                                                             \
    {                                                                                              \
        char UNIQUE_VAR(buffer)[1024];                                                             \
        std::ostringstream oss_(                                                                   \
            Log::prefix<sizeof(UNIQUE_VAR(buffer)) - 1>(UNIQUE_VAR(buffer), #LVL),                 \
            std::ostringstream::ate);                                                              \
        logPrefix(oss_);                                                                           \
        oss_ << std::boolalpha << X;                                                               \
        LOG_END(oss_);                                                                             \
        Log::log(Log::Level::FTL, oss_.str());                                                     \
    } while (false)

/// Unconditionally log at TST level. Used for tests only.
#define LOG_TST(X) LOG_UNCONDITIONAL(TST, X)

#if defined __GNUC__ || defined __clang__
#  define LOG_CONDITIONAL(type, area)  \
    __builtin_expect(Log::isEnabled(Log::Level::type, Log::Area::area), 0)
#else
#  define LOG_CONDITIONAL(type, area) Log::isEnabled(Log::Level::type, Log::Area::area)
#endif

#define LOG_TRC(X)        LOGA_TRC(Generic, X)
#define LOG_DBG(X)        LOGA_DBG(Generic, X)
#define LOG_INF(X)        LOGA_INF(Generic, X)
#define LOG_ERR(X)        LOG_MESSAGE_(ERR, Generic, X, logPrefix, LOG_END)

#define LOGA_TRC(A,X)        LOG_MESSAGE_(TRC, A, X, logPrefix, LOG_END)
#define LOGA_DBG(A,X)        LOG_MESSAGE_(DBG, A, X, logPrefix, LOG_END)
#define LOGA_INF(A,X)        LOG_MESSAGE_(INF, A, X, logPrefix, LOG_END)
// ERR is not filtered by area

/// Log an ERR entry with errno appended.
/// NOTE: Must be called immediately after an API that sets errno.
#define LOG_SYS(X)                                                                                 \
    do                                                                                             \
    {                                                                                              \
        const auto onrre = errno; /* Save errno immediately while avoiding name clashes*/          \
        LOG_ERR(X << " (" << onrre << ": " << std::strerror(onrre) << ')');                       \
    } while (false)

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
