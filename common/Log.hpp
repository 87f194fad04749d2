/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#pragma once

#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>

#include <Poco/Logger.h>
#include <Poco/Message.h>

namespace Log
{
    /// Initialize the logging system.
    /// When logFile is non-empty, entries are written both to the console and to that file.
    void initialize(const std::string& name,
                    const std::string& logLevel,
                    bool withColor = false,
                    const std::string& logFile = std::string());

    /// Release the channels. Safe to call more than once.
    void shutdown();

    Poco::Logger& logger();

    /// Set the logging level by Poco name (trace, debug, information, ...).
    void setLevel(const std::string& level);

    /// Returns the current level as a Poco name.
    std::string getLevelName();

    /// Maps a configuration log level (Critical, Error, Warning, Info, Debug)
    /// to its Poco name. Returns an empty string for unknown levels.
    std::string levelFromConfigName(const std::string& configLevel);

    inline bool traceEnabled() { return logger().getLevel() >= Poco::Message::PRIO_TRACE; }
    inline bool debugEnabled() { return logger().getLevel() >= Poco::Message::PRIO_DEBUG; }
    inline bool infoEnabled() { return logger().getLevel() >= Poco::Message::PRIO_INFORMATION; }
    inline bool warnEnabled() { return logger().getLevel() >= Poco::Message::PRIO_WARNING; }
    inline bool errorEnabled() { return logger().getLevel() >= Poco::Message::PRIO_ERROR; }
    inline bool fatalEnabled() { return logger().getLevel() >= Poco::Message::PRIO_FATAL; }

    /// Shortens a secret-bearing string (such as an access token) for logging
    /// at levels where the full value must not be written.
    inline std::string abbreviate(const std::string& secret, std::size_t keep = 8)
    {
        if (debugEnabled() || secret.size() <= keep)
            return secret;

        return secret.substr(0, keep) + "...";
    }
} // namespace Log

/// Strip the path prefix ("./") that is noisy.
template <std::size_t N>
static constexpr std::size_t skipPathPrefix(const char (&s)[N], std::size_t n = 0)
{
    return s[n] == '.' || s[n] == '/' ? skipPathPrefix(s, n + 1) : n;
}

#define LOG_FILE_NAME(f) (&f[skipPathPrefix(f)])

#define LOG_BODY_(X)                                                                               \
    std::ostringstream oss_;                                                                       \
    oss_ << std::boolalpha << X << "| " << LOG_FILE_NAME(__FILE__) << ':' << __LINE__

#define LOG_MESSAGE_(ENABLED, FUNC, X)                                                             \
    do                                                                                             \
    {                                                                                              \
        if (Log::ENABLED())                                                                        \
        {                                                                                          \
            LOG_BODY_(X);                                                                          \
            Log::logger().FUNC(oss_.str());                                                        \
        }                                                                                          \
    } while (false)

#define LOG_TRC(X) LOG_MESSAGE_(traceEnabled, trace, X)
#define LOG_DBG(X) LOG_MESSAGE_(debugEnabled, debug, X)
#define LOG_INF(X) LOG_MESSAGE_(infoEnabled, information, X)
#define LOG_WRN(X) LOG_MESSAGE_(warnEnabled, warning, X)
#define LOG_ERR(X) LOG_MESSAGE_(errorEnabled, error, X)

/// Log an ERR entry with errno appended.
/// NOTE: Must be called immediately after an API that sets errno.
#define LOG_SYS(X)                                                                                 \
    do                                                                                             \
    {                                                                                              \
        const auto onrre = errno; /* Save errno immediately while avoiding name clashes*/          \
        LOG_ERR(X << " (errno: " << std::strerror(onrre) << ')');                                  \
    } while (false)

/// Fatal entries also go to stderr, since they typically precede an exit.
#define LOG_FTL(X)                                                                                 \
    do                                                                                             \
    {                                                                                              \
        std::cerr << X << std::endl;                                                               \
        if (Log::fatalEnabled())                                                                   \
        {                                                                                          \
            LOG_BODY_(X);                                                                          \
            Log::logger().fatal(oss_.str());                                                       \
        }                                                                                          \
    } while (false)

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
