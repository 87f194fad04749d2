/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#pragma once

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>
#include <utility>
#include <vector>

namespace Util
{
    namespace rng
    {
        /// Generate a hard random string of hex characters
        /// from length bytes of the OpenSSL CSPRNG.
        std::string getHardRandomHexString(const std::size_t length);
    }

    /// Set the name of the current thread, as seen by ps and gdb.
    void setThreadName(const std::string& s);

    /// The fully-qualified name of this host, or the plain host name on failure.
    std::string getHostName();

    /// Resolves a host name into all its numeric addresses.
    /// Numeric addresses resolve to themselves.
    std::vector<std::string> resolveAddresses(const std::string& host);

    /// Formats a time as ISO 8601 in UTC with second precision (2017-04-05T16:32:17Z).
    std::string getIso8601Time(std::time_t time);

    /// Formats a local time as YYYYMMDD-HHMMSS, the suffix used for conflicting copies.
    std::string getCompactLocalTime(std::time_t time);

    /// URL-encodes everything but unreserved characters, spaces become '+'.
    std::string quotePlus(const std::string& s);

    /// Trim spaces from both left and right and copy. Just spaces.
    inline std::string trimmed(const std::string& s)
    {
        const std::size_t first = s.find_first_not_of(' ');
        if (first == std::string::npos)
        {
            return std::string();
        }

        const std::size_t last = s.find_last_not_of(' ');
        return s.substr(first, last + 1 - first);
    }

    /// Remove trailing whitespace of any kind (spaces, tabs, newlines).
    inline std::string rtrimmedWhitespace(const std::string& s)
    {
        const std::size_t last = s.find_last_not_of(" \t\r\n\v\f");
        return last == std::string::npos ? std::string() : s.substr(0, last + 1);
    }

    /// Return true iff s starts with t.
    inline bool startsWith(const std::string& s, const std::string& t)
    {
        return s.length() >= t.length() && memcmp(s.c_str(), t.c_str(), t.length()) == 0;
    }

    /// Converts and returns the argument to lower-case.
    inline std::string toLower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(::tolower(c)); });
        return s;
    }

    /// Case insensitive comparison of two strings.
    inline bool iequal(const std::string& lhs, const std::string& rhs)
    {
        return lhs.size() == rhs.size()
               && std::equal(lhs.begin(), lhs.end(), rhs.begin(),
                             [](char a, char b)
                             {
                                 return ::tolower(static_cast<unsigned char>(a))
                                        == ::tolower(static_cast<unsigned char>(b));
                             });
    }

    /// Split a string in tokens separated by delim, skipping empty ones.
    inline std::vector<std::string> splitStringToVector(const std::string& str, const char delim)
    {
        std::size_t start;
        std::size_t end = 0;

        std::vector<std::string> result;

        while ((start = str.find_first_not_of(delim, end)) != std::string::npos)
        {
            end = str.find(delim, start);
            result.emplace_back(str.substr(start, end - start));
        }
        return result;
    }

    /// Split a path in its directory part (without trailing '/', "/" for the root)
    /// and its last component.
    inline std::pair<std::string, std::string> splitPath(const std::string& path)
    {
        const std::size_t pos = path.find_last_of('/');
        if (pos == std::string::npos)
        {
            return std::make_pair(std::string(), path);
        }

        return std::make_pair(pos == 0 ? std::string("/") : path.substr(0, pos),
                              path.substr(pos + 1));
    }

    /// Split a file name in base and extension, the extension keeping its dot.
    /// Leading dots (hidden files) are not extensions.
    inline std::pair<std::string, std::string> splitExtension(const std::string& name)
    {
        const std::size_t slash = name.find_last_of('/');
        const std::size_t dot = name.find_last_of('.');
        const std::size_t nameStart = (slash == std::string::npos ? 0 : slash + 1);
        if (dot == std::string::npos || dot <= nameStart
            || name.find_first_not_of('.', nameStart) > dot)
        {
            return std::make_pair(name, std::string());
        }

        return std::make_pair(name.substr(0, dot), name.substr(dot));
    }

    /// Convert a string to 64-bit signed int.
    /// Returns the parsed value and a boolean indicating success or failure.
    /// Trailing garbage is a failure.
    inline std::pair<std::int64_t, bool> i64FromString(const std::string& input)
    {
        const char* str = input.c_str();
        char* endptr = nullptr;
        errno = 0;
        const auto value = std::strtoll(str, &endptr, 10);
        return std::make_pair(value, endptr > str && *endptr == '\0' && errno != ERANGE);
    }

    /// Seconds since the epoch.
    inline std::time_t getNowInSec()
    {
        return std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    }
} // end namespace Util

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
