/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include "Util.hpp"

#ifdef __linux__
#include <sys/prctl.h>
#endif
#include <unistd.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/rand.h>

#include <Poco/Exception.h>
#include <Poco/Net/DNS.h>
#include <Poco/Net/HostEntry.h>
#include <Poco/Net/IPAddress.h>
#include <Poco/String.h>
#include <Poco/URI.h>

#include "Log.hpp"

namespace Util
{
    namespace
    {
        const std::string QuotePlusReserved = ",/?:@&=+$#;";
    }

    namespace rng
    {
        std::string getHardRandomHexString(const std::size_t length)
        {
            std::vector<unsigned char> bytes(length);
            if (length > 0 && RAND_bytes(bytes.data(), static_cast<int>(length)) != 1)
            {
                throw std::runtime_error("Failed to generate " + std::to_string(length)
                                         + " random bytes");
            }

            std::ostringstream oss;
            oss << std::hex << std::setfill('0');
            for (const unsigned char byte : bytes)
            {
                oss << std::setw(2) << static_cast<unsigned>(byte);
            }

            return oss.str();
        }
    }

    void setThreadName(const std::string& s)
    {
#ifdef __linux__
        if (prctl(PR_SET_NAME, reinterpret_cast<unsigned long>(s.c_str()), 0, 0, 0) != 0)
            LOG_SYS("Cannot set thread name of process " << getpid() << " to [" << s << ']');
        else
            LOG_TRC("Thread of process " << getpid() << " is now called [" << s << ']');
#else
        (void)s;
#endif
    }

    std::string getHostName()
    {
        try
        {
            return Poco::Net::DNS::thisHost().name();
        }
        catch (const Poco::Exception& exc)
        {
            LOG_WRN("Failed to resolve the fully-qualified host name: " << exc.displayText());
        }

        return Poco::Net::DNS::hostName();
    }

    std::vector<std::string> resolveAddresses(const std::string& host)
    {
        std::vector<std::string> result;

        Poco::Net::IPAddress address;
        if (Poco::Net::IPAddress::tryParse(host, address))
        {
            result.push_back(address.toString());
            return result;
        }

        try
        {
            for (const auto& resolved : Poco::Net::DNS::resolve(host).addresses())
            {
                result.push_back(resolved.toString());
            }
        }
        catch (const Poco::Exception& exc)
        {
            LOG_WRN("Poco::Net::DNS::resolve(\"" << host << "\") failed: " << exc.displayText());
        }

        return result;
    }

    std::string getIso8601Time(std::time_t time)
    {
        std::tm tm;
        gmtime_r(&time, &tm);

        char buf[64];
        strftime(buf, sizeof(buf), "%FT%TZ", &tm);
        return buf;
    }

    std::string getCompactLocalTime(std::time_t time)
    {
        std::tm tm;
        localtime_r(&time, &tm);

        char buf[32];
        strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm);
        return buf;
    }

    std::string quotePlus(const std::string& s)
    {
        // Only the unreserved characters are left as-is, as in form encoding.
        std::string encoded;
        Poco::URI::encode(s, QuotePlusReserved, encoded);
        Poco::replaceInPlace(encoded, std::string("%20"), std::string("+"));
        return encoded;
    }
} // end namespace Util

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
