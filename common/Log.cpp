/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include <unistd.h>

#include <atomic>
#include <cstdio>
#include <map>
#include <string>

#include <Poco/AutoPtr.h>
#include <Poco/ConsoleChannel.h>
#include <Poco/FileChannel.h>
#include <Poco/FormattingChannel.h>
#include <Poco/PatternFormatter.h>
#include <Poco/SplitterChannel.h>

#include "Log.hpp"

namespace Log
{
    using namespace Poco;

    /// Helper to avoid destruction ordering issues.
    struct StaticNames
    {
        std::atomic<bool> inited;
        std::string name;
        StaticNames()
            : inited(true)
        {
        }
        ~StaticNames()
        {
            inited = false;
        }
    };
    static StaticNames Source;

    void initialize(const std::string& name,
                    const std::string& logLevel,
                    const bool withColor,
                    const std::string& logFile)
    {
        Source.name = name;

        AutoPtr<Channel> channelConsole = (isatty(fileno(stderr)) && withColor
                            ? static_cast<Poco::Channel*>(new Poco::ColorConsoleChannel())
                            : static_cast<Poco::Channel*>(new Poco::ConsoleChannel()));

        AutoPtr<Channel> channel = channelConsole;
        if (!logFile.empty())
        {
            AutoPtr<SplitterChannel> splitterChannel(new SplitterChannel());
            splitterChannel->addChannel(channelConsole);

            AutoPtr<FileChannel> fileChannel(new FileChannel(logFile));
            fileChannel->setProperty("rotation", "never");
            fileChannel->setProperty("flush", "true");
            splitterChannel->addChannel(fileChannel);
            channel = splitterChannel;
        }

        // name-pid-tid date level message
        AutoPtr<PatternFormatter> formatter(
            new PatternFormatter("%s-%P-%I %Y-%m-%dT%H:%M:%S.%i %q %t"));
        formatter->setProperty("times", "local");
        AutoPtr<FormattingChannel> formattingChannel(new FormattingChannel(formatter, channel));

        auto& logger = Poco::Logger::create(Source.name, formattingChannel,
                                            Poco::Message::PRIO_TRACE);
        logger.setLevel(logLevel.empty() ? std::string("information") : logLevel);

        LOG_INF("Initializing " << name << ", log level is [" << getLevelName() << ']');
    }

    void shutdown()
    {
        if (Source.inited && !Source.name.empty() && Poco::Logger::has(Source.name))
        {
            Poco::Logger::destroy(Source.name);
        }
    }

    Poco::Logger& logger()
    {
        return Poco::Logger::get(Source.inited ? Source.name : std::string());
    }

    void setLevel(const std::string& level)
    {
        logger().setLevel(level);
    }

    std::string getLevelName()
    {
        static const char* Names[] = { "none",    "fatal",  "critical",    "error", "warning",
                                       "notice",  "information", "debug", "trace" };
        const int level = logger().getLevel();
        return (level >= 0 && level <= Poco::Message::PRIO_TRACE) ? Names[level] : "unknown";
    }

    std::string levelFromConfigName(const std::string& configLevel)
    {
        static const std::map<std::string, std::string> Levels = {
            { "Critical", "critical" },
            { "Error", "error" },
            { "Warning", "warning" },
            { "Info", "information" },
            { "Debug", "debug" },
        };

        const auto it = Levels.find(configLevel);
        return it != Levels.end() ? it->second : std::string();
    }
} // namespace Log

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
