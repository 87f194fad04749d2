/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

// Configuration related utilities.
// Placed here to avoid polluting
// Util.hpp with the config headers.
// This is designed to be used from both the server and the tools.

#pragma once

#include <Poco/Exception.h>
#include <Poco/Util/AbstractConfiguration.h>
#include <Poco/Util/LayeredConfiguration.h>
#include <Poco/Util/MapConfiguration.h>

#include <map>
#include <string>

namespace ConfigUtil
{
/// Helper class to hold default configuration entries.
class AppConfigMap final : public Poco::Util::MapConfiguration
{
public:
    AppConfigMap(const std::map<std::string, std::string>& map)
    {
        for (const auto& pair : map)
        {
            setRaw(pair.first, pair.second);
        }
    }
};

/// Returns the built-in default config, used for keys missing from every file.
const std::map<std::string, std::string>& getDefaultAppConfig();

/// Returns true iff the key names a known setting.
bool isKnownKey(const std::string& key);

/// Parses a "section.key=value" command-line override into the map.
/// Keys are case-insensitive and stored lower-case.
/// Throws ConfigException when malformed.
void parseOverride(const std::string& setting, std::map<std::string, std::string>& overrides);

/// Stack the configuration layers, lowest priority first: the built-in defaults,
/// the defaults file (must exist and parse), the optional site file and the overrides.
/// Throws ConfigException when the defaults file can't be loaded or the site file
/// exists but can't be parsed.
void loadLayered(Poco::Util::LayeredConfiguration& config, const std::string& defaultsPath,
                 const std::string& sitePath,
                 const std::map<std::string, std::string>& overrides);

/// Extract all entries as key-value pairs. We use map to have the entries sorted.
/// Values are reported raw, without variable expansion.
std::map<std::string, std::string> extractAll(const Poco::Util::AbstractConfiguration& config);

/// Returns the config in a loggable string form.
std::string getLoggableConfig(const Poco::Util::AbstractConfiguration& config);

class ConfigRawValueGetter
{
    const Poco::Util::AbstractConfiguration* _config;

public:
    explicit ConfigRawValueGetter(const Poco::Util::AbstractConfiguration& config)
        : _config(&config)
    {
    }

    void operator()(const std::string& name, bool& value) const { value = _config->getBool(name); }
    void operator()(const std::string& name, std::string& value) const
    {
        value = _config->getString(name);
    }
};

template <typename T>
static bool getSafeConfig(const Poco::Util::AbstractConfiguration& config, const std::string& name,
                          T& value)
{
    try
    {
        ConfigRawValueGetter{ config }(name, value);
        return true;
    }
    catch (const Poco::Exception&)
    {
        // Missing or malformed: the caller falls back to its default.
    }

    return false;
}

/// Returns the value of the specified configuration entry,
/// or the default, if one doesn't exist or is malformed.
template <typename T>
static T getConfigValue(const Poco::Util::AbstractConfiguration& config, const std::string& name,
                        const T def)
{
    T value = def;
    if (getSafeConfig(config, name, value))
    {
        return value;
    }

    return def;
}

} // namespace ConfigUtil

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
