/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include <ConfigUtil.hpp>

#include <sstream>
#include <string>
#include <vector>

#include <Poco/AutoPtr.h>
#include <Poco/File.h>
#include <Poco/Util/IniFileConfiguration.h>

#include <Exceptions.hpp>
#include <Log.hpp>
#include <Util.hpp>

namespace ConfigUtil
{
// Add default values of new entries here, so there is a sensible default in case
// the setting is missing from both config files. These should match the values
// shipped in wopiserver.defaults.conf, which is the documentation for operators.
// NOTE: This is sorted, please keep it sorted as it's friendlier to readers.
static const std::map<std::string, std::string> DefAppConfig = {
    { "general.allowedclients", "localhost" },
    { "general.downloadurl", "" },
    { "general.logfile", "" },
    { "general.loglevel", "Info" },
    { "general.maxthreads", "16" },
    { "general.nonofficetypes", ".md .zmd .txt .epd" },
    { "general.port", "8080" },
    { "general.storagetype", "local" },
    { "general.tokenvalidity", "86400" },
    { "general.wopiurl", "" },
    { "io.chunksize", "4194304" },
    { "local.storagehomepath", "" },
    { "security.iopsecretfile", "/etc/wopi/iopsecret" },
    { "security.usehttps", "no" },
    { "security.wopicert", "/etc/grid-security/host.crt" },
    { "security.wopikey", "/etc/grid-security/host.key" },
    { "security.wopisecretfile", "/etc/wopi/wopisecret" },
};

// Priorities of the layers. Lower values take precedence.
constexpr int PrioOverrides = -100;
constexpr int PrioSiteFile = 0;
constexpr int PrioDefaultsFile = 10;
constexpr int PrioBuiltIn = 100;

const std::map<std::string, std::string>& getDefaultAppConfig() { return DefAppConfig; }

bool isKnownKey(const std::string& key)
{
    return DefAppConfig.find(Util::toLower(key)) != DefAppConfig.end();
}

void parseOverride(const std::string& setting, std::map<std::string, std::string>& overrides)
{
    const std::size_t pos = setting.find('=');
    const std::string key = Util::toLower(Util::trimmed(setting.substr(0, pos)));
    const std::size_t dot = key.find('.');
    if (pos == std::string::npos || dot == std::string::npos || dot == 0 || dot + 1 == key.size())
    {
        throw ConfigException("Invalid override [" + setting + "], expected section.key=value");
    }

    overrides[key] = Util::trimmed(setting.substr(pos + 1));
}

void loadLayered(Poco::Util::LayeredConfiguration& config, const std::string& defaultsPath,
                 const std::string& sitePath, const std::map<std::string, std::string>& overrides)
{
    Poco::AutoPtr<AppConfigMap> builtIn(new AppConfigMap(DefAppConfig));
    config.add(builtIn, PrioBuiltIn);

    try
    {
        Poco::AutoPtr<Poco::Util::IniFileConfiguration> defaults(
            new Poco::Util::IniFileConfiguration(defaultsPath));
        config.add(defaults, PrioDefaultsFile);
    }
    catch (const Poco::Exception& exc)
    {
        throw ConfigException("Failed to load defaults file [" + defaultsPath
                              + "]: " + exc.displayText());
    }

    if (!sitePath.empty() && Poco::File(sitePath).exists())
    {
        try
        {
            Poco::AutoPtr<Poco::Util::IniFileConfiguration> site(
                new Poco::Util::IniFileConfiguration(sitePath));
            config.add(site, PrioSiteFile);
        }
        catch (const Poco::Exception& exc)
        {
            throw ConfigException("Failed to load configuration file [" + sitePath
                                  + "]: " + exc.displayText());
        }
    }
    else
    {
        LOG_INF("Configuration file [" << sitePath << "] not found, using defaults only");
    }

    Poco::AutoPtr<AppConfigMap> overrideConfig(new AppConfigMap(overrides));
    config.addWriteable(overrideConfig, PrioOverrides); // Highest priority
}

/// Recursively extract the sub-keys of the given parent key.
static void extract(const std::string& parentKey, const Poco::Util::AbstractConfiguration& config,
                    std::map<std::string, std::string>& map)
{
    std::vector<std::string> keys;
    config.keys(parentKey, keys);
    for (const std::string& subKey : keys)
    {
        const std::string key = parentKey.empty() ? subKey : parentKey + '.' + subKey;
        if (config.has(key))
        {
            map.emplace(Util::toLower(key), config.getRawString(key));
        }

        extract(key, config, map);
    }
}

std::map<std::string, std::string> extractAll(const Poco::Util::AbstractConfiguration& config)
{
    std::map<std::string, std::string> map;
    extract(std::string(), config, map);
    return map;
}

std::string getLoggableConfig(const Poco::Util::AbstractConfiguration& config)
{
    const std::map<std::string, std::string> allConfigs = extractAll(config);
    std::ostringstream ossConfig;
    for (const auto& pair : allConfigs)
    {
        const auto it = DefAppConfig.find(pair.first);
        if (it == DefAppConfig.end() || it->second != pair.second)
        {
            ossConfig << '\t' << pair.first << ": " << pair.second << '\n';
        }
    }

    return ossConfig.str();
}

} // namespace ConfigUtil

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
