/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include "WopiConfig.hpp"

#include <fstream>
#include <iterator>
#include <limits>
#include <set>

#include <Poco/Exception.h>
#include <Poco/File.h>
#include <Poco/Util/IniFileConfiguration.h>

#include <ConfigUtil.hpp>
#include <Exceptions.hpp>
#include <Log.hpp>
#include <Util.hpp>

namespace
{
const std::set<std::string> StorageTypes = { "local" };
const std::set<std::string> LogLevels = { "Critical", "Error", "Warning", "Info", "Debug" };

void requireNonEmpty(const WopiConfig& config, const std::string& key)
{
    if (Util::trimmed(config.getString(key)).empty())
    {
        throw ConfigException(key + ": a value is required");
    }
}

/// Parses a positive integer, false in the second member when invalid.
std::pair<int, bool> parsePositive(const std::string& value)
{
    const auto pair = Util::i64FromString(Util::trimmed(value));
    if (!pair.second || pair.first <= 0 || pair.first > std::numeric_limits<int>::max())
    {
        return std::make_pair(0, false);
    }

    return std::make_pair(static_cast<int>(pair.first), true);
}
}

WopiConfig::WopiConfig()
    : _config(new Poco::Util::LayeredConfiguration())
    , _tokenValidity(86400)
    , _logLevel("Info")
    , _lastRefresh(0)
{
}

void WopiConfig::load(const std::string& defaultsPath, const std::string& sitePath,
                      const std::map<std::string, std::string>& overrides)
{
    _config = new Poco::Util::LayeredConfiguration();
    ConfigUtil::loadLayered(*_config, defaultsPath, sitePath, overrides);
    _sitePath = sitePath;
    _overrides = overrides;

    const auto validity = parsePositive(getString("general.tokenvalidity"));
    if (validity.second)
    {
        _tokenValidity = validity.first;
    }

    std::lock_guard<std::mutex> lock(_mutex);
    _logLevel = Util::trimmed(getString("general.loglevel"));
    _lastRefresh = Util::getNowInSec();
}

std::string WopiConfig::getString(const std::string& key) const
{
    return ConfigUtil::getConfigValue<std::string>(*_config, key, std::string());
}

std::map<std::string, std::string> WopiConfig::extractAll() const
{
    return ConfigUtil::extractAll(*_config);
}

std::int64_t WopiConfig::getInteger(const std::string& key, std::int64_t min,
                                    std::int64_t max) const
{
    const std::string value = Util::trimmed(getString(key));
    const auto pair = Util::i64FromString(value);
    if (!pair.second || pair.first < min || pair.first > max)
    {
        throw ConfigException(key + ": invalid value [" + value + "], expected an integer in "
                              + std::to_string(min) + ".." + std::to_string(max));
    }

    return pair.first;
}

void WopiConfig::validate() const
{
    const std::string storageType = getStorageType();
    if (StorageTypes.find(storageType) == StorageTypes.end())
    {
        throw ConfigException("general.storagetype: unsupported storage type [" + storageType
                              + ']');
    }

    getInteger("general.port", 1, 65535);

    const std::string logLevel = Util::trimmed(getString("general.loglevel"));
    if (LogLevels.find(logLevel) == LogLevels.end())
    {
        throw ConfigException("general.loglevel: unknown level [" + logLevel
                              + "], expected one of Critical, Error, Warning, Info, Debug");
    }

    getInteger("general.tokenvalidity", 1, std::numeric_limits<int>::max());
    getInteger("general.maxthreads", 1, 1024);
    getInteger("io.chunksize", 1, std::numeric_limits<int>::max());

    try
    {
        _config->getBool("security.usehttps");
    }
    catch (const Poco::Exception& exc)
    {
        throw ConfigException("security.usehttps: invalid value ["
                              + getString("security.usehttps")
                              + "], expected yes/no, true/false, on/off or a number: "
                              + exc.displayText());
    }

    if (useHttps())
    {
        requireNonEmpty(*this, "security.wopicert");
        requireNonEmpty(*this, "security.wopikey");
    }

    requireNonEmpty(*this, "security.wopisecretfile");
    requireNonEmpty(*this, "security.iopsecretfile");

    if (storageType == "local")
    {
        requireNonEmpty(*this, "local.storagehomepath");
    }
}

std::string WopiConfig::getStorageType() const
{
    return Util::toLower(Util::trimmed(getString("general.storagetype")));
}

int WopiConfig::getPort() const { return static_cast<int>(getInteger("general.port", 1, 65535)); }

std::string WopiConfig::getWopiUrl() const
{
    std::string url = Util::trimmed(getString("general.wopiurl"));
    if (url.empty())
    {
        url = (useHttps() ? "https://" : "http://") + Util::getHostName() + ':'
              + std::to_string(getPort());
    }

    while (!url.empty() && url.back() == '/')
        url.pop_back();

    return url;
}

std::string WopiConfig::getDownloadUrl() const { return Util::trimmed(getString("general.downloadurl")); }

unsigned WopiConfig::getMaxThreads() const
{
    return static_cast<unsigned>(getInteger("general.maxthreads", 1, 1024));
}

std::string WopiConfig::getLogFile() const { return Util::trimmed(getString("general.logfile")); }

bool WopiConfig::useHttps() const
{
    return ConfigUtil::getConfigValue<bool>(*_config, "security.usehttps", false);
}

std::string WopiConfig::getCertPath() const { return Util::trimmed(getString("security.wopicert")); }

std::string WopiConfig::getKeyPath() const { return Util::trimmed(getString("security.wopikey")); }

std::string WopiConfig::getWopiSecretPath() const
{
    return Util::trimmed(getString("security.wopisecretfile"));
}

std::string WopiConfig::getIopSecretPath() const
{
    return Util::trimmed(getString("security.iopsecretfile"));
}

std::string WopiConfig::getStorageHomePath() const
{
    return Util::trimmed(getString("local.storagehomepath"));
}

std::size_t WopiConfig::getChunkSize() const
{
    return static_cast<std::size_t>(getInteger("io.chunksize", 1, std::numeric_limits<int>::max()));
}

std::vector<std::string> WopiConfig::getAllowedClients() const
{
    return Util::splitStringToVector(getString("general.allowedclients"), ' ');
}

std::string WopiConfig::getLogLevel() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _logLevel;
}

bool WopiConfig::isOfficeType(const std::string& filename) const
{
    const std::string ext = Util::toLower(Util::splitExtension(filename).second);
    for (const auto& nonOffice : Util::splitStringToVector(getString("general.nonofficetypes"), ' '))
    {
        if (ext == Util::toLower(nonOffice))
        {
            return false;
        }
    }

    return true;
}

bool WopiConfig::refresh(std::time_t now)
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (now < _lastRefresh + RefreshIntervalSecs)
    {
        return false;
    }

    _lastRefresh = now;
    if (_sitePath.empty() || !Poco::File(_sitePath).exists())
    {
        return false;
    }

    Poco::AutoPtr<Poco::Util::IniFileConfiguration> site;
    try
    {
        site = new Poco::Util::IniFileConfiguration(_sitePath);
    }
    catch (const Poco::Exception& exc)
    {
        LOG_WRN("Failed to re-read configuration file [" << _sitePath
                                                         << "]: " << exc.displayText());
        return false;
    }

    // Command-line overrides keep precedence over the file.
    if (_overrides.find("general.tokenvalidity") == _overrides.end()
        && site->has("general.tokenvalidity"))
    {
        const std::string value = site->getString("general.tokenvalidity");
        const auto validity = parsePositive(value);
        if (validity.second)
        {
            if (validity.first != _tokenValidity)
            {
                LOG_INF("Token validity changed from " << _tokenValidity << "s to "
                                                       << validity.first << 's');
            }
            _tokenValidity = validity.first;
        }
        else
        {
            LOG_WRN("Ignoring invalid general.tokenvalidity [" << value << ']');
        }
    }

    if (_overrides.find("general.loglevel") == _overrides.end() && site->has("general.loglevel"))
    {
        const std::string level = Util::trimmed(site->getString("general.loglevel"));
        if (LogLevels.find(level) != LogLevels.end())
        {
            if (level != _logLevel)
            {
                LOG_INF("Log level changed from " << _logLevel << " to " << level);
            }
            _logLevel = level;
            Log::setLevel(Log::levelFromConfigName(level));
        }
        else
        {
            LOG_WRN("Ignoring invalid general.loglevel [" << level << ']');
        }
    }

    return true;
}

std::string WopiConfig::readSecret(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        throw ConfigException("Failed to read secret file [" + path + ']');
    }

    const std::string content((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad())
    {
        throw ConfigException("Failed to read secret file [" + path + ']');
    }

    std::string secret = Util::rtrimmedWhitespace(content);
    if (secret.empty())
    {
        throw ConfigException("Secret file [" + path + "] is empty");
    }

    return secret;
}

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
