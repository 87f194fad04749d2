/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

// The server configuration: a layered INI document with typed accessors.

#pragma once

#include <atomic>
#include <cstdint>
#include <ctime>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <Poco/AutoPtr.h>
#include <Poco/Util/LayeredConfiguration.h>

class WopiConfig
{
public:
    /// Minimum interval between two re-reads of the site file.
    static constexpr std::time_t RefreshIntervalSecs = 300;

    static constexpr const char* DefaultConfigPath = WOPISERVER_CONFIGDIR "/wopiserver.conf";
    static constexpr const char* DefaultDefaultsPath = WOPISERVER_CONFIGDIR "/wopiserver.defaults.conf";

    WopiConfig();

    /// Load the defaults file (mandatory), the site file (optional) and
    /// the command-line overrides, in increasing order of precedence.
    /// Throws ConfigException.
    void load(const std::string& defaultsPath, const std::string& sitePath,
              const std::map<std::string, std::string>& overrides = {});

    /// Checks every known key resolves to a value of the expected type.
    /// Throws ConfigException naming the first offending section.key.
    void validate() const;

    /// The underlying layered configuration.
    const Poco::Util::AbstractConfiguration& config() const { return *_config; }

    /// Returns the raw value of a key, empty when not set.
    std::string getString(const std::string& key) const;

    /// Every effective section.key=value, sorted.
    std::map<std::string, std::string> extractAll() const;

    std::string getStorageType() const;
    int getPort() const;
    std::string getWopiUrl() const;
    std::string getDownloadUrl() const;
    unsigned getMaxThreads() const;
    std::string getLogFile() const;
    bool useHttps() const;
    std::string getCertPath() const;
    std::string getKeyPath() const;
    std::string getWopiSecretPath() const;
    std::string getIopSecretPath() const;
    std::string getStorageHomePath() const;
    std::size_t getChunkSize() const;
    std::vector<std::string> getAllowedClients() const;

    /// Lifetime of new access tokens, in seconds. Refreshed at runtime.
    int getTokenValidity() const { return _tokenValidity; }

    /// The configured log level name (Critical, Error, ...). Refreshed at runtime.
    std::string getLogLevel() const;

    /// True when the log level is Debug, which also enables detailed
    /// error replies and request tracing in the HTTP layer.
    bool isDebug() const { return getLogLevel() == "Debug"; }

    /// False iff the extension of filename (lower-cased, with the dot)
    /// is listed in general.nonofficetypes.
    bool isOfficeType(const std::string& filename) const;

    /// Re-reads the site file and re-applies tokenvalidity and loglevel,
    /// at most once every RefreshIntervalSecs. Returns true if the file was read.
    bool refresh(std::time_t now);

    /// Returns the content of a secret file without trailing whitespace.
    /// Throws ConfigException when unreadable or empty.
    static std::string readSecret(const std::string& path);

private:
    std::int64_t getInteger(const std::string& key, std::int64_t min, std::int64_t max) const;

private:
    Poco::AutoPtr<Poco::Util::LayeredConfiguration> _config;
    std::string _sitePath;
    std::map<std::string, std::string> _overrides;

    std::atomic<int> _tokenValidity;

    mutable std::mutex _mutex;
    std::string _logLevel;
    std::time_t _lastRefresh;
};

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
