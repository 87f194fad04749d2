/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <Poco/Util/OptionSet.h>
#include <Poco/Util/ServerApplication.h>

class StorageBase;
class WopiConfig;
class WopiService;

/// The WOPI server daemon.
class WopiServer : public Poco::Util::ServerApplication
{
public:
    WopiServer();
    ~WopiServer();

    WopiServer(const WopiServer&) = delete;
    WopiServer& operator=(const WopiServer&) = delete;

protected:
    void defineOptions(Poco::Util::OptionSet& options) override;
    void handleOption(const std::string& name, const std::string& value) override;
    void initialize(Poco::Util::Application& self) override;
    void uninitialize() override;
    int main(const std::vector<std::string>& args) override;

private:
    void displayHelp();

    /// Loads and validates the configuration, then sets up logging,
    /// the secrets, the storage and TLS. Throws ConfigException.
    void initializeServer();

    void initializeSSL();

private:
    std::string _configPath;
    std::string _defaultsPath;
    std::map<std::string, std::string> _overrides;
    bool _displayVersion;
    bool _sslInitialized;
    /// Set when initialization failed, main() exits with EXIT_CONFIG.
    std::string _configError;

    std::unique_ptr<WopiConfig> _config;
    std::unique_ptr<StorageBase> _storage;
    std::unique_ptr<WopiService> _service;
};

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
