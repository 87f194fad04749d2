/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include "WopiServer.hpp"

#include <iostream>

#include <Poco/Crypto/Crypto.h>
#include <Poco/Exception.h>
#include <Poco/Net/AcceptCertificateHandler.h>
#include <Poco/Net/Context.h>
#include <Poco/Net/HTTPServer.h>
#include <Poco/Net/HTTPServerParams.h>
#include <Poco/Net/KeyConsoleHandler.h>
#include <Poco/Net/NetSSL.h>
#include <Poco/Net/SSLManager.h>
#include <Poco/Net/SecureServerSocket.h>
#include <Poco/Net/ServerSocket.h>
#include <Poco/ThreadPool.h>
#include <Poco/Util/HelpFormatter.h>
#include <Poco/Util/Option.h>

#include <ConfigUtil.hpp>
#include <Exceptions.hpp>
#include <Log.hpp>
#include <Util.hpp>

#include "RequestDispatcher.hpp"
#include "Storage.hpp"
#include "WopiConfig.hpp"
#include "WopiService.hpp"

using Poco::Net::HTTPServer;
using Poco::Net::HTTPServerParams;
using Poco::Net::SecureServerSocket;
using Poco::Net::ServerSocket;
using Poco::ThreadPool;
using Poco::Util::Application;
using Poco::Util::HelpFormatter;
using Poco::Util::Option;
using Poco::Util::OptionSet;

WopiServer::WopiServer()
    : _configPath(WopiConfig::DefaultConfigPath)
    , _defaultsPath(WopiConfig::DefaultDefaultsPath)
    , _displayVersion(false)
    , _sslInitialized(false)
{
}

WopiServer::~WopiServer() = default;

void WopiServer::defineOptions(OptionSet& optionSet)
{
    ServerApplication::defineOptions(optionSet);

    optionSet.addOption(Option("help", "", "Display help information on command line arguments.")
                        .required(false)
                        .repeatable(false));

    optionSet.addOption(Option("version", "", "Display version information.")
                        .required(false)
                        .repeatable(false));

    optionSet.addOption(Option("config-file", "", "Site configuration file (default: "
                                                  + std::string(WopiConfig::DefaultConfigPath) + ").")
                        .required(false)
                        .repeatable(false)
                        .argument("path"));

    optionSet.addOption(Option("defaults-file", "", "Defaults configuration file (default: "
                                                    + std::string(WopiConfig::DefaultDefaultsPath) + ").")
                        .required(false)
                        .repeatable(false)
                        .argument("path"));

    optionSet.addOption(Option("port", "", "Port number to listen to, overrides general.port.")
                        .required(false)
                        .repeatable(false)
                        .argument("port number"));

    optionSet.addOption(Option("override", "o", "Override any setting by providing section.key=value.")
                        .required(false)
                        .repeatable(true)
                        .argument("setting"));
}

void WopiServer::handleOption(const std::string& optionName, const std::string& value)
{
    ServerApplication::handleOption(optionName, value);

    if (optionName == "help")
    {
        displayHelp();
        std::exit(Application::EXIT_OK);
    }
    else if (optionName == "version")
        _displayVersion = true;
    else if (optionName == "config-file")
        _configPath = value;
    else if (optionName == "defaults-file")
        _defaultsPath = value;
    else if (optionName == "port")
        _overrides["general.port"] = value;
    else if (optionName == "override")
    {
        try
        {
            ConfigUtil::parseOverride(value, _overrides);
        }
        catch (const ConfigException& exc)
        {
            _configError = exc.what();
            stopOptionsProcessing();
        }
    }
}

void WopiServer::displayHelp()
{
    HelpFormatter helpFormatter(options());
    helpFormatter.setCommand(commandName());
    helpFormatter.setUsage("OPTIONS");
    helpFormatter.setHeader("WOPI Server, a bridge between Office Online style editors and a "
                            "storage backend.");
    helpFormatter.format(std::cout);
}

void WopiServer::initialize(Application& self)
{
    ServerApplication::initialize(self);

    if (_displayVersion || !_configError.empty())
    {
        return;
    }

    try
    {
        initializeServer();
    }
    catch (const ConfigException& exc)
    {
        _configError = exc.what();
    }
}

void WopiServer::initializeServer()
{
    _config.reset(new WopiConfig());
    _config->load(_defaultsPath, _configPath, _overrides);
    _config->validate();

    Log::initialize("wopiserver", Log::levelFromConfigName(_config->getLogLevel()),
                    /*withColor=*/true, _config->getLogFile());
    LOG_INF("WOPI Server " << WOPISERVER_VERSION << " starting, defaults ["
                           << _defaultsPath << "], configuration [" << _configPath << ']');

    const std::string loggable = ConfigUtil::getLoggableConfig(_config->config());
    if (!loggable.empty())
    {
        LOG_INF("Non-default configuration:\n" << loggable);
    }

    const std::string wopiSecret = WopiConfig::readSecret(_config->getWopiSecretPath());
    const std::string iopSecret = WopiConfig::readSecret(_config->getIopSecretPath());

    _storage = StorageBase::create(*_config);
    _service.reset(new WopiService(*_config, *_storage, wopiSecret, iopSecret));

    initializeSSL();
}

void WopiServer::initializeSSL()
{
    if (!_config->useHttps())
    {
        return;
    }

    const std::string certPath = _config->getCertPath();
    const std::string keyPath = _config->getKeyPath();
    LOG_INF("SSL Cert file: " << certPath);
    LOG_INF("SSL Key file: " << keyPath);

    Poco::Crypto::initializeCrypto();
    Poco::Net::initializeSSL();
    _sslInitialized = true;

    Poco::Net::Context::Params sslParams;
    sslParams.certificateFile = certPath;
    sslParams.privateKeyFile = keyPath;
    // Don't ask clients for certificate
    sslParams.verificationMode = Poco::Net::Context::VERIFY_NONE;

    try
    {
        Poco::SharedPtr<Poco::Net::PrivateKeyPassphraseHandler> consoleHandler
            = new Poco::Net::KeyConsoleHandler(true);
        Poco::SharedPtr<Poco::Net::InvalidCertificateHandler> invalidCertHandler
            = new Poco::Net::AcceptCertificateHandler(true);

        Poco::Net::Context::Ptr sslContext
            = new Poco::Net::Context(Poco::Net::Context::SERVER_USE, sslParams);
        Poco::Net::SSLManager::instance().initializeServer(consoleHandler, invalidCertHandler,
                                                           sslContext);
    }
    catch (const Poco::Exception& exc)
    {
        throw ConfigException("security.wopicert: failed to set up TLS with [" + certPath
                              + "] and [" + keyPath + "]: " + exc.displayText());
    }
}

void WopiServer::uninitialize()
{
    _service.reset();
    _storage.reset();

    if (_sslInitialized)
    {
        Poco::Net::uninitializeSSL();
        Poco::Crypto::uninitializeCrypto();
        _sslInitialized = false;
    }

    ServerApplication::uninitialize();
    Log::shutdown();
}

int WopiServer::main(const std::vector<std::string>& /*args*/)
{
    if (_displayVersion)
    {
        std::cout << "WOPI Server " << WOPISERVER_VERSION << std::endl;
        return Application::EXIT_OK;
    }

    if (!_configError.empty())
    {
        LOG_FTL("Configuration error: " << _configError);
        return Application::EXIT_CONFIG;
    }

    Util::setThreadName("wopiserver");

    const int port = _config->getPort();
    const unsigned maxThreads = _config->getMaxThreads();

    std::unique_ptr<ServerSocket> socket;
    try
    {
        socket.reset(_config->useHttps() ? new SecureServerSocket() : new ServerSocket());
        socket->bind(port, true);
        // 64 is the default value for the backlog parameter in Poco when creating a ServerSocket,
        // so use it here, too.
        socket->listen(64);
    }
    catch (const Poco::Exception& exc)
    {
        LOG_FTL("Could not create server socket on port " << port << ": " << exc.displayText());
        return Application::EXIT_SOFTWARE;
    }

    // The pool must have sufficient available threads to dispatch new connections.
    auto params = new HTTPServerParams();
    params->setMaxThreads(maxThreads);
    params->setKeepAlive(true);

    ThreadPool threadPool(1, maxThreads);
    HTTPServer srv(new WopiRequestHandlerFactory(*_service, *_config), threadPool, *socket,
                   params);
    srv.start();
    LOG_INF("WOPI Server listening on port " << port << (_config->useHttps() ? " (https)" : "")
                                             << " with up to " << maxThreads << " threads");

    waitForTerminationRequest();

    LOG_INF("Stopping WOPI Server");
    srv.stopAll(false);
    threadPool.joinAll();

    LOG_INF("Process [wopiserver] finished.");
    return Application::EXIT_OK;
}

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
