/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <sysexits.h>

#include <cerrno>
#include <cstring>
#include <iostream>

#include <Poco/Exception.h>
#include <Poco/Util/Application.h>
#include <Poco/Util/HelpFormatter.h>
#include <Poco/Util/Option.h>
#include <Poco/Util/OptionSet.h>

#include <ConfigUtil.hpp>
#include <Exceptions.hpp>
#include <FileUtil.hpp>
#include <Util.hpp>
#include <WopiConfig.hpp>

using Poco::Util::Application;
using Poco::Util::HelpFormatter;
using Poco::Util::Option;
using Poco::Util::OptionSet;

/// Default size of generated secrets, in random bytes.
constexpr std::size_t DefaultSecretBytes = 32;

// Config tool to inspect the wopiserver configuration and create its secrets.
class Config: public Application
{
    // Display help information on the console
    void displayHelp();

    /// Loads the configuration, reporting errors on stderr.
    bool load(WopiConfig& config);

    int check();
    int dump();
    int get(const std::vector<std::string>& args);
    int generateSecret(const std::vector<std::string>& args);

public:
    static std::string ConfigFile;
    static std::string DefaultsFile;

protected:
    void defineOptions(OptionSet&) override;
    void handleOption(const std::string&, const std::string&) override;
    int main(const std::vector<std::string>&) override;
};

std::string Config::ConfigFile = WopiConfig::DefaultConfigPath;
std::string Config::DefaultsFile = WopiConfig::DefaultDefaultsPath;

void Config::displayHelp()
{
    HelpFormatter helpFormatter(options());
    helpFormatter.setCommand(commandName());
    helpFormatter.setUsage("COMMAND [OPTIONS]");
    helpFormatter.setHeader("wopiconfig - Configuration tool for the WOPI Server.\n"
                            "\n"
                            "Options:");

    helpFormatter.format(std::cout);

    // Command list
    std::cout << std::endl
              << "Commands: " << std::endl
              << "    check" << std::endl
              << "    dump" << std::endl
              << "    get <section.key>" << std::endl
              << "    generate-secret <path> [bytes]" << std::endl << std::endl;
}

void Config::defineOptions(OptionSet& optionSet)
{
    Application::defineOptions(optionSet);

    optionSet.addOption(Option("help", "h", "Show this usage information.")
                        .required(false)
                        .repeatable(false));
    optionSet.addOption(Option("config-file", "", "Specify the site configuration file path manually.")
                        .required(false)
                        .repeatable(false)
                        .argument("path"));
    optionSet.addOption(Option("defaults-file", "", "Specify the defaults configuration file path manually.")
                        .required(false)
                        .repeatable(false)
                        .argument("path"));
}

void Config::handleOption(const std::string& optionName, const std::string& optionValue)
{
    Application::handleOption(optionName, optionValue);
    if (optionName == "help")
    {
        displayHelp();
        std::exit(EX_OK);
    }
    else if (optionName == "config-file")
    {
        ConfigFile = optionValue;
    }
    else if (optionName == "defaults-file")
    {
        DefaultsFile = optionValue;
    }
}

bool Config::load(WopiConfig& config)
{
    try
    {
        config.load(DefaultsFile, ConfigFile);
        return true;
    }
    catch (const ConfigException& exc)
    {
        std::cerr << exc.what() << std::endl;
    }

    return false;
}

int Config::check()
{
    WopiConfig config;
    if (!load(config))
    {
        return EX_CONFIG;
    }

    try
    {
        config.validate();
    }
    catch (const ConfigException& exc)
    {
        std::cerr << "Invalid configuration: " << exc.what() << std::endl;
        return EX_CONFIG;
    }

    std::cout << "Configuration is valid" << std::endl;
    return EX_OK;
}

int Config::dump()
{
    WopiConfig config;
    if (!load(config))
    {
        return EX_CONFIG;
    }

    // Secret files are referenced by path, their contents are never printed.
    for (const auto& pair : config.extractAll())
    {
        std::cout << pair.first << ": " << pair.second << std::endl;
    }

    return EX_OK;
}

int Config::get(const std::vector<std::string>& args)
{
    if (args.size() != 2)
    {
        std::cerr << "get expects a key as argument" << std::endl
                  << "Eg: " << std::endl
                  << "    get general.port" << std::endl;
        return EX_USAGE;
    }

    WopiConfig config;
    if (!load(config))
    {
        return EX_CONFIG;
    }

    const std::string key = Util::toLower(args[1]);
    if (!config.config().has(key))
    {
        std::cerr << "No property, \"" << args[1] << "\", found in configuration." << std::endl;
        return EX_DATAERR;
    }

    std::cout << config.getString(key) << std::endl;
    return EX_OK;
}

int Config::generateSecret(const std::vector<std::string>& args)
{
    if (args.size() < 2 || args.size() > 3)
    {
        std::cerr << "generate-secret expects a path and an optional size in bytes" << std::endl
                  << "Eg: " << std::endl
                  << "    generate-secret /etc/wopi/wopisecret 32" << std::endl;
        return EX_USAGE;
    }

    const std::string& path = args[1];
    std::size_t bytes = DefaultSecretBytes;
    if (args.size() == 3)
    {
        const auto pair = Util::i64FromString(args[2]);
        if (!pair.second || pair.first <= 0 || pair.first > 4096)
        {
            std::cerr << "Invalid secret size [" << args[2] << "]" << std::endl;
            return EX_USAGE;
        }

        bytes = static_cast<std::size_t>(pair.first);
    }

    const std::string secret = Util::rng::getHardRandomHexString(bytes) + '\n';

    const int fd = FileUtil::openFileAsFD(path, O_WRONLY | O_CREAT | O_EXCL, S_IRUSR | S_IWUSR);
    if (fd < 0)
    {
        const int err = errno;
        if (err == EEXIST)
        {
            std::cerr << path << " exists already. New secret was not generated." << std::endl;
        }
        else
        {
            std::cerr << "Failed to create " << path << ": " << std::strerror(err) << std::endl;
        }

        return EX_CANTCREAT;
    }

    const bool written = FileUtil::writeAll(fd, secret.data(), secret.size());
    const int err = errno;
    if (FileUtil::closeFD(fd) != 0 || !written)
    {
        std::cerr << "Failed to write " << path << ": " << std::strerror(err) << std::endl;
        FileUtil::removeFile(path);
        return EX_IOERR;
    }

    std::cout << "Generated a " << bytes << "-byte secret in " << path << std::endl;
    return EX_OK;
}

int Config::main(const std::vector<std::string>& args)
{
    if (args.empty())
    {
        std::cerr << "Nothing to do." << std::endl;
        displayHelp();
        return EX_NOINPUT;
    }

    try
    {
        if (args[0] == "check")
            return check();
        if (args[0] == "dump")
            return dump();
        if (args[0] == "get")
            return get(args);
        if (args[0] == "generate-secret")
            return generateSecret(args);
    }
    catch (const std::exception& exc)
    {
        std::cerr << "Error: " << exc.what() << std::endl;
        return EX_SOFTWARE;
    }

    std::cerr << "No such command, \"" << args[0]  << '"' << std::endl;
    displayHelp();
    return EX_USAGE;
}

POCO_APP_MAIN(Config);

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
