/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * Copyright the cspheader contributors.
 *
 * SPDX-License-Identifier: MPL-2.0
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include <config.h>

#include <iostream>
#include <string>
#include <sysexits.h>
#include <unistd.h>
#include <vector>

#include <Poco/AutoPtr.h>
#include <Poco/Exception.h>
#include <Poco/File.h>
#include <Poco/Logger.h>
#include <Poco/Util/Application.h>
#include <Poco/Util/HelpFormatter.h>
#include <Poco/Util/Option.h>
#include <Poco/Util/OptionException.h>
#include <Poco/Util/OptionSet.h>

#include <common/ConfigUtil.hpp>
#include <common/Log.hpp>
#include <common/Util.hpp>
#include <tools/Checker.hpp>

using Poco::Util::Application;
using Poco::Util::HelpFormatter;
using Poco::Util::Option;
using Poco::Util::OptionSet;

// Tool to validate and normalize Content-Security-Policy header lines.
class CspCheck final : public Application
{
    // Display help information on the console
    void displayHelp();

    /// Loads the configuration and sets up logging.
    /// Returns EX_OK or the exit code to fail with.
    int setup();

    std::string _configFile;
    bool _configFileProvided = false;
    std::string _logLevel;
    bool _merge = false;
    bool _multiple = false;
    bool _helpRequested = false;

public:
    CspCheck()
        : _configFile(CSPHEADER_CONFIGDIR "/cspheader.xml")
    {
    }

protected:
    void defineOptions(OptionSet&) override;
    void handleOption(const std::string&, const std::string&) override;
    int main(const std::vector<std::string>&) override;
};

void CspCheck::displayHelp()
{
    HelpFormatter helpFormatter(options());
    helpFormatter.setCommand(commandName());
    helpFormatter.setUsage("[OPTIONS] [header-line]...");
    helpFormatter.setHeader("cspcheck - Validate and normalize Content-Security-Policy headers.\n"
                            "\n"
                            "Header lines are read from standard input when none are given.\n\n"
                            "Options:");

    helpFormatter.format(std::cout);
    std::cout << std::endl;
}

void CspCheck::defineOptions(OptionSet& optionSet)
{
    Application::defineOptions(optionSet);

    optionSet.addOption(Option("help", "h", "Show this usage information.")
                        .required(false)
                        .repeatable(false));
    optionSet.addOption(Option("config-file", "", "Specify configuration file path manually.")
                        .required(false)
                        .repeatable(false)
                        .argument("path"));
    optionSet.addOption(Option("merge-config", "", "Merge the configured policy into every header.")
                        .required(false)
                        .repeatable(false));
    optionSet.addOption(Option("multiple", "", "Output all the headers as one multiple-header block.")
                        .required(false)
                        .repeatable(false));
    optionSet.addOption(Option("log-level", "", "Override the configured log level.")
                        .required(false)
                        .repeatable(false)
                        .argument("level"));
}

void CspCheck::handleOption(const std::string& optionName, const std::string& optionValue)
{
    Application::handleOption(optionName, optionValue);
    if (optionName == "help")
    {
        _helpRequested = true;
        stopOptionsProcessing();
    }
    else if (optionName == "config-file")
    {
        _configFile = optionValue;
        _configFileProvided = true;
    }
    else if (optionName == "merge-config")
    {
        _merge = true;
    }
    else if (optionName == "multiple")
    {
        _multiple = true;
    }
    else if (optionName == "log-level")
    {
        try
        {
            Poco::Logger::parseLevel(optionValue);
        }
        catch (const Poco::InvalidArgumentException&)
        {
            throw Poco::Util::InvalidArgumentException("Unknown log level: " + optionValue);
        }

        _logLevel = optionValue;
    }
}

int CspCheck::setup()
{
    try
    {
        if (Poco::File(_configFile).exists())
        {
            ConfigUtil::initializeFromFile(_configFile);
        }
        else if (_configFileProvided)
        {
            std::cerr << "Configuration file [" << _configFile << "] not found." << std::endl;
            return EX_CONFIG;
        }
        else
        {
            // Defaults only.
            ConfigUtil::initialize(std::string("<config></config>"));
        }
    }
    catch (const Poco::Exception& exc)
    {
        std::cerr << "Failed to load configuration file [" << _configFile
                  << "]: " << exc.displayText() << std::endl;
        return EX_CONFIG;
    }

    const std::string level =
        _logLevel.empty() ? ConfigUtil::getString("logging.level", CSPHEADER_LOGLEVEL) : _logLevel;
    const bool withColor = ConfigUtil::getBool("logging.color", true) && isatty(STDERR_FILENO);
    const bool logToFile = ConfigUtil::getBool("logging.file[@enable]", false);

    try
    {
        Log::initialize("csp", level, withColor, logToFile, ConfigUtil::getLogFileProperties());
    }
    catch (const Poco::Exception& exc)
    {
        std::cerr << "Failed to initialize logging: " << exc.displayText() << std::endl;
        return EX_CONFIG;
    }

    Util::setThreadName("cspcheck");
    LOG_INF("Starting cspcheck " << CSPHEADER_VERSION << " with config [" << _configFile
                                 << "], log level [" << level << ']');
    return EX_OK;
}

int CspCheck::main(const std::vector<std::string>& args)
{
    if (_helpRequested)
    {
        displayHelp();
        return EX_OK;
    }

    const int retval = setup();
    if (retval != EX_OK)
        return retval;

    const std::vector<std::string> lines = args.empty() ? Checker::readLines(std::cin) : args;

    Checker::Options options;
    options.merge = _merge;
    options.multiple = _multiple;
    options.sitePolicy = ConfigUtil::getContentSecurityPolicy();
    LOG_DBG("Site-wide policy: [" << options.sitePolicy << ']');

    const int result = Checker::checkLines(lines, options, std::cout, std::cerr);

    Log::shutdown();
    return result;
}

int main(int argc, char** argv)
{
    Poco::AutoPtr<CspCheck> app = new CspCheck();
    try
    {
        app->init(argc, argv);
    }
    catch (const Poco::Util::OptionException& exc)
    {
        std::cerr << exc.displayText() << std::endl;
        return EX_USAGE;
    }
    catch (const Poco::Exception& exc)
    {
        std::cerr << exc.displayText() << std::endl;
        return EX_CONFIG;
    }

    return app->run();
}

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
