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

#include <ConfigUtil.hpp>

#include <Log.hpp>

#include <cassert>
#include <sstream>
#include <string>

#include <Poco/AutoPtr.h>
#include <Poco/Util/LayeredConfiguration.h>
#include <Poco/Util/XMLConfiguration.h>

namespace ConfigUtil
{
static const Poco::Util::AbstractConfiguration* Config = nullptr;

// Add default values of new entries here, so there is a sensible default in case
// the setting is missing from the config file.
// NOTE: Poco doesn't index the first entry in an array, so omit '[0]'.
// NOTE: This is sorted, please keep it sorted.
static const std::map<std::string, std::string> DefAppConfig = {
    { "logging.color", "true" },
    { "logging.file.property[@name]", "path" },
    { "logging.file.property", CSPHEADER_LOGFILE },
    { "logging.file.property[1][@name]", "rotation" },
    { "logging.file.property[1]", "never" },
    { "logging.file.property[2][@name]", "flush" },
    { "logging.file.property[2]", "false" },
    { "logging.file[@enable]", "false" },
    { "logging.level", CSPHEADER_LOGLEVEL },
    { "net.content_security_policy", "" },
};

void initialize(const Poco::Util::AbstractConfiguration* config)
{
    assert(config && "Cannot initialize with invalid config instance");
    Config = config;
}

/// Layers the given XML configuration over the defaults and installs the result.
static void initializeLayered(Poco::AutoPtr<Poco::Util::XMLConfiguration> xmlConfig)
{
    static Poco::AutoPtr<Poco::Util::LayeredConfiguration> LayeredConfig;
    if (LayeredConfig)
    {
        LOGA_DBG(Config, "Replacing the existing configuration");
    }

    Poco::AutoPtr<Poco::Util::LayeredConfiguration> layered(
        new Poco::Util::LayeredConfiguration());

    // Lower priority values are searched first.
    layered->add(xmlConfig, 0);

    Poco::AutoPtr<AppConfigMap> defConfig(new AppConfigMap(DefAppConfig));
    layered->add(defConfig, 10);

    LayeredConfig = layered;
    initialize(LayeredConfig.get());
}

void initialize(const std::string& xml)
{
    std::istringstream iss(xml);
    initializeLayered(new Poco::Util::XMLConfiguration(iss));
}

void initializeFromFile(const std::string& path)
{
    LOGA_INF(Config, "Loading configuration from [" << path << ']');
    initializeLayered(new Poco::Util::XMLConfiguration(path));
}

bool isInitialized() { return Config != nullptr; }

const std::map<std::string, std::string>& getDefaultAppConfig() { return DefAppConfig; }

std::string getString(const std::string& key, const std::string& def)
{
    return (Config != nullptr) ? Config->getString(key, def) : def;
}

bool getBool(const std::string& key, const bool def)
{
    return (Config != nullptr) ? Config->getBool(key, def) : def;
}

int getInt(const std::string& key, const int def)
{
    return (Config != nullptr) ? Config->getInt(key, def) : def;
}

bool has(const std::string& key)
{
    return (Config != nullptr) ? Config->has(key) : false;
}

std::map<std::string, std::string> getLogFileProperties()
{
    std::map<std::string, std::string> properties;
    for (std::size_t i = 0;; ++i)
    {
        const std::string confPath
            = "logging.file.property" + (i == 0 ? std::string() : '[' + std::to_string(i) + ']');
        const std::string confName = getString(confPath + "[@name]", std::string());
        if (confName.empty())
            break;

        const std::string value = getString(confPath, std::string());
        properties.emplace(confName, value);
    }

    return properties;
}

} // namespace ConfigUtil

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
