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

// Configuration related utilities.
// Placed here to avoid polluting
// Util.hpp with the config headers.

#pragma once

#include <Poco/Util/AbstractConfiguration.h>
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

/// Initialize the config from an XML string, layered over the defaults.
/// Replaces any earlier configuration.
void initialize(const std::string& xml);

/// Initialize the config from an XML file, layered over the defaults.
/// Throws Poco::Exception when the file cannot be read or parsed.
void initializeFromFile(const std::string& path);

/// Initialize the config given a pointer to a long-lived configuration.
void initialize(const Poco::Util::AbstractConfiguration* config);

/// Check if the config has been initialized
bool isInitialized();

/// Returns the default config.
const std::map<std::string, std::string>& getDefaultAppConfig();

/// Returns the value of an entry as string or @def if it is not found.
std::string getString(const std::string& key, const std::string& def);

/// Returns true if and only if the property with the given key exists.
bool has(const std::string& key);

/// Returns the value of an entry as bool or @def if it is not found.
bool getBool(const std::string& key, bool def);

/// Returns the value of an entry as int or @def if it is not found.
int getInt(const std::string& key, int def);

/// Returns the logging.file.property entries as name/value pairs,
/// ready to be handed to Log::initialize.
std::map<std::string, std::string> getLogFileProperties();

/// Returns the site-wide policy that gets merged into
/// every Content-Security-Policy we produce.
inline std::string getContentSecurityPolicy()
{
    return getString("net.content_security_policy", std::string());
}

} // namespace ConfigUtil

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
