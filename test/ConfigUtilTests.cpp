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

#include <test/cspassert.hpp>
#include <cppunit/extensions/HelperMacros.h>

#include <map>
#include <string>

#include <Poco/Exception.h>

#include <common/ConfigUtil.hpp>
#include <net/ContentSecurityPolicy.hpp>

/// ConfigUtil unit-tests.
class ConfigUtilTests : public CPPUNIT_NS::TestFixture
{
    CPPUNIT_TEST_SUITE(ConfigUtilTests);
    CPPUNIT_TEST(testDefaults);
    CPPUNIT_TEST(testOverrides);
    CPPUNIT_TEST(testLogFileProperties);
    CPPUNIT_TEST(testSitePolicy);
    CPPUNIT_TEST(testMissingFile);
    CPPUNIT_TEST_SUITE_END();

    void testDefaults();
    void testOverrides();
    void testLogFileProperties();
    void testSitePolicy();
    void testMissingFile();
};

void ConfigUtilTests::testDefaults()
{
    constexpr auto testname = __func__;

    ConfigUtil::initialize(std::string("<config></config>"));
    CSP_ASSERT(ConfigUtil::isInitialized());

    CSP_ASSERT_EQUAL_STR(CSPHEADER_LOGLEVEL, ConfigUtil::getString("logging.level", "none"));
    CSP_ASSERT(ConfigUtil::getBool("logging.color", false));
    CSP_ASSERT(!ConfigUtil::getBool("logging.file[@enable]", true));
    CSP_ASSERT(ConfigUtil::has("net.content_security_policy"));
    CSP_ASSERT_EQUAL_STR("", ConfigUtil::getContentSecurityPolicy());

    // Unknown keys fall back to the given default.
    CSP_ASSERT(!ConfigUtil::has("no.such.key"));
    CSP_ASSERT_EQUAL_STR("fallback", ConfigUtil::getString("no.such.key", "fallback"));
    CSP_ASSERT_EQUAL(42, ConfigUtil::getInt("no.such.key", 42));

    for (const auto& pair : ConfigUtil::getDefaultAppConfig())
    {
        CSP_ASSERT_MESSAGE(pair.first, ConfigUtil::has(pair.first));
    }
}

void ConfigUtilTests::testOverrides()
{
    constexpr auto testname = __func__;

    ConfigUtil::initialize(std::string("<config>"
                                       "<logging><level>trace</level><color>false</color></logging>"
                                       "<limits><fields>16</fields></limits>"
                                       "</config>"));

    CSP_ASSERT_EQUAL_STR("trace", ConfigUtil::getString("logging.level", "none"));
    CSP_ASSERT(!ConfigUtil::getBool("logging.color", true));
    CSP_ASSERT_EQUAL(16, ConfigUtil::getInt("limits.fields", 0));

    // Defaults still apply to the rest.
    CSP_ASSERT(!ConfigUtil::getBool("logging.file[@enable]", true));
}

void ConfigUtilTests::testLogFileProperties()
{
    constexpr auto testname = __func__;

    ConfigUtil::initialize(std::string("<config></config>"));

    const std::map<std::string, std::string> properties = ConfigUtil::getLogFileProperties();
    CSP_ASSERT_EQUAL(static_cast<std::size_t>(3), properties.size());
    CSP_ASSERT_EQUAL_STR(CSPHEADER_LOGFILE, properties.at("path"));
    CSP_ASSERT_EQUAL_STR("never", properties.at("rotation"));
    CSP_ASSERT_EQUAL_STR("false", properties.at("flush"));
}

void ConfigUtilTests::testSitePolicy()
{
    constexpr auto testname = __func__;

    ConfigUtil::initialize(std::string("<config><net>"
                                       "<content_security_policy>frame-ancestors https://*.example.org; "
                                       "img-src data:</content_security_policy>"
                                       "</net></config>"));

    http::ContentSecurityPolicy csp = http::ContentSecurityPolicy::fromString(
        "Content-Security-Policy: default-src 'self'; img-src 'self';");
    csp.merge(ConfigUtil::getContentSecurityPolicy());

    CSP_ASSERT_EQUAL_STR(
        "default-src 'self'; img-src 'self' data:; frame-ancestors https://*.example.org;",
        csp.getFieldValue());
}

void ConfigUtilTests::testMissingFile()
{
    constexpr auto testname = __func__;

    ConfigUtil::initialize(std::string("<config><logging><level>error</level></logging></config>"));

    CPPUNIT_ASSERT_THROW(ConfigUtil::initializeFromFile("/nonexistent/cspheader.xml"),
                         Poco::Exception);

    // The earlier configuration is kept.
    CSP_ASSERT_EQUAL_STR("error", ConfigUtil::getString("logging.level", "none"));
}

CPPUNIT_TEST_SUITE_REGISTRATION(ConfigUtilTests);

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
