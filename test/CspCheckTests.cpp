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

#include <common/Util.hpp>
#include <tools/Checker.hpp>

#include <cppunit/extensions/HelperMacros.h>

#include <sstream>
#include <string>
#include <sysexits.h>
#include <vector>

/// cspcheck input handling unit-tests.
class CspCheckTests : public CPPUNIT_NS::TestFixture
{
    CPPUNIT_TEST_SUITE(CspCheckTests);

    CPPUNIT_TEST(testReadLines);
    CPPUNIT_TEST(testCheckLines);
    CPPUNIT_TEST(testCheckLinesCRLF);
    CPPUNIT_TEST(testCheckLinesMultiple);
    CPPUNIT_TEST(testCheckLinesMerge);
    CPPUNIT_TEST(testNoInput);
    CPPUNIT_TEST(testInvalidHeader);

    CPPUNIT_TEST_SUITE_END();

    void testReadLines();
    void testCheckLines();
    void testCheckLinesCRLF();
    void testCheckLinesMultiple();
    void testCheckLinesMerge();
    void testNoInput();
    void testInvalidHeader();
};

void CspCheckTests::testReadLines()
{
    constexpr auto testname = __func__;

    std::istringstream in("Content-Security-Policy: img-src *\r\n"
                          "\r\n"
                          "  \t\n"
                          "Content-Security-Policy: font-src 'self'\n"
                          "Content-Security-Policy: default-src 'none'");

    const std::vector<std::string> lines = Checker::readLines(in);
    CSP_ASSERT_EQUAL(static_cast<std::size_t>(3), lines.size());
    CSP_ASSERT_EQUAL_STR("Content-Security-Policy: img-src *", lines[0]);
    CSP_ASSERT_EQUAL_STR("Content-Security-Policy: font-src 'self'", lines[1]);
    CSP_ASSERT_EQUAL_STR("Content-Security-Policy: default-src 'none'", lines[2]);

    // Only one CR is dropped.
    std::istringstream twice("Content-Security-Policy: img-src *\r\r\n");
    const std::vector<std::string> kept = Checker::readLines(twice);
    CSP_ASSERT_EQUAL(static_cast<std::size_t>(1), kept.size());
    CSP_ASSERT_EQUAL_STR("Content-Security-Policy: img-src *\r", kept[0]);

    std::istringstream empty("");
    CSP_ASSERT(Checker::readLines(empty).empty());
}

void CspCheckTests::testCheckLines()
{
    constexpr auto testname = __func__;

    std::ostringstream out;
    std::ostringstream err;
    const int result = Checker::checkLines({ "content-security-policy:img-src  'self' ;; font-src *",
                                             "Content-Security-Policy: object-src" },
                                           Checker::Options(), out, err);

    CSP_ASSERT_EQUAL(EX_OK, result);
    CSP_ASSERT_EQUAL_STR("Content-Security-Policy: img-src 'self'; font-src *;\n"
                         "Content-Security-Policy: object-src 'none';\n",
                         out.str());
    CSP_ASSERT_EQUAL_STR("", err.str());
}

void CspCheckTests::testCheckLinesCRLF()
{
    constexpr auto testname = __func__;

    // As piped from a file with DOS line endings.
    std::istringstream in("Content-Security-Policy: default-src 'self'\r\n"
                          "Content-Security-Policy: img-src data:\r\n");

    std::ostringstream out;
    std::ostringstream err;
    CSP_ASSERT_EQUAL(EX_OK,
                     Checker::checkLines(Checker::readLines(in), Checker::Options(), out, err));
    CSP_ASSERT_EQUAL_STR("Content-Security-Policy: default-src 'self';\n"
                         "Content-Security-Policy: img-src data:;\n",
                         out.str());
}

void CspCheckTests::testCheckLinesMultiple()
{
    constexpr auto testname = __func__;

    Checker::Options options;
    options.multiple = true;

    std::ostringstream out;
    std::ostringstream err;
    CSP_ASSERT_EQUAL(EX_OK, Checker::checkLines({ "Content-Security-Policy: default-src 'self'",
                                                  "Content-Security-Policy: img-src *" },
                                                options, out, err));
    CSP_ASSERT_EQUAL_STR("Content-Security-Policy: default-src 'self';\r\n"
                         "Content-Security-Policy: img-src *;\r\n",
                         out.str());
}

void CspCheckTests::testCheckLinesMerge()
{
    constexpr auto testname = __func__;

    Checker::Options options;
    options.merge = true;
    options.sitePolicy = "frame-ancestors https://host.example; img-src data:";

    std::ostringstream out;
    std::ostringstream err;
    CSP_ASSERT_EQUAL(EX_OK, Checker::checkLines({ "Content-Security-Policy: img-src 'self'" },
                                                options, out, err));
    CSP_ASSERT_EQUAL_STR(
        "Content-Security-Policy: img-src 'self' data:; frame-ancestors https://host.example;\n",
        out.str());

    // The site policy is only used when asked for.
    options.merge = false;
    std::ostringstream plain;
    CSP_ASSERT_EQUAL(EX_OK, Checker::checkLines({ "Content-Security-Policy: img-src 'self'" },
                                                options, plain, err));
    CSP_ASSERT_EQUAL_STR("Content-Security-Policy: img-src 'self';\n", plain.str());

    // An invalid site policy is a data error.
    options.merge = true;
    options.sitePolicy = "bogus-src *";
    std::ostringstream none;
    CSP_ASSERT_EQUAL(EX_DATAERR, Checker::checkLines({ "Content-Security-Policy: img-src 'self'" },
                                                     options, none, err));
    CSP_ASSERT_EQUAL_STR("", none.str());
}

void CspCheckTests::testNoInput()
{
    constexpr auto testname = __func__;

    std::ostringstream out;
    std::ostringstream err;
    CSP_ASSERT_EQUAL(EX_NOINPUT, Checker::checkLines({}, Checker::Options(), out, err));
    CSP_ASSERT_EQUAL_STR("", out.str());
    CSP_ASSERT_EQUAL_STR("Nothing to do.\n", err.str());
}

void CspCheckTests::testInvalidHeader()
{
    constexpr auto testname = __func__;

    std::ostringstream out;
    std::ostringstream err;
    const int result = Checker::checkLines(
        { "Content-Security-Policy: img-src *", "Content-Security-Policy: img-src \x1b[31m" },
        Checker::Options(), out, err);

    CSP_ASSERT_EQUAL(EX_DATAERR, result);
    CSP_ASSERT_EQUAL_STR("", out.str());
    CSP_ASSERT_MESSAGE(err.str(), err.str().find("Invalid header [") == 0);
    CSP_ASSERT_MESSAGE(err.str(), err.str().find("\\x1b") != std::string::npos);

    std::ostringstream other;
    CSP_ASSERT_EQUAL(EX_DATAERR, Checker::checkLines({ "X-Frame-Options: DENY" },
                                                     Checker::Options(), other, err));
    CSP_ASSERT_EQUAL_STR("", other.str());
}

CPPUNIT_TEST_SUITE_REGISTRATION(CspCheckTests);

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
