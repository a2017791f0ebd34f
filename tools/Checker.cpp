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

#include "Checker.hpp"

#include <istream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <sysexits.h>

#include <common/Log.hpp>
#include <common/Util.hpp>
#include <net/ContentSecurityPolicy.hpp>

namespace Checker
{
std::vector<std::string> readLines(std::istream& in)
{
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (!Util::trimmed(line).empty())
            lines.push_back(line);
    }

    return lines;
}

int checkLines(const std::vector<std::string>& lines, const Options& options, std::ostream& out,
               std::ostream& err)
{
    if (lines.empty())
    {
        err << "Nothing to do." << std::endl;
        return EX_NOINPUT;
    }

    std::vector<std::shared_ptr<http::HeaderField>> policies;
    for (const auto& line : lines)
    {
        try
        {
            auto csp = std::make_shared<http::ContentSecurityPolicy>(
                http::ContentSecurityPolicy::fromString(line));
            if (options.merge && !options.sitePolicy.empty())
                csp->merge(options.sitePolicy);

            policies.push_back(csp);
        }
        catch (const std::invalid_argument& exc)
        {
            LOG_ERR("Invalid header [" << Util::escapeForLog(line) << "]: " << exc.what());
            err << "Invalid header [" << Util::escapeForLog(line) << "]: " << exc.what()
                << std::endl;
            return EX_DATAERR;
        }
    }

    LOG_DBG("Checked " << policies.size() << " header lines");
    if (options.multiple)
    {
        const auto first =
            std::static_pointer_cast<http::ContentSecurityPolicy>(policies.front());
        const std::vector<std::shared_ptr<http::HeaderField>> rest(policies.begin() + 1,
                                                                   policies.end());
        out << first->toStringMultipleHeaders(rest);
    }
    else
    {
        for (const auto& policy : policies)
        {
            out << policy->toString() << std::endl;
        }
    }

    return EX_OK;
}

} // namespace Checker

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
