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

#include "ContentSecurityPolicy.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>
#include <string>
#include <unordered_set>

#include <Poco/StringTokenizer.h>

#include <common/Exceptions.hpp>
#include <common/Log.hpp>
#include <common/Util.hpp>

namespace http
{
namespace
{
/// The 'none' source expression, which blocks everything.
const std::string NoneSource = "'none'";

/// Reporting is dropped, rather than blocked, when no URI is given.
const std::string ReportUri = "report-uri";

const std::vector<std::string> ValidDirectiveNames = {
    // Fetch directives.
    "child-src",
    "connect-src",
    "default-src",
    "font-src",
    "frame-src",
    "img-src",
    "manifest-src",
    "media-src",
    "object-src",
    "prefetch-src",
    "script-src",
    "script-src-elem",
    "script-src-attr",
    "style-src",
    "style-src-elem",
    "style-src-attr",
    "worker-src",
    // Document directives.
    "base-uri",
    "plugin-types",
    "sandbox",
    // Navigation directives.
    "form-action",
    "frame-ancestors",
    "navigate-to",
    // Reporting directives.
    "report-uri",
    "report-to",
    // Other directives.
    "block-all-mixed-content",
    "require-sri-for",
    "require-trusted-types-for",
    "trusted-types",
    "upgrade-insecure-requests",
};
} // namespace

const std::vector<std::string>& ContentSecurityPolicy::validDirectiveNames()
{
    return ValidDirectiveNames;
}

bool ContentSecurityPolicy::isValidDirectiveName(const std::string& name)
{
    static const std::unordered_set<std::string> Names(ValidDirectiveNames.begin(),
                                                       ValidDirectiveNames.end());
    return Names.find(name) != Names.end();
}

bool ContentSecurityPolicy::isValidSource(const std::string& source)
{
    // A separator would split the source, or start a new directive, on the wire.
    return !source.empty() && source.find_first_of(" \t;,") == std::string::npos
           && HeaderValue::isValid(source);
}

ContentSecurityPolicy ContentSecurityPolicy::fromString(const std::string& headerLine)
{
    // The transport may hand us the line with its terminator.
    std::string line = headerLine;
    if (Util::endsWith(line, "\r\n"))
        line.resize(line.size() - 2);
    else if (Util::endsWith(line, "\n"))
        line.resize(line.size() - 1);

    if (!HeaderValue::isValid(line))
    {
        LOGA_DBG(Http, "Invalid CSP header line [" << Util::escapeForLog(headerLine) << ']');
        throw InvalidArgumentException("Invalid header value detected");
    }

    const auto pair = Util::split(line, ':');
    if (pair.first.size() == line.size())
    {
        LOGA_DBG(Http, "No colon in CSP header line [" << line << ']');
        throw InvalidArgumentException("Header must match with the format 'name:value'");
    }

    const std::string& fieldName = pair.first;
    if (!isValidFieldName(fieldName))
    {
        LOGA_DBG(Http, "Invalid header name [" << fieldName << "] for " << FIELD_NAME);
        throw InvalidArgumentException("Header name must be a valid RFC 7230 token");
    }

    if (!Util::iequal(fieldName, std::string(FIELD_NAME)))
    {
        LOGA_DBG(Http, "Unexpected field name [" << fieldName << "] for " << FIELD_NAME);
        throw InvalidHeaderNameException(
            "Invalid header line for Content-Security-Policy string: \"" + fieldName + '"');
    }

    ContentSecurityPolicy csp;
    for (auto& clause : tokenize(pair.second))
    {
        const std::string directive = clause.front();
        clause.erase(clause.begin());
        csp.setDirective(directive, std::move(clause));
    }

    LOGA_TRC(Http, "Parsed CSP with " << csp._directives.size() << " directives: "
                                      << csp.getFieldValue());
    return csp;
}

ContentSecurityPolicy& ContentSecurityPolicy::setDirective(const std::string& name,
                                                           SourceList sources)
{
    validate(name, sources);

    auto it = find(name);
    if (sources.empty())
    {
        if (name == ReportUri)
        {
            if (it != _directives.end())
            {
                LOGA_TRC(Http, "Removing CSP directive [" << name << ']');
                _directives.erase(it);
            }

            return *this;
        }

        sources.push_back(NoneSource);
    }

    LOGA_TRC(Http, "Setting CSP directive [" << name << "] = [" << Util::join(sources) << ']');
    if (it != _directives.end())
        it->second = std::move(sources);
    else
        _directives.emplace_back(name, std::move(sources));

    return *this;
}

ContentSecurityPolicy& ContentSecurityPolicy::appendDirective(const std::string& name,
                                                              const SourceList& sources)
{
    validate(name, sources);
    if (sources.empty())
        return *this;

    auto it = find(name);
    if (it == _directives.end())
    {
        _directives.emplace_back(name, SourceList());
        it = std::prev(_directives.end());
    }

    SourceList& existing = it->second;

    // 'none' is only meaningful on its own.
    if (existing.size() == 1 && existing.front() == NoneSource)
        existing.clear();

    for (const auto& source : sources)
    {
        if (std::find(existing.begin(), existing.end(), source) == existing.end())
            existing.push_back(source);
    }

    LOGA_TRC(Http, "Appended CSP directive [" << name << "] = [" << Util::join(existing) << ']');
    return *this;
}

void ContentSecurityPolicy::merge(const std::string& policy)
{
    LOGA_TRC(Http, "Merging CSP directives [" << Util::escapeForLog(policy) << ']');
    if (!HeaderValue::isValid(policy))
    {
        throw InvalidArgumentException("Invalid header value detected");
    }

    std::vector<SourceList> clauses = tokenize(policy);
    for (const auto& clause : clauses)
    {
        validate(clause.front(), SourceList(clause.begin() + 1, clause.end()));
    }

    for (const auto& clause : clauses)
    {
        appendDirective(clause.front(), SourceList(clause.begin() + 1, clause.end()));
    }
}

bool ContentSecurityPolicy::hasDirective(const std::string& name) const
{
    return find(name) != _directives.end();
}

ContentSecurityPolicy::SourceList ContentSecurityPolicy::getDirective(const std::string& name) const
{
    const auto it = find(name);
    return it != _directives.end() ? it->second : SourceList();
}

std::string ContentSecurityPolicy::getFieldValue() const
{
    std::ostringstream oss;
    for (const auto& pair : _directives)
    {
        if (oss.tellp() > 0)
            oss << ' ';

        oss << pair.first;
        for (const auto& source : pair.second)
        {
            oss << ' ' << source;
        }

        oss << ';';
    }

    return oss.str();
}

std::vector<ContentSecurityPolicy::SourceList>
ContentSecurityPolicy::tokenize(const std::string& policy)
{
    std::vector<SourceList> clauses;

    const Poco::StringTokenizer directives(policy, ";",
                                           Poco::StringTokenizer::TOK_TRIM
                                               | Poco::StringTokenizer::TOK_IGNORE_EMPTY);
    for (const auto& directive : directives)
    {
        const Poco::StringTokenizer tokens(directive, " \t",
                                           Poco::StringTokenizer::TOK_IGNORE_EMPTY);
        if (tokens.count() > 0)
            clauses.emplace_back(tokens.begin(), tokens.end());
    }

    return clauses;
}

void ContentSecurityPolicy::validate(const std::string& name, const SourceList& sources)
{
    if (!isValidDirectiveName(name))
    {
        LOGA_DBG(Http, "Invalid CSP directive name [" << Util::escapeForLog(name) << ']');
        throw InvalidArgumentException(
            "Invalid Content-Security-Policy directive name provided: \""
            + Util::escapeForLog(name) + '"');
    }

    for (const auto& source : sources)
    {
        if (!isValidSource(source))
        {
            LOGA_DBG(Http, "Invalid source of CSP directive ["
                               << name << "]: [" << Util::escapeForLog(source) << ']');
            throw InvalidArgumentException("Invalid Content-Security-Policy source provided for \""
                                           + name + "\" directive");
        }
    }
}

ContentSecurityPolicy::Directives::iterator ContentSecurityPolicy::find(const std::string& name)
{
    return std::find_if(_directives.begin(), _directives.end(),
                        [&name](const auto& pair) { return pair.first == name; });
}

ContentSecurityPolicy::Directives::const_iterator
ContentSecurityPolicy::find(const std::string& name) const
{
    return std::find_if(_directives.begin(), _directives.end(),
                        [&name](const auto& pair) { return pair.first == name; });
}

} // namespace http

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
