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

#pragma once

#include <string>
#include <utility>
#include <vector>

#include <net/HeaderField.hpp>

namespace http
{
/// Manages the HTTP Content-Security-Policy Header.
/// See https://www.w3.org/TR/CSP3/
///
/// The directives are kept in the order they were first set,
/// so serialization is deterministic. Every directive name is
/// one of validDirectiveNames() and every source passes isValidSource().
class ContentSecurityPolicy final : public MultipleHeaderField
{
public:
    static constexpr const char* FIELD_NAME = "Content-Security-Policy";

    /// The source expressions of a directive, e.g. 'self' or https://*.example.com.
    using SourceList = std::vector<std::string>;
    using Directives = std::vector<std::pair<std::string, SourceList>>;

    ContentSecurityPolicy() = default;

    /// Parses a complete header line, e.g.
    /// "Content-Security-Policy: default-src 'none'; img-src 'self';".
    /// A single trailing line terminator is tolerated.
    /// Throws InvalidHeaderNameException for any other field name, and
    /// InvalidArgumentException for a malformed name, control characters,
    /// or unknown directives.
    static ContentSecurityPolicy fromString(const std::string& headerLine);

    /// Returns true iff @name is a CSP directive we accept.
    static bool isValidDirectiveName(const std::string& name);

    /// Returns true iff @source can be stored as a single source expression:
    /// non-empty, no blanks, ';' or ',', and a valid header value.
    static bool isValidSource(const std::string& source);

    /// All the directive names we accept.
    static const std::vector<std::string>& validDirectiveNames();

    /// Replaces the sources of the given directive.
    /// An empty list removes report-uri, and sets any other directive to 'none'.
    /// Throws InvalidArgumentException for an unknown name or an invalid source.
    ContentSecurityPolicy& setDirective(const std::string& name, SourceList sources);

    /// Appends the given sources to a directive, skipping duplicates.
    ContentSecurityPolicy& appendDirective(const std::string& name, const SourceList& sources);

    /// Given a policy (field value only), merge it with the existing directives.
    void merge(const std::string& policy);

    const Directives& getDirectives() const { return _directives; }

    bool hasDirective(const std::string& name) const;

    /// Returns the sources of the directive, or an empty list if not set.
    SourceList getDirective(const std::string& name) const;

    bool empty() const { return _directives.empty(); }

    HeaderKind kind() const override { return HeaderKind::ContentSecurityPolicy; }

    std::string getFieldName() const override { return FIELD_NAME; }

    /// Returns the value of the CSP header.
    std::string getFieldValue() const override;

private:
    /// Splits a field value into its directive clauses,
    /// each being the directive name followed by its sources.
    /// Empty clauses are skipped.
    static std::vector<SourceList> tokenize(const std::string& policy);

    /// Throws if the directive or any of its sources are invalid.
    static void validate(const std::string& name, const SourceList& sources);

    Directives::iterator find(const std::string& name);

    Directives::const_iterator find(const std::string& name) const;

private:
    /// The policy directives.
    Directives _directives;
};

} // namespace http

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
