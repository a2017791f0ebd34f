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

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace http
{
/// The concrete type of a header field.
/// Used to check that fields can be serialized together,
/// without resorting to RTTI.
enum class HeaderKind : char
{
    Generic,
    ContentSecurityPolicy
};

/// Returns the name of the header field type.
const char* name(HeaderKind kind);

/// Validation of header values, RFC 7230 section 3.2.
namespace HeaderValue
{
/// Returns true iff @value is acceptable as a field-value:
/// no CR or LF, and no control characters other than HTAB.
bool isValid(const std::string& value);

/// Throws InvalidArgumentException if @value is not valid.
void assertValid(const std::string& value);
} // namespace HeaderValue

/// Returns true iff @name is a non-empty RFC 7230 token.
bool isValidFieldName(const std::string& name);

/// A single HTTP header field (one "Name: value" line).
class HeaderField
{
public:
    virtual ~HeaderField() = default;

    /// The concrete type of this field.
    virtual HeaderKind kind() const = 0;

    virtual std::string getFieldName() const = 0;

    virtual std::string getFieldValue() const = 0;

    /// The full header line, without the line terminator.
    virtual std::string toString() const { return getFieldName() + ": " + getFieldValue(); }
};

/// A header field that can legitimately occur multiple times.
/// Clients merge all occurrences into one logical value.
class MultipleHeaderField : public HeaderField
{
public:
    /// Serializes this field followed by @headers, each line
    /// terminated by CRLF. All of @headers must be of the same kind
    /// as this one, otherwise RuntimeException is thrown and nothing
    /// is produced.
    virtual std::string
    toStringMultipleHeaders(const std::vector<std::shared_ptr<HeaderField>>& headers) const;
};

/// A header field without any specific semantics.
class GenericHeaderField final : public HeaderField
{
public:
    GenericHeaderField() = default;

    /// Throws InvalidArgumentException for an invalid name or value.
    GenericHeaderField(std::string name, std::string value);

    /// Parses a "Name: value" line.
    /// Throws InvalidArgumentException when malformed.
    static GenericHeaderField fromString(const std::string& headerLine);

    /// Splits a header line at the first colon, returning the
    /// name and the value with the leading blanks removed.
    /// Validates both; throws InvalidArgumentException otherwise.
    static std::pair<std::string, std::string> splitHeaderLine(const std::string& headerLine);

    HeaderKind kind() const override { return HeaderKind::Generic; }

    std::string getFieldName() const override { return _name; }

    std::string getFieldValue() const override { return _value; }

    void setFieldName(std::string name);

    void setFieldValue(std::string value);

private:
    std::string _name;
    std::string _value;
};

} // namespace http

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
