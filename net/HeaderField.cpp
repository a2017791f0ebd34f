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

#include "HeaderField.hpp"

#include <cstring>
#include <string>

#include <common/Exceptions.hpp>
#include <common/Log.hpp>
#include <common/Util.hpp>

namespace http
{
const char* name(const HeaderKind kind)
{
    switch (kind)
    {
        case HeaderKind::Generic:
            return "GenericHeader";
        case HeaderKind::ContentSecurityPolicy:
            return "ContentSecurityPolicy";
    }

    return "Unknown";
}

namespace HeaderValue
{
bool isValid(const std::string& value)
{
    for (const char ch : value)
    {
        const unsigned char c = static_cast<unsigned char>(ch);
        if ((c < 0x20 && c != '\t') || c == 0x7f)
            return false;
    }

    return true;
}

void assertValid(const std::string& value)
{
    if (!isValid(value))
    {
        LOGA_DBG(Http, "Invalid header value [" << Util::escapeForLog(value) << ']');
        throw InvalidArgumentException("Invalid header value detected");
    }
}
} // namespace HeaderValue

bool isValidFieldName(const std::string& name)
{
    // tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*" / "+" / "-" / "." /
    //         "^" / "_" / "`" / "|" / "~" / DIGIT / ALPHA
    static const char* const TokenSpecials = "!#$%&'*+-.^_`|~";

    if (name.empty())
        return false;

    for (const char c : name)
    {
        const bool alnum = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
        if (!alnum && (c == '\0' || std::strchr(TokenSpecials, c) == nullptr))
            return false;
    }

    return true;
}

std::string MultipleHeaderField::toStringMultipleHeaders(
    const std::vector<std::shared_ptr<HeaderField>>& headers) const
{
    for (const auto& header : headers)
    {
        if (!header || header->kind() != kind())
        {
            const char* const typeName = name(kind());
            LOGA_DBG(Http, "Refusing to serialize " << (header ? name(header->kind()) : "null")
                                                    << " header together with " << typeName);
            throw RuntimeException(std::string("The ") + typeName
                                   + " multiple header implementation can only accept an array of "
                                   + typeName + " headers");
        }
    }

    std::string s = toString() + "\r\n";
    for (const auto& header : headers)
    {
        s += header->toString();
        s += "\r\n";
    }

    return s;
}

GenericHeaderField::GenericHeaderField(std::string name, std::string value)
{
    setFieldName(std::move(name));
    setFieldValue(std::move(value));
}

void GenericHeaderField::setFieldName(std::string name)
{
    if (!isValidFieldName(name))
    {
        LOGA_DBG(Http, "Invalid header name [" << Util::escapeForLog(name) << ']');
        throw InvalidArgumentException("Header name must be a valid RFC 7230 token");
    }

    _name = std::move(name);
}

void GenericHeaderField::setFieldValue(std::string value)
{
    HeaderValue::assertValid(value);
    _value = std::move(value);
}

std::pair<std::string, std::string> GenericHeaderField::splitHeaderLine(const std::string& headerLine)
{
    const std::size_t colon = headerLine.find(':');
    if (colon == std::string::npos)
    {
        LOGA_DBG(Http, "No colon in header line [" << Util::escapeForLog(headerLine) << ']');
        throw InvalidArgumentException("Header must match with the format 'name:value'");
    }

    std::string name = headerLine.substr(0, colon);
    if (!isValidFieldName(name))
    {
        LOGA_DBG(Http, "Invalid header name [" << Util::escapeForLog(name) << ']');
        throw InvalidArgumentException("Header name must be a valid RFC 7230 token");
    }

    std::string value = Util::ltrimmed(headerLine.substr(colon + 1));
    HeaderValue::assertValid(value);

    return std::make_pair(std::move(name), std::move(value));
}

GenericHeaderField GenericHeaderField::fromString(const std::string& headerLine)
{
    const auto pair = splitHeaderLine(headerLine);
    return GenericHeaderField(pair.first, pair.second);
}

} // namespace http

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
