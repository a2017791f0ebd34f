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

#include "HttpHeader.hpp"

#include <algorithm>
#include <string>

#include <Poco/Exception.h>
#include <Poco/MemoryStream.h>
#include <Poco/Net/MessageHeader.h>

#include <common/Exceptions.hpp>
#include <common/Log.hpp>
#include <common/Util.hpp>
#include <net/ContentSecurityPolicy.hpp>

namespace http
{
void Header::parse(const std::string& block)
{
    LOGA_TRC(Http, "Parsing header given " << block.size() << " bytes: "
                                           << Util::escapeForLog(block.substr(0, 80)));

    Container fields;
    try
    {
        // Folded lines and other corner cases are handled
        // by Poco, conformant to the rfc.
        Poco::Net::MessageHeader msgHeader;
        Poco::MemoryInputStream data(block.data(), block.size());
        msgHeader.read(data);

        for (const auto& pair : msgHeader)
        {
            fields.push_back(createField(Util::trimmed(pair.first), Util::trimmed(pair.second)));
        }
    }
    catch (const Poco::Exception& exc)
    {
        LOGA_DBG(Http, "ERROR while parsing http header: " << exc.displayText());
        throw InvalidArgumentException("Malformed header block: " + exc.displayText());
    }

    LOGA_TRC(Http, "Parsed " << fields.size() << " header fields");
    _headers.insert(_headers.end(), fields.begin(), fields.end());
}

std::shared_ptr<HeaderField> Header::createField(const std::string& name, const std::string& value)
{
    if (Util::iequal(name, std::string(ContentSecurityPolicy::FIELD_NAME)))
    {
        return std::make_shared<ContentSecurityPolicy>(
            ContentSecurityPolicy::fromString(name + ": " + value));
    }

    return std::make_shared<GenericHeaderField>(name, value);
}

void Header::addHeader(std::shared_ptr<HeaderField> field)
{
    if (!field)
    {
        throw InvalidArgumentException("Cannot add a null header field");
    }

    _headers.push_back(std::move(field));
}

void Header::addHeaderLine(const std::string& headerLine)
{
    const auto pair = GenericHeaderField::splitHeaderLine(headerLine);
    add(pair.first, pair.second);
}

bool Header::has(const std::string& name) const
{
    return get(name) != nullptr;
}

std::shared_ptr<HeaderField> Header::get(const std::string& name) const
{
    for (const auto& field : _headers)
    {
        if (Util::iequal(field->getFieldName(), name))
            return field;
    }

    return nullptr;
}

Header::Container Header::getAll(const std::string& name) const
{
    Container fields;
    for (const auto& field : _headers)
    {
        if (Util::iequal(field->getFieldName(), name))
            fields.push_back(field);
    }

    return fields;
}

std::size_t Header::remove(const std::string& name)
{
    const std::size_t before = _headers.size();
    _headers.erase(std::remove_if(_headers.begin(), _headers.end(),
                                  [&name](const std::shared_ptr<HeaderField>& field)
                                  { return Util::iequal(field->getFieldName(), name); }),
                   _headers.end());
    return before - _headers.size();
}

} // namespace http

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
