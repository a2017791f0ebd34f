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

#include <cstddef>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <net/HeaderField.hpp>

namespace http
{
/// HTTP Header: an ordered list of header fields.
/// Fields with a known name are created with their specific type,
/// e.g. ContentSecurityPolicy, the rest are GenericHeaderField.
class Header
{
public:
    using Container = std::vector<std::shared_ptr<HeaderField>>;
    using ConstIterator = Container::const_iterator;

    ConstIterator begin() const { return _headers.begin(); }
    ConstIterator end() const { return _headers.end(); }

    /// Parse the given data as an HTTP header block, i.e. CRLF-separated
    /// "Name: value" lines, optionally ending with a blank line.
    /// Throws InvalidArgumentException if any of the fields is malformed,
    /// in which case nothing is added.
    void parse(const std::string& block);

    /// Creates the header field for the given name and value.
    /// Throws InvalidArgumentException if either is invalid.
    static std::shared_ptr<HeaderField> createField(const std::string& name,
                                                    const std::string& value);

    /// Add a header field.
    void addHeader(std::shared_ptr<HeaderField> field);

    /// Add a header field, given as "Name: value".
    void addHeaderLine(const std::string& headerLine);

    /// Add a header field given its name and value.
    void add(const std::string& name, const std::string& value)
    {
        addHeader(createField(name, value));
    }

    bool has(const std::string& name) const;

    /// Get the first field with the given name, if any.
    std::shared_ptr<HeaderField> get(const std::string& name) const;

    /// Get all the fields with the given name, in order.
    Container getAll(const std::string& name) const;

    /// Removes all the fields with the given name.
    /// Returns the number of fields removed.
    std::size_t remove(const std::string& name);

    std::size_t size() const { return _headers.size(); }

    bool empty() const { return _headers.empty(); }

    void clear() { _headers.clear(); }

    /// Serialize the header to an output stream.
    template <typename T> T& serialize(T& os) const
    {
        // Note: we don't add the end-of-header '\r\n'.
        for (const auto& field : _headers)
        {
            os << field->toString() << "\r\n";
        }

        return os;
    }

    /// Serialize the header to string.
    std::string toString() const
    {
        std::ostringstream oss;
        return serialize(oss).str();
    }

private:
    /// The fields are ordered; repeated names are kept in place.
    /// This isn't designed for lookup performance, but to preserve order.
    Container _headers;
};

} // namespace http

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
