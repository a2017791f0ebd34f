/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * Copyright the cspheader contributors.
 *
 * SPDX-License-Identifier: MPL-2.0
 */

// Exception classes to differentiate between the
// different error situations and handling.

#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>

// not beautiful
#define EXCEPTION_DECL(type,parent_cl)  \
    class type : public parent_cl \
    { \
    public: \
        static std::atomic<size_t> count; \
        type(const std::string &str) : parent_cl(str) \
            { type::count++; } \
    };

namespace http
{

/// Malformed header name or value, disallowed directive,
/// or an injected line-break in any input.
EXCEPTION_DECL(InvalidArgumentException,std::invalid_argument)

/// The field name of a header line is not the one expected
/// by the header type it is parsed into.
EXCEPTION_DECL(InvalidHeaderNameException,InvalidArgumentException)

/// Valid input used in an unsupported way, e.g. mixing
/// header types in a multiple-header serialization.
EXCEPTION_DECL(RuntimeException,std::runtime_error)

} // namespace http

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
