/* -*- Mode: C++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4; fill-column: 100 -*- */
/*
 * Copyright the cspheader contributors.
 *
 * SPDX-License-Identifier: MPL-2.0
 */

#include "Exceptions.hpp"

#undef EXCEPTION_DECL

// not beautiful
#define EXCEPTION_DECL(type,unused) \
    std::atomic<size_t> type::count;

namespace http
{
EXCEPTION_DECL(InvalidArgumentException,std::invalid_argument)
EXCEPTION_DECL(InvalidHeaderNameException,InvalidArgumentException)
EXCEPTION_DECL(RuntimeException,std::runtime_error)
} // namespace http

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
