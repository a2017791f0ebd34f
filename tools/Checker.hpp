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

// The input handling of cspcheck, kept apart from the Application so it can be unit-tested.

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace Checker
{
struct Options
{
    /// Merge sitePolicy into every header.
    bool merge = false;
    /// Write all the headers as one multiple-header block.
    bool multiple = false;
    std::string sitePolicy;
};

/// Reads header lines from @in, one per line.
/// A trailing CR is dropped and blank lines are skipped.
std::vector<std::string> readLines(std::istream& in);

/// Parses and normalizes each of @lines, writing the result to @out
/// and diagnostics to @err.
/// Returns EX_OK, EX_NOINPUT when there are no lines,
/// or EX_DATAERR on the first invalid header, when nothing is written to @out.
int checkLines(const std::vector<std::string>& lines, const Options& options, std::ostream& out,
               std::ostream& err);

} // namespace Checker

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
