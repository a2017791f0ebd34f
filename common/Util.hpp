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

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace Util
{
    /// Returns true iff the character is a blank (space or horizontal tab).
    inline bool isBlank(const char c) { return c == ' ' || c == '\t'; }

    /// Trim blanks (spaces and tabs) from both left and right.
    inline std::string& trim(std::string& s)
    {
        const auto first = std::find_if_not(s.begin(), s.end(), isBlank);
        const auto last = std::find_if_not(s.rbegin(), s.rend(), isBlank).base();
        if (first >= last)
        {
            s.clear();
            return s;
        }

        s = std::string(first, last);
        return s;
    }

    /// Trim blanks (spaces and tabs) from both left and right and copy.
    inline std::string trimmed(std::string s) { return trim(s); }

    /// Trim blanks from the left and copy.
    inline std::string ltrimmed(const std::string& s)
    {
        const auto first = std::find_if_not(s.begin(), s.end(), isBlank);
        return std::string(first, s.end());
    }

    /// Return true iff s ends with t.
    inline bool endsWith(const std::string& s, const std::string& t)
    {
        return s.size() >= t.size() && s.compare(s.size() - t.size(), t.size(), t) == 0;
    }

    /// Split a string in two at the first delimiter, removing it.
    /// When the delimiter is missing, the second part is empty.
    inline std::pair<std::string, std::string> split(const std::string& s,
                                                     const char delimiter = ' ')
    {
        const std::size_t pos = s.find(delimiter);
        if (pos == std::string::npos)
            return std::make_pair(s, std::string());

        return std::make_pair(s.substr(0, pos), s.substr(pos + 1));
    }

    /// Joins the given tokens with the separator between each two.
    inline std::string join(const std::vector<std::string>& tokens, const char separator = ' ')
    {
        std::string s;
        for (const auto& token : tokens)
        {
            if (!s.empty())
                s += separator;
            s += token;
        }

        return s;
    }

    /// Case insensitive comparison of two strings.
    /// Returns true iff the two strings are equal, regardless of case.
    inline bool iequal(const char* lhs, std::size_t lhs_len, const char* rhs, std::size_t rhs_len)
    {
        return ((lhs_len == rhs_len)
                && std::equal(lhs, lhs + lhs_len, rhs, [](const char lch, const char rch) {
                       return std::tolower(lch) == std::tolower(rch);
                   }));
    }

    /// Case insensitive comparison of two strings.
    inline bool iequal(const std::string& lhs, const std::string& rhs)
    {
        return iequal(lhs.c_str(), lhs.size(), rhs.c_str(), rhs.size());
    }

    /// Make control characters visible, for logging untrusted input.
    std::string escapeForLog(const std::string& s);

    void setThreadName(const std::string& s);

    const char* getThreadName();

#if defined __linux__
    pid_t getThreadId();
#else
    long getThreadId();
#endif

} // end namespace Util

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
