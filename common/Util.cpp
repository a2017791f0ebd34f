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

#include "Util.hpp"

#ifdef __linux__
#include <sys/prctl.h>
#include <sys/syscall.h>
#endif
#include <unistd.h>

#include <cstdio>
#include <cstring>
#include <string>

#include "Log.hpp"

namespace Util
{
    std::string escapeForLog(const std::string& s)
    {
        std::string r;
        r.reserve(s.size());
        for (const char c : s)
        {
            if (c == '\r')
                r += "\\r";
            else if (c == '\n')
                r += "\\n";
            else if (c == '\t')
                r += "\\t";
            else if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f)
            {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned char>(c));
                r += buf;
            }
            else
                r += c;
        }

        return r;
    }

#if defined __linux__
    static thread_local pid_t ThreadTid = 0;

    pid_t getThreadId()
#else
    static thread_local long ThreadTid = 0;

    long getThreadId()
#endif
    {
        // Avoid so many redundant system calls
#if defined __linux__
        if (!ThreadTid)
            ThreadTid = ::syscall(SYS_gettid);
        return ThreadTid;
#else
        static long threadCounter = 1;
        if (!ThreadTid)
            ThreadTid = threadCounter++;
        return ThreadTid;
#endif
    }

    // prctl(2) supports names of up to 16 characters, including null-termination.
    static thread_local char ThreadName[32] = {0};
    static_assert(sizeof(ThreadName) >= 16, "ThreadName should have a statically known size, and not be a pointer.");

    void setThreadName(const std::string& s)
    {
        const std::string knownAs
            = ThreadName[0] ? "known as [" + std::string(ThreadName) + ']' : "unnamed";

        strncpy(ThreadName, s.c_str(), sizeof(ThreadName) - 1);
        ThreadName[sizeof(ThreadName) - 1] = '\0';
#ifdef __linux__
        if (prctl(PR_SET_NAME, reinterpret_cast<unsigned long>(s.c_str()), 0, 0, 0) != 0)
            LOG_SYS("Cannot set thread name of " << getThreadId() << " of process " << getpid()
                                                 << " currently " << knownAs << " to [" << s
                                                 << ']');
        else
#endif
            LOG_INF("Thread " << getThreadId() << " of process " << getpid() << " formerly "
                              << knownAs << " is now called [" << s << ']');
    }

    const char* getThreadName()
    {
        // Main process and/or not set yet.
        if (ThreadName[0] == '\0')
        {
#ifdef __linux__
            // prctl(2): The buffer should allow space for up to 16 bytes; the returned string will be null-terminated.
            if (prctl(PR_GET_NAME, reinterpret_cast<unsigned long>(ThreadName), 0, 0, 0) != 0)
#endif
                strncpy(ThreadName, "<noid>", sizeof(ThreadName) - 1);
            ThreadName[sizeof(ThreadName) - 1] = '\0';
        }

        return ThreadName;
    }

} // namespace Util

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
