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

#include <unistd.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <unordered_map>

#include <Poco/AutoPtr.h>
#include <Poco/Channel.h>
#include <Poco/Exception.h>
#include <Poco/FileChannel.h>
#include <Poco/Logger.h>
#include <Poco/Message.h>

#include "Log.hpp"
#include "Util.hpp"

namespace Log
{
    using namespace Poco;

    /// Writes entries to stderr directly, one per line.
    class ConsoleChannel : public Poco::Channel
    {
    public:
        void close() override { ::fflush(stderr); }

        /// Write the given buffer to stderr directly.
        static inline std::size_t writeRaw(const char* data, std::size_t size)
        {
            std::size_t i = 0;
            while (i < size)
            {
                ssize_t wrote;
                while ((wrote = ::write(STDERR_FILENO, data + i, size - i)) < 0 && errno == EINTR)
                {
                }

                if (wrote < 0)
                {
                    return i;
                }

                i += wrote;
            }

            return i;
        }

        inline void writeRaw(const std::string& string) { writeRaw(string.data(), string.size()); }

        void log(const Poco::Message& msg) override
        {
            std::string s = msg.getText();
            s += '\n';
            writeRaw(s);
        }
    };

    /// Colored Console channel.
    class ColorConsoleChannel : public ConsoleChannel
    {
    public:
        ColorConsoleChannel()
        {
            _colorByPriority.emplace(Message::PRIO_FATAL, "\033[1;31m"); // Bold Red
            _colorByPriority.emplace(Message::PRIO_CRITICAL, "\033[1;31m"); // Bold Red
            _colorByPriority.emplace(Message::PRIO_ERROR, "\033[1;35m"); // Bold Magenta
            _colorByPriority.emplace(Message::PRIO_WARNING, "\033[1;33m"); // Bold Yellow
            _colorByPriority.emplace(Message::PRIO_NOTICE, "\033[0;34m"); // Blue
            _colorByPriority.emplace(Message::PRIO_INFORMATION, "\033[0;34m"); // Blue
            _colorByPriority.emplace(Message::PRIO_DEBUG, "\033[0;36m"); // Teal
            _colorByPriority.emplace(Message::PRIO_TRACE, "\033[0;37m"); // Grey
        }

        void log(const Poco::Message& msg) override
        {
            std::string s;
            const auto it = _colorByPriority.find(msg.getPriority());
            if (it != _colorByPriority.end())
                s = it->second;

            s += msg.getText();
            s += "\033[0m\n"; // Restore default color.
            writeRaw(s);
        }

    private:
        std::unordered_map<int, std::string> _colorByPriority;
    };

    /// Helper to avoid destruction ordering issues.
    static struct StaticHelper
    {
    private:
        Poco::Logger* _logger;
        std::string _name;
        std::string _logLevel;
        std::string _id;
        std::atomic<bool> _inited;
        std::array<std::atomic<bool>, static_cast<std::size_t>(Area::Max)> _disabledAreas;

    public:
        StaticHelper()
            : _logger(nullptr)
            , _inited(true)
        {
            for (auto& disabled : _disabledAreas)
                disabled = false;
        }

        ~StaticHelper() { _inited = false; }

        bool getInited() const { return _inited; }

        void setId(const std::string& id) { _id = id; }

        const std::string& getId() const { return _id; }

        void setName(const std::string& name) { _name = name; }

        const std::string& getName() const { return _name; }

        void setLevel(const std::string& logLevel) { _logLevel = logLevel; }

        const std::string& getLevel() const { return _logLevel; }

        void setLogger(Poco::Logger* logger) { _logger = logger; };

        Poco::Logger* getLogger() const { return _logger; }

        void setAreaDisabled(Area a, bool disabled)
        {
            _disabledAreas[static_cast<std::size_t>(a)] = disabled;
        }

        bool isAreaDisabled(Area a) const { return _disabledAreas[static_cast<std::size_t>(a)]; }

    } Static;

    char* prefix(const std::chrono::time_point<std::chrono::system_clock>& tp,
                 char* buffer,
                 const char* level)
    {
        const std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm;
        localtime_r(&t, &tm);

        const auto microseconds
            = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch());
        const long fractional = static_cast<long>(microseconds.count() % 1000000);

        char date[32];
        std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm);
        char tz[16];
        std::strftime(tz, sizeof(tz), "%z", &tm);

        // The buffer is at least 128 bytes; the thread name is at most 31.
        std::snprintf(buffer, 128, "%.24s-%05ld %s.%06ld %s [ %s ] %s  ",
                      (Static.getInited() ? Static.getId().c_str() : "<shutdown>"),
                      static_cast<long>(Util::getThreadId()), date, fractional, tz,
                      Util::getThreadName(), level);
        return buffer;
    }

    void initialize(const std::string& name,
                    const std::string& logLevel,
                    const bool withColor,
                    const bool logToFile,
                    const std::map<std::string, std::string>& config)
    {
        Static.setName(name);
        std::ostringstream oss;
        oss << Static.getName() << '-' << std::setw(5) << std::setfill('0') << getpid();
        Static.setId(oss.str());

        // Configure the logger.
        AutoPtr<Channel> channel;

        if (logToFile)
        {
            channel = static_cast<Poco::Channel*>(new Poco::FileChannel());
            for (const auto& pair : config)
            {
                channel->setProperty(pair.first, pair.second);
            }
        }
        else if (withColor)
        {
            channel = static_cast<Poco::Channel*>(new Log::ColorConsoleChannel());
        }
        else
        {
            channel = static_cast<Poco::Channel*>(new Log::ConsoleChannel());
        }

        channel->open();

        try
        {
            auto& logger = Poco::Logger::create(Static.getName(), channel, Poco::Message::PRIO_TRACE);
            Static.setLogger(&logger);
        }
        catch (ExistsException&)
        {
            auto& logger = Poco::Logger::get(Static.getName());
            logger.setChannel(channel);
            Static.setLogger(&logger);
        }

        const std::string level = logLevel.empty() ? std::string("trace") : logLevel;
        setLevel(level);

        const std::time_t t = std::time(nullptr);
        struct tm tm;
        LOG_INF("Initializing " << name << ". Local time: "
                                << std::put_time(localtime_r(&t, &tm), "%a %F %T %z")
                                << ". Log level is [" << Static.getLevel() << ']');
    }

    Poco::Logger& logger()
    {
        Poco::Logger* pLogger = Static.getLogger();
        return pLogger ? *pLogger
                       : Poco::Logger::get(Static.getInited() ? Static.getName() : std::string());
    }

    void shutdown()
    {
        Static.setLogger(nullptr);
        Poco::Logger::shutdown();

        // Flush
        fflush(stdout);
        fflush(stderr);
    }

    bool isEnabled(const Level l, const Area a)
    {
        if (Static.getLogger() == nullptr)
        {
            // Not initialized; only the most severe make it through.
            return l <= Level::ERR;
        }

        if (l > Level::WRN && Static.isAreaDisabled(a))
            return false;

        return Static.getLogger()->getLevel() >= static_cast<int>(l);
    }

    void log(const Level l, const std::string& text)
    {
        logger().log(Poco::Message(Static.getName(), text, static_cast<Poco::Message::Priority>(l)));
    }

    void setLevel(const std::string& l)
    {
        // Throws Poco::InvalidArgumentException for unknown names.
        logger().setLevel(l);
        Static.setLevel(l);
    }

    Level getLevel()
    {
        return static_cast<Level>(logger().getLevel());
    }

    const std::string& getLevelName()
    {
        return Static.getLevel();
    }

    void setAreaDisabled(const Area a, const bool disabled)
    {
        Static.setAreaDisabled(a, disabled);
    }
}

/* vim:set shiftwidth=4 softtabstop=4 expandtab: */
