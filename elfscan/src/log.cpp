// log.cpp

#include <elfscan/log.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <cinttypes>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <stdexcept>

using namespace elfscan;

namespace
{
    constexpr std::size_t level_count = log::error + 1;

    constexpr std::array<const char*, level_count> level_names =
    {
        "debug",
        "info",
        "success",
        "warn",
        "error"
    };

    // where records of one level go; a null primary stream drops them
    struct sink
    {
        std::ostream* primary = nullptr;
        std::ostream* copy = nullptr;
    };

    std::mutex sinks_mtx;
    std::array<sink, level_count> sinks;
    std::ofstream log_file;

    // HH:MM:SS.uuuuuu in local time, or empty on failure
    std::string timestamp()
    {
        using namespace std::chrono;
        microseconds us = duration_cast<microseconds>(
            system_clock::now().time_since_epoch());
        std::time_t time = duration_cast<seconds>(us).count();
        std::tm tm;
        if (!localtime_r(&time, &tm))
            return {};
        char buff[32];
        std::size_t sz = std::strftime(buff, sizeof(buff), "%T", &tm);
        if (!sz)
            return {};
        int written = std::snprintf(buff + sz, sizeof(buff) - sz, ".%06" PRId64,
            static_cast<int64_t>(us.count() % 1000000));
        if (written < 0 || static_cast<std::size_t>(written) >= sizeof(buff) - sz)
            return {};
        return buff;
    }

    std::string record(log::level lvl, const log::content& cnt, log::loc at)
    {
        std::string ts = timestamp();
        if (ts.empty() || !cnt || !at)
            return "<log error>\n";
        char location[16];
        std::snprintf(location, sizeof(location), ":%-3d ", at.line);
        std::string retval;
        retval.reserve(ts.size() + cnt.msg.size() + 64);
        retval.append(ts).append(": ")
            .append(at.file).append(location)
            .append(level_names[lvl]).append(": ")
            .append(cnt.msg).append("\n");
        return retval;
    }

    void route(std::initializer_list<log::level> levels, std::ostream* primary,
        std::ostream* copy = nullptr)
    {
        for (log::level lvl : levels)
            sinks[lvl] = { primary, copy };
    }
}

namespace elfscan
{
    log::loc::operator bool() const
    {
        return file && line;
    }

    log::content::content(const char* fmt, ...) :
        msg()
    {
        va_list args;
        va_list args_copy;
        va_start(args, fmt);
        va_copy(args_copy, args);
        int bufsz = std::vsnprintf(nullptr, 0, fmt, args);
        va_end(args);
        if (bufsz < 0)
        {
            va_end(args_copy);
            return;
        }

        msg.resize(bufsz + 1);
        int written = std::vsnprintf(msg.data(), msg.size(), fmt, args_copy);
        va_end(args_copy);
        if (written < 0)
            msg.clear();
        else
            msg.resize(written);
    }

    log::content::operator bool() const
    {
        return !msg.empty();
    }

    void log::init(bool quiet, const std::string& path)
    {
        static std::once_flag oflag;
        std::call_once(oflag, [&]()
            {
                std::scoped_lock lock(sinks_mtx);
                if (quiet)
                    route({ error }, &std::cerr);
                else if (path.empty())
                    // standard output is left to the program's own output
                    route({ debug, info, success, warning, error }, &std::cerr);
                else
                {
                    log_file.open(path);
                    if (!log_file)
                        throw std::runtime_error(std::string("Error opening log file ")
                            .append(path).append(": ").append(std::strerror(errno)));
                    route({ debug, info, success, warning }, &log_file);
                    route({ error }, &log_file, &std::cerr);
                }
            });
    }

    void log::write(level lvl, const content& cnt, loc at)
    {
        std::scoped_lock lock(sinks_mtx);
        const sink& s = sinks[lvl];
        if (!s.primary)
            return;
        std::string text = record(lvl, cnt, at);
        *s.primary << text;
        if (s.copy)
            *s.copy << text;
    }
}
