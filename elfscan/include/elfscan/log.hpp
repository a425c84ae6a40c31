// log.hpp

#pragma once

#include <string>

namespace elfscan
{
    class log
    {
    private:
        log() = default;

    public:
        enum level
        {
            debug,
            info,
            success,
            warning,
            error
        };

        struct loc
        {
            const char* file;
            int line;
            explicit operator bool() const;
        };

        struct content
        {
            std::string msg;

            content(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

            explicit operator bool() const;
        };

        // nothing is written before init() is called; only the first call
        // has an effect
        static void init(bool quiet = false, const std::string& path = "");

        static void write(level lvl, const content& cnt, loc at);

    #define logline(lvl, ...) \
        write((lvl), { __VA_ARGS__ }, { __FILE__, __LINE__ })
    };
}
