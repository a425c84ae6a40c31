// process.hpp

#pragma once

#include <elfscan/result.hpp>

#include <array>
#include <iosfwd>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>

namespace elfscan
{
    class file_descriptor
    {
    public:
        static result<file_descriptor> open(const char* path, int flags);

    private:
        int _fd;

    public:
        explicit file_descriptor(int fd = -1);
        ~file_descriptor();

        file_descriptor(file_descriptor&& other) noexcept;
        file_descriptor& operator=(file_descriptor&& other) noexcept;

        file_descriptor(const file_descriptor&) = delete;
        file_descriptor& operator=(const file_descriptor&) = delete;

        int get() const;

        std::error_code redirect(int newfd) const;
        std::error_code close();

        // reads until end-of-file
        result<std::string> read_all() const;
    };

    class pipe
    {
    public:
        static result<pipe> create();

    private:
        std::array<file_descriptor, 2> _pipe;

        pipe(int read_fd, int write_fd);

    public:
        file_descriptor& read_end();
        const file_descriptor& read_end() const;
        file_descriptor& write_end();
        const file_descriptor& write_end() const;
    };

    class command
    {
    private:
        std::vector<std::string> _args;

    public:
        command(const std::vector<std::string>& args);
        command(std::vector<std::string>&& args);

        const std::vector<std::string>& values() const;

        const std::string& path() const;
        std::vector<const char*> argv() const;

        // runs the command to completion, capturing its standard output;
        // standard error is redirected to /dev/null
        result<std::string> capture_output() const;
    };

    std::ostream& operator<<(std::ostream& os, const command& c);
}
