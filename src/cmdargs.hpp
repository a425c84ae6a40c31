// cmdargs.hpp

#pragma once

#include <fstream>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace escan
{
    class optional_output_file
    {
        std::ofstream _file;

    public:
        optional_output_file(const std::string& path = "");
        operator std::ostream& ();
        explicit operator bool() const;
        friend std::ostream& operator<<(std::ostream&, const optional_output_file&);
    };

    class optional_input_file
    {
        std::ifstream _file;

    public:
        optional_input_file(const std::string& path = "");
        operator std::istream& ();
        bool present() const;
        explicit operator bool() const;
        friend std::ostream& operator<<(std::ostream&, const optional_input_file&);
    };

    struct log_args
    {
        bool quiet;
        std::string path;
    };

    struct arguments
    {
        optional_input_file config;
        optional_output_file output;
        log_args logargs;
        std::optional<std::string> tool;
        std::optional<std::string> member;
        std::optional<std::string> functions;
        std::vector<std::string> files;
    };

    std::ostream& operator<<(std::ostream& os, const optional_output_file& f);
    std::ostream& operator<<(std::ostream& os, const optional_input_file& f);
    std::ostream& operator<<(std::ostream& os, const arguments& a);

    std::optional<arguments> parse_arguments(int argc, char* const argv[]);
}
