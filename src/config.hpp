// config.hpp

#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace escan
{
    namespace cfg
    {
        enum class errc : uint32_t;
    }
}

namespace std
{
    template<> struct is_error_code_enum<escan::cfg::errc> : std::true_type {};
}

namespace escan
{
    namespace cfg
    {
        enum class errc : uint32_t
        {
            config_io_error = 1,
            config_not_found,
            config_out_of_mem,
            config_bad_format,
            config_no_config,
            tool_invalid_path,
            targets_empty,
            object_no_path,
            object_invalid_path,
            object_invalid_member,
        };

        struct exception : std::system_error
        {
            using system_error::system_error;
        };

        std::error_code make_error_code(errc) noexcept;
        const std::error_category& config_category() noexcept;

        struct target_t
        {
            // file handed to the introspection tool
            std::string path;
            // path of the file inside its package
            std::string member;
        };

        struct config_t
        {
            using opt_tool_t = std::optional<std::string>;
            using targets_t = std::vector<target_t>;

            const opt_tool_t& tool() const noexcept;
            const targets_t& targets() const noexcept;

            explicit config_t(std::istream&);

        private:
            struct impl;
            std::shared_ptr<const impl> _impl;
        };

        std::ostream& operator<<(std::ostream&, const target_t&);
        std::ostream& operator<<(std::ostream&, const config_t&);

        bool operator==(const target_t&, const target_t&);
    }
}
