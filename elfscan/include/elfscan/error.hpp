// error.hpp

#pragma once

#include <cstdint>
#include <system_error>

namespace elfscan {
enum class errc : uint32_t;
enum class error_cause : uint32_t;
} // namespace elfscan

namespace std {
template <> struct is_error_code_enum<elfscan::errc> : std::true_type {};
template <>
struct is_error_condition_enum<elfscan::error_cause> : std::true_type {};
} // namespace std

namespace elfscan {
enum class errc : uint32_t {
  tool_exit_failure = 1,
  tool_signaled,
  tool_not_started,
  unexpected_soname_format,
  unknown_error,
};

enum class error_cause : uint32_t {
  tool_error = 1,
  format_error,
  system_error,
  unknown,
};

struct exception : std::system_error {
  using system_error::system_error;
};

std::error_code make_error_code(errc) noexcept;
std::error_condition make_error_condition(error_cause) noexcept;

const std::error_category &generic_category() noexcept;
} // namespace elfscan
