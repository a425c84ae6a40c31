// tool.hpp

#pragma once

#include <elfscan/result.hpp>

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace elfscan {
enum class report_kind {
  sections,
  program_headers,
  dynamic_section,
  symbols,
};

// the ELF introspection program, invoked once per report kind
struct tool {
  std::string program = "readelf";

  // argv of the invocation: <program> -W <flag> <path>
  std::vector<std::string> arguments(report_kind, std::string_view path) const;

  // runs the program and returns its standard output;
  // standard error is discarded and a non-zero exit status is an error
  result<std::string> run(report_kind, std::string_view path) const;
};

const char *report_flag(report_kind) noexcept;

std::ostream &operator<<(std::ostream &, report_kind);
std::ostream &operator<<(std::ostream &, const tool &);
} // namespace elfscan
