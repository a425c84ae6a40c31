// program_headers.hpp

#pragma once

#include <elfscan/tool.hpp>

#include <iosfwd>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace elfscan {
struct program_header {
  std::string type;
  // subset of "RWE", without blanks
  std::string flags;
};

// program header tables of `readelf -W -l`, one group per embedded object
class program_header_report {
public:
  using object_headers = std::vector<program_header>;

  explicit program_header_report(std::string_view path,
                                 const tool &t = tool{});

  static program_header_report from_output(std::string_view text);

  bool parsing_failed() const noexcept;
  const std::error_code &error() const noexcept;

  // false if the output has no program header table at all
  bool table_found() const noexcept;

  const std::vector<object_headers> &elf_files() const noexcept;

  // all headers of all objects, in load order
  const std::vector<program_header> &headers() const noexcept;

  bool has(std::string_view type) const noexcept;
  std::vector<std::string> flags_of(std::string_view type) const;

private:
  program_header_report() = default;

  void parse(std::string_view text);

  std::error_code _error;
  bool _table_found = false;
  std::vector<object_headers> _elf_files;
  std::vector<program_header> _headers;
};

bool operator==(const program_header &, const program_header &);
bool operator!=(const program_header &, const program_header &);

std::ostream &operator<<(std::ostream &, const program_header &);
std::ostream &operator<<(std::ostream &, const program_header_report &);
} // namespace elfscan
