// dynamic.hpp

#pragma once

#include <elfscan/tool.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace elfscan {
struct dynamic_entry {
  std::string key;
  std::string value;
};

// dynamic section of `readelf -W -d`; entries of all embedded objects form
// a single group
class dynamic_report {
public:
  // throws elfscan::exception if the SONAME entry has an unexpected shape
  explicit dynamic_report(std::string_view path, const tool &t = tool{});

  // throws elfscan::exception if the SONAME entry has an unexpected shape
  static dynamic_report from_output(std::string_view text);

  bool parsing_failed() const noexcept;
  const std::error_code &error() const noexcept;

  // false if the output has no dynamic section at all
  bool table_found() const noexcept;

  const std::vector<dynamic_entry> &entries() const noexcept;

  // values of all entries with the given tag, in order
  std::vector<std::string> operator[](std::string_view key) const;

  // set only if there is exactly one SONAME entry
  const std::optional<std::string> &soname() const noexcept;

  // names of the NEEDED libraries
  std::vector<std::string> needed() const;

private:
  dynamic_report() = default;

  void parse(std::string_view text);
  void parse_meta();

  std::error_code _error;
  bool _table_found = false;
  std::vector<dynamic_entry> _entries;
  std::optional<std::string> _soname;
};

bool operator==(const dynamic_entry &, const dynamic_entry &);
bool operator!=(const dynamic_entry &, const dynamic_entry &);

std::ostream &operator<<(std::ostream &, const dynamic_entry &);
std::ostream &operator<<(std::ostream &, const dynamic_report &);
} // namespace elfscan
