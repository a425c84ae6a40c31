// sections.hpp

#pragma once

#include <elfscan/tool.hpp>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace elfscan {
struct section {
  std::string name;
  uint64_t size;
};

// section header tables of `readelf -W -S`, one group per embedded object
class section_report {
public:
  using object_sections = std::vector<section>;

  explicit section_report(std::string_view path, const tool &t = tool{});

  static section_report from_output(std::string_view text);

  bool parsing_failed() const noexcept;
  const std::error_code &error() const noexcept;

  // false if the output has no section header table at all
  bool table_found() const noexcept;

  // true if any object has a relocation section for .text or .data
  bool pic() const noexcept;

  const std::vector<object_sections> &elf_files() const noexcept;

  // first section with the given name across all objects, or nullptr
  const section *find(std::string_view name) const noexcept;

  // content lines which did not match the section line grammar
  std::size_t skipped_lines() const noexcept;

private:
  section_report() = default;

  void parse(std::string_view text);

  std::error_code _error;
  bool _table_found = false;
  bool _pic = false;
  std::vector<object_sections> _elf_files;
  std::size_t _skipped = 0;
};

bool operator==(const section &, const section &);
bool operator!=(const section &, const section &);

std::ostream &operator<<(std::ostream &, const section &);
std::ostream &operator<<(std::ostream &, const section_report &);
} // namespace elfscan
