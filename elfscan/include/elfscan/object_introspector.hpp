// object_introspector.hpp

#pragma once

#include <elfscan/dynamic.hpp>
#include <elfscan/program_headers.hpp>
#include <elfscan/sections.hpp>
#include <elfscan/symbols.hpp>
#include <elfscan/tool.hpp>

#include <iosfwd>
#include <string>
#include <string_view>

namespace elfscan {
// classification of a path inside a package, from the path string alone
bool is_archive_path(std::string_view) noexcept;
bool is_shared_library_path(std::string_view);
bool is_debug_info_path(std::string_view) noexcept;

// all four reports of one object file
//
// `package_path` is the file handed to the tool; `member_path` is the path
// the file has inside its package and is only used for classification
class object_introspector {
public:
  // throws elfscan::exception if the SONAME entry has an unexpected shape
  object_introspector(std::string_view package_path,
                      std::string_view member_path, const tool &t = tool{});

  const std::string &package_path() const noexcept;
  const std::string &member_path() const noexcept;

  bool is_archive() const noexcept;
  bool is_shared_library() const noexcept;
  bool is_debug_info() const noexcept;

  const section_report &sections() const noexcept;
  const program_header_report &program_headers() const noexcept;
  const dynamic_report &dynamic_section() const noexcept;
  const symbol_report &symbol_table() const noexcept;

  // true if any of the reports failed
  bool failed() const noexcept;

private:
  std::string _package_path;
  std::string _member_path;
  bool _is_archive;
  bool _is_shared_library;
  bool _is_debug_info;
  section_report _sections;
  program_header_report _program_headers;
  dynamic_report _dynamic;
  symbol_report _symbols;
};

std::ostream &operator<<(std::ostream &, const object_introspector &);
} // namespace elfscan
