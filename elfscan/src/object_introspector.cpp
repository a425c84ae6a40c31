// object_introspector.cpp

#include <elfscan/log.hpp>
#include <elfscan/object_introspector.hpp>

#include <util/strings.hpp>

#include <ostream>
#include <regex>

namespace {
const std::regex re_shared_library{R"(/lib(64)?/[^/]+\.so(\.[0-9]+)*$)"};
} // namespace

namespace elfscan {
bool is_archive_path(std::string_view path) noexcept {
  return cmmn::ends_with(path, ".a");
}

bool is_shared_library_path(std::string_view path) {
  return std::regex_search(path.begin(), path.end(), re_shared_library);
}

bool is_debug_info_path(std::string_view path) noexcept {
  return cmmn::ends_with(path, ".debug");
}

// the reports are built in declaration order, one tool run each
object_introspector::object_introspector(std::string_view package_path,
                                         std::string_view member_path,
                                         const tool &t)
    : _package_path(package_path), _member_path(member_path),
      _is_archive(is_archive_path(member_path)),
      _is_shared_library(is_shared_library_path(member_path)),
      _is_debug_info(is_debug_info_path(member_path)),
      _sections(package_path, t), _program_headers(package_path, t),
      _dynamic(package_path, t), _symbols(package_path, t) {
  if (failed())
    log::logline(log::warning, "%s: introspection failed",
                 _member_path.c_str());
}

const std::string &object_introspector::package_path() const noexcept {
  return _package_path;
}

const std::string &object_introspector::member_path() const noexcept {
  return _member_path;
}

bool object_introspector::is_archive() const noexcept { return _is_archive; }

bool object_introspector::is_shared_library() const noexcept {
  return _is_shared_library;
}

bool object_introspector::is_debug_info() const noexcept {
  return _is_debug_info;
}

const section_report &object_introspector::sections() const noexcept {
  return _sections;
}

const program_header_report &
object_introspector::program_headers() const noexcept {
  return _program_headers;
}

const dynamic_report &object_introspector::dynamic_section() const noexcept {
  return _dynamic;
}

const symbol_report &object_introspector::symbol_table() const noexcept {
  return _symbols;
}

bool object_introspector::failed() const noexcept {
  return _sections.parsing_failed() || _program_headers.parsing_failed() ||
         _dynamic.parsing_failed() || _symbols.parsing_failed();
}

std::ostream &operator<<(std::ostream &os, const object_introspector &obj) {
  os << obj.member_path();
  if (obj.member_path() != obj.package_path())
    os << " (" << obj.package_path() << ")";
  if (obj.is_archive())
    os << " [archive]";
  if (obj.is_shared_library())
    os << " [shared library]";
  if (obj.is_debug_info())
    os << " [debug info]";
  os << "\n  " << obj.sections();
  os << "\n  " << obj.program_headers();
  os << "\n  " << obj.dynamic_section();
  os << "\n  " << obj.symbol_table();
  return os;
}
} // namespace elfscan
