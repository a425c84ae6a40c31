// program_headers.cpp

#include <elfscan/log.hpp>
#include <elfscan/program_headers.hpp>
#include <elfscan/text_scan.hpp>

#include <algorithm>
#include <ostream>
#include <regex>
#include <utility>

namespace {
constexpr std::string_view needle = "Program Headers:";
// header line and column titles
constexpr std::size_t frame = 2;

//  LOAD  0x001000 0x0000000000401000 0x0000000000401000 0x0002ad 0x0002ad R E 0x1000
const std::regex re_header{R"(\s+(\w+)(\s+\w+){5}\s+([RWE ]{3}).*)"};

std::string remove_spaces(std::string txt) {
  txt.erase(std::remove(txt.begin(), txt.end(), ' '), txt.end());
  return txt;
}
} // namespace

namespace elfscan {
program_header_report::program_header_report(std::string_view path,
                                             const tool &t) {
  auto output = t.run(report_kind::program_headers, path);
  if (!output) {
    _error = output.error();
    return;
  }
  parse(*output);
}

program_header_report
program_header_report::from_output(std::string_view text) {
  program_header_report retval;
  retval.parse(text);
  return retval;
}

void program_header_report::parse(std::string_view text) {
  std::vector<std::string_view> lines = split_lines(text);
  block_scanner scanner(lines, needle, frame);
  while (auto group = scanner.next()) {
    object_headers parsed;
    for (std::string_view line : *group) {
      // annotation rows such as the interpreter path do not match
      std::match_results<std::string_view::const_iterator> match;
      if (!std::regex_search(line.begin(), line.end(), match, re_header))
        continue;
      parsed.push_back({match[1].str(), remove_spaces(match[3].str())});
    }
    _headers.insert(_headers.end(), parsed.begin(), parsed.end());
    if (!parsed.empty())
      _elf_files.push_back(std::move(parsed));
  }
  _table_found = scanner.headers_found() != 0;
  if (!_table_found)
    log::logline(log::debug, "no program header table found");
}

bool program_header_report::parsing_failed() const noexcept {
  return bool(_error);
}

const std::error_code &program_header_report::error() const noexcept {
  return _error;
}

bool program_header_report::table_found() const noexcept {
  return _table_found;
}

const std::vector<program_header_report::object_headers> &
program_header_report::elf_files() const noexcept {
  return _elf_files;
}

const std::vector<program_header> &
program_header_report::headers() const noexcept {
  return _headers;
}

bool program_header_report::has(std::string_view type) const noexcept {
  return std::any_of(_headers.begin(), _headers.end(),
                     [type](const program_header &h) { return h.type == type; });
}

std::vector<std::string>
program_header_report::flags_of(std::string_view type) const {
  std::vector<std::string> retval;
  for (const auto &h : _headers)
    if (h.type == type)
      retval.push_back(h.flags);
  return retval;
}

bool operator==(const program_header &lhs, const program_header &rhs) {
  return lhs.type == rhs.type && lhs.flags == rhs.flags;
}

bool operator!=(const program_header &lhs, const program_header &rhs) {
  return !(lhs == rhs);
}

std::ostream &operator<<(std::ostream &os, const program_header &h) {
  os << h.type << " " << h.flags;
  return os;
}

std::ostream &operator<<(std::ostream &os, const program_header_report &r) {
  if (r.parsing_failed())
    return os << "program headers: failed (" << r.error().message() << ")";
  os << "program headers: " << r.headers().size();
  return os;
}
} // namespace elfscan
