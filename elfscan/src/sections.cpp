// sections.cpp

#include <elfscan/log.hpp>
#include <elfscan/sections.hpp>
#include <elfscan/text_scan.hpp>

#include <charconv>
#include <cstdint>
#include <optional>
#include <ostream>
#include <regex>

namespace {
constexpr std::string_view needle = "Section Headers:";
constexpr std::string_view terminator = "Key to Flags:";
// header line, column titles and the NULL section at index 0
constexpr std::size_t frame = 3;

//  [ 1] .text   PROGBITS   0000000000000000 000040 000015 00  AX  0   0  1
const std::regex re_section{
    R"(.*\] ([^\s]*)\s*\w+\s*\w*\s*\w*\w*\s*(\w*))"};
const std::regex re_pic{R"(\.rela?\.(data|text))"};

std::optional<uint64_t> parse_hex(std::string_view text) {
  uint64_t value;
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value, 16);
  if (std::make_error_code(ec) || ptr != text.data() + text.size())
    return std::nullopt;
  return value;
}
} // namespace

namespace elfscan {
section_report::section_report(std::string_view path, const tool &t) {
  auto output = t.run(report_kind::sections, path);
  if (!output) {
    _error = output.error();
    return;
  }
  parse(*output);
}

section_report section_report::from_output(std::string_view text) {
  section_report retval;
  retval.parse(text);
  return retval;
}

void section_report::parse(std::string_view text) {
  std::vector<std::string_view> lines = split_lines(text);
  // archives contain one table per member object
  block_scanner scanner(lines, needle, frame, terminator);
  while (auto group = scanner.next()) {
    object_sections parsed;
    for (std::string_view line : *group) {
      std::match_results<std::string_view::const_iterator> match;
      std::optional<uint64_t> size;
      if (std::regex_search(line.begin(), line.end(), match, re_section))
        size = parse_hex(match[2].str());
      if (!size) {
        log::logline(log::warning, "skipping malformed section line '%.*s'",
                     static_cast<int>(line.size()), line.data());
        _skipped++;
        continue;
      }
      section sec{match[1].str(), *size};
      if (std::regex_search(sec.name, re_pic))
        _pic = true;
      parsed.push_back(std::move(sec));
    }
    if (!parsed.empty())
      _elf_files.push_back(std::move(parsed));
  }
  _table_found = scanner.headers_found() != 0;
  if (!_table_found)
    log::logline(log::debug, "no section header table found");
}

bool section_report::parsing_failed() const noexcept { return bool(_error); }

bool section_report::table_found() const noexcept { return _table_found; }

const std::error_code &section_report::error() const noexcept {
  return _error;
}

bool section_report::pic() const noexcept { return _pic; }

const std::vector<section_report::object_sections> &
section_report::elf_files() const noexcept {
  return _elf_files;
}

const section *section_report::find(std::string_view name) const noexcept {
  for (const auto &file : _elf_files)
    for (const auto &sec : file)
      if (sec.name == name)
        return &sec;
  return nullptr;
}

std::size_t section_report::skipped_lines() const noexcept { return _skipped; }

bool operator==(const section &lhs, const section &rhs) {
  return lhs.name == rhs.name && lhs.size == rhs.size;
}

bool operator!=(const section &lhs, const section &rhs) {
  return !(lhs == rhs);
}

std::ostream &operator<<(std::ostream &os, const section &sec) {
  os << sec.name << " (" << sec.size << " bytes)";
  return os;
}

std::ostream &operator<<(std::ostream &os, const section_report &r) {
  if (r.parsing_failed())
    return os << "sections: failed (" << r.error().message() << ")";
  os << "sections: " << r.elf_files().size() << " object(s), pic=" << r.pic();
  return os;
}
} // namespace elfscan
