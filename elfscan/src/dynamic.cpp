// dynamic.cpp

#include <elfscan/dynamic.hpp>
#include <elfscan/error.hpp>
#include <elfscan/log.hpp>
#include <elfscan/text_scan.hpp>

#include <util/strings.hpp>

#include <ostream>
#include <regex>

namespace {
constexpr std::string_view needle = "Dynamic section at offset";
// header line and column titles
constexpr std::size_t frame = 2;

constexpr std::string_view soname_prefix = "Library soname: [";
constexpr std::string_view needed_prefix = "Shared library: [";
constexpr std::string_view bracket_suffix = "]";

// 0x000000000000000e (SONAME)             Library soname: [libc.so.6]
const std::regex re_entry{R"(\s+\w*\s+\((\w+)\)\s+(.*))"};

std::optional<std::string_view> unwrap(std::string_view value,
                                       std::string_view prefix) {
  if (!cmmn::starts_with(value, prefix) ||
      !cmmn::ends_with(value, bracket_suffix) ||
      value.size() < prefix.size() + bracket_suffix.size())
    return std::nullopt;
  return value.substr(prefix.size(),
                      value.size() - prefix.size() - bracket_suffix.size());
}
} // namespace

namespace elfscan {
dynamic_report::dynamic_report(std::string_view path, const tool &t) {
  auto output = t.run(report_kind::dynamic_section, path);
  if (!output) {
    _error = output.error();
    return;
  }
  parse(*output);
  parse_meta();
}

dynamic_report dynamic_report::from_output(std::string_view text) {
  dynamic_report retval;
  retval.parse(text);
  retval.parse_meta();
  return retval;
}

void dynamic_report::parse(std::string_view text) {
  std::vector<std::string_view> lines = split_lines(cmmn::trim(text));
  block_scanner scanner(lines, needle, frame);
  auto group = scanner.rest();
  if (!group) {
    log::logline(log::debug, "no dynamic section found");
    return;
  }
  _table_found = true;
  for (std::string_view line : *group) {
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(line.begin(), line.end(), match, re_entry)) {
      log::logline(log::debug, "skipping dynamic section line '%.*s'",
                   static_cast<int>(line.size()), line.data());
      continue;
    }
    _entries.push_back({match[1].str(), match[2].str()});
  }
}

void dynamic_report::parse_meta() {
  std::vector<std::string> soname = (*this)["SONAME"];
  if (soname.size() != 1)
    return;
  const std::string &value = soname.front();
  auto name = unwrap(value, soname_prefix);
  if (!name)
    throw exception(errc::unexpected_soname_format,
                    cmmn::concat("SONAME value '", value, "'"));
  _soname = std::string(*name);
}

bool dynamic_report::parsing_failed() const noexcept { return bool(_error); }

const std::error_code &dynamic_report::error() const noexcept {
  return _error;
}

bool dynamic_report::table_found() const noexcept { return _table_found; }

const std::vector<dynamic_entry> &dynamic_report::entries() const noexcept {
  return _entries;
}

std::vector<std::string>
dynamic_report::operator[](std::string_view key) const {
  std::vector<std::string> retval;
  for (const auto &entry : _entries)
    if (entry.key == key)
      retval.push_back(entry.value);
  return retval;
}

const std::optional<std::string> &dynamic_report::soname() const noexcept {
  return _soname;
}

std::vector<std::string> dynamic_report::needed() const {
  std::vector<std::string> retval;
  for (const auto &value : (*this)["NEEDED"]) {
    if (auto name = unwrap(value, needed_prefix))
      retval.emplace_back(*name);
  }
  return retval;
}

bool operator==(const dynamic_entry &lhs, const dynamic_entry &rhs) {
  return lhs.key == rhs.key && lhs.value == rhs.value;
}

bool operator!=(const dynamic_entry &lhs, const dynamic_entry &rhs) {
  return !(lhs == rhs);
}

std::ostream &operator<<(std::ostream &os, const dynamic_entry &e) {
  os << "(" << e.key << ") " << e.value;
  return os;
}

std::ostream &operator<<(std::ostream &os, const dynamic_report &r) {
  if (r.parsing_failed())
    return os << "dynamic section: failed (" << r.error().message() << ")";
  os << "dynamic section: " << r.entries().size() << " entries";
  if (r.soname())
    os << ", soname " << *r.soname();
  return os;
}
} // namespace elfscan
