// symbols.cpp

#include <elfscan/symbols.hpp>
#include <elfscan/text_scan.hpp>

#include <util/strings.hpp>

#include <ostream>
#include <regex>

namespace {
//    10: 0000000000000000    18 FUNC    GLOBAL DEFAULT    4 main
const std::regex re_symbol{
    R"(\s+[0-9]+:\s\w+\s+(\w+)\s+(\w+)\s+(\w+)\s+(\w+)\s+(\w+)(?:\s+(\S+))?)"};
} // namespace

namespace elfscan {
bool symbol::undefined() const noexcept { return section_index == "UND"; }

symbol_report::symbol_report(std::string_view path, const tool &t) {
  auto output = t.run(report_kind::symbols, path);
  if (!output) {
    _error = output.error();
    return;
  }
  parse(*output);
}

symbol_report symbol_report::from_output(std::string_view text) {
  symbol_report retval;
  retval.parse(text);
  return retval;
}

void symbol_report::parse(std::string_view text) {
  // table headers, titles and blank lines simply do not match
  for (std::string_view line : split_lines(cmmn::trim(text))) {
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(line.begin(), line.end(), match, re_symbol))
      continue;
    _symbols.push_back({match[2].str(), match[3].str(), match[4].str(),
                        match[5].str(), match[6].str()});
  }
}

bool symbol_report::parsing_failed() const noexcept { return bool(_error); }

const std::error_code &symbol_report::error() const noexcept {
  return _error;
}

const std::vector<symbol> &symbol_report::symbols() const noexcept {
  return _symbols;
}

std::vector<symbol>
symbol_report::functions_matching(std::string_view pattern) const {
  std::regex re(pattern.begin(), pattern.end());
  std::vector<symbol> retval;
  for (const auto &sym : _symbols)
    if (sym.type == "FUNC" && std::regex_search(sym.name, re))
      retval.push_back(sym);
  return retval;
}

std::vector<symbol> symbol_report::undefined() const {
  std::vector<symbol> retval;
  for (const auto &sym : _symbols)
    if (sym.undefined() && !sym.name.empty())
      retval.push_back(sym);
  return retval;
}

bool operator==(const symbol &lhs, const symbol &rhs) {
  return lhs.type == rhs.type && lhs.bind == rhs.bind &&
         lhs.visibility == rhs.visibility &&
         lhs.section_index == rhs.section_index && lhs.name == rhs.name;
}

bool operator!=(const symbol &lhs, const symbol &rhs) { return !(lhs == rhs); }

std::ostream &operator<<(std::ostream &os, const symbol &sym) {
  os << sym.type << " " << sym.bind << " " << sym.visibility << " "
     << sym.section_index;
  if (!sym.name.empty())
    os << " " << sym.name;
  return os;
}

std::ostream &operator<<(std::ostream &os, const symbol_report &r) {
  if (r.parsing_failed())
    return os << "symbols: failed (" << r.error().message() << ")";
  os << "symbols: " << r.symbols().size();
  return os;
}
} // namespace elfscan
