// symbols.hpp

#pragma once

#include <elfscan/tool.hpp>

#include <iosfwd>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace elfscan {
struct symbol {
  std::string type;
  std::string bind;
  std::string visibility;
  // the Ndx column: UND, ABS, COM or a section number
  std::string section_index;
  // empty for unnamed symbols
  std::string name;

  bool undefined() const noexcept;
};

// symbol tables of `readelf -W -s`, flattened into a single list
class symbol_report {
public:
  explicit symbol_report(std::string_view path, const tool &t = tool{});

  static symbol_report from_output(std::string_view text);

  bool parsing_failed() const noexcept;
  const std::error_code &error() const noexcept;

  const std::vector<symbol> &symbols() const noexcept;

  // FUNC symbols whose name contains a match of the ECMAScript regular
  // expression; throws std::regex_error if the pattern is invalid
  std::vector<symbol> functions_matching(std::string_view pattern) const;

  // named symbols without a defining section
  std::vector<symbol> undefined() const;

private:
  symbol_report() = default;

  void parse(std::string_view text);

  std::error_code _error;
  std::vector<symbol> _symbols;
};

bool operator==(const symbol &, const symbol &);
bool operator!=(const symbol &, const symbol &);

std::ostream &operator<<(std::ostream &, const symbol &);
std::ostream &operator<<(std::ostream &, const symbol_report &);
} // namespace elfscan
