// text_scan.hpp

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace elfscan {
using line_group = std::vector<std::string_view>;

// splits on '\n', keeping empty lines; a trailing newline does not start a
// new line
std::vector<std::string_view> split_lines(std::string_view text);

// Finds every block of a report in a list of lines. A block starts at a line
// containing the needle; `frame` lines are dropped starting at that line
// (the header itself and the column titles below it) and the rest are
// collected until a line containing the terminator, or until a blank line
// when the terminator is empty.
class block_scanner {
public:
  block_scanner(const std::vector<std::string_view> &lines,
                std::string_view needle, std::size_t frame,
                std::string_view terminator = {});

  // next block, or std::nullopt once the needle no longer occurs
  std::optional<line_group> next();

  std::size_t headers_found() const noexcept;

  // the lines following the header and frame of the next block up to the
  // end of the input, without looking for a terminator
  std::optional<line_group> rest();

private:
  const std::vector<std::string_view> &_lines;
  std::string_view _needle;
  std::size_t _frame;
  std::string_view _terminator;
  std::size_t _pos = 0;
  std::size_t _headers = 0;

  bool seek_header();
  bool terminates(std::string_view line) const;
};

struct scan_result {
  std::size_t headers_found = 0;
  std::vector<line_group> groups;

  bool found() const noexcept { return headers_found != 0; }
};

scan_result scan_blocks(const std::vector<std::string_view> &lines,
                        std::string_view needle, std::size_t frame,
                        std::string_view terminator = {});
} // namespace elfscan
