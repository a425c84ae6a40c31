// text_scan.cpp

#include <elfscan/text_scan.hpp>

#include <util/strings.hpp>

#include <algorithm>

namespace elfscan {
std::vector<std::string_view> split_lines(std::string_view text) {
  std::vector<std::string_view> lines;
  std::string_view::size_type current = 0;
  std::string_view::size_type next;
  while ((next = text.find('\n', current)) != std::string_view::npos) {
    lines.push_back(text.substr(current, next - current));
    current = next + 1;
  }
  if (current < text.size())
    lines.push_back(text.substr(current));
  return lines;
}

block_scanner::block_scanner(const std::vector<std::string_view> &lines,
                             std::string_view needle, std::size_t frame,
                             std::string_view terminator)
    : _lines(lines), _needle(needle), _frame(frame), _terminator(terminator) {}

bool block_scanner::seek_header() {
  auto it = std::find_if(
      _lines.begin() + _pos, _lines.end(),
      [this](std::string_view line) { return cmmn::contains(line, _needle); });
  if (it == _lines.end()) {
    _pos = _lines.size();
    return false;
  }
  _headers++;
  // the header line itself is always consumed
  auto skip = std::max<std::size_t>(_frame, 1);
  _pos = std::min<std::size_t>(
      static_cast<std::size_t>(it - _lines.begin()) + skip, _lines.size());
  return true;
}

bool block_scanner::terminates(std::string_view line) const {
  if (_terminator.empty())
    return cmmn::is_blank(line);
  return cmmn::contains(line, _terminator);
}

std::optional<line_group> block_scanner::next() {
  if (!seek_header())
    return std::nullopt;
  line_group group;
  for (; _pos < _lines.size() && !terminates(_lines[_pos]); _pos++)
    group.push_back(_lines[_pos]);
  return group;
}

std::optional<line_group> block_scanner::rest() {
  if (!seek_header())
    return std::nullopt;
  line_group group(_lines.begin() + _pos, _lines.end());
  _pos = _lines.size();
  return group;
}

std::size_t block_scanner::headers_found() const noexcept { return _headers; }

scan_result scan_blocks(const std::vector<std::string_view> &lines,
                        std::string_view needle, std::size_t frame,
                        std::string_view terminator) {
  scan_result retval;
  block_scanner scanner(lines, needle, frame, terminator);
  while (auto group = scanner.next())
    retval.groups.push_back(std::move(*group));
  retval.headers_found = scanner.headers_found();
  return retval;
}
} // namespace elfscan
