// strings.hpp

#pragma once

#include <string>
#include <string_view>

namespace cmmn {

template <typename Ret = std::string, typename... T> Ret concat(T &&...args) {
  Ret result;
  typename Ret::size_type total_sz = 0;
  std::basic_string_view<typename Ret::value_type> views[] = {args...};
  for (const auto &v : views)
    total_sz += v.size();
  result.reserve(total_sz);
  for (const auto &v : views)
    result.append(v);
  return result;
}

inline bool starts_with(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(std::string_view str, std::string_view suffix) {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool contains(std::string_view str, std::string_view needle) {
  return str.find(needle) != std::string_view::npos;
}

// strips leading and trailing whitespace
inline std::string_view trim(std::string_view str) {
  constexpr std::string_view whitespace = " \t\n\r\f\v";
  auto first = str.find_first_not_of(whitespace);
  if (first == std::string_view::npos)
    return {};
  auto last = str.find_last_not_of(whitespace);
  return str.substr(first, last - first + 1);
}

inline bool is_blank(std::string_view str) { return trim(str).empty(); }

} // namespace cmmn
