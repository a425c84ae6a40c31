// dump.hpp

#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace elfscan {
class object_introspector;
}

namespace escan {
struct report_dump {
  const std::vector<elfscan::object_introspector> &objects;
  // when set, FUNC symbols matching this pattern are listed
  const std::optional<std::string> &functions;

  report_dump(const std::vector<elfscan::object_introspector> &,
              const std::optional<std::string> &) noexcept;
  report_dump(const report_dump &) = delete;
  report_dump &operator=(const report_dump &) = delete;
};

std::ostream &operator<<(std::ostream &, const report_dump &);
} // namespace escan
