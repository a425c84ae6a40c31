// tool.cpp

#include "process.hpp"

#include <elfscan/log.hpp>
#include <elfscan/tool.hpp>

#include <ostream>

namespace elfscan {
const char *report_flag(report_kind kind) noexcept {
  switch (kind) {
  case report_kind::sections:
    return "-S";
  case report_kind::program_headers:
    return "-l";
  case report_kind::dynamic_section:
    return "-d";
  case report_kind::symbols:
    return "-s";
  }
  return "";
}

std::vector<std::string> tool::arguments(report_kind kind,
                                         std::string_view path) const {
  // -W: wide output, lines are never truncated
  return {program, "-W", report_flag(kind), std::string(path)};
}

result<std::string> tool::run(report_kind kind, std::string_view path) const {
  command cmd(arguments(kind, path));
  log::logline(log::debug, "running %s report for %.*s", report_flag(kind),
               static_cast<int>(path.size()), path.data());
  return cmd.capture_output();
}

std::ostream &operator<<(std::ostream &os, report_kind kind) {
  switch (kind) {
  case report_kind::sections:
    os << "sections";
    break;
  case report_kind::program_headers:
    os << "program headers";
    break;
  case report_kind::dynamic_section:
    os << "dynamic section";
    break;
  case report_kind::symbols:
    os << "symbols";
    break;
  }
  return os;
}

std::ostream &operator<<(std::ostream &os, const tool &t) {
  os << t.program;
  return os;
}
} // namespace elfscan
