// dump.cpp

#include "dump.hpp"

#include <elfscan/object_introspector.hpp>

#include <nlohmann/json.hpp>

#include <ostream>

namespace elfscan {
static void to_json(nlohmann::json &j, const section &x) {
  j["name"] = x.name;
  j["size"] = x.size;
}

static void to_json(nlohmann::json &j, const program_header &x) {
  j["type"] = x.type;
  j["flags"] = x.flags;
}

static void to_json(nlohmann::json &j, const dynamic_entry &x) {
  j["key"] = x.key;
  j["value"] = x.value;
}

static void to_json(nlohmann::json &j, const symbol &x) {
  j["name"] = x.name;
  j["type"] = x.type;
  j["bind"] = x.bind;
  j["visibility"] = x.visibility;
  j["section_index"] = x.section_index;
}

static void to_json(nlohmann::json &j, const std::error_code &ec) {
  j["category"] = ec.category().name();
  j["message"] = ec.message();
}

static void to_json(nlohmann::json &j, const section_report &x) {
  j["failed"] = x.parsing_failed();
  if (x.parsing_failed()) {
    to_json(j["error"], x.error());
    return;
  }
  j["table_found"] = x.table_found();
  j["pic"] = x.pic();
  auto &files = j["files"] = nlohmann::json::array();
  for (const auto &file : x.elf_files()) {
    auto &sections = files.emplace_back(nlohmann::json::array());
    for (const auto &sec : file) {
      nlohmann::json jsec;
      to_json(jsec, sec);
      sections.push_back(std::move(jsec));
    }
  }
  if (x.skipped_lines())
    j["skipped_lines"] = x.skipped_lines();
}

static void to_json(nlohmann::json &j, const program_header_report &x) {
  j["failed"] = x.parsing_failed();
  if (x.parsing_failed()) {
    to_json(j["error"], x.error());
    return;
  }
  j["table_found"] = x.table_found();
  auto &files = j["files"] = nlohmann::json::array();
  for (const auto &file : x.elf_files()) {
    auto &headers = files.emplace_back(nlohmann::json::array());
    for (const auto &h : file) {
      nlohmann::json jhdr;
      to_json(jhdr, h);
      headers.push_back(std::move(jhdr));
    }
  }
}

static void to_json(nlohmann::json &j, const dynamic_report &x) {
  j["failed"] = x.parsing_failed();
  if (x.parsing_failed()) {
    to_json(j["error"], x.error());
    return;
  }
  j["table_found"] = x.table_found();
  if (x.soname())
    j["soname"] = *x.soname();
  else
    j["soname"] = nullptr;
  j["needed"] = x.needed();
  auto &entries = j["entries"] = nlohmann::json::array();
  for (const auto &e : x.entries()) {
    nlohmann::json jentry;
    to_json(jentry, e);
    entries.push_back(std::move(jentry));
  }
}

static void to_json(nlohmann::json &j, const symbol_report &x,
                    const std::optional<std::string> &functions) {
  j["failed"] = x.parsing_failed();
  if (x.parsing_failed()) {
    to_json(j["error"], x.error());
    return;
  }
  j["count"] = x.symbols().size();
  auto &undefined = j["undefined"] = nlohmann::json::array();
  for (const auto &sym : x.undefined())
    undefined.push_back(sym.name);
  if (functions) {
    auto &funcs = j["functions"] = nlohmann::json::array();
    for (const auto &sym : x.functions_matching(*functions)) {
      nlohmann::json jsym;
      to_json(jsym, sym);
      funcs.push_back(std::move(jsym));
    }
  }
}

static void to_json(nlohmann::json &j, const object_introspector &x,
                    const std::optional<std::string> &functions) {
  j["path"] = x.package_path();
  j["member"] = x.member_path();
  j["failed"] = x.failed();
  j["archive"] = x.is_archive();
  j["shared_library"] = x.is_shared_library();
  j["debug_info"] = x.is_debug_info();
  to_json(j["sections"], x.sections());
  to_json(j["program_headers"], x.program_headers());
  to_json(j["dynamic"], x.dynamic_section());
  to_json(j["symbols"], x.symbol_table(), functions);
}
} // namespace elfscan

namespace escan {
report_dump::report_dump(
    const std::vector<elfscan::object_introspector> &objects,
    const std::optional<std::string> &functions) noexcept
    : objects(objects), functions(functions) {}

std::ostream &operator<<(std::ostream &os, const report_dump &x) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &obj : x.objects) {
    nlohmann::json jobj;
    elfscan::to_json(jobj, obj, x.functions);
    j.push_back(std::move(jobj));
  }
  // readelf passes names through byte for byte, they need not be UTF-8
  os << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
     << "\n";
  return os;
}
} // namespace escan
