// config.cpp

#include "config.hpp"

#include <iostream>
#include <string_view>

#include <pugixml.hpp>

static constexpr std::string_view error_messages[] = {
    "I/O error when loading config file",
    "Config file not found",
    "Out of memory when loading config file",
    "Config file is badly formatted",
    "Node <config></config> not found",

    "tool: attribute 'path' cannot be empty",

    "targets: <targets></targets> must contain at least one <object/>",

    "object: attribute 'path' not found",
    "object: attribute 'path' cannot be empty",
    "object: attribute 'member' cannot be empty",
};

static_assert(
    static_cast<size_t>(escan::cfg::errc::object_invalid_member) ==
        sizeof(error_messages) / sizeof(error_messages[0]),
    "cfg::errc number of entries does not match message array size");

namespace {
struct config_category_t : std::error_category {
  const char *name() const noexcept override { return "config"; }

  std::string message(int ev) const override {
    using escan::cfg::errc;
    auto ec = static_cast<errc>(ev);
    if (ec >= errc::config_io_error && ec <= errc::object_invalid_member)
      return std::string(error_messages[ev - 1]);
    return "(unrecognized error code)";
  }
};

const config_category_t config_category_v;

std::optional<std::string> get_tool(const pugi::xml_node &nconfig) {
  using escan::cfg::errc;
  using escan::cfg::exception;
  using namespace pugi;
  // <tool/> - optional
  xml_node ntool = nconfig.child("tool");
  if (!ntool)
    return std::nullopt;
  xml_attribute path_attr = ntool.attribute("path");
  if (!path_attr || !*path_attr.value())
    throw exception(errc::tool_invalid_path);
  return path_attr.value();
}

escan::cfg::target_t get_target(const pugi::xml_node &nobject) {
  using escan::cfg::errc;
  using escan::cfg::exception;
  using namespace pugi;
  xml_attribute path_attr = nobject.attribute("path");
  if (!path_attr)
    throw exception(errc::object_no_path);
  if (!*path_attr.value())
    throw exception(errc::object_invalid_path);
  // member defaults to the path itself
  xml_attribute member_attr = nobject.attribute("member");
  if (!member_attr)
    return {path_attr.value(), path_attr.value()};
  if (!*member_attr.value())
    throw exception(errc::object_invalid_member);
  return {path_attr.value(), member_attr.value()};
}
} // namespace

namespace escan::cfg {
std::error_code make_error_code(errc x) noexcept {
  return {static_cast<int>(x), config_category()};
}

const std::error_category &config_category() noexcept {
  return config_category_v;
}

struct config_t::impl {
  opt_tool_t tool;
  targets_t targets;

  impl(std::istream &);
};

config_t::impl::impl(std::istream &is) : tool(std::nullopt) {
  using namespace pugi;
  xml_document doc;
  xml_parse_result parse_result = doc.load(is);
  if (!parse_result) {
    switch (parse_result.status) {
    case status_file_not_found:
      throw exception(errc::config_not_found);
    case status_io_error:
      throw exception(errc::config_io_error);
    case status_out_of_memory:
      throw exception(errc::config_out_of_mem);
    default:
      throw exception(errc::config_bad_format);
    }
  }
  // <config></config>
  xml_node nconfig = doc.child("config");
  if (!nconfig)
    throw exception(errc::config_no_config);
  tool = get_tool(nconfig);
  // <targets></targets> - optional, but never empty
  for (xml_node ntargets = nconfig.child("targets"); ntargets;
       ntargets = ntargets.next_sibling("targets")) {
    xml_node nobject = ntargets.child("object");
    if (!nobject)
      throw exception(errc::targets_empty);
    for (; nobject; nobject = nobject.next_sibling("object"))
      targets.push_back(get_target(nobject));
  }
}

config_t::config_t(std::istream &is) : _impl(std::make_shared<impl>(is)) {}

const config_t::opt_tool_t &config_t::tool() const noexcept {
  return _impl->tool;
}

const config_t::targets_t &config_t::targets() const noexcept {
  return _impl->targets;
}

std::ostream &operator<<(std::ostream &os, const target_t &t) {
  os << t.path;
  if (t.member != t.path)
    os << " as " << t.member;
  return os;
}

std::ostream &operator<<(std::ostream &os, const config_t &cfg) {
  os << "tool: " << cfg.tool().value_or("(default)");
  os << "\ntargets:";
  for (const auto &t : cfg.targets())
    os << "\n  " << t;
  return os;
}

bool operator==(const target_t &lhs, const target_t &rhs) {
  return lhs.path == rhs.path && lhs.member == rhs.member;
}
} // namespace escan::cfg
