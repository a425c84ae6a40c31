// error.cpp

#include <elfscan/error.hpp>

namespace {
struct generic_category_t : std::error_category {
  const char *name() const noexcept override;
  std::string message(int) const override;
  std::error_condition default_error_condition(int) const noexcept override;
};

struct error_cause_category_t : std::error_category {
  const char *name() const noexcept override;
  std::string message(int) const override;
  bool equivalent(const std::error_code &, int) const noexcept override;
};

const generic_category_t generic_category_v;
const error_cause_category_t error_cause_category_v;

const char *generic_category_t::name() const noexcept { return "elfscan"; }

std::string generic_category_t::message(int ev) const {
  using elfscan::errc;
  switch (static_cast<errc>(ev)) {
  case errc::tool_exit_failure:
    return "introspection tool exited with non-zero status";
  case errc::tool_signaled:
    return "introspection tool was terminated by a signal";
  case errc::tool_not_started:
    return "introspection tool could not be started";
  case errc::unexpected_soname_format:
    return "SONAME entry is not of the form 'Library soname: [name]'";
  case errc::unknown_error:
    return "unknown error";
  }
  return "(unrecognized elfscan error code)";
}

std::error_condition
generic_category_t::default_error_condition(int ev) const noexcept {
  using elfscan::errc;
  using elfscan::error_cause;
  switch (static_cast<errc>(ev)) {
  case errc::tool_exit_failure:
  case errc::tool_signaled:
  case errc::tool_not_started:
    return error_cause::tool_error;
  case errc::unexpected_soname_format:
    return error_cause::format_error;
  case errc::unknown_error:
    return error_cause::unknown;
  }
  return error_cause::unknown;
}

const char *error_cause_category_t::name() const noexcept {
  return "error-cause";
}

std::string error_cause_category_t::message(int ev) const {
  using elfscan::error_cause;
  switch (static_cast<error_cause>(ev)) {
  case error_cause::tool_error:
    return "error running introspection tool";
  case error_cause::format_error:
    return "unexpected report format";
  case error_cause::system_error:
    return "system error";
  case error_cause::unknown:
    return "unknown error cause";
  }
  return "(unrecognized error condition)";
}

bool error_cause_category_t::equivalent(const std::error_code &ec,
                                        int cv) const noexcept {
  using elfscan::error_cause;
  auto cond = static_cast<error_cause>(cv);
  if (ec.category() == std::system_category())
    return cond == error_cause::system_error;
  if (ec.category() == elfscan::generic_category())
    return cond == ec.category().default_error_condition(ec.value());
  return false;
}
} // namespace

namespace elfscan {
std::error_code make_error_code(errc x) noexcept {
  return std::error_code{static_cast<int>(x), generic_category()};
}

std::error_condition make_error_condition(error_cause x) noexcept {
  return std::error_condition{static_cast<int>(x), error_cause_category_v};
}

const std::error_category &generic_category() noexcept {
  return generic_category_v;
}
} // namespace elfscan
