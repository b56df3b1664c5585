#ifndef CHECK_DOT_HPP
#define CHECK_DOT_HPP

#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include "SMTP-error.hpp"

namespace Check {

enum class errc : uint8_t {
  format,
  invalid_code,
  invalid_enhanced_code,
  empty_message,
  arg_count,
  invalid_action,
  no_arguments,
  unknown_check,
};

constexpr char const* errc_c_str(errc e)
{
  switch (e) { // clang-format off
  case errc::format:                return "format";
  case errc::invalid_code:          return "invalid_code";
  case errc::invalid_enhanced_code: return "invalid_enhanced_code";
  case errc::empty_message:         return "empty_message";
  case errc::arg_count:             return "arg_count";
  case errc::invalid_action:        return "invalid_action";
  case errc::no_arguments:          return "no_arguments";
  case errc::unknown_check:         return "unknown_check";
  } // clang-format on
  return "*** unknown errc ***";
}

// Thrown while loading configuration, never while checking a message.
class config_error : public std::invalid_argument {
public:
  config_error(errc code, std::string const& msg)
    : std::invalid_argument(msg)
    , code_(code)
  {
  }

  errc code() const { return code_; }

private:
  errc code_;
};

// The verdict of one check on one message.
struct Result {
  std::optional<SMTP::Error> reason; // empty means the check passed

  bool quarantine{false};
  bool reject{false};

  enum class disposition_t : uint8_t {
    accept,
    log_only,
    quarantine,
    reject,
  };

  bool passed() const { return !reason.has_value(); }

  // Both flags can be set after a merge; reject wins.
  disposition_t disposition() const
  {
    if (!reason)
      return disposition_t::accept;
    if (reject)
      return disposition_t::reject;
    if (quarantine)
      return disposition_t::quarantine;
    return disposition_t::log_only;
  }
};

constexpr char const* disposition_c_str(Result::disposition_t d)
{
  switch (d) { // clang-format off
  case Result::disposition_t::accept:     return "accept";
  case Result::disposition_t::log_only:   return "log only";
  case Result::disposition_t::quarantine: return "quarantine";
  case Result::disposition_t::reject:     return "reject";
  } // clang-format on
  return "*** unknown disposition ***";
}

// What to do when a check fails, as configured by the administrator:
//
//   reject [code [enhanced-code [message]]]
//   quarantine [code [enhanced-code [message]]]
//   ignore
//
// Parsed once at load time, read only after that.
struct Fail_action {
  bool quarantine{false};
  bool reject{false};

  std::optional<SMTP::Error> reason_override;

  // Merge the raw result of a check with this action. A passing result is
  // returned as is. Call exactly once per raw result.
  Result apply(Result res) const;
};

SMTP::Enhanced_code parse_enhanced_code(std::string_view s);

SMTP::Error parse_reject_directive(std::span<std::string const> args);

Fail_action parse_action_directive(std::span<std::string const> args);

} // namespace Check

#endif // CHECK_DOT_HPP
