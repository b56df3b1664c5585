#include "Check.hpp"

#include <charconv>
#include <system_error>

#include <glog/logging.h>

#include <fmt/format.h>

namespace Check {

namespace {
constexpr auto default_code    = 554;
constexpr auto default_message = "Message rejected due to a local policy";

constexpr auto reject_directive_reason = "reject directive used";

std::optional<int> to_int(std::string_view s)
{
  int value{};
  auto const [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (s.empty() || (ec != std::errc{}) || (ptr != s.data() + s.size()))
    return {};
  return value;
}

bool is_reply_class(int first_digit)
{
  return (first_digit == 4) || (first_digit == 5);
}
} // namespace

SMTP::Enhanced_code parse_enhanced_code(std::string_view s)
{
  int parts[3]{};
  auto n_parts{0};

  for (;;) {
    auto const dot  = s.find('.');
    auto const part = s.substr(0, dot);

    if (n_parts == 3) {
      throw config_error(errc::format,
                         "wrong amount of enhanced code parts");
    }

    auto const num = to_int(part);
    if (!num || (*num < 0)) {
      throw config_error(
          errc::format,
          fmt::format("invalid enhanced code part \"{}\"", part));
    }
    parts[n_parts++] = *num;

    if (dot == std::string_view::npos)
      break;
    s.remove_prefix(dot + 1);
  }

  if (n_parts != 3) {
    throw config_error(errc::format, "wrong amount of enhanced code parts");
  }

  return SMTP::Enhanced_code{parts[0], parts[1], parts[2]};
}

// Arguments are positional: code, enhanced-code, message. Each argument
// present is validated along with every one before it, so a message can't be
// given without a code and an enhanced code.

SMTP::Error parse_reject_directive(std::span<std::string const> args)
{
  if (args.size() > 3) {
    throw config_error(errc::arg_count,
                       fmt::format("invalid count of arguments: {}, "
                                   "expected at most 3",
                                   args.size()));
  }

  auto code{default_code};
  auto enhanced_code{SMTP::Enhanced_code{5, 7, 0}};
  auto message{std::string{default_message}};

  if (args.size() >= 1) {
    auto const num = to_int(args[0]);
    if (!num) {
      throw config_error(
          errc::invalid_code,
          fmt::format("invalid error code integer \"{}\"", args[0]));
    }
    if (!is_reply_class(*num / 100)) {
      throw config_error(
          errc::invalid_code,
          fmt::format("error code {} should start with either 4 or 5", *num));
    }
    code = *num;
  }

  if (args.size() >= 2) {
    enhanced_code = parse_enhanced_code(args[1]);
    if (!is_reply_class(enhanced_code.cls)) {
      throw config_error(
          errc::invalid_enhanced_code,
          fmt::format("enhanced code {} should use either 4 or 5 as a first "
                      "number",
                      enhanced_code));
    }
  }

  if (args.size() == 3) {
    if (args[2].empty()) {
      throw config_error(errc::empty_message, "message can't be empty");
    }
    message = args[2];
  }

  return SMTP::Error(code, enhanced_code, message)
      .with_reason(reject_directive_reason);
}

Fail_action parse_action_directive(std::span<std::string const> args)
{
  if (args.empty()) {
    throw config_error(errc::no_arguments, "expected at least 1 argument");
  }

  auto const& action = args[0];
  auto const  rest   = args.subspan(1);

  Fail_action res;

  if (action == "reject" || action == "quarantine") {
    if (!rest.empty()) {
      res.reason_override = parse_reject_directive(rest);
    }
    res.reject     = (action == "reject");
    res.quarantine = (action == "quarantine");
  }
  else if (action == "ignore") {
    if (!rest.empty()) {
      throw config_error(errc::arg_count,
                         fmt::format("ignore takes no arguments, got {}",
                                     rest.size()));
    }
  }
  else {
    throw config_error(errc::invalid_action,
                       fmt::format("invalid action \"{}\", expected reject, "
                                   "quarantine or ignore",
                                   action));
  }

  return res;
}

Result Fail_action::apply(Result res) const
{
  if (!res.reason)
    return res;

  if (reason_override) {
    // Wrap, don't replace, so the original is still there for the log.
    res.reason = SMTP::Error(reason_override->code(),
                             reason_override->enhanced_code(),
                             reason_override->what())
                     .with_cause(*res.reason);
  }

  if ((quarantine && !res.quarantine) || (reject && !res.reject)) {
    VLOG(1) << "policy escalates " << *res.reason << " to "
            << (reject ? "reject" : "quarantine");
  }

  res.quarantine = quarantine || res.quarantine;
  res.reject     = reject || res.reject;

  return res;
}

} // namespace Check
