#include "Mailbox.hpp"

#include "iequal.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace {
// RFC 5321 section 4.5.1 requires "postmaster" without a domain.
constexpr std::string_view postmaster = "postmaster";
} // namespace

Mailbox::Mailbox(std::string_view mailbox)
{
  // The local part may itself be quoted and contain "@".
  auto const at = mailbox.rfind('@');

  if (at == std::string_view::npos) {
    if (iequal(mailbox, postmaster)) {
      local_part_ = mailbox;
      return;
    }
    throw std::invalid_argument(
        fmt::format("missing \"@\" in mailbox \"{}\"", mailbox));
  }

  local_part_ = mailbox.substr(0, at);
  domain_     = mailbox.substr(at + 1);

  if (local_part_.empty()) {
    throw std::invalid_argument(
        fmt::format("empty local part in mailbox \"{}\"", mailbox));
  }
  if (domain_.empty()) {
    throw std::invalid_argument(
        fmt::format("empty domain in mailbox \"{}\"", mailbox));
  }
}
