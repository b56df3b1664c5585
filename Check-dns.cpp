#include "Check-dns.hpp"

#include "IP.hpp"
#include "Mailbox.hpp"
#include "iequal.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <glog/logging.h>

namespace Check {

namespace {
constexpr auto dns_failure_msg = "DNS lookup failure during policy check";

Result fail(int code, SMTP::Enhanced_code ec, char const* msg,
            char const* check_name)
{
  return Result{SMTP::Error(code, ec, msg).with_check_name(check_name)};
}

// A lookup that was cancelled or ran out of time tells us nothing about the
// records, so that is always temporary.
Result dns_failure(char const*              check_name,
                   DNS::Context const&      ctx,
                   DNS::lookup_error const& e)
{
  auto const temporary = e.temporary() || ctx.done();

  LOG(WARNING) << check_name << ": " << (temporary ? "temporary" : "permanent")
               << " DNS failure: " << e.what();

  auto const code = temporary ? 420 : 501;
  auto const ec   = temporary ? SMTP::Enhanced_code{4, 7, 27}
                              : SMTP::Enhanced_code{5, 7, 27};

  // Resolver errors carry no context of their own, so the text goes in a
  // field as well as in the cause.
  return Result{SMTP::Error(code, ec, dns_failure_msg)
                    .with_check_name(check_name)
                    .with_cause(std::make_exception_ptr(e))
                    .with_field("reason", e.what())};
}
} // namespace

Result require_matching_rdns(Conn_meta const& conn)
{
  if (std::holds_alternative<RDNS::not_attempted>(conn.src_rdns)) {
    LOG(INFO) << rdns_check_name << ": rDNS lookup is disabled, skipped";
    return {};
  }

  if (auto const f = std::get_if<RDNS::failed>(&conn.src_rdns)) {
    // Can't tell a temporary failure from a missing PTR here, so don't
    // risk bouncing a legitimate sender.
    LOG(WARNING) << rdns_check_name << ": no usable rDNS name: " << f->what;
    return Result{SMTP::Error(450, {4, 7, 25}, dns_failure_msg)
                      .with_check_name(rdns_check_name)
                      .with_field("reason", f->what)};
  }

  auto const& rdns_name = std::get<RDNS::resolved>(conn.src_rdns).name;

  if (iequal_dns(rdns_name, conn.src_hostname)) {
    VLOG(1) << "PTR record " << rdns_name << " matches source hostname, OK";
    return {};
  }

  LOG(INFO) << rdns_check_name << ": PTR record " << rdns_name
            << " does not match " << conn.src_hostname;
  return fail(550, {5, 7, 25}, "rDNS name does not match source hostname",
              rdns_check_name);
}

Result require_mx_record(Conn_meta const&    conn,
                         DNS::Lookup&        res,
                         DNS::Context const& ctx,
                         std::string_view    mail_from)
{
  if (mail_from.empty()) {
    // Permit null reverse-path for bounces.
    LOG(INFO) << mx_check_name << ": null reverse-path, skipped";
    return {};
  }

  Mailbox sender;
  try {
    sender = Mailbox{mail_from};
  }
  catch (std::invalid_argument const& e) {
    LOG(INFO) << mx_check_name << ": " << e.what();
    return Result{SMTP::Error(501, {5, 1, 7}, "Malformed address in MAIL FROM")
                      .with_check_name(mx_check_name)
                      .with_cause(std::make_exception_ptr(e))};
  }

  if (sender.domain().empty()) {
    return fail(501, {5, 1, 8}, "No domain part", mx_check_name);
  }

  if (!conn.is_ip()) {
    LOG(INFO) << mx_check_name << ": non-TCP/IP source, skipped";
    return {};
  }

  std::vector<DNS::RR_MX> mxs;
  try {
    mxs = res.lookup_mx(ctx, sender.domain());
  }
  catch (DNS::lookup_error const& e) {
    return dns_failure(mx_check_name, ctx, e);
  }

  if (mxs.empty()) {
    LOG(INFO) << mx_check_name << ": no MX records for " << sender.domain();
    return fail(501, {5, 7, 27}, "Domain in MAIL FROM has no MX records",
                mx_check_name);
  }

  for (auto const& mx : mxs) {
    VLOG(1) << sender.domain() << " MX " << mx.preference() << ' '
            << mx.exchange();
  }
  return {};
}

Result require_matching_ehlo(Conn_meta const&    conn,
                             DNS::Lookup&        res,
                             DNS::Context const& ctx)
{
  if (!conn.is_ip()) {
    LOG(INFO) << ehlo_check_name << ": non-TCP/IP source, skipped";
    return {};
  }

  auto const& src_addr = *conn.src_addr;
  auto const& ehlo     = conn.src_hostname;

  if (ehlo.starts_with('[') && ehlo.ends_with(']')) {
    // Address literal in EHLO, check against the source address directly.
    // Clients also send IPv6 in brackets without the "IPv6:" tag.
    auto const inner = std::string_view{ehlo}.substr(1, ehlo.size() - 2);

    std::string_view ehlo_addr;
    if (IP::is_address_literal(ehlo)) {
      ehlo_addr = IP::as_address(ehlo);
    }
    else if (IP::is_address(inner)) {
      ehlo_addr = inner;
    }
    else {
      return fail(550, {5, 7, 0}, "Malformed IP in EHLO", ehlo_check_name);
    }
    if (!IP::equal(ehlo_addr, src_addr)) {
      LOG(INFO) << ehlo_check_name << ": " << ehlo << " is not " << src_addr;
      return fail(550, {5, 7, 0},
                  "IP in EHLO is not the same as actual client IP",
                  ehlo_check_name);
    }
    return {};
  }

  // A bare address stands for itself, there is nothing to look up.
  std::vector<std::string> addrs;
  try {
    addrs = IP::is_address(ehlo) ? std::vector<std::string>{ehlo}
                                 : res.lookup_addresses(ctx, ehlo);
  }
  catch (DNS::lookup_error const& e) {
    return dns_failure(ehlo_check_name, ctx, e);
  }

  auto const match
      = std::find_if(begin(addrs), end(addrs), [&src_addr](auto const& addr) {
          return IP::equal(addr, src_addr);
        });
  if (match != end(addrs)) {
    VLOG(1) << "A/AAAA record found for " << src_addr << " for " << ehlo
            << " domain";
    return {};
  }

  LOG(INFO) << ehlo_check_name << ": none of the " << addrs.size()
            << " address(es) of " << ehlo << " is " << src_addr;
  return fail(550, {5, 7, 0},
              "No matching A/AAAA records found for EHLO hostname",
              ehlo_check_name);
}

} // namespace Check
