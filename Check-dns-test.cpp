#include "Check-dns.hpp"

#include "DNS-fake.hpp"

#include <glog/logging.h>

namespace {
Conn_meta tcp_conn(std::string addr, std::string ehlo, RDNS::result rdns = {})
{
  return Conn_meta{std::move(addr), std::move(ehlo), std::move(rdns)};
}

void check_reason(Check::Result const&      res,
                  int                       code,
                  SMTP::Enhanced_code const ec,
                  char const*               check_name)
{
  CHECK(!res.passed());
  CHECK_EQ(res.reason->code(), code) << *res.reason;
  CHECK(res.reason->enhanced_code() == ec) << *res.reason;
  CHECK_EQ(res.reason->check_name(), check_name);

  // Validators leave the action to the caller.
  CHECK(!res.quarantine);
  CHECK(!res.reject);
}

void test_rdns()
{
  using Check::require_matching_rdns;

  auto const skipped = tcp_conn("192.0.2.1", "mail.example.com");
  CHECK(require_matching_rdns(skipped).passed());

  auto const match = tcp_conn("192.0.2.1", "mail.example.com",
                              RDNS::resolved{"mail.example.com."});
  CHECK(require_matching_rdns(match).passed());

  auto const match_ci = tcp_conn("192.0.2.1", "Mail.Example.COM.",
                                 RDNS::resolved{"mail.example.com"});
  CHECK(require_matching_rdns(match_ci).passed());

  auto const mismatch = tcp_conn("192.0.2.1", "mail.example.com",
                                 RDNS::resolved{"mail.evil.com"});
  auto const res = require_matching_rdns(mismatch);
  check_reason(res, 550, {5, 7, 25}, Check::rdns_check_name);
  CHECK_EQ(res.reason->reply(),
           "550 5.7.25 rDNS name does not match source hostname");

  // Only one trailing dot is dropped.
  auto const two_dots = tcp_conn("192.0.2.1", "mail.example.com",
                                 RDNS::resolved{"mail.example.com.."});
  CHECK(!require_matching_rdns(two_dots).passed());

  auto const failed = tcp_conn("192.0.2.1", "mail.example.com",
                               RDNS::failed{"SERVFAIL"});
  auto const res_failed = require_matching_rdns(failed);
  check_reason(res_failed, 450, {4, 7, 25}, Check::rdns_check_name);
  CHECK(res_failed.reason->temporary());
  CHECK_EQ(res_failed.reason->fields().at("reason"), "SERVFAIL");
}

void test_mx()
{
  using Check::require_mx_record;

  DNS::Fake_lookup res;
  res.mx["example.com"] = {DNS::RR_MX{"mx.example.com", 10}};
  res.mx["example.org"] = {};
  res.errors.emplace("flaky.example",
                     DNS::lookup_error("MX lookup failed: server failure", true));
  res.errors.emplace("gone.example",
                     DNS::lookup_error("non-existent domain", false));

  DNS::Context ctx;

  auto const conn = tcp_conn("192.0.2.1", "mail.example.com");

  // Bounces are exempt and don't hit DNS.
  CHECK(require_mx_record(conn, res, ctx, "").passed());
  CHECK_EQ(res.n_lookups, 0);

  CHECK(require_mx_record(conn, res, ctx, "user@example.com").passed());
  CHECK_EQ(res.n_lookups, 1);

  auto const none = require_mx_record(conn, res, ctx, "user@example.org");
  check_reason(none, 501, {5, 7, 27}, Check::mx_check_name);
  CHECK_EQ(none.reason->message(), "Domain in MAIL FROM has no MX records");

  auto const tmp = require_mx_record(conn, res, ctx, "user@flaky.example");
  check_reason(tmp, 420, {4, 7, 27}, Check::mx_check_name);
  CHECK_EQ(tmp.reason->fields().at("reason"),
           "MX lookup failed: server failure");
  CHECK(tmp.reason->cause());
  CHECK(tmp.reason->next() == nullptr);
  try {
    std::rethrow_exception(tmp.reason->cause());
  }
  catch (DNS::lookup_error const& e) {
    CHECK(e.temporary());
  }

  auto const perm = require_mx_record(conn, res, ctx, "user@gone.example");
  check_reason(perm, 501, {5, 7, 27}, Check::mx_check_name);
  CHECK_EQ(perm.reason->fields().at("reason"), "non-existent domain");

  auto const nodom = require_mx_record(conn, res, ctx, "postmaster");
  check_reason(nodom, 501, {5, 1, 8}, Check::mx_check_name);

  auto const n_before = res.n_lookups;
  auto const bad = require_mx_record(conn, res, ctx, "not an address");
  check_reason(bad, 501, {5, 1, 7}, Check::mx_check_name);
  CHECK_EQ(SMTP::what(bad.reason->cause()),
           "missing \"@\" in mailbox \"not an address\"");
  CHECK_EQ(res.n_lookups, n_before);

  auto const no_domain = require_mx_record(conn, res, ctx, "user@");
  check_reason(no_domain, 501, {5, 1, 7}, Check::mx_check_name);
  CHECK_EQ(res.n_lookups, n_before);

  // Only the "@" matters; the domain after the last one gets looked up.
  CHECK(require_mx_record(conn, res, ctx, "A@b@c@example.com").passed());
  CHECK_EQ(res.n_lookups, n_before + 1);

  auto const odd = require_mx_record(conn, res, ctx, "allen@bad_d0main.com");
  check_reason(odd, 501, {5, 7, 27}, Check::mx_check_name);
  CHECK_EQ(res.n_lookups, n_before + 2);

  // Not over TCP/IP: nothing to check.
  auto const n_local = res.n_lookups;
  auto const local    = Conn_meta{{}, "localhost", RDNS::not_attempted{}};
  CHECK(require_mx_record(local, res, ctx, "user@example.org").passed());
  CHECK_EQ(res.n_lookups, n_local);

  // A cancelled lookup is always temporary, even if the resolver says
  // otherwise.
  DNS::Context cancelled;
  cancelled.cancel();
  auto const c1 = require_mx_record(conn, res, cancelled, "user@example.com");
  check_reason(c1, 420, {4, 7, 27}, Check::mx_check_name);
  auto const c2 = require_mx_record(conn, res, cancelled, "user@gone.example");
  check_reason(c2, 420, {4, 7, 27}, Check::mx_check_name);

  DNS::Context expired{std::chrono::milliseconds{0}};
  auto const c3 = require_mx_record(conn, res, expired, "user@example.com");
  check_reason(c3, 420, {4, 7, 27}, Check::mx_check_name);
}

void test_ehlo()
{
  using Check::require_matching_ehlo;

  DNS::Fake_lookup res;
  res.addresses["mail.example.com"] = {"192.0.2.9", "192.0.2.1",
                                       "2001:db8::25"};
  res.addresses["www.example.com"]  = {"198.51.100.7"};
  res.errors.emplace("flaky.example",
                     DNS::lookup_error("A lookup failed: timeout", true));
  res.errors.emplace("gone.example",
                     DNS::lookup_error("non-existent domain", false));

  DNS::Context ctx;

  CHECK(require_matching_ehlo(tcp_conn("192.0.2.1", "[192.0.2.1]"), res, ctx)
            .passed());
  CHECK_EQ(res.n_lookups, 0);

  auto const lit_mismatch
      = require_matching_ehlo(tcp_conn("192.0.2.2", "[192.0.2.1]"), res, ctx);
  check_reason(lit_mismatch, 550, {5, 7, 0}, Check::ehlo_check_name);
  CHECK_EQ(lit_mismatch.reason->message(),
           "IP in EHLO is not the same as actual client IP");

  for (auto malformed : {"[192.0.2.256]", "[]", "[mail.example.com]",
                         "[IPv6:192.0.2.1]", "[IPv6:]"}) {
    auto const r
        = require_matching_ehlo(tcp_conn("192.0.2.1", malformed), res, ctx);
    check_reason(r, 550, {5, 7, 0}, Check::ehlo_check_name);
    CHECK_EQ(r.reason->message(), "Malformed IP in EHLO") << malformed;
  }
  CHECK_EQ(res.n_lookups, 0);

  CHECK(require_matching_ehlo(tcp_conn("2001:db8::1", "[IPv6:2001:DB8::1]"),
                              res, ctx)
            .passed());

  // IPv6 in brackets without the tag is understood too.
  CHECK(require_matching_ehlo(tcp_conn("2001:db8::1", "[2001:db8::1]"), res,
                              ctx)
            .passed());
  CHECK(require_matching_ehlo(tcp_conn("::1", "[::1]"), res, ctx).passed());
  auto const untagged_mismatch
      = require_matching_ehlo(tcp_conn("::2", "[::1]"), res, ctx);
  check_reason(untagged_mismatch, 550, {5, 7, 0}, Check::ehlo_check_name);
  CHECK_EQ(untagged_mismatch.reason->message(),
           "IP in EHLO is not the same as actual client IP");

  // A bare address in EHLO is compared as is, never looked up.
  CHECK(require_matching_ehlo(tcp_conn("192.0.2.1", "192.0.2.1"), res, ctx)
            .passed());
  CHECK(require_matching_ehlo(tcp_conn("::ffff:192.0.2.1", "192.0.2.1"), res,
                              ctx)
            .passed());
  auto const bare_mismatch
      = require_matching_ehlo(tcp_conn("192.0.2.2", "192.0.2.1"), res, ctx);
  check_reason(bare_mismatch, 550, {5, 7, 0}, Check::ehlo_check_name);
  CHECK_EQ(bare_mismatch.reason->message(),
           "No matching A/AAAA records found for EHLO hostname");
  CHECK_EQ(res.n_lookups, 0);

  CHECK(require_matching_ehlo(tcp_conn("192.0.2.1", "mail.example.com"), res,
                              ctx)
            .passed());
  CHECK(require_matching_ehlo(
            tcp_conn("2001:db8:0::25", "mail.example.com"), res, ctx)
            .passed());

  auto const no_match = require_matching_ehlo(
      tcp_conn("192.0.2.1", "www.example.com"), res, ctx);
  check_reason(no_match, 550, {5, 7, 0}, Check::ehlo_check_name);
  CHECK_EQ(no_match.reason->message(),
           "No matching A/AAAA records found for EHLO hostname");

  auto const tmp = require_matching_ehlo(
      tcp_conn("192.0.2.1", "flaky.example"), res, ctx);
  check_reason(tmp, 420, {4, 7, 27}, Check::ehlo_check_name);
  CHECK_EQ(tmp.reason->fields().at("reason"), "A lookup failed: timeout");

  auto const perm = require_matching_ehlo(
      tcp_conn("192.0.2.1", "gone.example"), res, ctx);
  check_reason(perm, 501, {5, 7, 27}, Check::ehlo_check_name);

  auto const n_before = res.n_lookups;
  auto const local = Conn_meta{{}, "[192.0.2.99]", RDNS::not_attempted{}};
  CHECK(require_matching_ehlo(local, res, ctx).passed());
  CHECK_EQ(res.n_lookups, n_before);

  DNS::Context cancelled;
  cancelled.cancel();
  auto const c = require_matching_ehlo(
      tcp_conn("192.0.2.1", "gone.example"), res, cancelled);
  check_reason(c, 420, {4, 7, 27}, Check::ehlo_check_name);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  test_rdns();
  test_mx();
  test_ehlo();
}
