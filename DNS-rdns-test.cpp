#include "DNS-rdns.hpp"

#include "DNS-fake.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  DNS::Fake_lookup res;
  res.ptr["1.2.0.192.in-addr.arpa"] = {"mail-out-1.example.com",
                                       "mx.example.com"};
  res.ptr["2.2.0.192.in-addr.arpa"] = {};
  res.errors.emplace(
      "3.2.0.192.in-addr.arpa",
      DNS::lookup_error("PTR lookup failed: server failure", true));
  res.ptr["1.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.8.b.d.0.1.0.0.2."
          "ip6.arpa"] = {"v6.example.com"};

  DNS::Context ctx;

  auto const r1 = DNS::resolve_rdns(ctx, res, "192.0.2.1");
  CHECK(std::holds_alternative<RDNS::resolved>(r1));
  CHECK_EQ(std::get<RDNS::resolved>(r1).name, "mx.example.com");

  auto const r2 = DNS::resolve_rdns(ctx, res, "192.0.2.2");
  CHECK(std::holds_alternative<RDNS::failed>(r2));

  auto const r3 = DNS::resolve_rdns(ctx, res, "192.0.2.3");
  CHECK(std::holds_alternative<RDNS::failed>(r3));
  CHECK_EQ(std::get<RDNS::failed>(r3).what,
           "PTR lookup failed: server failure");

  auto const r4 = DNS::resolve_rdns(ctx, res, "192.0.2.4");
  CHECK(std::holds_alternative<RDNS::failed>(r4));

  auto const r6 = DNS::resolve_rdns(ctx, res, "2001:db8::1");
  CHECK(std::holds_alternative<RDNS::resolved>(r6));
  CHECK_EQ(std::get<RDNS::resolved>(r6).name, "v6.example.com");

  auto const bad = DNS::resolve_rdns(ctx, res, "mail.example.com");
  CHECK(std::holds_alternative<RDNS::failed>(bad));

  auto const n_lookups = res.n_lookups;
  DNS::Context cancelled;
  cancelled.cancel();
  auto const rc = DNS::resolve_rdns(cancelled, res, "192.0.2.1");
  CHECK(std::holds_alternative<RDNS::failed>(rc));
  CHECK_EQ(res.n_lookups, n_lookups + 1);
}
