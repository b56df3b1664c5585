#include "DNS-ldns.hpp"

#include <string>

#include <unistd.h>

#include <glog/logging.h>

namespace {
void test_rcodes()
{
  using DNS_ldns::is_temporary_rcode;

  CHECK(is_temporary_rcode(2)); // SERVFAIL
  CHECK(is_temporary_rcode(5)); // REFUSED

  CHECK(!is_temporary_rcode(1)); // FORMERR
  CHECK(!is_temporary_rcode(3)); // NXDOMAIN
  CHECK(!is_temporary_rcode(4)); // NOTIMP
}

void test_timeouts()
{
  using DNS_ldns::query_timeout;
  using std::chrono::milliseconds;

  auto const dflt = timeval{5, 0};

  // No deadline: back to the default, whatever was used before.
  auto const tv0 = query_timeout({}, dflt, 2);
  CHECK_EQ(tv0.tv_sec, 5);
  CHECK_EQ(tv0.tv_usec, 0);

  auto const tv1 = query_timeout(milliseconds{2500}, dflt, 1);
  CHECK_EQ(tv1.tv_sec, 2);
  CHECK_EQ(tv1.tv_usec, 500'000);

  // Shared between the nameservers.
  auto const tv2 = query_timeout(milliseconds{3000}, dflt, 3);
  CHECK_EQ(tv2.tv_sec, 1);
  CHECK_EQ(tv2.tv_usec, 0);

  auto const tv3 = query_timeout(milliseconds{1}, dflt, 3);
  CHECK_EQ(tv3.tv_sec, 0);
  CHECK_EQ(tv3.tv_usec, 1000);

  auto const tv4 = query_timeout(milliseconds{900}, dflt, 0);
  CHECK_EQ(tv4.tv_sec, 0);
  CHECK_EQ(tv4.tv_usec, 900'000);
}

void test_domain()
{
  auto const too_long = std::string(64, 'a') + ".example.com";

  auto threw = false;
  try {
    DNS_ldns::Domain dom(too_long);
  }
  catch (DNS::lookup_error const& e) {
    CHECK(!e.temporary());
    threw = true;
  }
  CHECK(threw);

  DNS_ldns::Domain dom("mail.example.com");
  CHECK_EQ(dom.str(), "mail.example.com");
  CHECK(dom.get() != nullptr);
}

void test_address_hostname()
{
  if (access("/etc/resolv.conf", R_OK) != 0) {
    LOG(INFO) << "no /etc/resolv.conf, resolver test skipped";
    return;
  }

  DNS_ldns::Resolver res;
  DNS::Context       ctx;

  // Answered without a query.
  auto const v4 = res.lookup_addresses(ctx, "192.0.2.1");
  CHECK_EQ(v4.size(), 1);
  CHECK_EQ(v4[0], "192.0.2.1");

  auto const v6 = res.lookup_addresses(ctx, "2001:db8::1");
  CHECK_EQ(v6.size(), 1);
  CHECK_EQ(v6[0], "2001:db8::1");

  DNS::Context cancelled;
  cancelled.cancel();
  auto threw = false;
  try {
    res.lookup_mx(cancelled, "example.com");
  }
  catch (DNS::lookup_error const& e) {
    CHECK(e.temporary());
    threw = true;
  }
  CHECK(threw);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  test_rcodes();
  test_timeouts();
  test_domain();
  test_address_hostname();
}
