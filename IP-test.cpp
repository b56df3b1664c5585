#include "IP.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  CHECK(IP::is_address("192.0.2.1"));
  CHECK(IP::is_address("2001:db8::1"));
  CHECK(!IP::is_address("mail.example.com"));

  CHECK(IP::is_address_literal("[192.0.2.1]"));
  CHECK(IP::is_address_literal("[IPv6:2001:db8::1]"));
  CHECK(!IP::is_address_literal("[mail.example.com]"));
  CHECK(!IP::is_address_literal("[2001:db8::1]"));

  CHECK_EQ(IP::as_address("[192.0.2.1]"), "192.0.2.1");
  CHECK_EQ(IP::as_address("[IPv6:2001:db8::1]"), "2001:db8::1");

  CHECK_EQ(IP::reverse_name("192.0.2.1"), "1.2.0.192.in-addr.arpa");
  CHECK_EQ(IP::reverse_name("2001:db8::1"),
           "1.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.8.b.d.0.1.0.0.2."
           "ip6.arpa");

  CHECK(IP::equal("192.0.2.1", "192.0.2.1"));
  CHECK(!IP::equal("192.0.2.1", "192.0.2.2"));

  // Different spellings of the same IPv6 address.
  CHECK(IP::equal("2001:db8::1", "2001:0DB8:0000:0000:0000:0000:0000:0001"));

  // IPv4-mapped
  CHECK(IP::equal("::ffff:192.0.2.1", "192.0.2.1"));
  CHECK(IP::equal("192.0.2.1", "::ffff:192.0.2.1"));
  CHECK(!IP::equal("::192.0.2.1", "192.0.2.1"));

  CHECK(!IP::equal("192.0.2.1", "not an address"));
  CHECK(!IP::equal("", ""));
}
