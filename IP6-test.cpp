#include "IP6.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  using IP6::as_address;
  using IP6::is_address;
  using IP6::is_address_literal;
  using IP6::reverse;

  CHECK(is_address("::1"));
  CHECK(is_address_literal("[IPv6:::1]"));
  CHECK(is_address_literal("[ipv6:::1]"));
  CHECK(!is_address_literal("[::1]"));

  CHECK(is_address("::ffff:0.0.0.0"));
  CHECK(is_address("::ffff:255.255.255.255"));

  CHECK(is_address("2001:db8::1"));
  CHECK(!is_address("2001:db8::1::2"));

  auto const addr{"2001:0db8:85a3:0000:0000:8a2e:0370:7334"};
  auto const addr_lit{"[IPv6:2001:0db8:85a3:0000:0000:8a2e:0370:7334]"};

  CHECK(is_address(addr));
  CHECK(is_address_literal(addr_lit));

  CHECK_EQ(as_address(addr_lit), addr);

  CHECK_EQ(reverse("2001:db8::567:89ab"),
           "b.a.9.8.7.6.5.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.8.b.d.0.1.0.0.2.");
}
