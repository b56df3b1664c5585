#include "IP4.hpp"

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  using IP4::as_address;
  using IP4::is_address;
  using IP4::is_address_literal;
  using IP4::reverse;

  CHECK(is_address_literal("[69.0.0.0]"));
  CHECK(!is_address_literal("69.0.0.0]"));
  CHECK(!is_address_literal("[69.0.0.0"));
  CHECK(!is_address_literal("[]"));
  CHECK(!is_address_literal("[1234]"));
  CHECK(!is_address_literal("[192.0.2.300]"));

  CHECK(is_address("0.0.0.0"));
  CHECK(is_address("9.9.9.9"));
  CHECK(is_address("99.99.99.99"));
  CHECK(is_address("255.0.0.1"));
  CHECK(is_address("127.0.0.1"));

  CHECK(!is_address("127.0.0.1."));
  CHECK(!is_address("foo.bar"));
  CHECK(!is_address(""));

  CHECK(!is_address("256.0.0.0"));
  CHECK(!is_address("1.256.0.0"));
  CHECK(!is_address("1.1.256.0"));
  CHECK(!is_address("1.1.1.256"));
  CHECK(!is_address("1.1.1.1000"));

  CHECK_EQ(reverse("1.2.3.4"), "4.3.2.1.");

  auto const addr     = "192.0.2.1";
  auto const addr_lit = "[192.0.2.1]";

  CHECK(is_address(addr));
  CHECK(is_address_literal(addr_lit));

  CHECK_EQ(as_address(addr_lit), addr);
}
