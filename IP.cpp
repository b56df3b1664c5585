#include "IP.hpp"

#include "IP4.hpp"
#include "IP6.hpp"

#include <cstring>
#include <optional>

#include <arpa/inet.h>
#include <netinet/in.h>

#include <glog/logging.h>

namespace IP {

namespace {
// Every address as 16 octets, IPv4 as ::ffff:a.b.c.d
std::optional<in6_addr> to_in6(std::string_view addr)
{
  auto const str{std::string{addr}};

  in6_addr a6{};
  if (IP6::is_address(addr)) {
    if (inet_pton(AF_INET6, str.c_str(), &a6) == 1)
      return a6;
    return {};
  }

  if (IP4::is_address(addr)) {
    in_addr a4{};
    if (inet_pton(AF_INET, str.c_str(), &a4) != 1)
      return {};
    a6.s6_addr[10] = 0xff;
    a6.s6_addr[11] = 0xff;
    std::memcpy(&a6.s6_addr[12], &a4, sizeof(a4));
    return a6;
  }

  return {};
}
} // namespace

bool is_address(std::string_view addr)
{
  return IP4::is_address(addr) || IP6::is_address(addr);
}

bool is_address_literal(std::string_view addr)
{
  return IP4::is_address_literal(addr) || IP6::is_address_literal(addr);
}

std::string_view as_address(std::string_view addr)
{
  if (IP4::is_address_literal(addr))
    return IP4::as_address(addr);
  if (IP6::is_address_literal(addr))
    return IP6::as_address(addr);
  LOG(FATAL) << "not a valid IP address literal " << addr;
}

std::string reverse_name(std::string_view addr)
{
  if (IP4::is_address(addr))
    return IP4::reverse(addr) + "in-addr.arpa";
  if (IP6::is_address(addr))
    return IP6::reverse(addr) + "ip6.arpa";
  LOG(FATAL) << "not a valid IP address " << addr;
}

bool equal(std::string_view a, std::string_view b)
{
  auto const a6 = to_in6(a);
  auto const b6 = to_in6(b);
  return a6 && b6 && (std::memcmp(&*a6, &*b6, sizeof(in6_addr)) == 0);
}
} // namespace IP
