#ifndef IP_DOT_HPP
#define IP_DOT_HPP

#include <string>
#include <string_view>

namespace IP {
bool is_address(std::string_view addr);
bool is_address_literal(std::string_view addr);
std::string_view as_address(std::string_view addr);

// Name to look up PTR records for: "4.3.2.1.in-addr.arpa" and the like.
std::string reverse_name(std::string_view addr);

// Same address, whatever the spelling. An IPv4-mapped IPv6 address is
// equal to its IPv4 form. False if either one isn't an address at all.
bool equal(std::string_view a, std::string_view b);
} // namespace IP

#endif // IP_DOT_HPP
