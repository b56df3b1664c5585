#ifndef DNS_RDNS_DOT_HPP_INCLUDED
#define DNS_RDNS_DOT_HPP_INCLUDED

#include "Conn-meta.hpp"
#include "DNS-lookup.hpp"

#include <string_view>

namespace DNS {
// The reverse DNS name of addr: the shortest PTR name, or why there isn't
// one. Never throws lookup_error.
RDNS::result
resolve_rdns(Context const& ctx, Lookup& res, std::string_view addr);
} // namespace DNS

#endif // DNS_RDNS_DOT_HPP_INCLUDED
