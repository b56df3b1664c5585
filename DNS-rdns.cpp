#include "DNS-rdns.hpp"

#include "IP.hpp"

#include <algorithm>

#include <glog/logging.h>

#include <fmt/format.h>

namespace DNS {

RDNS::result
resolve_rdns(Context const& ctx, Lookup& res, std::string_view addr)
{
  if (!IP::is_address(addr)) {
    return RDNS::failed{fmt::format("not a valid IP address {}", addr)};
  }

  auto const name = IP::reverse_name(addr);

  std::vector<std::string> ptrs;
  try {
    ptrs = res.lookup_ptr(ctx, name);
  }
  catch (lookup_error const& e) {
    LOG(WARNING) << "PTR lookup for " << addr << " failed: " << e.what();
    return RDNS::failed{e.what()};
  }

  if (ptrs.empty()) {
    return RDNS::failed{fmt::format("no PTR records for {}", addr)};
  }

  // Sort 1st by name length: short to long.
  std::sort(begin(ptrs), end(ptrs), [](std::string_view a, std::string_view b) {
    if (a.length() != b.length())
      return a.length() < b.length();
    return a < b;
  });

  return RDNS::resolved{ptrs.front()};
}

} // namespace DNS
