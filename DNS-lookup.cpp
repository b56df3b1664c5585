#include "DNS-lookup.hpp"

#include <algorithm>

namespace DNS {

std::optional<std::chrono::milliseconds> Context::remaining() const
{
  if (!deadline_)
    return {};
  auto const left = std::chrono::duration_cast<std::chrono::milliseconds>(
      *deadline_ - clock::now());
  return std::max(left, std::chrono::milliseconds{0});
}

void check_context(Context const& ctx)
{
  if (ctx.cancelled())
    throw lookup_error("lookup canceled", true);
  if (ctx.expired())
    throw lookup_error("lookup deadline exceeded", true);
}

} // namespace DNS
