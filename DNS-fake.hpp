#ifndef DNS_FAKE_DOT_HPP
#define DNS_FAKE_DOT_HPP

#include <map>
#include <string>
#include <vector>

#include "DNS-lookup.hpp"

// In memory DNS::Lookup for the tests. Names with no data configured are
// NXDOMAIN. A configured error is thrown before the context is looked at.

namespace DNS {

class Fake_lookup : public Lookup {
public:
  std::map<std::string, std::vector<RR_MX>>       mx;
  std::map<std::string, std::vector<std::string>> addresses;
  std::map<std::string, std::vector<std::string>> ptr;
  std::map<std::string, lookup_error>             errors;

  int n_lookups{0};

  std::vector<RR_MX> lookup_mx(Context const&      ctx,
                               std::string const& domain) override
  {
    return lookup_(ctx, mx, domain);
  }

  std::vector<std::string> lookup_addresses(Context const&      ctx,
                                            std::string const& hostname) override
  {
    return lookup_(ctx, addresses, hostname);
  }

  std::vector<std::string> lookup_ptr(Context const&      ctx,
                                      std::string const& name) override
  {
    return lookup_(ctx, ptr, name);
  }

private:
  template <typename T>
  std::vector<T> lookup_(Context const&                                 ctx,
                         std::map<std::string, std::vector<T>> const& data,
                         std::string const&                             name)
  {
    ++n_lookups;
    if (auto const err = errors.find(name); err != errors.end())
      throw err->second;
    check_context(ctx);
    if (auto const rrs = data.find(name); rrs != data.end())
      return rrs->second;
    throw lookup_error(name + ": non-existent domain", false);
  }
};

} // namespace DNS

#endif // DNS_FAKE_DOT_HPP
