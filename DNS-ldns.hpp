#ifndef DNS_LDNS_DOT_HPP
#define DNS_LDNS_DOT_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/time.h>

#include "DNS-lookup.hpp"

// forward decl
typedef struct ldns_struct_pkt      ldns_pkt;
typedef struct ldns_struct_rdf      ldns_rdf;
typedef struct ldns_struct_resolver ldns_resolver;

namespace DNS_ldns {

// SERVFAIL and REFUSED may well go away, any other rcode is an answer.
bool is_temporary_rcode(uint16_t rcode);

// Timeout for each try of one query. Each nameserver is tried once, so
// what is left of the deadline is shared between them. Without a deadline
// it's the resolver's own default.
timeval query_timeout(std::optional<std::chrono::milliseconds> remaining,
                      timeval                                  dflt,
                      size_t                                   n_nameservers);

class Domain {
public:
  Domain(Domain const&) = delete;
  Domain& operator=(Domain const&) = delete;

  // Throws a permanent DNS::lookup_error if domain isn't a DNS name.
  explicit Domain(std::string const& domain);
  ~Domain();

  std::string const& str() const { return str_; }
  ldns_rdf*          get() const { return rdfp_; }

private:
  std::string str_;
  ldns_rdf*   rdfp_;
};

// The answer to one query, with a NOERROR rcode.
class Query {
public:
  Query(Query const&) = delete;
  Query& operator=(Query const&) = delete;

  explicit Query(ldns_pkt* p)
    : p_(p)
  {
  }
  ~Query();

  ldns_pkt* get() const { return p_; }

private:
  ldns_pkt* p_;
};

// Stub resolver configured from /etc/resolv.conf. One ldns resolver is not
// safe to use from two threads, so queries are serialized.
//
// The context is looked at before each query and again once the lock is
// held. A query in flight runs until it is answered or times out, so
// cancel() takes effect between queries.

class Resolver : public DNS::Lookup {
public:
  Resolver(Resolver const&) = delete;
  Resolver& operator=(Resolver const&) = delete;

  Resolver();
  ~Resolver() override;

  std::vector<DNS::RR_MX> lookup_mx(DNS::Context const& ctx,
                                    std::string const&  domain) override;

  std::vector<std::string> lookup_addresses(DNS::Context const& ctx,
                                            std::string const& hostname) override;

  std::vector<std::string> lookup_ptr(DNS::Context const& ctx,
                                      std::string const&  name) override;

private:
  // Throws DNS::lookup_error for anything but a NOERROR answer.
  ldns_pkt* query_(DNS::Context const& ctx,
                   DNS::RR_type        type,
                   std::string const&  name);

  std::mutex     mtx_;
  ldns_resolver* res_;
  timeval        default_timeout_;
};

} // namespace DNS_ldns

#endif // DNS_LDNS_DOT_HPP
