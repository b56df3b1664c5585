#include "DNS-ldns.hpp"

#include "IP.hpp"

#include <algorithm>

#include <cstdbool> // needs to be above ldns includes
#include <ldns/ldns.h>
#include <ldns/packet.h>
#include <ldns/rr.h>

#include <arpa/inet.h>
#include <sys/time.h>

#include <glog/logging.h>

#include <fmt/format.h>

namespace DNS_ldns {

namespace {
std::string rr_name_str(ldns_rdf const* rdf)
{
  auto const sz = ldns_rdf_size(rdf);

  if (sz > LDNS_MAX_DOMAINLEN) {
    LOG(WARNING) << "rdf size too large";
    return "<too long>";
  }
  if (sz == 1) {
    return ""; // root label
  }

  auto const data = ldns_rdf_data(rdf);

  size_t        src_pos = 0;
  unsigned char len     = data[src_pos];

  std::string str;
  str.reserve(64);
  while ((len > 0) && (src_pos < sz)) {
    src_pos++;
    for (unsigned char i = 0; i < len; ++i) {
      unsigned char c = data[src_pos];
      if (c == '.' || c == '\\') {
        str += '\\';
      }
      str += c;
      src_pos++;
    }
    if (src_pos < sz) {
      str += '.';
    }
    len = data[src_pos];
  }

  if (str.length() && ('.' == str.back())) {
    str.erase(str.length() - 1);
  }

  return str;
}

std::string addr_str(ldns_rdf const* rdf, int af)
{
  char str[INET6_ADDRSTRLEN];
  CHECK_NOTNULL(inet_ntop(af, ldns_rdf_data(rdf), str, sizeof(str)));
  return str;
}

// Answer records of the given type, CNAMEs and the rest are skipped.
template <typename F>
void for_each_answer(ldns_pkt const* p, DNS::RR_type type, F f)
{
  auto const answer = ldns_pkt_answer(p); // no clone, no free
  if (!answer)
    return;
  for (size_t i = 0; i < ldns_rr_list_rr_count(answer); ++i) {
    auto const rr = ldns_rr_list_rr(answer, i);
    if (rr && (ldns_rr_get_type(rr) == static_cast<ldns_rr_type>(type))) {
      f(rr);
    }
  }
}
} // namespace

bool is_temporary_rcode(uint16_t rcode)
{
  return (rcode == LDNS_RCODE_SERVFAIL) || (rcode == LDNS_RCODE_REFUSED);
}

timeval query_timeout(std::optional<std::chrono::milliseconds> remaining,
                      timeval                                  dflt,
                      size_t                                   n_nameservers)
{
  if (!remaining)
    return dflt;

  auto const n_tries = static_cast<std::chrono::milliseconds::rep>(
      std::max<size_t>(n_nameservers, 1));

  // Never zero, ldns would not wait at all.
  auto const ms = std::max<std::chrono::milliseconds::rep>(
      remaining->count() / n_tries, 1);

  timeval tv{};
  tv.tv_sec  = ms / 1000;
  tv.tv_usec = (ms % 1000) * 1000;
  return tv;
}

Domain::Domain(std::string const& domain)
  : str_(domain)
  , rdfp_(ldns_dname_new_frm_str(domain.c_str()))
{
  if (rdfp_ == nullptr) {
    throw DNS::lookup_error(fmt::format("invalid domain name \"{}\"", domain),
                            false);
  }
}

Domain::~Domain() { ldns_rdf_deep_free(rdfp_); }

Query::~Query()
{
  if (p_)
    ldns_pkt_free(p_);
}

Resolver::Resolver()
{
  auto status = ldns_resolver_new_frm_file(&res_, nullptr);
  CHECK_EQ(status, LDNS_STATUS_OK) << "failed to initialize DNS resolver: "
                                   << ldns_get_errorstr_by_id(status);

  // One try per nameserver, the deadline is spread over them.
  ldns_resolver_set_retry(res_, 1);
  default_timeout_ = ldns_resolver_timeout(res_);
}

Resolver::~Resolver() { ldns_resolver_deep_free(res_); }

ldns_pkt* Resolver::query_(DNS::Context const& ctx,
                           DNS::RR_type        type,
                           std::string const&  name)
{
  DNS::check_context(ctx);

  Domain dom(name);

  ldns_pkt* p{nullptr};
  {
    std::lock_guard<std::mutex> lock(mtx_);

    DNS::check_context(ctx); // may have waited for the lock

    // Set every time, the last caller may have left a short one behind.
    ldns_resolver_set_timeout(
        res_, query_timeout(ctx.remaining(), default_timeout_,
                            ldns_resolver_nameserver_count(res_)));

    auto const status = ldns_resolver_query_status(
        &p, res_, dom.get(), static_cast<ldns_rr_type>(type),
        LDNS_RR_CLASS_IN, LDNS_RD);

    if (status != LDNS_STATUS_OK) {
      // If we have only one nameserver, reset the RTT otherwise all
      // future use of this resolver object will fail.
      ldns_resolver_set_nameserver_rtt(res_, 0, LDNS_RESOLV_RTT_MIN);

      if (p)
        ldns_pkt_free(p);
      throw DNS::lookup_error(
          fmt::format("{} lookup for {} failed: {}",
                      DNS::RR_type_c_str(type), name,
                      ldns_get_errorstr_by_id(status)),
          true);
    }
  }

  auto const rcode = ldns_pkt_get_rcode(p);
  if (rcode != LDNS_RCODE_NOERROR) {
    ldns_pkt_free(p);
    throw DNS::lookup_error(fmt::format("{} lookup for {} failed: {}",
                                        DNS::RR_type_c_str(type), name,
                                        DNS::rcode_c_str(rcode)),
                            is_temporary_rcode(rcode));
  }

  return p;
}

std::vector<DNS::RR_MX> Resolver::lookup_mx(DNS::Context const& ctx,
                                            std::string const&  domain)
{
  Query q(query_(ctx, DNS::RR_type::MX, domain));

  std::vector<DNS::RR_MX> mxs;
  for_each_answer(q.get(), DNS::RR_type::MX, [&mxs](ldns_rr const* rr) {
    CHECK_EQ(ldns_rr_rd_count(rr), 2);
    auto const rdf_0 = ldns_rr_rdf(rr, 0);
    auto const rdf_1 = ldns_rr_rdf(rr, 1);
    mxs.emplace_back(rr_name_str(rdf_1), ldns_rdf2native_int16(rdf_0));
  });

  return mxs;
}

std::vector<std::string>
Resolver::lookup_addresses(DNS::Context const& ctx, std::string const& hostname)
{
  // Like getaddrinfo(), an address is its own answer.
  if (IP::is_address(hostname))
    return {hostname};

  std::vector<std::string> addrs;

  Query q4(query_(ctx, DNS::RR_type::A, hostname));
  for_each_answer(q4.get(), DNS::RR_type::A, [&addrs](ldns_rr const* rr) {
    addrs.emplace_back(addr_str(ldns_rr_rdf(rr, 0), AF_INET));
  });

  Query q6(query_(ctx, DNS::RR_type::AAAA, hostname));
  for_each_answer(q6.get(), DNS::RR_type::AAAA, [&addrs](ldns_rr const* rr) {
    addrs.emplace_back(addr_str(ldns_rr_rdf(rr, 0), AF_INET6));
  });

  return addrs;
}

std::vector<std::string> Resolver::lookup_ptr(DNS::Context const& ctx,
                                              std::string const&  name)
{
  Query q(query_(ctx, DNS::RR_type::PTR, name));

  std::vector<std::string> ptrs;
  for_each_answer(q.get(), DNS::RR_type::PTR, [&ptrs](ldns_rr const* rr) {
    ptrs.emplace_back(rr_name_str(ldns_rr_rdf(rr, 0)));
  });

  return ptrs;
}

} // namespace DNS_ldns
