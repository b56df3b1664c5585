#ifndef CHECK_DNS_DOT_HPP
#define CHECK_DNS_DOT_HPP

#include <string_view>

#include "Check.hpp"
#include "Conn-meta.hpp"
#include "DNS-lookup.hpp"

// Does the client's network identity match what it claims to be? Each
// check returns a Result with only the reason set; the caller applies the
// configured Fail_action. None of them throw on a DNS failure.

namespace Check {

constexpr auto rdns_check_name = "require_matching_rdns";
constexpr auto mx_check_name   = "require_mx_record";
constexpr auto ehlo_check_name = "require_matching_ehlo";

// The PTR name of the client address must match the HELO/EHLO name.
Result require_matching_rdns(Conn_meta const& conn);

// The domain in MAIL FROM must have at least one MX record.
Result require_mx_record(Conn_meta const&    conn,
                         DNS::Lookup&        res,
                         DNS::Context const& ctx,
                         std::string_view    mail_from);

// The HELO/EHLO name (or address literal) must match the client address.
Result require_matching_ehlo(Conn_meta const&    conn,
                             DNS::Lookup&        res,
                             DNS::Context const& ctx);

} // namespace Check

#endif // CHECK_DNS_DOT_HPP
