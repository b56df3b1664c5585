// Run the client identity checks against live DNS for one connection and
// one MAIL FROM, the way the SMTP server would, and print the verdicts.

#include "Check-dns.hpp"
#include "Check-registry.hpp"
#include "DNS-ldns.hpp"
#include "DNS-rdns.hpp"
#include "IP.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include <boost/tokenizer.hpp>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_string(ip, "", "client IP address, empty for a non-TCP/IP client");
DEFINE_string(ehlo, "", "HELO/EHLO argument sent by the client");
DEFINE_string(mail_from, "", "MAIL FROM reverse-path, empty for a bounce");
DEFINE_string(rdns, "", "client rDNS name, if already known");
DEFINE_bool(unix_socket, false, "client connected over a UNIX-domain socket");
DEFINE_bool(resolve_rdns, false, "look up the rDNS name of --ip");
DEFINE_uint64(timeout_ms, 10'000, "deadline for all DNS lookups");

DEFINE_string(require_matching_rdns,
              "quarantine",
              "action if the rDNS name does not match HELO/EHLO");
DEFINE_string(require_matching_ehlo,
              "quarantine",
              "action if HELO/EHLO does not resolve to the client address");
DEFINE_string(require_mx_record,
              "quarantine",
              "action if the MAIL FROM domain has no MX record");

namespace {
// reject 550 5.7.1 "Go away"  ->  {reject, 550, 5.7.1, Go away}
std::vector<std::string> split_directive(std::string const& directive)
{
  using separator = boost::escaped_list_separator<char>;

  boost::tokenizer<separator> tok(directive, separator('\\', ' ', '"'));

  std::vector<std::string> args;
  for (auto const& arg : tok) {
    if (!arg.empty())
      args.push_back(arg);
  }
  return args;
}

void configure(Check::Registry& reg)
{
  struct {
    char const*        name;
    std::string const& directive;
  } const directives[]{
      {Check::rdns_check_name, FLAGS_require_matching_rdns},
      {Check::ehlo_check_name, FLAGS_require_matching_ehlo},
      {Check::mx_check_name, FLAGS_require_mx_record},
  };

  for (auto const& d : directives) {
    auto const args = split_directive(d.directive);
    reg.configure(d.name, args);
  }
}

bool report(std::vector<std::pair<std::string, Check::Result>> const& results)
{
  auto rejected = false;
  for (auto const& [name, res] : results) {
    std::cout << name << ": ";
    if (res.passed()) {
      std::cout << "pass\n";
      continue;
    }
    std::cout << res.reason->reply() << " ("
              << Check::disposition_c_str(res.disposition()) << ")\n";
    LOG(INFO) << name << ": " << *res.reason;
    rejected = rejected || res.reject;
  }
  return rejected;
}
} // namespace

int main(int argc, char* argv[])
{
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  auto reg = Check::Registry::builtin();
  try {
    configure(reg);
  }
  catch (Check::config_error const& e) {
    LOG(ERROR) << "bad configuration (" << Check::errc_c_str(e.code())
               << "): " << e.what();
    return 2;
  }

  if (FLAGS_unix_socket && !FLAGS_ip.empty()) {
    LOG(ERROR) << "--ip and --unix_socket are mutually exclusive";
    return 2;
  }
  if (!FLAGS_ip.empty() && !IP::is_address(FLAGS_ip)) {
    LOG(ERROR) << "--ip " << FLAGS_ip << " is not an IP address";
    return 2;
  }

  DNS_ldns::Resolver res;
  DNS::Context ctx{std::chrono::milliseconds{FLAGS_timeout_ms}};

  Conn_meta conn;
  if (!FLAGS_ip.empty())
    conn.src_addr = FLAGS_ip;
  conn.src_hostname = FLAGS_ehlo;
  if (!FLAGS_rdns.empty()) {
    conn.src_rdns = RDNS::resolved{FLAGS_rdns};
  }
  else if (FLAGS_resolve_rdns && conn.is_ip()) {
    conn.src_rdns = DNS::resolve_rdns(ctx, res, *conn.src_addr);
  }

  auto const in = Check::Input{conn, res, ctx, FLAGS_mail_from};

  auto rejected = report(reg.run_all(Check::stage::connection, in));
  rejected      = report(reg.run_all(Check::stage::sender, in)) || rejected;

  return rejected ? 1 : 0;
}
