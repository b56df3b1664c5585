#include "Check-registry.hpp"

#include "Check-dns.hpp"
#include "DNS-fake.hpp"

#include <string>
#include <vector>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto reg = Check::Registry::builtin();

  CHECK_EQ(reg.entries().size(), 3u);
  for (auto name : {Check::rdns_check_name, Check::ehlo_check_name,
                    Check::mx_check_name}) {
    auto const entry = reg.find(name);
    CHECK(entry != nullptr) << name;
    CHECK(entry->action.quarantine) << name;
    CHECK(!entry->action.reject) << name;
  }
  CHECK(reg.find(Check::mx_check_name)->when == Check::stage::sender);
  CHECK(reg.find(Check::rdns_check_name)->when == Check::stage::connection);
  CHECK(reg.find("require_spf") == nullptr);

  // Configuration
  std::vector<std::string> const reject{"reject", "550", "5.7.1",
                                        "Who are you?"};
  reg.configure(Check::ehlo_check_name, reject);
  CHECK(reg.find(Check::ehlo_check_name)->action.reject);

  std::vector<std::string> const ignore{"ignore"};
  reg.configure(Check::mx_check_name, ignore);
  CHECK(!reg.find(Check::mx_check_name)->action.reject);
  CHECK(!reg.find(Check::mx_check_name)->action.quarantine);

  auto threw = false;
  try {
    reg.configure("require_spf", ignore);
  }
  catch (Check::config_error const& e) {
    CHECK(e.code() == Check::errc::unknown_check);
    threw = true;
  }
  CHECK(threw);

  // A bad directive leaves the previous action in place.
  threw = false;
  try {
    std::vector<std::string> const bad{"reject", "250"};
    reg.configure(Check::rdns_check_name, bad);
  }
  catch (Check::config_error const& e) {
    CHECK(e.code() == Check::errc::invalid_code);
    threw = true;
  }
  CHECK(threw);
  CHECK(reg.find(Check::rdns_check_name)->action.quarantine);

  // Dispatch
  DNS::Fake_lookup res;
  res.addresses["mail.example.com"] = {"198.51.100.7"};
  res.mx["example.org"]             = {};

  DNS::Context ctx;

  auto const conn = Conn_meta{"192.0.2.1", "mail.example.com",
                              RDNS::resolved{"mail.example.com"}};

  auto const in = Check::Input{conn, res, ctx, "user@example.org"};

  auto const conn_results = reg.run_all(Check::stage::connection, in);
  CHECK_EQ(conn_results.size(), 2u);

  CHECK_EQ(conn_results[0].first, Check::rdns_check_name);
  CHECK(conn_results[0].second.passed());

  CHECK_EQ(conn_results[1].first, Check::ehlo_check_name);
  auto const& ehlo = conn_results[1].second;
  CHECK(!ehlo.passed());
  CHECK(ehlo.reject);
  CHECK_EQ(ehlo.reason->reply(), "550 5.7.1 Who are you?");
  CHECK_EQ(ehlo.reason->next()->message(),
           "No matching A/AAAA records found for EHLO hostname");

  auto const sender_results = reg.run_all(Check::stage::sender, in);
  CHECK_EQ(sender_results.size(), 1u);
  auto const& mx = sender_results[0].second;
  CHECK(!mx.passed());
  CHECK(mx.disposition() == Check::Result::disposition_t::log_only);

  // Extra checks can be registered next to the built-in ones.
  reg.add(
      "require_hostname", Check::stage::connection,
      [](Check::Input const& input) {
        if (input.conn.src_hostname.empty()) {
          return Check::Result{SMTP::Error(550, {5, 7, 0}, "no hostname")};
        }
        return Check::Result{};
      },
      Check::Fail_action{.reject = true});

  auto const anon = Conn_meta{"192.0.2.1", "", RDNS::not_attempted{}};
  auto const anon_in = Check::Input{anon, res, ctx, ""};
  auto const r = Check::Registry::run(*reg.find("require_hostname"), anon_in);
  CHECK(r.reject);
  CHECK_EQ(reg.run_all(Check::stage::connection, anon_in).size(), 3u);
}
