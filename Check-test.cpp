#include "Check.hpp"

#include <string>
#include <vector>

#include <glog/logging.h>

using namespace std::string_literals;

namespace {
// Returns the errc thrown by f, CHECK fails if nothing is thrown.
template <typename F>
Check::errc config_errc(F f)
{
  try {
    f();
  }
  catch (Check::config_error const& e) {
    LOG(INFO) << "expected: " << e.what();
    return e.code();
  }
  LOG(FATAL) << "no config_error thrown";
}

Check::errc reject_errc(std::vector<std::string> const& args)
{
  return config_errc([&args] { Check::parse_reject_directive(args); });
}

Check::errc action_errc(std::vector<std::string> const& args)
{
  return config_errc([&args] { Check::parse_action_directive(args); });
}

void test_enhanced_code()
{
  using Check::parse_enhanced_code;

  CHECK(parse_enhanced_code("5.7.1") == (SMTP::Enhanced_code{5, 7, 1}));
  CHECK(parse_enhanced_code("4.7.27") == (SMTP::Enhanced_code{4, 7, 27}));

  // No semantic checks at this level.
  CHECK(parse_enhanced_code("2.0.0") == (SMTP::Enhanced_code{2, 0, 0}));

  for (auto bad : {"5.7", "a.b.c", "", "5", "5.7.1.2", "5..1", "5.7.", ".7.1",
                   "5.-7.1", "5.7.x", "5.7.1 "}) {
    CHECK(config_errc([bad] { parse_enhanced_code(bad); })
          == Check::errc::format)
        << bad;
  }
}

void test_reject_directive()
{
  auto const dflt = Check::parse_reject_directive({});
  CHECK_EQ(dflt.code(), 554);
  CHECK(dflt.enhanced_code() == (SMTP::Enhanced_code{5, 7, 0}));
  CHECK_EQ(dflt.message(), "Message rejected due to a local policy");
  CHECK_EQ(dflt.reason(), "reject directive used");

  std::vector<std::string> const one{"450"};
  auto const r1 = Check::parse_reject_directive(one);
  CHECK_EQ(r1.code(), 450);
  CHECK(r1.enhanced_code() == (SMTP::Enhanced_code{5, 7, 0}));
  CHECK_EQ(r1.message(), "Message rejected due to a local policy");

  std::vector<std::string> const two{"451", "4.7.1"};
  auto const r2 = Check::parse_reject_directive(two);
  CHECK_EQ(r2.code(), 451);
  CHECK(r2.enhanced_code() == (SMTP::Enhanced_code{4, 7, 1}));
  CHECK_EQ(r2.message(), "Message rejected due to a local policy");

  std::vector<std::string> const three{"550", "5.7.1", "Go away"};
  auto const r3 = Check::parse_reject_directive(three);
  CHECK_EQ(r3.code(), 550);
  CHECK(r3.enhanced_code() == (SMTP::Enhanced_code{5, 7, 1}));
  CHECK_EQ(r3.message(), "Go away");
  CHECK_EQ(r3.reason(), "reject directive used");

  CHECK(reject_errc({"550", "5.7.1", "msg", "extra"})
        == Check::errc::arg_count);

  for (auto bad : {"250", "354", "600", "99", "0", "4", "5000", "-450", "abc",
                   "", "550x"}) {
    CHECK(reject_errc({bad}) == Check::errc::invalid_code) << bad;
  }

  CHECK(reject_errc({"550", "2.0.0"}) == Check::errc::invalid_enhanced_code);
  CHECK(reject_errc({"550", "6.7.1"}) == Check::errc::invalid_enhanced_code);
  CHECK(reject_errc({"550", "5.7"}) == Check::errc::format);
  CHECK(reject_errc({"550", "5.7.1", ""}) == Check::errc::empty_message);

  // Every argument up to the last one given is checked.
  CHECK(reject_errc({"250", "5.7.1", "msg"}) == Check::errc::invalid_code);
  CHECK(reject_errc({"550", "x", "msg"}) == Check::errc::format);
}

void test_action_directive()
{
  CHECK(action_errc({}) == Check::errc::no_arguments);
  CHECK(action_errc({"bounce"}) == Check::errc::invalid_action);
  CHECK(action_errc({"Reject"}) == Check::errc::invalid_action);
  CHECK(action_errc({"ignore", "550"}) == Check::errc::arg_count);
  CHECK(action_errc({"reject", "250"}) == Check::errc::invalid_code);
  CHECK(action_errc({"quarantine", "550", "5.7.1", "a", "b"})
        == Check::errc::arg_count);

  std::vector<std::string> const reject{"reject"};
  auto const a1 = Check::parse_action_directive(reject);
  CHECK(a1.reject);
  CHECK(!a1.quarantine);
  CHECK(!a1.reason_override);

  std::vector<std::string> const quarantine{"quarantine"};
  auto const a2 = Check::parse_action_directive(quarantine);
  CHECK(!a2.reject);
  CHECK(a2.quarantine);
  CHECK(!a2.reason_override);

  std::vector<std::string> const ignore{"ignore"};
  auto const a3 = Check::parse_action_directive(ignore);
  CHECK(!a3.reject);
  CHECK(!a3.quarantine);
  CHECK(!a3.reason_override);

  std::vector<std::string> const custom{"reject", "550", "5.7.1",
                                        "No thanks"};
  auto const a4 = Check::parse_action_directive(custom);
  CHECK(a4.reject);
  CHECK(a4.reason_override);
  CHECK_EQ(a4.reason_override->code(), 550);
  CHECK_EQ(a4.reason_override->message(), "No thanks");

  std::vector<std::string> const quarantine_code{"quarantine", "451"};
  auto const a5 = Check::parse_action_directive(quarantine_code);
  CHECK(a5.quarantine);
  CHECK_EQ(a5.reason_override->code(), 451);
}

void test_apply()
{
  auto const raw_reason = SMTP::Error(550, {5, 7, 25}, "rDNS mismatch")
                              .with_check_name("require_matching_rdns")
                              .with_field("reason", "some detail");

  std::vector<Check::Fail_action> actions;
  actions.push_back(Check::Fail_action{});
  actions.push_back(Check::Fail_action{.quarantine = true});
  actions.push_back(Check::Fail_action{.reject = true});
  actions.push_back(Check::Fail_action{
      .reject = true, .reason_override = Check::parse_reject_directive({})});

  for (auto const& action : actions) {
    // A pass stays a pass, whatever the action.
    for (auto q : {false, true}) {
      for (auto r : {false, true}) {
        auto const res = action.apply(Check::Result{{}, q, r});
        CHECK(res.passed());
        CHECK_EQ(res.quarantine, q);
        CHECK_EQ(res.reject, r);
      }
    }

    // Flags only ever go up.
    for (auto q : {false, true}) {
      for (auto r : {false, true}) {
        auto const res = action.apply(Check::Result{raw_reason, q, r});
        CHECK(!res.passed());
        CHECK_EQ(res.quarantine, q || action.quarantine);
        CHECK_EQ(res.reject, r || action.reject);
      }
    }
  }

  // No override: the reason is untouched.
  auto const plain = Check::Fail_action{.quarantine = true}.apply(
      Check::Result{raw_reason});
  CHECK_EQ(plain.reason->code(), 550);
  CHECK_EQ(plain.reason->check_name(), "require_matching_rdns");
  CHECK(plain.reason->next() == nullptr);
  CHECK(plain.disposition() == Check::Result::disposition_t::quarantine);

  // Override: the outside changes, the original is the cause.
  std::vector<std::string> const args{"reject", "554", "5.7.1", "Rejected"};
  auto const action  = Check::parse_action_directive(args);
  auto const wrapped = action.apply(Check::Result{raw_reason});

  CHECK(wrapped.reject);
  CHECK(wrapped.disposition() == Check::Result::disposition_t::reject);
  CHECK_EQ(wrapped.reason->code(), 554);
  CHECK(wrapped.reason->enhanced_code() == (SMTP::Enhanced_code{5, 7, 1}));
  CHECK_EQ(wrapped.reason->message(), "Rejected");
  CHECK_EQ(wrapped.reason->reply(), "554 5.7.1 Rejected");

  auto const inner = wrapped.reason->next();
  CHECK(inner != nullptr);
  CHECK_EQ(inner->code(), 550);
  CHECK(inner->enhanced_code() == (SMTP::Enhanced_code{5, 7, 25}));
  CHECK_EQ(inner->message(), "rDNS mismatch");
  CHECK_EQ(inner->check_name(), "require_matching_rdns");
  CHECK_EQ(inner->fields().at("reason"), "some detail");
  CHECK(inner->next() == nullptr);

  // Wrapping an already wrapped result keeps the whole chain.
  auto const twice = action.apply(wrapped);
  CHECK_EQ(twice.reason->next()->next()->message(), "rDNS mismatch");

  // log only
  auto const logged = Check::Fail_action{}.apply(Check::Result{raw_reason});
  CHECK(logged.disposition() == Check::Result::disposition_t::log_only);

  // Both flags may end up set, reject wins.
  auto const both = Check::Fail_action{.reject = true}.apply(
      Check::Result{raw_reason, true, false});
  CHECK(both.quarantine);
  CHECK(both.reject);
  CHECK(both.disposition() == Check::Result::disposition_t::reject);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  test_enhanced_code();
  test_reject_directive();
  test_action_directive();
  test_apply();
}
