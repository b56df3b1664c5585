#include "SMTP-error.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  SMTP::Enhanced_code const ec{5, 7, 25};
  CHECK_EQ(ec.str(), "5.7.25");
  CHECK_EQ(fmt::format("{}", ec), "5.7.25");
  CHECK(ec == (SMTP::Enhanced_code{5, 7, 25}));
  CHECK(!(ec == (SMTP::Enhanced_code{4, 7, 25})));

  auto const err = SMTP::Error(550, ec, "rDNS name does not match")
                       .with_check_name("require_matching_rdns");

  CHECK_EQ(err.code(), 550);
  CHECK(err.enhanced_code() == ec);
  CHECK_EQ(err.message(), "rDNS name does not match");
  CHECK_EQ(err.check_name(), "require_matching_rdns");
  CHECK(err.permanent());
  CHECK(!err.temporary());
  CHECK(err.next() == nullptr);
  CHECK(!err.cause());

  CHECK_EQ(err.reply(), "550 5.7.25 rDNS name does not match");

  // with_*() leaves the original alone
  auto const tagged = err.with_field("reason", "timeout");
  CHECK(err.fields().empty());
  CHECK_EQ(tagged.fields().at("reason"), "timeout");

  // Wrapping an SMTP::Error keeps it reachable both ways.
  auto const outer
      = SMTP::Error(554, {5, 7, 0}, "go away").with_cause(tagged);
  CHECK(outer.next() != nullptr);
  CHECK_EQ(outer.next()->code(), 550);
  CHECK_EQ(outer.next()->fields().at("reason"), "timeout");
  CHECK(outer.cause());
  try {
    std::rethrow_exception(outer.cause());
  }
  catch (SMTP::Error const& e) {
    CHECK_EQ(e.check_name(), "require_matching_rdns");
  }

  // An exception_ptr holding an SMTP::Error is recognized as one.
  auto const outer2 = SMTP::Error(421, {4, 3, 0}, "later")
                          .with_cause(std::make_exception_ptr(err));
  CHECK(outer2.next() != nullptr);
  CHECK_EQ(outer2.next()->check_name(), "require_matching_rdns");

  // A foreign cause is only reachable through cause().
  auto const foreign
      = SMTP::Error(420, {4, 7, 27}, "DNS lookup failure")
            .with_cause(std::make_exception_ptr(std::runtime_error("SERVFAIL")));
  CHECK(foreign.next() == nullptr);
  CHECK_EQ(SMTP::what(foreign.cause()), "SERVFAIL");

  // Walk the whole chain.
  auto const top = SMTP::Error(451, {4, 0, 0}, "top").with_cause(foreign);
  std::vector<int> codes;
  auto const last = SMTP::for_each_cause(
      top, [&codes](SMTP::Error const& e) { codes.push_back(e.code()); });
  CHECK_EQ(codes.size(), 2u);
  CHECK_EQ(codes[0], 451);
  CHECK_EQ(codes[1], 420);
  CHECK_EQ(SMTP::what(last), "SERVFAIL");

  std::ostringstream os;
  os << top;
  CHECK_EQ(os.str(), "451 4.0.0 top: caused by: 420 4.7.27 DNS lookup failure"
                     ": caused by: SERVFAIL");

  std::ostringstream os2;
  os2 << tagged.with_reason("reject directive used");
  CHECK_EQ(os2.str(), "550 5.7.25 rDNS name does not match "
                      "[check=require_matching_rdns] (reject directive used) "
                      "reason=\"timeout\"");
}
