#include "Mailbox.hpp"

#include <stdexcept>

#include <glog/logging.h>

namespace {
bool splits(char const* mailbox)
{
  try {
    Mailbox{mailbox};
  }
  catch (std::invalid_argument const& e) {
    LOG(INFO) << e.what();
    return false;
  }
  return true;
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Mailbox mb;
  CHECK(mb.local_part().empty());
  CHECK(mb.domain().empty());

  Mailbox dg0{"gene@digilicious.com"};
  CHECK_EQ(dg0.local_part(), "gene");
  CHECK_EQ(dg0.domain(), "digilicious.com");

  // RFC 5321 section 4.5.1
  Mailbox pm{"PostMaster"};
  CHECK_EQ(pm.local_part(), "PostMaster");
  CHECK(pm.domain().empty());

  Mailbox lit{"gene@[127.0.0.1]"};
  CHECK_EQ(lit.domain(), "[127.0.0.1]");

  // Split at the last "@", whatever comes before it.
  Mailbox many{"A@b@c@example.com"};
  CHECK_EQ(many.local_part(), "A@b@c");
  CHECK_EQ(many.domain(), "example.com");

  Mailbox quoted{"\"john@doe\"@example.org"};
  CHECK_EQ(quoted.local_part(), "\"john@doe\"");
  CHECK_EQ(quoted.domain(), "example.org");

  // The domain is left for DNS to judge.
  Mailbox odd{"allen@bad_d0main.com"};
  CHECK_EQ(odd.domain(), "bad_d0main.com");

  CHECK(splits("user%example.com@example.org"));
  CHECK(splits("\" \"@example.org"));
  CHECK(splits("should not throw@example.com"));

  CHECK(!splits(""));
  CHECK(!splits("Abc.example.com"));
  CHECK(!splits("2962"));
  CHECK(!splits("postmaster@"));
  CHECK(!splits("@example.com"));
  CHECK(!splits("user@"));

  auto threw = false;
  try {
    Mailbox bad("not an address");
  }
  catch (std::invalid_argument const& e) {
    CHECK_EQ(std::string{e.what()},
             "missing \"@\" in mailbox \"not an address\"");
    threw = true;
  }
  CHECK(threw);
}
