#ifndef CHECK_REGISTRY_DOT_HPP
#define CHECK_REGISTRY_DOT_HPP

#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "Check.hpp"
#include "Conn-meta.hpp"
#include "DNS-lookup.hpp"

namespace Check {

// When in the SMTP dialog a check can run.
enum class stage : uint8_t {
  connection, // after HELO/EHLO
  sender,     // after MAIL FROM
};

constexpr char const* stage_c_str(stage s)
{
  switch (s) { // clang-format off
  case stage::connection: return "connection";
  case stage::sender:     return "sender";
  } // clang-format on
  return "*** unknown stage ***";
}

struct Input {
  Conn_meta const&    conn;
  DNS::Lookup&        resolver;
  DNS::Context const& ctx;
  std::string_view    mail_from;
};

using validator = std::function<Result(Input const&)>;

// The set of checks this process knows about, with the action configured
// for each. Built at startup, then only read.

class Registry {
public:
  struct Entry {
    std::string name;
    stage       when;
    validator   fn;
    Fail_action action;
  };

  // require_matching_rdns, require_matching_ehlo and require_mx_record,
  // each quarantining on failure.
  static Registry builtin();

  void add(std::string name, stage when, validator fn, Fail_action action);

  // Replace the action of a check with the one the directive args describe.
  // Throws config_error.
  void configure(std::string_view name, std::span<std::string const> args);

  Entry const* find(std::string_view name) const;

  std::vector<Entry> const& entries() const { return entries_; }

  // Run the check and apply its action.
  static Result run(Entry const& entry, Input const& in);

  // Every check of the given stage, in the order they were added.
  std::vector<std::pair<std::string, Result>> run_all(stage        when,
                                                      Input const& in) const;

private:
  std::vector<Entry> entries_;
};

} // namespace Check

#endif // CHECK_REGISTRY_DOT_HPP
