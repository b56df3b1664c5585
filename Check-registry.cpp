#include "Check-registry.hpp"

#include "Check-dns.hpp"

#include <algorithm>

#include <glog/logging.h>

#include <fmt/format.h>

namespace Check {

Registry Registry::builtin()
{
  auto const quarantine = Fail_action{.quarantine = true};

  Registry reg;

  reg.add(
      rdns_check_name, stage::connection,
      [](Input const& in) { return require_matching_rdns(in.conn); },
      quarantine);

  reg.add(
      ehlo_check_name, stage::connection,
      [](Input const& in) {
        return require_matching_ehlo(in.conn, in.resolver, in.ctx);
      },
      quarantine);

  reg.add(
      mx_check_name, stage::sender,
      [](Input const& in) {
        return require_mx_record(in.conn, in.resolver, in.ctx, in.mail_from);
      },
      quarantine);

  return reg;
}

void Registry::add(std::string name,
                   stage       when,
                   validator   fn,
                   Fail_action action)
{
  CHECK(find(name) == nullptr) << "check " << name << " added twice";
  CHECK(fn) << "no validator for check " << name;
  entries_.push_back(
      Entry{std::move(name), when, std::move(fn), std::move(action)});
}

void Registry::configure(std::string_view             name,
                         std::span<std::string const> args)
{
  auto const entry =
      std::find_if(begin(entries_), end(entries_),
                   [name](Entry const& e) { return e.name == name; });
  if (entry == end(entries_)) {
    throw config_error(errc::unknown_check,
                       fmt::format("unknown check \"{}\"", name));
  }
  entry->action = parse_action_directive(args);
}

Registry::Entry const* Registry::find(std::string_view name) const
{
  auto const entry =
      std::find_if(begin(entries_), end(entries_),
                   [name](Entry const& e) { return e.name == name; });
  return (entry == end(entries_)) ? nullptr : &*entry;
}

Result Registry::run(Entry const& entry, Input const& in)
{
  auto res = entry.action.apply(entry.fn(in));
  if (!res.passed()) {
    LOG(INFO) << entry.name << ": " << *res.reason << " -> "
              << disposition_c_str(res.disposition());
  }
  return res;
}

std::vector<std::pair<std::string, Result>>
Registry::run_all(stage when, Input const& in) const
{
  VLOG(1) << "running " << stage_c_str(when) << " checks";

  std::vector<std::pair<std::string, Result>> results;
  for (auto const& entry : entries_) {
    if (entry.when == when) {
      results.emplace_back(entry.name, run(entry, in));
    }
  }
  return results;
}

} // namespace Check
