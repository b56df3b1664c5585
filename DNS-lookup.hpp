#ifndef DNS_LOOKUP_DOT_HPP
#define DNS_LOOKUP_DOT_HPP

#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "DNS-rrs.hpp"

namespace DNS {

// Deadline and cancellation for the lookups made on behalf of one message.
// Owned by the caller; lookups only look at it. cancel() may be called from
// any thread.

class Context {
public:
  using clock = std::chrono::steady_clock;

  Context(Context const&) = delete;
  Context& operator=(Context const&) = delete;

  Context() = default;
  explicit Context(clock::duration timeout)
    : deadline_(clock::now() + timeout)
  {
  }

  void cancel() { cancelled_.store(true, std::memory_order_release); }

  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }
  bool expired() const { return deadline_ && (clock::now() >= *deadline_); }
  bool done() const { return cancelled() || expired(); }

  // Time left before the deadline, zero once expired, empty without one.
  std::optional<std::chrono::milliseconds> remaining() const;

private:
  std::atomic<bool>                cancelled_{false};
  std::optional<clock::time_point> deadline_;
};

class lookup_error : public std::runtime_error {
public:
  lookup_error(std::string const& what, bool temporary)
    : std::runtime_error(what)
    , temporary_(temporary)
  {
  }

  // A temporary failure says nothing about whether the records exist.
  bool temporary() const { return temporary_; }

private:
  bool temporary_;
};

// Throws a temporary lookup_error if ctx is cancelled or past its deadline.
void check_context(Context const& ctx);

// What the checks need from a resolver. Every member either returns the
// records found (possibly none) or throws lookup_error.

class Lookup {
public:
  virtual ~Lookup() = default;

  virtual std::vector<RR_MX> lookup_mx(Context const&      ctx,
                                       std::string const& domain) = 0;

  // A and AAAA records, as address strings.
  virtual std::vector<std::string>
  lookup_addresses(Context const& ctx, std::string const& hostname) = 0;

  virtual std::vector<std::string> lookup_ptr(Context const&      ctx,
                                              std::string const& name) = 0;
};

} // namespace DNS

#endif // DNS_LOOKUP_DOT_HPP
