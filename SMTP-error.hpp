#ifndef SMTP_ERROR_DOT_HPP
#define SMTP_ERROR_DOT_HPP

#include <exception>
#include <map>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace SMTP {

// RFC 3463 enhanced status code: class.subject.detail
struct Enhanced_code {
  int cls{0};
  int subject{0};
  int detail{0};

  bool operator==(Enhanced_code const& rhs) const = default;

  std::string str() const;
};

inline std::ostream& operator<<(std::ostream& os, Enhanced_code const& ec)
{
  return os << ec.cls << '.' << ec.subject << '.' << ec.detail;
}

// A reply the peer gets to see (code, enhanced code, message) plus the
// bits that only go to the log: the name of the check that produced it,
// a short tag, free-form fields and the error it wraps.
//
// Values are never modified once built; the with_*() members return a
// modified copy.

class Error : public std::runtime_error {
public:
  using fields_t = std::map<std::string, std::string>;

  Error(int code, Enhanced_code enhanced_code, std::string const& message);

  int                code() const { return code_; }
  Enhanced_code      enhanced_code() const { return enhanced_code_; }
  std::string_view   message() const { return what(); }
  std::string const& check_name() const { return check_name_; }
  std::string const& reason() const { return reason_; }
  fields_t const&    fields() const { return fields_; }

  bool temporary() const { return (code_ / 100) == 4; }
  bool permanent() const { return (code_ / 100) == 5; }

  // The wrapped error, if any, as an exception_ptr; it may or may not be
  // an SMTP::Error.
  std::exception_ptr cause() const { return cause_; }

  // The wrapped error if it is itself an SMTP::Error, else nullptr.
  Error const* next() const { return next_.get(); }

  Error with_check_name(std::string check_name) const;
  Error with_reason(std::string reason) const;
  Error with_field(std::string key, std::string value) const;
  Error with_cause(Error const& cause) const;
  Error with_cause(std::exception_ptr cause) const;

  // What goes on the wire: "550 5.7.25 rDNS name does not match ..."
  std::string reply() const;

private:
  int           code_;
  Enhanced_code enhanced_code_;

  std::string check_name_;
  std::string reason_;
  fields_t    fields_;

  std::exception_ptr           cause_;
  std::shared_ptr<Error const> next_;
};

// Text of any exception held in p.
std::string what(std::exception_ptr p);

// Call f on err and on each SMTP::Error it wraps, outermost first.
// Returns the innermost cause that is not an SMTP::Error, if any.
template <typename F>
std::exception_ptr for_each_cause(Error const& err, F f)
{
  Error const* e = &err;
  for (;;) {
    f(*e);
    if (e->next() == nullptr)
      return e->cause();
    e = e->next();
  }
}

std::ostream& operator<<(std::ostream& os, Error const& err);

} // namespace SMTP

template <>
struct fmt::formatter<SMTP::Enhanced_code> : ostream_formatter {};

template <>
struct fmt::formatter<SMTP::Error> : ostream_formatter {};

#endif // SMTP_ERROR_DOT_HPP
