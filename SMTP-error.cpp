#include "SMTP-error.hpp"

namespace SMTP {

std::string Enhanced_code::str() const
{
  return fmt::format("{}.{}.{}", cls, subject, detail);
}

Error::Error(int code, Enhanced_code enhanced_code, std::string const& message)
  : std::runtime_error(message)
  , code_(code)
  , enhanced_code_(enhanced_code)
{
}

Error Error::with_check_name(std::string check_name) const
{
  auto err{*this};
  err.check_name_ = std::move(check_name);
  return err;
}

Error Error::with_reason(std::string reason) const
{
  auto err{*this};
  err.reason_ = std::move(reason);
  return err;
}

Error Error::with_field(std::string key, std::string value) const
{
  auto err{*this};
  err.fields_[std::move(key)] = std::move(value);
  return err;
}

Error Error::with_cause(Error const& cause) const
{
  auto err{*this};
  err.next_  = std::make_shared<Error const>(cause);
  err.cause_ = std::make_exception_ptr(cause);
  return err;
}

Error Error::with_cause(std::exception_ptr cause) const
{
  auto err{*this};
  err.cause_ = cause;
  err.next_.reset();
  if (cause) {
    try {
      std::rethrow_exception(cause);
    }
    catch (Error const& e) {
      err.next_ = std::make_shared<Error const>(e);
    }
    catch (std::exception const&) {
      // foreign cause, reachable only through cause()
    }
  }
  return err;
}

std::string Error::reply() const
{
  return fmt::format("{} {} {}", code_, enhanced_code_, what());
}

std::string what(std::exception_ptr p)
{
  if (!p)
    return {};
  try {
    std::rethrow_exception(p);
  }
  catch (std::exception const& e) {
    return e.what();
  }
}

std::ostream& operator<<(std::ostream& os, Error const& err)
{
  auto const last = for_each_cause(err, [&os, &err](Error const& e) {
    if (&e != &err)
      os << ": caused by: ";
    os << e.code() << ' ' << e.enhanced_code() << ' ' << e.what();
    if (!e.check_name().empty())
      os << " [check=" << e.check_name() << ']';
    if (!e.reason().empty())
      os << " (" << e.reason() << ')';
    for (auto const& [key, value] : e.fields()) {
      os << ' ' << key << "=\"" << value << '"';
    }
  });
  if (last)
    os << ": caused by: " << what(last);
  return os;
}

} // namespace SMTP
