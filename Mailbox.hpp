#ifndef MAILBOX_DOT_HPP
#define MAILBOX_DOT_HPP

#include <string>
#include <string_view>

// The reverse-path from MAIL FROM, split into local part and domain at the
// last "@". Nothing else about the syntax is checked, the domain is only
// looked up. The special address "postmaster" (any case) is accepted with
// an empty domain.

class Mailbox {
public:
  Mailbox() = default;

  // Throws std::invalid_argument if there is no "@" or either side of the
  // last one is empty.
  explicit Mailbox(std::string_view mailbox);

  std::string const& local_part() const { return local_part_; }
  std::string const& domain() const { return domain_; }

private:
  std::string local_part_;
  std::string domain_;
};

#endif // MAILBOX_DOT_HPP
