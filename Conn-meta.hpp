#ifndef CONN_META_DOT_HPP
#define CONN_META_DOT_HPP

#include <optional>
#include <string>
#include <variant>

// Reverse DNS name of the client, resolved (or not) by the session before
// any check runs.

namespace RDNS {
struct not_attempted {
};

struct resolved {
  std::string name;
};

struct failed {
  std::string what;
};

using result = std::variant<not_attempted, resolved, failed>;
} // namespace RDNS

// What we know about the client side of a connection.

struct Conn_meta {
  // Client IP address, without brackets. Empty when the transport is not
  // TCP/IP (UNIX domain socket, pipe, ...).
  std::optional<std::string> src_addr;

  // The HELO/EHLO argument.
  std::string src_hostname;

  RDNS::result src_rdns;

  bool is_ip() const { return src_addr.has_value(); }
};

#endif // CONN_META_DOT_HPP
