#ifndef DNS_RRS_DOT_HPP
#define DNS_RRS_DOT_HPP

#include <cstdint>
#include <string>

namespace DNS {

enum class RR_type : uint16_t {
  // RFC 1035 section 3.2.2 “TYPE values”
  A   = 1,
  PTR = 12,
  MX  = 15,

  // RFC 3596 section 2.1 “AAAA record type”
  AAAA = 28,
};

constexpr char const* RR_type_c_str(RR_type type)
{
  switch (type) { // clang-format off
  case RR_type::A:    return "A";
  case RR_type::PTR:  return "PTR";
  case RR_type::MX:   return "MX";
  case RR_type::AAAA: return "AAAA";
  } // clang-format on
  return "*** unknown RR_type ***";
}

constexpr char const* rcode_c_str(uint16_t rcode)
{
  // https://www.iana.org/assignments/dns-parameters/dns-parameters.xhtml#dns-parameters-6
  switch (rcode) { // clang-format off
  case 0:  return "no error";                           // [RFC1035]
  case 1:  return "format error";                       // [RFC1035]
  case 2:  return "server failure";                     // [RFC1035]
  case 3:  return "non-existent domain";                // [RFC1035]
  case 4:  return "not implemented";                    // [RFC1035]
  case 5:  return "query refused";                      // [RFC1035]
  } // clang-format on
  return "*** unexpected rcode ***";
}

class RR_MX {
public:
  RR_MX(std::string exchange, uint16_t preference)
    : exchange_(exchange)
    , preference_(preference)
  {
  }

  std::string const& exchange() const { return exchange_; }
  uint16_t           preference() const { return preference_; }

private:
  std::string exchange_;
  uint16_t    preference_;
};

} // namespace DNS

#endif // DNS_RRS_DOT_HPP
