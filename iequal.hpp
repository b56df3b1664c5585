#ifndef IEQUAL_DOT_HPP
#define IEQUAL_DOT_HPP

#include <algorithm>
#include <cctype>
#include <string_view>

// Like boost, but ASCII only.  Only C locale required.

inline bool iequal_char(char a, char b)
{
  return std::toupper(static_cast<unsigned char>(a)) ==
         std::toupper(static_cast<unsigned char>(b));
}

inline bool iequal(std::string_view a, std::string_view b)
{
  return (size(a) == size(b)) &&
         std::equal(begin(b), end(b), begin(a), iequal_char);
}

// DNS names compare equal with or without the root label.
inline bool iequal_dns(std::string_view a, std::string_view b)
{
  if (!a.empty() && a.back() == '.')
    a.remove_suffix(1);
  if (!b.empty() && b.back() == '.')
    b.remove_suffix(1);
  return iequal(a, b);
}

#endif // IEQUAL_DOT_HPP
