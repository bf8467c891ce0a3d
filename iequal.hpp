#ifndef IEQUAL_DOT_HPP
#define IEQUAL_DOT_HPP

#include <algorithm>
#include <cctype>
#include <string_view>

// ASCII only, so DNS names and CSV headers compare the same in any
// locale.

inline bool iequal_char(char a, char b)
{
  return std::tolower(static_cast<unsigned char>(a))
         == std::tolower(static_cast<unsigned char>(b));
}

inline bool iequal(std::string_view a, std::string_view b)
{
  return (size(a) == size(b))
         && std::equal(begin(b), end(b), begin(a), iequal_char);
}

#endif // IEQUAL_DOT_HPP
