#ifndef DNS_IOSTREAM_DOT_HPP
#define DNS_IOSTREAM_DOT_HPP

#include "DNS-rrs.hpp"

#include <iostream>
#include <variant>

inline std::ostream& operator<<(std::ostream& os, DNS::RR_A const& rr_a)
{
  return os << "A " << rr_a.c_str();
}

inline std::ostream& operator<<(std::ostream& os, DNS::RR_CNAME const& rr_c)
{
  return os << "CNAME " << rr_c.str();
}

inline std::ostream& operator<<(std::ostream& os, DNS::RR_MX const& rr_mx)
{
  return os << "MX " << rr_mx.preference() << ' ' << rr_mx.exchange();
}

inline std::ostream& operator<<(std::ostream& os, DNS::RR_TXT const& rr_txt)
{
  return os << "TXT " << rr_txt.str();
}

inline std::ostream& operator<<(std::ostream& os, DNS::RR_AAAA const& rr_aaaa)
{
  return os << "AAAA " << rr_aaaa.c_str();
}

inline std::ostream& operator<<(std::ostream& os, DNS::RR const& rr)
{
  std::visit([&os](auto const& r) { os << r; }, rr);
  return os;
}

inline std::ostream& operator<<(std::ostream& os, DNS::RR_type const& type)
{
  return os << DNS::RR_type_c_str(type);
}

#endif // DNS_IOSTREAM_DOT_HPP
