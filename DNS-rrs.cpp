#include "DNS-rrs.hpp"

#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>

#include <glog/logging.h>

namespace DNS {

RR_A::RR_A(uint8_t const* rd, size_t sz)
{
  static_assert(sizeof(addr_.sin_addr) == 4);
  if (sz != sizeof(addr_.sin_addr))
    throw std::invalid_argument("bad A record length");
  addr_.sin_family = AF_INET;
  std::memcpy(&addr_.sin_addr, rd, sizeof(addr_.sin_addr));
  PCHECK(inet_ntop(AF_INET, &addr_.sin_addr, str_, sizeof str_));
}

RR_AAAA::RR_AAAA(uint8_t const* rd, size_t sz)
{
  static_assert(sizeof(addr_.sin6_addr) == 16);
  if (sz != sizeof(addr_.sin6_addr))
    throw std::invalid_argument("bad AAAA record length");
  addr_.sin6_family = AF_INET6;
  std::memcpy(&addr_.sin6_addr, rd, sizeof(addr_.sin6_addr));
  PCHECK(inet_ntop(AF_INET6, &addr_.sin6_addr, str_, sizeof str_));
}

} // namespace DNS
