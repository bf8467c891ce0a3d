#include "Sock.hpp"

#include "POSIX.hpp"

#include <cerrno>

#include <sys/socket.h>

#include <glog/logging.h>

namespace {
bool is_ipv4_mapped_ipv6_addresses(in6_addr const& sa)
{
  // clang-format off
  return sa.s6_addr[0] == 0 &&
         sa.s6_addr[1] == 0 &&
         sa.s6_addr[2] == 0 &&
         sa.s6_addr[3] == 0 &&
         sa.s6_addr[4] == 0 &&
         sa.s6_addr[5] == 0 &&
         sa.s6_addr[6] == 0 &&
         sa.s6_addr[7] == 0 &&
         sa.s6_addr[8] == 0 &&
         sa.s6_addr[9] == 0 &&
         sa.s6_addr[10] == 0xff &&
         sa.s6_addr[11] == 0xff;
  // clang-format on
}

void addr_str(sockaddrs const& addr, socklen_t len, char* str, size_t sz)
{
  switch (len) {
  case sizeof(sockaddr_in):
    PCHECK(inet_ntop(AF_INET, &addr.addr_in.sin_addr, str, sz) != nullptr);
    break;

  case sizeof(sockaddr_in6):
    if (is_ipv4_mapped_ipv6_addresses(addr.addr_in6.sin6_addr)) {
      PCHECK(inet_ntop(AF_INET, &addr.addr_in6.sin6_addr.s6_addr[12], str, sz)
             != nullptr);
    }
    else {
      PCHECK(inet_ntop(AF_INET6, &addr.addr_in6.sin6_addr, str, sz)
             != nullptr);
    }
    break;

  default:
    LOG(WARNING) << "bogus address length (" << len << ")";
    break;
  }
}
} // namespace

Sock::Sock(int fd)
  : fd_(fd)
{
  CHECK_GE(fd_, 0);

  // Get our local IP address as "us".

  if (-1 == getsockname(fd_, &us_addr_.addr, &us_addr_len_)) {
    PLOG(WARNING) << "getsockname failed";
  }
  else {
    addr_str(us_addr_, us_addr_len_, us_addr_str_, sizeof us_addr_str_);
  }

  // Get the remote IP address as "them".

  if (-1 == getpeername(fd_, &them_addr_.addr, &them_addr_len_)) {
    PLOG(WARNING) << "getpeername failed";
  }
  else {
    addr_str(them_addr_, them_addr_len_, them_addr_str_,
             sizeof them_addr_str_);
  }
}

Sock::~Sock()
{
  if (::close(fd_) == -1) {
    PLOG(WARNING) << "close(2) failed";
  }
}

std::unique_ptr<Sock> Sock::connect(std::string const&        addr,
                                    uint16_t                  port,
                                    std::chrono::milliseconds timeout,
                                    bool&                     t_o)
{
  t_o = false;

  auto sas{sockaddrs{}};
  socklen_t len = 0;

  if (inet_pton(AF_INET, addr.c_str(), &sas.addr_in.sin_addr) == 1) {
    sas.addr_in.sin_family = AF_INET;
    sas.addr_in.sin_port   = htons(port);
    len                    = sizeof(sas.addr_in);
  }
  else if (inet_pton(AF_INET6, addr.c_str(), &sas.addr_in6.sin6_addr) == 1) {
    sas.addr_in6.sin6_family = AF_INET6;
    sas.addr_in6.sin6_port   = htons(port);
    len                      = sizeof(sas.addr_in6);
  }
  else {
    LOG(WARNING) << "can't interpret " << addr << " as an IP address";
    return nullptr;
  }

  int const fd = socket(sas.addr.sa_family, SOCK_STREAM, 0);
  if (fd < 0) {
    PLOG(WARNING) << "socket() failed for " << addr;
    return nullptr;
  }

  if (!POSIX::connect(fd, &sas.addr, len, timeout, t_o)) {
    LOG(WARNING) << "connect failed " << addr << ":" << port;
    ::close(fd);
    return nullptr;
  }

  LOG(INFO) << "connected to " << addr << ":" << port;
  return std::make_unique<Sock>(fd);
}

std::streamsize Sock::read(char*                     s,
                           std::streamsize           n,
                           std::chrono::milliseconds timeout,
                           bool&                     t_o)
{
  auto const n_read = POSIX::read(fd_, s, n, timeout, t_o);
  if (log_data_ && (n_read > 0)) {
    LOG(INFO) << "read: " << std::string_view(s, n_read);
  }
  return n_read;
}

bool Sock::write(std::string_view data, std::chrono::milliseconds timeout)
{
  if (log_data_) {
    LOG(INFO) << "write: " << data;
  }
  auto t_o = false;
  auto const n_written
      = POSIX::write(fd_, data.data(), data.size(), timeout, t_o);
  return n_written == std::streamsize(data.size());
}
