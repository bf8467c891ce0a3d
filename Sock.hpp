#ifndef SOCK_DOT_HPP
#define SOCK_DOT_HPP

#include <chrono>
#include <cstdint>
#include <ios>
#include <memory>
#include <string>
#include <string_view>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace Config {
constexpr auto write_timeout_default = std::chrono::seconds(30);
} // namespace Config

// An outbound TCP connection, owning its descriptor.

union sockaddrs {
  sockaddr     addr;
  sockaddr_in  addr_in;
  sockaddr_in6 addr_in6;
};

class Sock {
public:
  Sock(const Sock&) = delete;
  Sock& operator=(const Sock&) = delete;

  explicit Sock(int fd);
  ~Sock();

  // Connect to a numeric IPv4 or IPv6 address.  Returns nullptr on any
  // failure, with t_o set if it was the timeout.
  static std::unique_ptr<Sock> connect(std::string const&        addr,
                                       uint16_t                  port,
                                       std::chrono::milliseconds timeout,
                                       bool&                     t_o);

  char const* us_c_str() const { return us_addr_str_; }
  char const* them_c_str() const { return them_addr_str_; }

  // -1 on error or time out (t_o set), 0 on end of file.
  std::streamsize
  read(char* s, std::streamsize n, std::chrono::milliseconds timeout, bool& t_o);

  bool write(std::string_view data,
             std::chrono::milliseconds timeout = Config::write_timeout_default);

  void log_data_on() { log_data_ = true; }

private:
  int fd_;

  socklen_t us_addr_len_{sizeof us_addr_};
  socklen_t them_addr_len_{sizeof them_addr_};

  sockaddrs us_addr_{};
  sockaddrs them_addr_{};

  char us_addr_str_[INET6_ADDRSTRLEN]{'\0'};
  char them_addr_str_[INET6_ADDRSTRLEN]{'\0'};

  bool log_data_{false};
};

#endif // SOCK_DOT_HPP
