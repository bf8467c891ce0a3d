#include "Sock.hpp"

#include <string>

#include <sys/resource.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const lsn = socket(AF_INET, SOCK_STREAM, 0);
  PCHECK(lsn >= 0);
  sockaddr_in sin{};
  sin.sin_family      = AF_INET;
  sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  socklen_t len       = sizeof sin;
  PCHECK(bind(lsn, reinterpret_cast<sockaddr*>(&sin), len) == 0);
  PCHECK(listen(lsn, 1) == 0);
  PCHECK(getsockname(lsn, reinterpret_cast<sockaddr*>(&sin), &len) == 0);
  auto const port = ntohs(sin.sin_port);

  auto t_o = false;

  // Not addresses.
  CHECK(!Sock::connect("mx.example.com", port, 1s, t_o));
  CHECK(!t_o);
  CHECK(!Sock::connect("999.1.1.1", port, 1s, t_o));

  auto sock = Sock::connect("127.0.0.1", port, 1s, t_o);
  CHECK(sock);
  CHECK_EQ(std::string(sock->them_c_str()), "127.0.0.1");
  CHECK_EQ(std::string(sock->us_c_str()), "127.0.0.1");

  auto const peer = accept(lsn, nullptr, nullptr);
  PCHECK(peer >= 0);

  sock->log_data_on();
  CHECK(sock->write("HELO example.com\r\n"));

  char buf[64];
  auto const n = ::read(peer, buf, sizeof buf);
  CHECK_EQ(std::string(buf, n), "HELO example.com\r\n");

  t_o = false;
  CHECK_EQ(sock->read(buf, sizeof buf, 50ms, t_o), -1);
  CHECK(t_o);

  PCHECK(::write(peer, "250 hi\r\n", 8) == 8);
  t_o = false;
  CHECK_EQ(sock->read(buf, sizeof buf, 1s, t_o), 8);
  CHECK(!t_o);

  close(peer);
  CHECK_EQ(sock->read(buf, sizeof buf, 1s, t_o), 0);

  sock.reset();

  // Out of descriptors is a failed connect, not a crash.
  auto const next_fd = dup(0);
  PCHECK(next_fd >= 0);
  close(next_fd);
  rlimit lim;
  PCHECK(getrlimit(RLIMIT_NOFILE, &lim) == 0);
  auto const saved = lim;
  lim.rlim_cur     = next_fd;
  PCHECK(setrlimit(RLIMIT_NOFILE, &lim) == 0);
  t_o = false;
  CHECK(!Sock::connect("127.0.0.1", port, 1s, t_o));
  CHECK(!t_o);
  PCHECK(setrlimit(RLIMIT_NOFILE, &saved) == 0);

  close(lsn);
}
