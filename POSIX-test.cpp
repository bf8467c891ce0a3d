#include "POSIX.hpp"

#include <cstring>

#include <fcntl.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/resource.h>
#include <sys/select.h>
#include <sys/socket.h>

#include <glog/logging.h>

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  int fds[2];
  PCHECK(socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
  POSIX::set_nonblocking(fds[0]);
  POSIX::set_nonblocking(fds[1]);

  CHECK(!POSIX::input_ready(fds[0], 1ms));
  CHECK(POSIX::output_ready(fds[1], 1ms));

  auto t_o = false;
  char buf[16];
  CHECK_EQ(POSIX::read(fds[0], buf, sizeof buf, 50ms, t_o), -1);
  CHECK(t_o);

  t_o = false;
  CHECK_EQ(POSIX::write(fds[1], "250 ok\r\n", 8, 1s, t_o), 8);
  CHECK(!t_o);
  CHECK(POSIX::input_ready(fds[0], 1s));
  CHECK_EQ(POSIX::read(fds[0], buf, sizeof buf, 1s, t_o), 8);
  CHECK_EQ(std::memcmp(buf, "250 ok\r\n", 8), 0);

  // A descriptor number past FD_SETSIZE, where the limit allows one.
  rlimit lim;
  PCHECK(getrlimit(RLIMIT_NOFILE, &lim) == 0);
  if (lim.rlim_max == RLIM_INFINITY || lim.rlim_max > FD_SETSIZE + 16) {
    auto const saved = lim;
    lim.rlim_cur     = FD_SETSIZE + 16;
    PCHECK(setrlimit(RLIMIT_NOFILE, &lim) == 0);
    auto const high = fcntl(fds[0], F_DUPFD, FD_SETSIZE + 8);
    PCHECK(high >= 0);
    CHECK(!POSIX::input_ready(high, 1ms));
    CHECK_EQ(POSIX::write(fds[1], "x", 1, 1s, t_o), 1);
    CHECK(POSIX::input_ready(high, 1s));
    CHECK_EQ(POSIX::read(high, buf, sizeof buf, 1s, t_o), 1);
    CHECK(POSIX::output_ready(high, 1s));
    close(high);
    PCHECK(setrlimit(RLIMIT_NOFILE, &saved) == 0);
  }

  close(fds[1]);
  CHECK_EQ(POSIX::read(fds[0], buf, sizeof buf, 1s, t_o), 0);

  // Peer gone: the write fails, no SIGPIPE.
  CHECK_EQ(POSIX::write(fds[0], "QUIT\r\n", 6, 1s, t_o), -1);
  close(fds[0]);

  // Nobody listening.
  auto const lsn = socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in sin{};
  sin.sin_family      = AF_INET;
  sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  socklen_t len       = sizeof sin;
  PCHECK(bind(lsn, reinterpret_cast<sockaddr*>(&sin), len) == 0);
  PCHECK(getsockname(lsn, reinterpret_cast<sockaddr*>(&sin), &len) == 0);
  close(lsn);

  auto const fd = socket(AF_INET, SOCK_STREAM, 0);
  t_o           = false;
  CHECK(!POSIX::connect(fd, reinterpret_cast<sockaddr*>(&sin), sizeof sin, 1s,
                        t_o));
  CHECK(!t_o);
  close(fd);
}
