#include "POSIX.hpp"

#include <algorithm>
#include <cerrno>

#include <glog/logging.h>

#include <fcntl.h>
#include <poll.h>

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

namespace {
int as_poll_timeout(milliseconds wait)
{
  return static_cast<int>(std::max(wait.count(), milliseconds::rep(0)));
}

// Works for descriptors past FD_SETSIZE.
bool ready(int fd, short events, milliseconds wait)
{
  auto pfd{pollfd{fd, events, 0}};

  int n;
  while ((n = poll(&pfd, 1, as_poll_timeout(wait))) == -1) {
    PCHECK(errno == EINTR) << "poll(2) failed";
  }

  return 0 != n;
}
} // namespace

void POSIX::set_nonblocking(int fd)
{
  int flags;
  PCHECK((flags = fcntl(fd, F_GETFL, 0)) != -1);
  if (0 == (flags & O_NONBLOCK)) {
    PCHECK(fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1);
  }
}

bool POSIX::input_ready(int fd_in, milliseconds wait)
{
  return ready(fd_in, POLLIN, wait);
}

bool POSIX::output_ready(int fd_out, milliseconds wait)
{
  return ready(fd_out, POLLOUT, wait);
}

bool POSIX::connect(int             fd,
                    sockaddr const* addr,
                    socklen_t       addrlen,
                    milliseconds    timeout,
                    bool&           t_o)
{
  set_nonblocking(fd);

  if (::connect(fd, addr, addrlen) == 0)
    return true;

  if (errno != EINPROGRESS) {
    PLOG(WARNING) << "connect(2) failed";
    return false;
  }

  if (!output_ready(fd, timeout)) {
    t_o = true;
    LOG(WARNING) << "connect(2) timed out";
    return false;
  }

  int       err = 0;
  socklen_t len = sizeof(err);
  PCHECK(getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0);
  if (err) {
    errno = err;
    PLOG(WARNING) << "connect(2) failed";
    return false;
  }

  return true;
}

std::streamsize POSIX::read(int             fd,
                            char*           s,
                            std::streamsize n,
                            milliseconds    timeout,
                            bool&           t_o)
{
  auto const end_time = steady_clock::now() + timeout;

  for (;;) {
    auto const n_ret = ::read(fd, static_cast<void*>(s), n);

    if (n_ret >= 0)
      return n_ret;

    switch (errno) {
    case EINTR: continue; // try read again

    case EWOULDBLOCK:
#if EAGAIN != EWOULDBLOCK
    case EAGAIN:
#endif
      break;

    default: PLOG(WARNING) << "read(2) failed"; return -1;
    }

    auto const now = steady_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      if (input_ready(fd, time_left))
        continue; // try read again
    }
    t_o = true;
    LOG(WARNING) << "read(2) timed out";
    return -1;
  }
}

std::streamsize POSIX::write(int             fd,
                             const char*     s,
                             std::streamsize n,
                             milliseconds    timeout,
                             bool&           t_o)
{
  auto const end_time = steady_clock::now() + timeout;

  auto written = std::streamsize{};

  for (;;) {
    auto const n_ret
        = ::send(fd, static_cast<const void*>(s), n - written, MSG_NOSIGNAL);

    if (n_ret == -1) {
      switch (errno) {
      case EINTR: continue; // try write again

      case EWOULDBLOCK:
#if EAGAIN != EWOULDBLOCK
      case EAGAIN:
#endif
        break;

      default: PLOG(WARNING) << "write failed"; return -1;
      }
    }
    else {
      s += n_ret;
      written += n_ret;
    }

    if (written == n)
      return n;

    auto const now = steady_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      if (output_ready(fd, time_left))
        continue; // write some more
    }
    t_o = true;
    LOG(WARNING) << "write time out";
    return -1;
  }
}
