#ifndef POSIX_DOT_HPP
#define POSIX_DOT_HPP

#include <chrono>
#include <ios>

#include <sys/socket.h>
#include <unistd.h>

class POSIX {
public:
  POSIX()             = delete;
  POSIX(POSIX const&) = delete;

  static void set_nonblocking(int fd);

  static bool input_ready(int fd_in, std::chrono::milliseconds wait);
  static bool output_ready(int fd_out, std::chrono::milliseconds wait);

  // Non-blocking connect bounded by timeout.  Returns false on failure,
  // with t_o set if it was the timeout.
  static bool connect(int                       fd,
                      sockaddr const*           addr,
                      socklen_t                 addrlen,
                      std::chrono::milliseconds timeout,
                      bool&                     t_o);

  // Return -1 on error or time out (t_o set), 0 at end of file.
  static std::streamsize read(int                       fd,
                              char*                     s,
                              std::streamsize           n,
                              std::chrono::milliseconds timeout,
                              bool&                     t_o);

  static std::streamsize write(int                       fd,
                               const char*               s,
                               std::streamsize           n,
                               std::chrono::milliseconds timeout,
                               bool&                     t_o);
};

#endif // POSIX_DOT_HPP
