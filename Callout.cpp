#include "Callout.hpp"

#include "Probe.hpp"
#include "Sock.hpp"

#include <algorithm>
#include <memory>

#include <arpa/inet.h>

#include <glog/logging.h>

#include <gflags/gflags.h>

#include <fmt/format.h>

DEFINE_int32(smtp_port, 25, "port to find mail exchangers listening on");
DEFINE_bool(log_smtp_data, false, "log all SMTP protocol data");

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

namespace Config {
constexpr auto quit_timeout = std::chrono::seconds(1);
constexpr auto read_size    = 1024;
} // namespace Config

namespace {

bool is_numeric(std::string const& host)
{
  unsigned char buf[sizeof(in6_addr)];
  return (inet_pton(AF_INET, host.c_str(), buf) == 1)
         || (inet_pton(AF_INET6, host.c_str(), buf) == 1);
}

// Whatever way we leave a session, the peer gets a QUIT if it's still
// listening, then the descriptor is closed when the Sock goes.
class Release {
public:
  Release(Release const&) = delete;
  Release& operator=(Release const&) = delete;

  explicit Release(std::unique_ptr<Sock> sock)
    : sock_(std::move(sock))
  {
  }

  ~Release()
  {
    if (!sock_->write("QUIT\r\n", Config::quit_timeout)) {
      LOG(INFO) << "QUIT on release not written to " << sock_->them_c_str();
    }
  }

  Sock& operator*() const { return *sock_; }
  Sock* operator->() const { return sock_.get(); }

private:
  std::unique_ptr<Sock> sock_;
};

} // namespace

namespace Callout {

uint16_t default_port()
{
  CHECK((0 < FLAGS_smtp_port) && (FLAGS_smtp_port < 65536))
      << "bad --smtp_port " << FLAGS_smtp_port;
  return static_cast<uint16_t>(FLAGS_smtp_port);
}

SMTP::SMTP(Resolve::Lookup& lookup, uint16_t port)
  : lookup_(lookup)
  , port_(port)
{
}

bool SMTP::probe(std::string const&       exchanger,
                 std::string_view         address,
                 Provider::Dialect const& dialect)
{
  Probe::Session session(dialect, address);

  // Lenient dialects get the whole timeout for every wait, the others
  // get it once for the whole session.
  auto const deadline = steady_clock::now() + dialect.timeout;
  auto const wait     = [&dialect, deadline]() {
    if (dialect.lenient)
      return dialect.timeout;
    return std::max(milliseconds(0),
                    duration_cast<milliseconds>(deadline - steady_clock::now()));
  };

  LOG(INFO) << "probing " << exchanger << " for " << address << " ("
            << dialect.name << ")";

  auto const addrs = is_numeric(exchanger)
                         ? std::vector<std::string>{exchanger}
                         : lookup_.host_addresses(exchanger);
  if (addrs.empty()) {
    LOG(WARNING) << "no address for " << exchanger;
    return session.error().valid;
  }

  // wait() is asked again for each address, so a strict deadline covers
  // them all.
  auto t_o = false;
  std::unique_ptr<Sock> sock;
  for (auto const& addr : addrs) {
    auto const timeout = wait();
    if (timeout <= milliseconds(0)) {
      t_o = true;
      break;
    }
    sock = Sock::connect(addr, port_, timeout, t_o);
    if (sock)
      break;
  }
  if (!sock) {
    LOG(WARNING) << exchanger << " no connection";
    return (t_o ? session.timed_out() : session.error()).valid;
  }

  Release conn(std::move(sock));
  if (FLAGS_log_smtp_data) {
    conn->log_data_on();
  }

  char buf[Config::read_size];
  for (;;) {
    t_o = false;
    auto const n_read = conn->read(buf, sizeof buf, wait(), t_o);

    Probe::step st;
    if (n_read < 0) {
      st = t_o ? session.timed_out() : session.error();
    }
    else if (n_read == 0) {
      st = session.closed();
    }
    else {
      st = session.feed(std::string_view(buf, n_read));
      if (!st.done) {
        for (auto const& cmd : st.send) {
          LOG(INFO) << "C: " << cmd;
          if (!conn->write(fmt::format("{}\r\n", cmd), wait())) {
            st = session.error();
            break;
          }
        }
      }
    }

    if (st.done) {
      LOG(INFO) << exchanger << " says " << address << " is "
                << (st.valid ? "deliverable" : "undeliverable") << " after "
                << session.commands_sent() << " commands";
      return st.valid;
    }
  }
}

} // namespace Callout
