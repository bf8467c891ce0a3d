#include "Callout.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <glog/logging.h>

using namespace std::chrono_literals;

namespace {

// Knows nothing; the tests only use numeric exchangers.
class No_DNS : public Resolve::Lookup {
public:
  Resolve::status address(std::string const&) override
  {
    return Resolve::status::none;
  }
  Resolve::exchangers mail_exchangers(std::string const&) override
  {
    return {Resolve::status::none, {}};
  }
  Resolve::status spf(std::string const&) override
  {
    return Resolve::status::none;
  }
  std::vector<std::string> host_addresses(std::string const&) override
  {
    return {};
  }
};

int listener(uint16_t& port)
{
  auto const fd = socket(AF_INET, SOCK_STREAM, 0);
  PCHECK(fd >= 0) << "socket() failed";

  sockaddr_in sin{};
  sin.sin_family      = AF_INET;
  sin.sin_port        = 0;
  sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  PCHECK(bind(fd, reinterpret_cast<sockaddr*>(&sin), sizeof sin) == 0);
  PCHECK(listen(fd, 1) == 0);

  socklen_t len = sizeof sin;
  PCHECK(getsockname(fd, reinterpret_cast<sockaddr*>(&sin), &len) == 0);
  port = ntohs(sin.sin_port);
  return fd;
}

// Accepts one connection, sends the greeting, then answers each
// command line with the next reply.  An empty reply means say nothing.
// Every line received is kept in commands.
void serve(int                             fd,
           std::vector<std::string> const& replies,
           std::vector<std::string>&       commands)
{
  auto const conn = accept(fd, nullptr, nullptr);
  PCHECK(conn >= 0) << "accept() failed";

  auto say = [conn](std::string const& reply) {
    if (reply.empty())
      return;
    auto const ln = reply + "\r\n";
    PCHECK(send(conn, ln.data(), ln.size(), MSG_NOSIGNAL)
           == static_cast<ssize_t>(ln.size()));
  };

  auto next = replies.begin();
  if (next != replies.end())
    say(*next++);

  std::string ln;
  char        ch;
  while (recv(conn, &ch, 1, 0) == 1) {
    if (ch != '\n') {
      ln += ch;
      continue;
    }
    if (!ln.empty() && ln.back() == '\r')
      ln.pop_back();
    commands.push_back(ln);
    ln.clear();
    if (next != replies.end())
      say(*next++);
  }

  close(conn);
}

bool probe(std::vector<std::string> const& replies,
           Provider::Dialect const&        dialect,
           std::vector<std::string>&       commands)
{
  uint16_t   port;
  auto const fd = listener(port);

  std::thread server(serve, fd, std::cref(replies), std::ref(commands));

  No_DNS        dns;
  Callout::SMTP smtp(dns, port);
  auto const    valid = smtp.probe("127.0.0.1", "user@example.com", dialect);

  server.join();
  close(fd);
  return valid;
}

Provider::Dialect quick_generic()
{
  auto dialect    = Provider::generic("checker.example");
  dialect.timeout = 300ms;
  return dialect;
}

void accepted()
{
  std::vector<std::string> commands;
  CHECK(probe({"220 fake ESMTP", "250 fake", "250 2.1.0 Ok", "250 2.1.5 Ok",
               "221 2.0.0 Bye"},
              quick_generic(), commands));

  CHECK_GE(commands.size(), 4);
  CHECK_EQ(commands[0], "HELO checker.example");
  CHECK_EQ(commands[1], "MAIL FROM:<verify@checker.example>");
  CHECK_EQ(commands[2], "RCPT TO:<user@example.com>");
  CHECK_EQ(commands[3], "QUIT");
}

void rejected()
{
  std::vector<std::string> commands;
  CHECK(!probe({"220 fake ESMTP", "250 fake", "250 2.1.0 Ok",
                "550 5.1.1 No such user"},
               quick_generic(), commands));

  // The RCPT was the last real command; the QUIT comes on release.
  CHECK_GE(commands.size(), 3);
  CHECK_EQ(commands[2], "RCPT TO:<user@example.com>");
  CHECK_EQ(commands.back(), "QUIT");
}

void silent_after_mail_from()
{
  std::vector<std::string> commands;
  CHECK(probe({"220 fake ESMTP", "250 fake", ""}, quick_generic(), commands));
  CHECK_EQ(commands[1], "MAIL FROM:<verify@checker.example>");
}

void strict_times_out()
{
  auto dialect = Provider::Dialect{
      "strict", {"example.com"}, "checker.example", 300ms, {250},
  };
  std::vector<std::string> commands;
  CHECK(!probe({"220 fake ESMTP", ""}, dialect, commands));
  CHECK_EQ(commands[0], "HELO checker.example");
}

void refused()
{
  // Grab a port nobody is listening on.
  uint16_t port;
  close(listener(port));

  No_DNS        dns;
  Callout::SMTP smtp(dns, port);
  CHECK(!smtp.probe("127.0.0.1", "user@example.com", quick_generic()));
}

void refused_strict()
{
  uint16_t port;
  close(listener(port));

  auto dialect = Provider::Dialect{
      "strict", {"example.com"}, "checker.example", 300ms, {250},
  };
  No_DNS        dns;
  Callout::SMTP smtp(dns, port);
  CHECK(!smtp.probe("127.0.0.1", "user@example.com", dialect));
}

// Every address of the exchanger goes nowhere.
class Unroutable_DNS : public No_DNS {
public:
  std::vector<std::string> host_addresses(std::string const&) override
  {
    return {"192.0.2.1", "192.0.2.2", "192.0.2.3"};
  }
};

void deadline_covers_all_addresses()
{
  auto dialect = Provider::Dialect{
      "strict", {"example.com"}, "checker.example", 300ms, {250},
  };
  Unroutable_DNS dns;
  Callout::SMTP  smtp(dns, 25);

  auto const start = std::chrono::steady_clock::now();
  CHECK(!smtp.probe("mx.example.com", "user@example.com", dialect));
  auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  CHECK_LT(elapsed.count(), 450);
}

void no_address()
{
  No_DNS        dns;
  Callout::SMTP smtp(dns, 25);
  CHECK(!smtp.probe("mx.invalid", "user@example.com", quick_generic()));
}

} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  accepted();
  rejected();
  silent_after_mail_from();
  strict_times_out();
  refused();
  refused_strict();
  deadline_covers_all_addresses();
  no_address();
}
