#include "Probe.hpp"

#include <string>
#include <vector>

#include <glog/logging.h>

using namespace std::chrono_literals;

namespace {
Provider::Dialect strict_dialect()
{
  return Provider::Dialect{
      "test", {"test.example"}, "probe.test.example", 1s, {250, 251},
  };
}

// Feeds each reply in turn, checking that the session asks for exactly
// the expected command after each.
Probe::step run(Probe::Session&                 session,
                std::vector<std::string> const& replies)
{
  Probe::step st;
  for (auto const& reply : replies) {
    CHECK(!session.done());
    st = session.feed(reply);
  }
  return st;
}

void lenient_accepts()
{
  Probe::Session session(Provider::generic("example.com"), "user@example.com");
  CHECK_EQ(session.current(), Probe::state::connecting);

  auto st = session.feed("220 mx.example.com ESMTP\r\n");
  CHECK_EQ(st.send.size(), 1);
  CHECK_EQ(st.send[0], "HELO example.com");
  CHECK_EQ(session.current(), Probe::state::awaiting_helo);

  st = session.feed("250 mx.example.com\r\n");
  CHECK_EQ(st.send.size(), 1);
  CHECK_EQ(st.send[0], "MAIL FROM:<verify@example.com>");

  st = session.feed("250 2.1.0 Ok\r\n");
  CHECK_EQ(st.send.size(), 1);
  CHECK_EQ(st.send[0], "RCPT TO:<user@example.com>");
  CHECK_EQ(session.current(), Probe::state::awaiting_rcpt);

  st = session.feed("250 2.1.5 Ok\r\n");
  CHECK_EQ(st.send.size(), 1);
  CHECK_EQ(st.send[0], "QUIT");
  CHECK(!st.done);
  CHECK(session.valid());
  CHECK(session.rcpt_seen());
  CHECK_EQ(session.commands_sent(), 4);

  st = session.feed("221 2.0.0 Bye\r\n");
  CHECK(st.done);
  CHECK(st.valid);
  CHECK(st.send.empty());
  CHECK(session.done());
  CHECK_EQ(session.current(), Probe::state::closed);

  // Once closed, the verdict stands.
  st = session.feed("250 more\r\n");
  CHECK(st.done);
  CHECK(st.valid);
  st = session.error();
  CHECK(st.valid);
}

void lenient_rejects()
{
  Probe::Session session(Provider::generic("example.com"),
                         "nobody@example.com");
  auto st = run(session, {"220 hi\r\n", "250 hello\r\n", "250 ok\r\n",
                          "550 5.1.1 no such user\r\n"});
  CHECK(st.done);
  CHECK(!st.valid);
  CHECK(st.send.empty());
  CHECK_EQ(session.commands_sent(), 3);
}

void lenient_greylisted()
{
  for (auto const code : {"450", "451", "452"}) {
    Probe::Session session(Provider::generic("example.com"),
                           "user@example.com");
    auto st = run(session, {"220 hi\r\n", "250 hello\r\n", "250 ok\r\n",
                            std::string(code) + " try later\r\n"});
    CHECK(!st.done);
    CHECK_EQ(st.send.size(), 1);
    CHECK_EQ(st.send[0], "QUIT");
    CHECK(session.valid());
    st = session.closed();
    CHECK(st.done);
    CHECK(st.valid);
  }
}

void lenient_rejects_helo()
{
  Probe::Session session(Provider::generic("example.com"), "user@example.com");
  auto st = run(session, {"220 hi\r\n", "554 go away\r\n"});
  CHECK(st.done);
  CHECK(!st.valid);
  CHECK_EQ(session.commands_sent(), 1);
}

void multi_line_replies()
{
  Probe::Session session(Provider::generic("example.com"), "user@example.com");

  // Only the last line of a reply counts, and lines may arrive in
  // pieces.
  auto st = session.feed("220-mx.example.com ESMTP\r\n220-more\r\n");
  CHECK(st.send.empty());
  CHECK_EQ(session.current(), Probe::state::connecting);

  st = session.feed("220 rea");
  CHECK(st.send.empty());
  st = session.feed("dy\r\n");
  CHECK_EQ(st.send.size(), 1);
  CHECK_EQ(st.send[0], "HELO example.com");

  st = session.feed("250-mx.example.com\r\n250-PIPELINING\r\n250 8BITMIME\r\n");
  CHECK_EQ(st.send.size(), 1);
  CHECK_EQ(session.current(), Probe::state::awaiting_mail_from);

  // Two complete replies in one read.
  st = session.feed("250 ok\r\n250 ok\r\n");
  CHECK_EQ(st.send.size(), 2);
  CHECK_EQ(st.send[0], "RCPT TO:<user@example.com>");
  CHECK_EQ(st.send[1], "QUIT");
  CHECK(session.valid());

  // Junk is skipped.
  st = session.feed("garbage\r\n221 bye\n");
  CHECK(st.done);
  CHECK(st.valid);
}

void lenient_timeouts()
{
  {
    // Silence after HELO and MAIL FROM is not a rejection.
    Probe::Session session(Provider::generic("example.com"),
                           "user@example.com");
    run(session, {"220 hi\r\n", "250 hello\r\n"});
    CHECK_EQ(session.commands_sent(), 2);
    auto const st = session.timed_out();
    CHECK(st.done);
    CHECK(st.valid);
  }
  {
    Probe::Session session(Provider::generic("example.com"),
                           "user@example.com");
    run(session, {"220 hi\r\n"});
    CHECK_EQ(session.commands_sent(), 1);
    auto const st = session.timed_out();
    CHECK(st.done);
    CHECK(!st.valid);
  }
  {
    Probe::Session session(Provider::generic("example.com"),
                           "user@example.com");
    auto const st = session.timed_out();
    CHECK(st.done);
    CHECK(!st.valid);
  }
}

void lenient_errors_and_closes()
{
  {
    Probe::Session session(Provider::generic("example.com"),
                           "user@example.com");
    auto const st = session.error();
    CHECK(st.done);
    CHECK(!st.valid);
  }
  {
    Probe::Session session(Provider::generic("example.com"),
                           "user@example.com");
    run(session, {"220 hi\r\n"});
    auto const st = session.error();
    CHECK(st.done);
    CHECK(st.valid);
  }
  {
    // Dropped after MAIL FROM was accepted, before any RCPT reply.
    Probe::Session session(Provider::generic("example.com"),
                           "user@example.com");
    run(session, {"220 hi\r\n", "250 hello\r\n", "250 ok\r\n"});
    CHECK_EQ(session.commands_sent(), 3);
    auto const st = session.closed();
    CHECK(st.done);
    CHECK(st.valid);
  }
  {
    Probe::Session session(Provider::generic("example.com"),
                           "user@example.com");
    run(session, {"220 hi\r\n"});
    auto const st = session.closed();
    CHECK(st.done);
    CHECK(!st.valid);
  }
}

void strict_accepts()
{
  Probe::Session session(strict_dialect(), "user@test.example");
  auto st = run(session, {"220 hi\r\n", "250 hello\r\n", "250 ok\r\n",
                          "251 will forward\r\n", "221 bye\r\n"});
  CHECK(st.done);
  CHECK(st.valid);
  CHECK_EQ(session.commands_sent(), 4);
}

void strict_is_strict()
{
  {
    // Greylisting is a failure.
    Probe::Session session(strict_dialect(), "user@test.example");
    auto st = run(session, {"220 hi\r\n", "250 hello\r\n", "250 ok\r\n",
                            "450 try later\r\n"});
    CHECK(st.done);
    CHECK(!st.valid);
  }
  {
    // A 250 earlier in the dialogue already counts.
    Probe::Session session(strict_dialect(), "user@test.example");
    auto st = run(session, {"220 hi\r\n", "250 hello\r\n"});
    CHECK(session.valid());
    st = session.timed_out();
    CHECK(st.done);
    CHECK(st.valid);
  }
  {
    Probe::Session session(strict_dialect(), "user@test.example");
    run(session, {"220 hi\r\n"});
    auto st = session.timed_out();
    CHECK(st.done);
    CHECK(!st.valid);
  }
  {
    Probe::Session session(strict_dialect(), "user@test.example");
    run(session, {"220 hi\r\n"});
    auto st = session.closed();
    CHECK(!st.valid);
  }
  {
    Probe::Session session(strict_dialect(), "user@test.example");
    auto st = run(session, {"220 hi\r\n", "250 hello\r\n", "250 ok\r\n",
                            "550 no such user\r\n"});
    CHECK(st.done);
    CHECK(!st.valid);
  }
}

void strict_error_and_close()
{
  // No leniency: error or close gives back only what was seen.
  {
    Probe::Session session(strict_dialect(), "user@test.example");
    run(session, {"220 hi\r\n"});
    CHECK_EQ(session.commands_sent(), 1);
    auto const st = session.error();
    CHECK(st.done);
    CHECK(!st.valid);
  }
  {
    Probe::Session session(strict_dialect(), "user@test.example");
    run(session, {"220 hi\r\n", "250 hello\r\n", "250 ok\r\n"});
    CHECK_EQ(session.commands_sent(), 3);
    auto const st = session.closed();
    CHECK(st.done);
    CHECK(st.valid); // the 250s were success codes
  }
  {
    Probe::Session session(strict_dialect(), "user@test.example");
    auto const st = session.error();
    CHECK(st.done);
    CHECK(!st.valid);
  }
}

void strict_greeting_counts()
{
  // A dialect that lists 220 is satisfied by the greeting alone.
  auto const icloud = Provider::lookup("icloud.com");
  CHECK(icloud != nullptr);
  Probe::Session session(*icloud, "user@icloud.com");
  auto st = session.feed("220 ready\r\n");
  CHECK(session.valid());
  CHECK_EQ(st.send.size(), 1);
  CHECK_EQ(st.send[0], "HELO icloud-com.mail.protection.outlook.com");
  st = session.error();
  CHECK(st.valid);
}

void long_line_discarded()
{
  Probe::Session session(Provider::generic("example.com"), "user@example.com");
  auto st = session.feed(std::string(Probe::Session::max_line + 1, 'x'));
  CHECK(st.send.empty());
  CHECK(!session.done());
  st = session.feed("220 ok\r\n");
  CHECK_EQ(st.send.size(), 1);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  lenient_accepts();
  lenient_rejects();
  lenient_greylisted();
  lenient_rejects_helo();
  multi_line_replies();
  lenient_timeouts();
  lenient_errors_and_closes();
  strict_accepts();
  strict_is_strict();
  strict_error_and_close();
  strict_greeting_counts();
  long_line_discarded();
}
