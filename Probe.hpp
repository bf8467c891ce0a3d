#ifndef PROBE_DOT_HPP
#define PROBE_DOT_HPP

#include "Provider.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

// The callout dialogue as a state machine, with no I/O of its own.  The
// caller feeds it whatever arrives on the socket and the socket events,
// and writes whatever commands it hands back.

namespace Probe {

enum class state : uint8_t {
  connecting, // waiting for the 220 greeting
  awaiting_helo,
  awaiting_mail_from,
  awaiting_rcpt,
  awaiting_quit,
  closed,
};

char const* state_c_str(state s);

inline std::ostream& operator<<(std::ostream& os, state s)
{
  return os << state_c_str(s);
}

struct step {
  std::vector<std::string> send; // command lines, CRLF not included
  bool                     done{false};
  bool                     valid{false}; // the verdict, once done
};

class Session {
public:
  Session(Session const&) = delete;
  Session& operator=(Session const&) = delete;

  Session(Provider::Dialect dialect, std::string_view rcpt_to);

  step feed(std::string_view data);

  step timed_out();
  step error();
  step closed();

  state current() const { return state_; }
  bool  done() const { return state_ == state::closed; }

  int  commands_sent() const { return sent_; }
  bool valid() const { return valid_; }
  bool rcpt_seen() const { return rcpt_seen_; }

  // RFC 5321 section 4.5.3.1.5 allows 512, be generous.
  static constexpr std::string_view::size_type max_line = 4 * 1024;

private:
  void reply_(int code, step& st);
  void advance_(step& st);
  void finish_(bool valid, step& st);
  step verdict_() const;

  std::string command_(state s) const;

  Provider::Dialect dialect_;
  std::string       rcpt_to_;
  std::string       buffer_;

  state state_{state::connecting};

  int  sent_{0};
  bool valid_{false};
  bool rcpt_seen_{false};
  bool result_{false};
};

} // namespace Probe

#endif // PROBE_DOT_HPP
