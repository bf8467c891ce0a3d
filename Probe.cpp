#include "Probe.hpp"

#include "Reply.hpp"

#include <utility>

#include <glog/logging.h>

#include <fmt/format.h>

namespace Probe {

char const* state_c_str(state s)
{
  switch (s) { // clang-format off
  case state::connecting:         return "connecting";
  case state::awaiting_helo:      return "awaiting_helo";
  case state::awaiting_mail_from: return "awaiting_mail_from";
  case state::awaiting_rcpt:      return "awaiting_rcpt";
  case state::awaiting_quit:      return "awaiting_quit";
  case state::closed:             return "closed";
  } // clang-format on
  return "*** unknown state ***";
}

Session::Session(Provider::Dialect dialect, std::string_view rcpt_to)
  : dialect_(std::move(dialect))
  , rcpt_to_(rcpt_to)
{
}

std::string Session::command_(state s) const
{
  switch (s) {
  case state::connecting:
    return fmt::format("HELO {}", dialect_.helo_identity);
  case state::awaiting_helo:
    return fmt::format("MAIL FROM:<verify@{}>", dialect_.helo_identity);
  case state::awaiting_mail_from:
    return fmt::format("RCPT TO:<{}>", rcpt_to_);
  case state::awaiting_rcpt: return "QUIT";
  default: break;
  }
  LOG(FATAL) << "no command follows " << s;
  return {};
}

step Session::verdict_() const
{
  step st;
  st.done  = true;
  st.valid = result_;
  return st;
}

void Session::finish_(bool valid, step& st)
{
  state_   = state::closed;
  result_  = valid;
  st.done  = true;
  st.valid = valid;
}

void Session::advance_(step& st)
{
  if (state_ == state::awaiting_quit) {
    // The reply to QUIT; nothing left to learn from the peer.
    finish_(valid_ || (dialect_.lenient && (sent_ > 1) && !rcpt_seen_), st);
    return;
  }

  st.send.push_back(command_(state_));
  ++sent_;

  switch (state_) { // clang-format off
  case state::connecting:         state_ = state::awaiting_helo;      break;
  case state::awaiting_helo:      state_ = state::awaiting_mail_from; break;
  case state::awaiting_mail_from: state_ = state::awaiting_rcpt;      break;
  case state::awaiting_rcpt:      state_ = state::awaiting_quit;      break;
  default: LOG(FATAL) << "can't advance from " << state_;
  } // clang-format on
}

// Lenient (generic) dialect: at RCPT, 250/251/252 and the transient
// 450/451/452 all count as “exists”; elsewhere 2xx, 451 and 452 move
// us along.  Any 5xx is the end of it.
//
// Strict (provider) dialects: any reply carrying one of the dialect's
// success codes sets the flag; 2xx, 451 and 452 move us along; 5xx and
// 450 are the end of it.

void Session::reply_(int code, step& st)
{
  auto const at_rcpt = (state_ == state::awaiting_rcpt);
  if (at_rcpt)
    rcpt_seen_ = true;

  if (dialect_.lenient) {
    auto const transient = (450 <= code) && (code <= 452);
    if (at_rcpt && (dialect_.is_success(code) || transient))
      valid_ = true;

    if (Reply::is_permanent(code)) {
      finish_(false, st);
      return;
    }
    if (Reply::is_positive(code) || Reply::is_soft_transient(code)
        || (at_rcpt && transient)) {
      advance_(st);
    }
    return;
  }

  if (dialect_.is_success(code))
    valid_ = true;

  if (Reply::is_permanent(code) || (code == 450)) {
    finish_(false, st);
    return;
  }
  if (Reply::is_positive(code) || Reply::is_soft_transient(code)) {
    advance_(st);
  }
}

step Session::feed(std::string_view data)
{
  if (done())
    return verdict_();

  step st;
  buffer_.append(data.data(), data.size());

  std::string::size_type eol;
  while ((eol = buffer_.find('\n')) != std::string::npos) {
    auto ln = buffer_.substr(0, eol);
    buffer_.erase(0, eol + 1);
    if (!ln.empty() && ln.back() == '\r')
      ln.pop_back();

    LOG(INFO) << "S: " << ln;

    auto const reply = Reply::parse(ln);
    if (!reply) {
      LOG(WARNING) << "unrecognizable reply line in " << state_;
      continue;
    }
    if (!reply->last)
      continue;

    reply_(reply->code, st);
    if (done()) {
      buffer_.clear();
      return st;
    }
  }

  if (buffer_.size() > max_line) {
    LOG(WARNING) << "reply line longer than " << max_line << " octets";
    buffer_.clear();
  }

  return st;
}

step Session::timed_out()
{
  if (done())
    return verdict_();

  LOG(INFO) << "timed out in " << state_ << " after " << sent_ << " commands";

  step st;
  // Getting past HELO and MAIL FROM and then hearing nothing is taken
  // as a server being protective, not as a rejection.
  finish_(valid_ || (dialect_.lenient && (sent_ >= 2)), st);
  return st;
}

step Session::error()
{
  if (done())
    return verdict_();

  LOG(INFO) << "socket error in " << state_ << " after " << sent_
            << " commands";

  step st;
  finish_(valid_ || (dialect_.lenient && (sent_ >= 1)), st);
  return st;
}

step Session::closed()
{
  if (done())
    return verdict_();

  LOG(INFO) << "connection closed in " << state_ << " after " << sent_
            << " commands";

  step st;
  finish_(valid_ || (dialect_.lenient && (sent_ > 1) && !rcpt_seen_), st);
  return st;
}

} // namespace Probe
