#ifndef REPLY_DOT_HPP
#define REPLY_DOT_HPP

#include <optional>
#include <string>
#include <string_view>

// One line of an SMTP reply, RFC 5321 section 4.2.

namespace Reply {

struct line {
  int         code{0};
  bool        last{true}; // "250 ..." rather than "250-..."
  std::string text;
};

// Takes a line with its CRLF already removed.  Anything that isn't a
// Reply-line yields nothing.
std::optional<line> parse(std::string_view ln);

constexpr bool is_positive(int code) { return (200 <= code) && (code < 300); }
constexpr bool is_permanent(int code) { return code >= 500; }

// 451 “local error in processing” and 452 “insufficient system storage”
constexpr bool is_soft_transient(int code)
{
  return (code == 451) || (code == 452);
}

} // namespace Reply

#endif // REPLY_DOT_HPP
