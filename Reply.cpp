#include "Reply.hpp"

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace Reply {
namespace RFC5321 {
// clang-format off

// Reply-code     = %x32-35 %x30-35 %x30-39

struct reply_code
: seq<range<0x32, 0x35>, range<0x30, 0x35>, range<0x30, 0x39>> {};

// Although not explicit in the grammar of RFC-6531, in practice UTF-8
// is used in the replys, so take any octet that isn't CR or LF.

struct textstring : plus<sor<ranges<0, 9, 11, 12, 14, 127>,
                             range<'\x80', '\xFF'>>> {};

struct continued : seq<one<'-'>, opt<textstring>> {};

struct closing : opt<SP, opt<textstring>> {};

struct reply_line : seq<reply_code, sor<continued, closing>, eof> {};

// clang-format on

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<reply_code> {
  template <typename Input>
  static void apply(Input const& in, line& ln)
  {
    auto const p = in.begin();
    ln.code      = (p[0] - '0') * 100 + (p[1] - '0') * 10 + (p[2] - '0');
  }
};

template <>
struct action<continued> {
  template <typename Input>
  static void apply(Input const&, line& ln)
  {
    ln.last = false;
  }
};

template <>
struct action<textstring> {
  template <typename Input>
  static void apply(Input const& in, line& ln)
  {
    ln.text = in.string();
  }
};
} // namespace RFC5321

std::optional<line> parse(std::string_view ln)
{
  line           reply;
  memory_input<> in(ln.data(), ln.size(), "reply");
  if (!tao::pegtl::parse<RFC5321::reply_line, RFC5321::action>(in, reply))
    return {};
  return reply;
}

} // namespace Reply
