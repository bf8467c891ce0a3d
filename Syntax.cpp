#include "Syntax.hpp"

#include <glog/logging.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using namespace tao::pegtl;
using namespace tao::pegtl::abnf;

namespace Syntax {
namespace Grammar {
// clang-format off

using dot  = one<'.'>;
using dash = one<'-'>;

struct let_dig : sor<ALPHA, DIGIT> {};

struct special : one<'.', '_', '%', '+', '-'> {};

// Must begin and end with a let_dig.
struct local_tail : star<sor<seq<plus<special>, let_dig>, let_dig>> {};

struct local_part : seq<let_dig, local_tail> {};

struct ldh_tail : star<sor<seq<plus<dash>, let_dig>, let_dig>> {};

struct label : seq<let_dig, ldh_tail> {};

struct top_label : rep_min<2, ALPHA> {};

struct domain : seq<plus<seq<label, dot>>, top_label> {};

struct address_only : seq<local_part, one<'@'>, domain, eof> {};

// clang-format on

struct lengths {
  bool too_long{false};
};

template <typename Rule>
struct action : nothing<Rule> {
};

template <>
struct action<local_part> {
  template <typename Input>
  static void apply(Input const& in, lengths& len)
  {
    if (in.size() > max_local_length)
      len.too_long = true;
  }
};

template <>
struct action<label> {
  template <typename Input>
  static void apply(Input const& in, lengths& len)
  {
    if (in.size() > max_label_length)
      len.too_long = true;
  }
};

template <>
struct action<top_label> {
  template <typename Input>
  static void apply(Input const& in, lengths& len)
  {
    if (in.size() > max_label_length)
      len.too_long = true;
  }
};
} // namespace Grammar

bool validate(std::string_view address)
{
  if (address.empty())
    return false;

  Grammar::lengths len;
  memory_input<>   in(address.data(), address.size(), "address");
  if (!parse<Grammar::address_only, Grammar::action>(in, len))
    return false;

  LOG_IF(INFO, len.too_long) << "over-long local part or label: " << address;
  return !len.too_long;
}

std::string_view domain(std::string_view address)
{
  auto const at = address.rfind('@');
  if (at == std::string_view::npos)
    return {};
  return address.substr(at + 1);
}

} // namespace Syntax
