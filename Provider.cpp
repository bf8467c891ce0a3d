#include "Provider.hpp"

#include "iequal.hpp"

#include <algorithm>

#include <glog/logging.h>

using namespace std::chrono_literals;

namespace Provider {

bool Dialect::is_success(int code) const
{
  return std::find(begin(success_codes), end(success_codes), code)
         != end(success_codes);
}

std::vector<Dialect> const& registry()
{
  // clang-format off
  static std::vector<Dialect> const dialects{
    {
      "outlook.com",
      {"outlook.com", "hotmail.com", "live.com"},
      "outlook-com.olc.protection.outlook.com",
      15s,
      {250, 251},
    },
    {
      "yahoo.com",
      {"yahoo.com", "ymail.com", "yahoo.co.uk"},
      "yahoo-smtp-in.l.yahoo.com",
      12s,
      {250, 235},
    },
    {
      "icloud.com",
      {"icloud.com", "me.com", "mac.com"},
      "icloud-com.mail.protection.outlook.com",
      10s,
      {250, 220},
    },
  };
  // clang-format on
  return dialects;
}

Dialect const* lookup(std::string_view domain)
{
  for (auto const& dialect : registry()) {
    auto const& doms = dialect.domains;
    if (std::any_of(begin(doms), end(doms),
                    [domain](auto const& d) { return iequal(d, domain); })) {
      return &dialect;
    }
  }
  return nullptr;
}

Dialect generic(std::string_view helo_identity)
{
  CHECK(!helo_identity.empty());
  return Dialect{
      "generic", {}, std::string(helo_identity), Config::generic_timeout,
      {250, 251, 252}, true,
  };
}

} // namespace Provider
