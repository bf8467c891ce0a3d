#ifndef PROVIDER_DOT_HPP
#define PROVIDER_DOT_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Provider {

// How to conduct a callout against one receiving provider.
struct Dialect {
  std::string              name;
  std::vector<std::string> domains;       // exact aliases, lower case
  std::string              helo_identity; // HELO and MAIL FROM domain
  std::chrono::milliseconds timeout;
  std::vector<int>          success_codes;

  // The generic dialect: temporary failures, timeouts and ambiguous
  // closes lean towards "exists", and the timeout is per wait rather
  // than for the whole session.
  bool lenient{false};

  bool is_success(int code) const;
};

namespace Config {
constexpr auto generic_timeout = std::chrono::seconds(7);
}

// Case-insensitive exact match against the registered aliases, no
// subdomains.
Dialect const* lookup(std::string_view domain);

inline bool is_registered(std::string_view domain)
{
  return lookup(domain) != nullptr;
}

// The lenient dialect used for every unregistered domain.
Dialect generic(std::string_view helo_identity);

std::vector<Dialect> const& registry();

} // namespace Provider

#endif // PROVIDER_DOT_HPP
