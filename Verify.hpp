#ifndef VERIFY_DOT_HPP
#define VERIFY_DOT_HPP

#include "Callout.hpp"
#include "Resolve.hpp"

#include <ostream>
#include <string>
#include <string_view>

namespace Verify {

struct Checks {
  bool mx{false};
  bool dns{false};
  bool spf{false};
  bool mailbox{false}; // always equal to smtp
  bool smtp{false};

  bool all() const { return mx && dns && spf && mailbox && smtp; }

  bool operator==(Checks const& rhs) const = default;
};

struct Result {
  std::string email;
  bool        valid{false};
  Checks      checks;
  std::string reason;

  bool operator==(Result const& rhs) const = default;
};

std::ostream& operator<<(std::ostream& os, Result const& result);

namespace Reason {
constexpr char const* invalid_format  = "Invalid email format";
constexpr char const* no_domain       = "Domain does not exist";
constexpr char const* no_mx           = "No mail server found for domain";
constexpr char const* mx_failed       = "Failed to verify mail server";
constexpr char const* no_spf          = "Domain lacks SPF record";
constexpr char const* spf_failed      = "Failed to verify SPF record";
constexpr char const* mailbox_failed  = "Mailbox verification failed";
constexpr char const* mailbox_unknown = "Email appears valid but could not fully verify";
constexpr char const* verified        = "Email verified successfully";
constexpr char const* failed          = "Validation failed";
} // namespace Reason

class Verifier {
public:
  Verifier(Verifier const&) = delete;
  Verifier& operator=(Verifier const&) = delete;

  Verifier(Resolve::Lookup& lookup, Callout::Prober& prober);

  Result check(std::string_view address);

private:
  Resolve::Lookup& lookup_;
  Callout::Prober& prober_;
};

// With a resolver and prober of its own, so safe to call from any
// thread.  Never throws.
Result validate_one(std::string_view address);

} // namespace Verify

#endif // VERIFY_DOT_HPP
