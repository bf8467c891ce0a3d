#include "Verify.hpp"

#include "Provider.hpp"
#include "Syntax.hpp"

#include <exception>

#include <glog/logging.h>

#include <gflags/gflags.h>

#include <boost/algorithm/string/case_conv.hpp>

DEFINE_string(helo_domain,
              "",
              "HELO and MAIL FROM domain for generic callouts, "
              "default is the domain being checked");

namespace Verify {

std::ostream& operator<<(std::ostream& os, Result const& result)
{
  return os << result.email << (result.valid ? " valid" : " invalid") << " ("
            << result.reason << ")";
}

namespace {
Result invalid_format(std::string_view address)
{
  Result result;
  result.email  = std::string(address);
  result.reason = Reason::invalid_format;
  return result;
}

// valid is recomputed on every way out.
Result& conclude(Result& result, char const* reason)
{
  result.reason = reason;
  result.valid  = result.checks.all();
  return result;
}
} // namespace

Verifier::Verifier(Resolve::Lookup& lookup, Callout::Prober& prober)
  : lookup_(lookup)
  , prober_(prober)
{
}

Result Verifier::check(std::string_view address)
{
  if (!Syntax::validate(address))
    return invalid_format(address);

  Result result;
  result.email = std::string(address);

  auto const domain = boost::algorithm::to_lower_copy(
      std::string(Syntax::domain(address)));

  auto const dialect = Provider::lookup(domain);

  try {
    if (lookup_.address(domain) != Resolve::status::found) {
      return conclude(result, Reason::no_domain);
    }
    result.checks.dns = true;

    auto const mxs = lookup_.mail_exchangers(domain);
    switch (mxs.st) {
    case Resolve::status::failed: return conclude(result, Reason::mx_failed);
    case Resolve::status::none: return conclude(result, Reason::no_mx);
    case Resolve::status::found: break;
    }
    result.checks.mx = true;

    switch (lookup_.spf(domain)) {
    case Resolve::status::found: result.checks.spf = true; break;

    case Resolve::status::none:
      if (dialect)
        return conclude(result, Reason::no_spf);
      LOG(INFO) << "no SPF for " << domain << ", not held against it";
      result.checks.spf = true;
      break;

    case Resolve::status::failed:
      if (dialect)
        return conclude(result, Reason::spf_failed);
      LOG(INFO) << "SPF lookup failed for " << domain
                << ", not held against it";
      result.checks.spf = true;
      break;
    }

    auto const probe_dialect
        = dialect ? *dialect
                  : Provider::generic(FLAGS_helo_domain.empty()
                                          ? domain
                                          : FLAGS_helo_domain);

    for (auto const& mx : mxs.hosts) {
      if (prober_.probe(mx, address, probe_dialect)) {
        result.checks.mailbox = true;
        result.checks.smtp    = true;
        break;
      }
    }
  }
  catch (std::exception const& e) {
    LOG(ERROR) << "checking " << address << ": " << e.what();
    return conclude(result, Reason::failed);
  }

  if (result.checks.mailbox)
    return conclude(result, Reason::verified);

  if (dialect)
    return conclude(result, Reason::mailbox_failed);

  // Not being able to prove it is not taken as proof against it.
  result.checks.mailbox = true;
  result.checks.smtp    = true;
  return conclude(result, Reason::mailbox_unknown);
}

Result validate_one(std::string_view address)
{
  if (!Syntax::validate(address))
    return invalid_format(address);

  try {
    Resolve::LDNS lookup;
    Callout::SMTP prober(lookup);
    Verifier      verifier(lookup, prober);
    return verifier.check(address);
  }
  catch (std::exception const& e) {
    LOG(ERROR) << "can't check " << address << ": " << e.what();
    auto result   = Result{};
    result.email  = std::string(address);
    result.reason = Reason::failed;
    return result;
  }
}

} // namespace Verify
