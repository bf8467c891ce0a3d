#include "Resolve.hpp"

#include "DNS-iostream.hpp"
#include "iequal.hpp"

#include <algorithm>
#include <iomanip>
#include <random>
#include <variant>

#include <glog/logging.h>

using std::begin;
using std::end;

namespace Resolve {

char const* status_c_str(status st)
{
  switch (st) { // clang-format off
  case status::found:  return "found";
  case status::none:   return "none";
  case status::failed: return "failed";
  } // clang-format on
  return "*** unknown status ***";
}

std::vector<std::string> order_exchangers(DNS::RR_collection const& rrs)
{
  std::vector<DNS::RR_MX> mxs;
  for (auto const& rr : rrs) {
    if (std::holds_alternative<DNS::RR_MX>(rr))
      mxs.push_back(std::get<DNS::RR_MX>(rr));
  }

  if ((mxs.size() == 1) && mxs.front().is_null()) {
    LOG(INFO) << "null MX, domain does not accept mail";
    return {};
  }

  mxs.erase(std::remove_if(begin(mxs), end(mxs),
                           [](DNS::RR_MX const& mx) {
                             return mx.is_null()
                                    || iequal(mx.exchange(), "localhost");
                           }),
            end(mxs));

  // RFC 5321 section 5.1 “Locating the Target Host”

  // […] then the sender-SMTP MUST randomize them to spread the load
  // across multiple mail exchangers for a specific organization.
  std::shuffle(begin(mxs), end(mxs), std::mt19937{std::random_device{}()});
  std::stable_sort(begin(mxs), end(mxs),
                   [](DNS::RR_MX const& a, DNS::RR_MX const& b) {
                     return a.preference() < b.preference();
                   });

  std::vector<std::string> hosts;
  for (auto const& mx : mxs) {
    VLOG(1) << std::setfill(' ') << std::setw(3) << mx.preference() << " "
            << mx.exchange();
    hosts.push_back(mx.exchange());
  }
  return hosts;
}

bool has_spf(std::vector<std::string> const& txts)
{
  return std::any_of(begin(txts), end(txts), [](std::string const& txt) {
    return txt.find("v=spf1") != std::string::npos;
  });
}

status LDNS::address(std::string const& domain)
{
  auto failed = false;

  for (auto const typ : {DNS::RR_type::A, DNS::RR_type::AAAA}) {
    DNS_ldns::Query q(res_, typ, domain);
    if (!q.get_strings().empty())
      return status::found;
    if (q.nx_domain())
      return status::none;
    failed = failed || q.bogus_or_indeterminate();
  }

  return failed ? status::failed : status::none;
}

exchangers LDNS::mail_exchangers(std::string const& domain)
{
  DNS_ldns::Query q(res_, DNS::RR_type::MX, domain);

  if (q.nx_domain())
    return {status::none, {}};

  if (q.bogus_or_indeterminate())
    return {status::failed, {}};

  auto hosts = order_exchangers(q.get_records());
  if (hosts.empty())
    return {status::none, {}};

  LOG(INFO) << "MXs for " << domain << " are:";
  for (auto const& host : hosts)
    LOG(INFO) << "  " << host;

  return {status::found, std::move(hosts)};
}

status LDNS::spf(std::string const& domain)
{
  DNS_ldns::Query q(res_, DNS::RR_type::TXT, domain);

  if (q.nx_domain())
    return status::none;

  if (q.bogus_or_indeterminate())
    return status::failed;

  return has_spf(q.get_strings()) ? status::found : status::none;
}

std::vector<std::string> LDNS::host_addresses(std::string const& host)
{
  auto addrs = res_.get_strings(DNS::RR_type::A, host);
  auto const aaaas = res_.get_strings(DNS::RR_type::AAAA, host);
  addrs.insert(end(addrs), begin(aaaas), end(aaaas));
  return addrs;
}

} // namespace Resolve
