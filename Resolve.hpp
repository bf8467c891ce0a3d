#ifndef RESOLVE_DOT_HPP
#define RESOLVE_DOT_HPP

#include "DNS-ldns.hpp"
#include "DNS-rrs.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

// The DNS questions a deliverability check asks about a domain.

namespace Resolve {

enum class status : uint8_t {
  found,
  none,   // definitive: NXDOMAIN or no records of the type
  failed, // no usable answer: SERVFAIL, timeout, &c.
};

char const* status_c_str(status st);

inline std::ostream& operator<<(std::ostream& os, status st)
{
  return os << status_c_str(st);
}

struct exchangers {
  status                   st{status::failed};
  std::vector<std::string> hosts; // most preferred first
};

class Lookup {
public:
  virtual ~Lookup() = default;

  // Does the domain have an A or AAAA record?
  virtual status address(std::string const& domain) = 0;

  virtual exchangers mail_exchangers(std::string const& domain) = 0;

  // Is there a TXT record containing "v=spf1"?
  virtual status spf(std::string const& domain) = 0;

  // A then AAAA addresses for a mail exchanger's host name.
  virtual std::vector<std::string> host_addresses(std::string const& host) = 0;
};

class LDNS : public Lookup {
public:
  LDNS() = default;

  status     address(std::string const& domain) override;
  exchangers mail_exchangers(std::string const& domain) override;
  status     spf(std::string const& domain) override;

  std::vector<std::string> host_addresses(std::string const& host) override;

private:
  DNS_ldns::Resolver res_;
};

// Exchanger names by preference, equal preferences in random order.  An
// RFC 7505 null MX, or only "localhost", leaves the list empty.
std::vector<std::string> order_exchangers(DNS::RR_collection const& rrs);

bool has_spf(std::vector<std::string> const& txts);

} // namespace Resolve

#endif // RESOLVE_DOT_HPP
