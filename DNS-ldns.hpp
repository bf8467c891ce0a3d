#ifndef DNS_LDNS_DOT_HPP
#define DNS_LDNS_DOT_HPP

#include <ostream>
#include <string>
#include <vector>

#include "DNS-rrs.hpp"

// forward decl
typedef struct ldns_struct_pkt      ldns_pkt;
typedef struct ldns_struct_rdf      ldns_rdf;
typedef struct ldns_struct_resolver ldns_resolver;
typedef struct ldns_struct_rr_list  ldns_rr_list;

namespace DNS_ldns {

class Domain {
public:
  Domain(Domain const&) = delete;
  Domain& operator=(Domain const&) = delete;

  explicit Domain(char const* domain);
  explicit Domain(std::string const& domain);
  ~Domain();

  std::string const& str() const { return str_; }
  ldns_rdf*          get() const { return rdfp_; }

private:
  std::string str_;
  ldns_rdf*   rdfp_;

  friend std::ostream& operator<<(std::ostream& os, Domain const& dom)
  {
    return os << dom.str();
  }
};

// One per thread: an ldns_resolver keeps per-nameserver RTT state and
// is not safe to share.
class Resolver {
public:
  Resolver(Resolver const&) = delete;
  Resolver& operator=(Resolver const&) = delete;

  // Reads the system resolv.conf; throws std::runtime_error if that
  // can't be done.
  Resolver();
  ~Resolver();

  std::vector<std::string> get_strings(DNS::RR_type       typ,
                                       std::string const& domain) const
  {
    return get_strings(typ, domain.c_str());
  }
  std::vector<std::string> get_strings(DNS::RR_type typ,
                                       char const*  domain) const;

  ldns_resolver* get() const { return res_; }

private:
  ldns_resolver* res_{nullptr};
};

class Query {
public:
  Query(Query const&) = delete;
  Query& operator=(Query const&) = delete;

  Query(Resolver const& res, DNS::RR_type type, std::string const& dom);
  Query(Resolver const& res, DNS::RR_type type, char const* dom);
  ~Query();

  ldns_pkt* get() const { return p_; }

  bool bogus_or_indeterminate() const { return bogus_or_indeterminate_; }
  bool nx_domain() const { return nx_domain_; }

  DNS::RR_type type() const { return type_; }

  DNS::RR_collection       get_records() const;
  std::vector<std::string> get_strings() const;

private:
  DNS::RR_type type_;

  ldns_pkt* p_{nullptr};

  bool bogus_or_indeterminate_{false};
  bool nx_domain_{false};
};

class RR_list {
public:
  RR_list(RR_list const&) = delete;
  RR_list& operator=(RR_list const&) = delete;

  explicit RR_list(Query const& q);

  DNS::RR_collection get_records() const;

  // Only records of type, as strings.
  std::vector<std::string> get_strings(DNS::RR_type type) const;

private:
  ldns_rr_list* rrlst_answer_{nullptr};
};

} // namespace DNS_ldns

#endif // DNS_LDNS_DOT_HPP
