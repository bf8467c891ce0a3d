#include "DNS-ldns.hpp"

#include "DNS-iostream.hpp"

#include <algorithm>
#include <stdexcept>

#include <cstdbool> // needs to be above ldns includes
#include <ldns/ldns.h>
#include <ldns/packet.h>
#include <ldns/rr.h>

#include <arpa/inet.h>

#include <glog/logging.h>

#include <fmt/format.h>

namespace DNS_ldns {

std::string rr_name_str(ldns_rdf const* rdf)
{
  auto const sz = ldns_rdf_size(rdf);

  if (sz > LDNS_MAX_DOMAINLEN) {
    LOG(WARNING) << "rdf size too large";
    return "<too long>";
  }
  if (sz == 1) {
    return ""; // root label
  }

  auto const data = ldns_rdf_data(rdf);

  size_t        src_pos = 0;
  unsigned char len     = data[src_pos];

  std::string str;
  str.reserve(64);
  while ((len > 0) && (src_pos < sz)) {
    src_pos++;
    for (unsigned char i = 0; (i < len) && (src_pos < sz); ++i) {
      unsigned char c = data[src_pos];
      if (c == '.' || c == '\\') {
        str += '\\';
      }
      str += c;
      src_pos++;
    }
    if (src_pos < sz) {
      str += '.';
      len = data[src_pos];
    }
    else {
      len = 0;
    }
  }

  if (str.length() && ('.' == str.back())) {
    str.erase(str.length() - 1);
  }

  return str;
}

// A TXT RR carries one or more <character-string>s, each with a
// leading length octet.
std::string txt_str(ldns_rr const* rr)
{
  std::string str;
  for (size_t i = 0; i < ldns_rr_rd_count(rr); ++i) {
    auto const rdf = ldns_rr_rdf(rr, i);
    if (ldns_rdf_get_type(rdf) != LDNS_RDF_TYPE_STR || !ldns_rdf_size(rdf))
      continue;
    auto const udata = ldns_rdf_data(rdf);
    auto const len   = std::min<size_t>(udata[0], ldns_rdf_size(rdf) - 1);
    str.append(reinterpret_cast<char const*>(udata + 1), len);
  }
  return str;
}

Resolver::Resolver()
{
  auto const status = ldns_resolver_new_frm_file(&res_, nullptr);
  if (status != LDNS_STATUS_OK) {
    throw std::runtime_error(
        fmt::format("failed to initialize DNS resolver: {}",
                    ldns_get_errorstr_by_id(status)));
  }
}

Resolver::~Resolver() { ldns_resolver_deep_free(res_); }

Domain::Domain(char const* domain)
  : str_(domain)
  , rdfp_(ldns_dname_new_frm_str(domain))
{
  if (!rdfp_)
    throw std::invalid_argument(fmt::format("bad domain name {}", str_));
}

Domain::Domain(std::string const& domain)
  : Domain(domain.c_str())
{
}

Domain::~Domain() { ldns_rdf_deep_free(rdfp_); }

Query::Query(Resolver const& res, DNS::RR_type type, std::string const& dom)
  : Query(res, type, dom.c_str())
{
}

Query::Query(Resolver const& res, DNS::RR_type type, char const* domain)
  : type_(type)
{
  Domain dom(domain);

  ldns_status status = ldns_resolver_query_status(
      &p_, res.get(), dom.get(), static_cast<ldns_enum_rr_type>(type),
      LDNS_RR_CLASS_IN, LDNS_RD);

  if (status != LDNS_STATUS_OK) {
    bogus_or_indeterminate_ = true;

    LOG(WARNING) << "Query (" << dom.str() << "/" << type << ") "
                 << "ldns_resolver_query_status failed: "
                 << ldns_get_errorstr_by_id(status);

    // If we have only one nameserver, reset the RTT otherwise all
    // future use of this resolver object will fail.

    ldns_resolver_set_nameserver_rtt(res.get(), 0,
                                     LDNS_RESOLV_RTT_MIN); // "reachable"
  }

  if (p_) {
    auto const rcode = ldns_pkt_get_rcode(p_);

    switch (rcode) {
    case LDNS_RCODE_NOERROR:
      break;

    case LDNS_RCODE_NXDOMAIN:
      nx_domain_ = true;
      LOG(INFO) << "NX domain (" << dom.str() << "/" << type << ")";
      break;

    case LDNS_RCODE_SERVFAIL:
      bogus_or_indeterminate_ = true;
      LOG(WARNING) << "DNS server fail (" << dom.str() << "/" << type << ")";
      break;

    default:
      bogus_or_indeterminate_ = true;
      LOG(WARNING) << "DNS unknown error (" << dom.str() << "/" << type
                   << "), rcode = " << DNS::rcode_c_str(rcode) << " (" << rcode
                   << ")";
      break;
    }
  }
  else {
    bogus_or_indeterminate_ = true;
  }
}

Query::~Query()
{
  if (p_)
    ldns_pkt_free(p_);
}

DNS::RR_collection Query::get_records() const
{
  RR_list rrlst(*this);
  return rrlst.get_records();
}

std::vector<std::string> Query::get_strings() const
{
  RR_list rrlst(*this);
  return rrlst.get_strings(type_);
}

RR_list::RR_list(Query const& q)
{
  if (q.get()) {
    // no clones, so no frees required
    rrlst_answer_ = ldns_pkt_answer(q.get());
  }
}

DNS::RR_collection RR_list::get_records() const
{
  DNS::RR_collection ret;

  if (!rrlst_answer_)
    return ret;

  ret.reserve(ldns_rr_list_rr_count(rrlst_answer_));

  for (unsigned i = 0; i < ldns_rr_list_rr_count(rrlst_answer_); ++i) {
    auto const rr = ldns_rr_list_rr(rrlst_answer_, i);
    if (!rr)
      continue;

    // Malformed records are skipped.
    try {
      switch (ldns_rr_get_type(rr)) {
      case LDNS_RR_TYPE_A: {
        auto const rdf = ldns_rr_rdf(rr, 0);
        if (!rdf || ldns_rdf_get_type(rdf) != LDNS_RDF_TYPE_A)
          break;
        ret.emplace_back(DNS::RR_A{ldns_rdf_data(rdf), ldns_rdf_size(rdf)});
        break;
      }
      case LDNS_RR_TYPE_CNAME: {
        auto const rdf = ldns_rr_rdf(rr, 0);
        if (!rdf || ldns_rdf_get_type(rdf) != LDNS_RDF_TYPE_DNAME)
          break;
        ret.emplace_back(DNS::RR_CNAME{rr_name_str(rdf)});
        break;
      }
      case LDNS_RR_TYPE_MX: {
        if (ldns_rr_rd_count(rr) != 2)
          break;
        auto const rdf_0 = ldns_rr_rdf(rr, 0);
        auto const rdf_1 = ldns_rr_rdf(rr, 1);
        if ((ldns_rdf_get_type(rdf_0) != LDNS_RDF_TYPE_INT16)
            || (ldns_rdf_get_type(rdf_1) != LDNS_RDF_TYPE_DNAME))
          break;
        ret.emplace_back(
            DNS::RR_MX{rr_name_str(rdf_1), ldns_rdf2native_int16(rdf_0)});
        break;
      }
      case LDNS_RR_TYPE_TXT: {
        ret.emplace_back(DNS::RR_TXT{txt_str(rr)});
        break;
      }
      case LDNS_RR_TYPE_AAAA: {
        auto const rdf = ldns_rr_rdf(rr, 0);
        if (!rdf || ldns_rdf_get_type(rdf) != LDNS_RDF_TYPE_AAAA)
          break;
        ret.emplace_back(
            DNS::RR_AAAA{ldns_rdf_data(rdf), ldns_rdf_size(rdf)});
        break;
      }
      default:
        LOG(WARNING) << "unexpected RR type == " << ldns_rr_get_type(rr);
        break;
      }
    }
    catch (std::invalid_argument const& e) {
      LOG(WARNING) << "malformed RR skipped: " << e.what();
    }
  }

  return ret;
}

std::vector<std::string> RR_list::get_strings(DNS::RR_type type) const
{
  std::vector<std::string> ret;

  for (auto const& rr : get_records()) {
    std::visit(
        [&ret, type](auto const& r) {
          if (type == r.rr_type()) {
            auto const s = r.as_str();
            if (s)
              ret.push_back(*s);
          }
        },
        rr);
  }

  return ret;
}

std::vector<std::string> Resolver::get_strings(DNS::RR_type typ,
                                               char const*  domain) const
{
  Query q(*this, typ, domain);
  return q.get_strings();
}

} // namespace DNS_ldns
