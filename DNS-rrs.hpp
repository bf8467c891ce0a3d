#ifndef DNS_RRS_DOT_HPP
#define DNS_RRS_DOT_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <netinet/in.h>

namespace DNS {

// Only the types a deliverability check ever asks for.
enum class RR_type : uint16_t {
  // RFC 1035 section 3.2.2 “TYPE values”
  A     = 1,
  CNAME = 5,
  MX    = 15,
  TXT   = 16,

  // RFC 3596 section 2.1 “AAAA record type”
  AAAA = 28,
};

constexpr char const* RR_type_c_str(RR_type type)
{
  switch (type) { // clang-format off
  case RR_type::A:     return "A";
  case RR_type::CNAME: return "CNAME";
  case RR_type::MX:    return "MX";
  case RR_type::TXT:   return "TXT";
  case RR_type::AAAA:  return "AAAA";
  } // clang-format on
  return "*** unknown RR_type ***";
}

constexpr char const* RR_type_c_str(uint16_t type)
{
  return RR_type_c_str(static_cast<RR_type>(type));
}

constexpr char const* rcode_c_str(uint16_t rcode)
{
  switch (rcode) { // clang-format off
  case 0:  return "no error";                           // [RFC1035]
  case 1:  return "format error";                       // [RFC1035]
  case 2:  return "server failure";                     // [RFC1035]
  case 3:  return "non-existent domain";                // [RFC1035]
  case 4:  return "not implemented";                    // [RFC1035]
  case 5:  return "query Refused";                      // [RFC1035]
  } // clang-format on
  return "*** other rcode ***";
}

class RR_A {
public:
  RR_A(uint8_t const* rd, size_t sz);

  std::optional<std::string> as_str() const { return std::string{str_}; }

  sockaddr_in const& addr() const { return addr_; }
  char const*        c_str() const { return str_; }
  constexpr static RR_type rr_type() { return RR_type::A; }

  bool operator==(RR_A const& rhs) const { return strcmp(str_, rhs.str_) == 0; }
  bool operator<(RR_A const& rhs) const { return strcmp(str_, rhs.str_) < 0; }

private:
  sockaddr_in addr_{};
  char        str_[INET_ADDRSTRLEN]{'\0'};
};

class RR_CNAME {
public:
  explicit RR_CNAME(std::string cname)
    : cname_(cname)
  {
  }

  std::optional<std::string> as_str() const { return str(); }

  std::string const& str() const { return cname_; }
  char const*        c_str() const { return str().c_str(); }
  constexpr static RR_type rr_type() { return RR_type::CNAME; }

  bool operator==(RR_CNAME const& rhs) const { return str() == rhs.str(); }
  bool operator<(RR_CNAME const& rhs) const { return str() < rhs.str(); }

private:
  std::string cname_;
};

class RR_MX {
public:
  RR_MX(std::string exchange, uint16_t preference)
    : exchange_(exchange)
    , preference_(preference)
  {
  }

  std::optional<std::string> as_str() const { return exchange(); }

  std::string const& exchange() const { return exchange_; }
  uint16_t           preference() const { return preference_; }

  // RFC 7505 “A "Null MX" No Service Resource Record”
  bool is_null() const
  {
    return (preference() == 0) && (exchange().empty() || exchange() == ".");
  }

  constexpr static RR_type rr_type() { return RR_type::MX; }

  bool operator==(RR_MX const& rhs) const
  {
    return (preference() == rhs.preference()) && (exchange() == rhs.exchange());
  }
  bool operator<(RR_MX const& rhs) const
  {
    if (preference() == rhs.preference())
      return exchange() < rhs.exchange();
    return preference() < rhs.preference();
  }

private:
  std::string exchange_;
  uint16_t    preference_;
};

// All the character-strings of one TXT record, concatenated.
class RR_TXT {
public:
  explicit RR_TXT(std::string txt_data)
    : txt_data_(txt_data)
  {
  }

  std::optional<std::string> as_str() const { return str(); }

  char const*        c_str() const { return str().c_str(); }
  std::string const& str() const { return txt_data_; }
  constexpr static RR_type rr_type() { return RR_type::TXT; }

  bool operator==(RR_TXT const& rhs) const { return str() == rhs.str(); }
  bool operator<(RR_TXT const& rhs) const { return str() < rhs.str(); }

private:
  std::string txt_data_;
};

class RR_AAAA {
public:
  RR_AAAA(uint8_t const* rd, size_t sz);

  std::optional<std::string> as_str() const { return std::string{c_str()}; }

  sockaddr_in6 const& addr() const { return addr_; }
  char const*         c_str() const { return str_; }
  constexpr static RR_type rr_type() { return RR_type::AAAA; }

  bool operator==(RR_AAAA const& rhs) const
  {
    return strcmp(c_str(), rhs.c_str()) == 0;
  }
  bool operator<(RR_AAAA const& rhs) const
  {
    return strcmp(c_str(), rhs.c_str()) < 0;
  }

private:
  sockaddr_in6 addr_{};
  char         str_[INET6_ADDRSTRLEN]{'\0'};
};

using RR = std::variant<RR_A, RR_CNAME, RR_MX, RR_TXT, RR_AAAA>;

using RR_collection = std::vector<RR>;

} // namespace DNS

#endif // DNS_RRS_DOT_HPP
