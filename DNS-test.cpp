#include "DNS-iostream.hpp"
#include "DNS-ldns.hpp"
#include "DNS-rrs.hpp"

#include <sstream>
#include <stdexcept>

#include <glog/logging.h>

template <typename T>
std::string str(T const& t)
{
  std::ostringstream os;
  os << t;
  return os.str();
}

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  uint8_t const a_rd[] = {192, 0, 2, 25};
  DNS::RR_A const a(a_rd, sizeof a_rd);
  CHECK_EQ(std::string(a.c_str()), "192.0.2.25");
  CHECK_EQ(str(DNS::RR{a}), "A 192.0.2.25");

  uint8_t const aaaa_rd[]
      = {0x20, 0x01, 0x0d, 0xb8, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0x19};
  DNS::RR_AAAA const aaaa(aaaa_rd, sizeof aaaa_rd);
  CHECK_EQ(std::string(aaaa.c_str()), "2001:db8::19");

  auto bad_a = false;
  try {
    DNS::RR_A const short_a(a_rd, 3);
  }
  catch (std::invalid_argument const&) {
    bad_a = true;
  }
  CHECK(bad_a);

  auto bad_aaaa = false;
  try {
    DNS::RR_AAAA const short_aaaa(a_rd, sizeof a_rd);
  }
  catch (std::invalid_argument const&) {
    bad_aaaa = true;
  }
  CHECK(bad_aaaa);

  CHECK(DNS::RR_MX("", 0).is_null());
  CHECK(DNS::RR_MX(".", 0).is_null());
  CHECK(!DNS::RR_MX("", 10).is_null());
  CHECK(!DNS::RR_MX("mx.example.com", 0).is_null());
  CHECK(DNS::RR_MX("a.example", 5) < DNS::RR_MX("b.example", 5));
  CHECK(DNS::RR_MX("z.example", 5) < DNS::RR_MX("a.example", 10));
  CHECK_EQ(str(DNS::RR{DNS::RR_MX("mx.example.com", 10)}),
           "MX 10 mx.example.com");

  CHECK_EQ(str(DNS::RR{DNS::RR_TXT("v=spf1 -all")}), "TXT v=spf1 -all");
  CHECK_EQ(str(DNS::RR_type::AAAA), "AAAA");
  CHECK_EQ(std::string(DNS::rcode_c_str(3)), "non-existent domain");

  DNS_ldns::Domain const dom("Example.COM");
  CHECK_EQ(dom.str(), "Example.COM");
  CHECK(dom.get() != nullptr);
}
