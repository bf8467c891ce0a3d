#include "Resolve.hpp"

#include <set>
#include <string>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK_EQ(std::string(Resolve::status_c_str(Resolve::status::failed)),
           "failed");

  // Preference order.
  DNS::RR_collection const rrs{
      DNS::RR_MX("mx30.example.com", 30),
      DNS::RR_TXT("not an MX"),
      DNS::RR_MX("mx10.example.com", 10),
      DNS::RR_MX("mx20.example.com", 20),
  };
  auto const hosts = Resolve::order_exchangers(rrs);
  CHECK_EQ(hosts.size(), 3);
  CHECK_EQ(hosts[0], "mx10.example.com");
  CHECK_EQ(hosts[1], "mx20.example.com");
  CHECK_EQ(hosts[2], "mx30.example.com");

  // Ties are all there, in some order, ahead of the next preference.
  DNS::RR_collection const ties{
      DNS::RR_MX("b.example.com", 5),
      DNS::RR_MX("c.example.com", 50),
      DNS::RR_MX("a.example.com", 5),
  };
  auto const tied = Resolve::order_exchangers(ties);
  CHECK_EQ(tied.size(), 3);
  CHECK(std::set<std::string>(tied.begin(), tied.begin() + 2)
        == (std::set<std::string>{"a.example.com", "b.example.com"}));
  CHECK_EQ(tied[2], "c.example.com");

  // RFC 7505 null MX.
  CHECK(Resolve::order_exchangers({DNS::RR_MX("", 0)}).empty());
  CHECK(Resolve::order_exchangers({DNS::RR_MX(".", 0)}).empty());

  // Useless entries dropped.
  auto const mixed = Resolve::order_exchangers({
      DNS::RR_MX("localhost", 0),
      DNS::RR_MX("", 0),
      DNS::RR_MX("mx.example.com", 10),
  });
  CHECK_EQ(mixed.size(), 1);
  CHECK_EQ(mixed[0], "mx.example.com");

  CHECK(Resolve::order_exchangers({DNS::RR_MX("LocalHost", 10)}).empty());
  CHECK(Resolve::order_exchangers({}).empty());

  CHECK(Resolve::has_spf({"v=spf1 include:_spf.example.com ~all"}));
  CHECK(Resolve::has_spf({"google-site-verification=xyz", "v=spf1 -all"}));
  CHECK(!Resolve::has_spf({}));
  CHECK(!Resolve::has_spf({"google-site-verification=xyz"}));
  CHECK(!Resolve::has_spf({"v=DMARC1; p=none"}));
}
