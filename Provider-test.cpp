#include "Provider.hpp"

#include <glog/logging.h>

using namespace std::chrono_literals;

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK_EQ(Provider::registry().size(), 3);

  auto const outlook = Provider::lookup("hotmail.com");
  CHECK(outlook != nullptr);
  CHECK_EQ(outlook->name, "outlook.com");
  CHECK_EQ(outlook->helo_identity, "outlook-com.olc.protection.outlook.com");
  CHECK(outlook->timeout == 15s);
  CHECK(outlook->is_success(250));
  CHECK(outlook->is_success(251));
  CHECK(!outlook->is_success(252));
  CHECK(!outlook->lenient);

  CHECK_EQ(Provider::lookup("outlook.com"), outlook);
  CHECK_EQ(Provider::lookup("LIVE.com"), outlook);

  auto const yahoo = Provider::lookup("ymail.com");
  CHECK(yahoo != nullptr);
  CHECK_EQ(yahoo->name, "yahoo.com");
  CHECK(yahoo->timeout == 12s);
  CHECK(yahoo->is_success(235));
  CHECK_EQ(Provider::lookup("yahoo.co.uk"), yahoo);

  auto const icloud = Provider::lookup("Me.Com");
  CHECK(icloud != nullptr);
  CHECK_EQ(icloud->name, "icloud.com");
  CHECK_EQ(icloud->helo_identity, "icloud-com.mail.protection.outlook.com");
  CHECK(icloud->timeout == 10s);
  CHECK(icloud->is_success(220));
  CHECK_EQ(Provider::lookup("mac.com"), icloud);

  // Exact aliases only.
  CHECK(!Provider::is_registered("gmail.com"));
  CHECK(!Provider::is_registered("mail.outlook.com"));
  CHECK(!Provider::is_registered("outlook.com.example"));
  CHECK(!Provider::is_registered("yahoo.de"));
  CHECK(!Provider::is_registered(""));
  CHECK(Provider::is_registered("icloud.com"));

  auto const generic = Provider::generic("example.org");
  CHECK_EQ(generic.name, "generic");
  CHECK_EQ(generic.helo_identity, "example.org");
  CHECK(generic.timeout == Provider::Config::generic_timeout);
  CHECK(generic.lenient);
  CHECK(generic.is_success(250));
  CHECK(generic.is_success(251));
  CHECK(generic.is_success(252));
  CHECK(!generic.is_success(220));
}
