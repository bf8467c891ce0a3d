#include "Verify.hpp"

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <glog/logging.h>

namespace {

struct Zone {
  Resolve::status     address{Resolve::status::found};
  Resolve::exchangers mxs{Resolve::status::found, {"mx1.test", "mx2.test"}};
  Resolve::status     spf{Resolve::status::found};
};

class Fake_DNS : public Resolve::Lookup {
public:
  std::map<std::string, Zone> zones;
  std::vector<std::string>    asked;
  bool                        throws{false};

  Resolve::status address(std::string const& domain) override
  {
    asked.push_back(domain);
    if (throws)
      throw std::runtime_error("resolver on fire");
    auto const z = zones.find(domain);
    return z == zones.end() ? Resolve::status::none : z->second.address;
  }
  Resolve::exchangers mail_exchangers(std::string const& domain) override
  {
    return zones.at(domain).mxs;
  }
  Resolve::status spf(std::string const& domain) override
  {
    return zones.at(domain).spf;
  }
  std::vector<std::string> host_addresses(std::string const&) override
  {
    return {};
  }
};

class Fake_SMTP : public Callout::Prober {
public:
  std::map<std::string, bool> answers; // by exchanger, default false
  std::vector<std::string>    probed;
  std::vector<Provider::Dialect> dialects;

  bool probe(std::string const&       exchanger,
             std::string_view         address,
             Provider::Dialect const& dialect) override
  {
    probed.push_back(exchanger);
    dialects.push_back(dialect);
    auto const a = answers.find(exchanger);
    return a != answers.end() && a->second;
  }
};

void check_consistent(Verify::Result const& r)
{
  CHECK_EQ(r.checks.mailbox, r.checks.smtp) << r;
  CHECK_EQ(r.valid, r.checks.all()) << r;
}

void bad_syntax()
{
  Fake_DNS  dns;
  Fake_SMTP smtp;
  Verify::Verifier v(dns, smtp);

  for (auto const addr : {"not-an-email", "", "a@b", "a b@example.com"}) {
    auto const r = v.check(addr);
    CHECK(!r.valid);
    CHECK(r.checks == Verify::Checks{});
    CHECK_EQ(r.reason, "Invalid email format");
    CHECK_EQ(r.email, addr);
    CHECK(r == v.check(addr));
  }
  CHECK(dns.asked.empty());
  CHECK(smtp.probed.empty());

  auto const r = Verify::validate_one("not-an-email");
  CHECK(!r.valid);
  CHECK_EQ(r.reason, "Invalid email format");
}

void no_domain()
{
  Fake_DNS  dns;
  Fake_SMTP smtp;
  Verify::Verifier v(dns, smtp);

  auto const r = v.check("user@zzz-nonexistent-domain-test.invalid");
  CHECK(!r.valid);
  CHECK(!r.checks.dns);
  CHECK(!r.checks.mx);
  CHECK_EQ(r.reason, "Domain does not exist");
  check_consistent(r);

  dns.zones["broken.test"].address = Resolve::status::failed;
  auto const b = v.check("user@broken.test");
  CHECK(!b.checks.dns);
  CHECK_EQ(b.reason, "Domain does not exist");
  CHECK(smtp.probed.empty());
}

void no_mx()
{
  Fake_DNS  dns;
  Fake_SMTP smtp;
  Verify::Verifier v(dns, smtp);

  dns.zones["nomx.test"].mxs = {Resolve::status::none, {}};
  auto const r = v.check("user@nomx.test");
  CHECK(r.checks.dns);
  CHECK(!r.checks.mx);
  CHECK(!r.valid);
  CHECK_EQ(r.reason, "No mail server found for domain");
  check_consistent(r);

  dns.zones["servfail.test"].mxs = {Resolve::status::failed, {}};
  auto const f = v.check("user@servfail.test");
  CHECK(f.checks.dns);
  CHECK(!f.checks.mx);
  CHECK_EQ(f.reason, "Failed to verify mail server");
  CHECK(smtp.probed.empty());
}

void verified()
{
  Fake_DNS  dns;
  Fake_SMTP smtp;
  Verify::Verifier v(dns, smtp);

  dns.zones["good.test"];
  smtp.answers["mx2.test"] = true;

  auto const r = v.check("User@Good.Test");
  CHECK(r.valid);
  CHECK(r.checks.all());
  CHECK_EQ(r.reason, "Email verified successfully");
  CHECK_EQ(r.email, "User@Good.Test");
  check_consistent(r);

  // Tried in preference order until one says yes.
  CHECK_EQ(smtp.probed.size(), 2);
  CHECK_EQ(smtp.probed[0], "mx1.test");
  CHECK_EQ(smtp.probed[1], "mx2.test");
  CHECK(smtp.dialects[0].lenient);
  CHECK_EQ(smtp.dialects[0].helo_identity, "good.test");
  CHECK_EQ(dns.asked.back(), "good.test");
}

void generic_fallback()
{
  Fake_DNS  dns;
  Fake_SMTP smtp;
  Verify::Verifier v(dns, smtp);

  dns.zones["quiet.test"];
  auto const r = v.check("user@quiet.test");
  CHECK(r.valid);
  CHECK(r.checks.mailbox);
  CHECK(r.checks.smtp);
  CHECK_EQ(r.reason, "Email appears valid but could not fully verify");
  CHECK_EQ(smtp.probed.size(), 2);
  check_consistent(r);
}

void generic_without_spf()
{
  Fake_DNS  dns;
  Fake_SMTP smtp;
  Verify::Verifier v(dns, smtp);

  dns.zones["nospf.test"].spf = Resolve::status::none;
  smtp.answers["mx1.test"]    = true;
  auto const r = v.check("user@nospf.test");
  CHECK(r.valid);
  CHECK(r.checks.spf);
  CHECK_EQ(r.reason, "Email verified successfully");

  dns.zones["spffail.test"].spf = Resolve::status::failed;
  auto const f = v.check("user@spffail.test");
  CHECK(f.valid);
  CHECK(f.checks.spf);
}

void provider_without_spf()
{
  Fake_DNS  dns;
  Fake_SMTP smtp;
  Verify::Verifier v(dns, smtp);

  dns.zones["outlook.com"].spf = Resolve::status::none;
  auto const r = v.check("someone@outlook.com");
  CHECK(!r.valid);
  CHECK(r.checks.dns);
  CHECK(r.checks.mx);
  CHECK(!r.checks.spf);
  CHECK_EQ(r.reason, "Domain lacks SPF record");
  check_consistent(r);

  dns.zones["yahoo.com"].spf = Resolve::status::failed;
  auto const f = v.check("someone@yahoo.com");
  CHECK(!f.valid);
  CHECK_EQ(f.reason, "Failed to verify SPF record");
  CHECK(smtp.probed.empty());
}

void provider_mailbox()
{
  Fake_DNS  dns;
  Fake_SMTP smtp;
  Verify::Verifier v(dns, smtp);

  dns.zones["hotmail.com"];
  auto const r = v.check("someone@hotmail.com");
  CHECK(!r.valid);
  CHECK(r.checks.spf);
  CHECK(!r.checks.mailbox);
  CHECK(!r.checks.smtp);
  CHECK_EQ(r.reason, "Mailbox verification failed");
  check_consistent(r);

  CHECK(!smtp.dialects.empty());
  CHECK_EQ(smtp.dialects[0].name, "outlook.com");
  CHECK(!smtp.dialects[0].lenient);

  smtp.answers["mx1.test"] = true;
  auto const ok = v.check("someone@HOTMAIL.COM");
  CHECK(ok.valid);
  CHECK_EQ(ok.reason, "Email verified successfully");
}

void engine_failure()
{
  Fake_DNS  dns;
  Fake_SMTP smtp;
  Verify::Verifier v(dns, smtp);

  dns.throws = true;
  auto const r = v.check("user@good.test");
  CHECK(!r.valid);
  CHECK_EQ(r.reason, "Validation failed");
  check_consistent(r);
}

} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  bad_syntax();
  no_domain();
  no_mx();
  verified();
  generic_fallback();
  generic_without_spf();
  provider_without_spf();
  provider_mailbox();
  engine_failure();
}
