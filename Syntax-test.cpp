#include "Syntax.hpp"

#include <string>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  CHECK(Syntax::validate("user@example.com"));
  CHECK(Syntax::validate("first.last@example.com"));
  CHECK(Syntax::validate("a+tag@sub.example.co.uk"));
  CHECK(Syntax::validate("x_y%z-w@mail-1.example.org"));
  CHECK(Syntax::validate("a@b.cd"));
  CHECK(Syntax::validate("USER@EXAMPLE.COM"));
  CHECK(Syntax::validate("a--b@x--y.example"));
  CHECK(Syntax::validate("1234@123.example.com"));

  CHECK(!Syntax::validate(""));
  CHECK(!Syntax::validate("not-an-email"));
  CHECK(!Syntax::validate("@example.com"));
  CHECK(!Syntax::validate("user@"));
  CHECK(!Syntax::validate("user@example"));
  CHECK(!Syntax::validate("user@example.c"));
  CHECK(!Syntax::validate("user@example.c0m"));
  CHECK(!Syntax::validate("user@@example.com"));
  CHECK(!Syntax::validate("user@exa mple.com"));
  CHECK(!Syntax::validate(" user@example.com"));
  CHECK(!Syntax::validate("user@example.com "));
  CHECK(!Syntax::validate("user@example.com\n"));
  CHECK(!Syntax::validate("user@-example.com"));
  CHECK(!Syntax::validate("user@example-.com"));
  CHECK(!Syntax::validate("user@example..com"));
  CHECK(!Syntax::validate("user@.example.com"));
  CHECK(!Syntax::validate(".user@example.com"));
  CHECK(!Syntax::validate("user.@example.com"));
  CHECK(Syntax::validate("us..er@example.com"));
  CHECK(Syntax::validate("a.-_b@example.com"));
  CHECK(!Syntax::validate("\"quoted\"@example.com"));
  CHECK(!Syntax::validate("user@[192.0.2.1]"));
  CHECK(!Syntax::validate("üser@example.com"));

  auto const local63 = std::string(63, 'a');
  auto const local64 = std::string(64, 'a');
  CHECK(Syntax::validate(local63 + "@example.com"));
  CHECK(!Syntax::validate(local64 + "@example.com"));

  auto const label63 = std::string(63, 'b');
  auto const label64 = std::string(64, 'b');
  CHECK(Syntax::validate("user@" + label63 + ".com"));
  CHECK(!Syntax::validate("user@" + label64 + ".com"));
  CHECK(!Syntax::validate("user@example." + std::string(64, 'c')));

  CHECK_EQ(Syntax::domain("user@example.com"), "example.com");
  CHECK_EQ(Syntax::domain("a.b@Sub.Example.ORG"), "Sub.Example.ORG");
  CHECK(Syntax::domain("no-at-sign").empty());
}
