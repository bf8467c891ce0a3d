#include "iequal.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  CHECK(iequal("", ""));
  CHECK(!iequal("a", ""));
  CHECK(!iequal("", "b"));

  CHECK(iequal("Email", "email"));
  CHECK(iequal("HOTMAIL.COM", "hotmail.com"));
  CHECK(iequal("localhost", "LocalHost"));
  CHECK(!iequal("e-mail", "email"));
  CHECK(!iequal("live.com.", "live.com"));
}
