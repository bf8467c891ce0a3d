#include "Reply.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  auto const greeting = Reply::parse("220 mx.example.com ESMTP ready");
  CHECK(greeting);
  CHECK_EQ(greeting->code, 220);
  CHECK(greeting->last);
  CHECK_EQ(greeting->text, "mx.example.com ESMTP ready");

  auto const more = Reply::parse("250-mx.example.com Hello");
  CHECK(more);
  CHECK_EQ(more->code, 250);
  CHECK(!more->last);
  CHECK_EQ(more->text, "mx.example.com Hello");

  auto const bare = Reply::parse("250");
  CHECK(bare);
  CHECK_EQ(bare->code, 250);
  CHECK(bare->last);
  CHECK(bare->text.empty());

  auto const rejected = Reply::parse("550 5.1.1 <nobody@example.com> unknown");
  CHECK(rejected);
  CHECK_EQ(rejected->code, 550);
  CHECK(rejected->last);

  CHECK(!Reply::parse(""));
  CHECK(!Reply::parse("hello"));
  CHECK(!Reply::parse("25 short"));
  CHECK(!Reply::parse("2500 long"));
  CHECK(!Reply::parse("650 out of range"));
  CHECK(!Reply::parse("160 out of range"));
  CHECK(!Reply::parse("250:bad separator"));

  CHECK(Reply::is_positive(220));
  CHECK(Reply::is_positive(252));
  CHECK(!Reply::is_positive(354));
  CHECK(!Reply::is_positive(451));

  CHECK(Reply::is_permanent(500));
  CHECK(Reply::is_permanent(554));
  CHECK(!Reply::is_permanent(450));

  CHECK(Reply::is_soft_transient(451));
  CHECK(Reply::is_soft_transient(452));
  CHECK(!Reply::is_soft_transient(450));
  CHECK(!Reply::is_soft_transient(421));
}
