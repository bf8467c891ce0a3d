#include "CSV.hpp"

#include <sstream>
#include <stdexcept>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  {
    std::istringstream in("\xEF\xBB\xBF"
                          "name, Email ,note\r\n"
                          "Alice,alice@example.com,first\r\n"
                          "\r\n"
                          "  Bob  ,  bob@example.com  \r\n"
                          "\"Carol, Jr.\",carol@example.com,\"a, b\",extra\n"
                          "   \n");
    auto const records = CSV::read(in);
    CHECK_EQ(records.size(), 3);

    CHECK_EQ(records[0].size(), 3);
    CHECK_EQ(records[0][0].first, "name");
    CHECK_EQ(records[0][1].first, "Email");
    CHECK_EQ(records[0][1].second, "alice@example.com");
    CHECK_EQ(records[0][2].second, "first");

    // Padded.
    CHECK_EQ(records[1][0].second, "Bob");
    CHECK_EQ(records[1][1].second, "bob@example.com");
    CHECK_EQ(records[1][2].first, "note");
    CHECK(records[1][2].second.empty());

    // Quoted, with the extra field dropped.
    CHECK_EQ(records[2].size(), 3);
    CHECK_EQ(records[2][0].second, "Carol, Jr.");
    CHECK_EQ(records[2][2].second, "a, b");

    CHECK_EQ(*Bulk::email_field(records[2]), "carol@example.com");
  }

  {
    std::istringstream in("");
    CHECK(CSV::read(in).empty());
  }

  {
    std::istringstream in("email\n");
    CHECK(CSV::read(in).empty());
  }

  {
    auto const fields = CSV::split("a,,\"b\\c\"");
    CHECK_EQ(fields.size(), 3);
    CHECK(fields[1].empty());
    CHECK_EQ(fields[2], "b\\c");
  }

  {
    auto const fields = CSV::split(R"("say ""hi""",x,"""",a""b)");
    CHECK_EQ(fields.size(), 4);
    CHECK_EQ(fields[0], "say \"hi\"");
    CHECK_EQ(fields[1], "x");
    CHECK_EQ(fields[2], "\"");
    CHECK_EQ(fields[3], "ab");
  }

  {
    // A quoted field can't run onto the next line.
    std::istringstream in("email,note\na@b.cd,\"first\nsecond\"\n");
    auto threw = false;
    try {
      CSV::read(in);
    }
    catch (std::exception const&) {
      threw = true;
    }
    CHECK(threw);
  }

  {
    std::istringstream in("email\n\"unterminated@example.com\n");
    auto threw = false;
    try {
      CSV::read(in);
    }
    catch (std::exception const&) {
      threw = true;
    }
    CHECK(threw);
  }
}
