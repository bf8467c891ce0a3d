#include "JSON.hpp"

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Verify::Result result;
  result.email         = "user@example.com";
  result.valid         = false;
  result.checks.dns    = true;
  result.checks.mx     = true;
  result.reason        = "Mailbox verification failed";

  nlohmann::ordered_json const j = result;
  CHECK_EQ(j.dump(),
           R"({"email":"user@example.com","valid":false,)"
           R"("checks":{"mx":true,"dns":true,"spf":false,"mailbox":false,)"
           R"("smtp":false},"reason":"Mailbox verification failed"})");

  Bulk::Row row{{{"name", "User"}, {"email", "user@example.com"}}, result};
  nlohmann::ordered_json const r = row;
  CHECK_EQ(r.dump(),
           R"({"name":"User","email":"user@example.com",)"
           R"("validation_result":"Invalid",)"
           R"("validation_reason":"Mailbox verification failed",)"
           R"("mx_check":true,"dns_check":true,"spf_check":false,)"
           R"("mailbox_check":false,"smtp_check":false})");

  Bulk::Row bare{{{"name", "Nobody"}}, {}};
  CHECK_EQ(nlohmann::ordered_json(bare).dump(), R"({"name":"Nobody"})");

  Bulk::Event progress{Bulk::event_type::progress};
  progress.progress = 40;
  progress.rows     = {bare};
  CHECK_EQ(nlohmann::ordered_json(progress).dump(),
           R"({"type":"progress","progress":40.0,)"
           R"("partialResults":[{"name":"Nobody"}]})");

  Bulk::Event complete{Bulk::event_type::complete};
  CHECK_EQ(nlohmann::ordered_json(complete).dump(),
           R"({"type":"complete","results":[]})");

  Bulk::Event error{Bulk::event_type::error};
  error.error = "Failed to process records";
  CHECK_EQ(nlohmann::ordered_json(error).dump(),
           R"({"type":"error","error":"Failed to process records"})");
}
