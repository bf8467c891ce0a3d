#include "JSON.hpp"

namespace Verify {

void to_json(nlohmann::ordered_json& j, Checks const& checks)
{
  j = nlohmann::ordered_json{
      {"mx", checks.mx},           {"dns", checks.dns},
      {"spf", checks.spf},         {"mailbox", checks.mailbox},
      {"smtp", checks.smtp},
  };
}

void to_json(nlohmann::ordered_json& j, Result const& result)
{
  j = nlohmann::ordered_json{
      {"email", result.email},
      {"valid", result.valid},
      {"checks", result.checks},
      {"reason", result.reason},
  };
}

} // namespace Verify

namespace Bulk {

void to_json(nlohmann::ordered_json& j, Row const& row)
{
  j = nlohmann::ordered_json::object();
  for (auto const& [name, value] : row.fields)
    j[name] = value;

  if (!row.result)
    return;

  auto const& r = *row.result;

  j["validation_result"] = r.valid ? "Valid" : "Invalid";
  j["validation_reason"] = r.reason;
  j["mx_check"]          = r.checks.mx;
  j["dns_check"]         = r.checks.dns;
  j["spf_check"]         = r.checks.spf;
  j["mailbox_check"]     = r.checks.mailbox;
  j["smtp_check"]        = r.checks.smtp;
}

void to_json(nlohmann::ordered_json& j, Event const& event)
{
  j = nlohmann::ordered_json{{"type", event_type_c_str(event.type)}};

  switch (event.type) {
  case event_type::progress:
    j["progress"]       = event.progress;
    j["partialResults"] = event.rows;
    break;
  case event_type::complete: j["results"] = event.rows; break;
  case event_type::error: j["error"] = event.error; break;
  }
}

} // namespace Bulk
