#ifndef JSON_DOT_HPP
#define JSON_DOT_HPP

#include "Bulk.hpp"
#include "Verify.hpp"

#include <nlohmann/json.hpp>

// The wire form of results and bulk events; object keys stay in the
// order written.

namespace Verify {
void to_json(nlohmann::ordered_json& j, Checks const& checks);
void to_json(nlohmann::ordered_json& j, Result const& result);
} // namespace Verify

namespace Bulk {
void to_json(nlohmann::ordered_json& j, Row const& row);
void to_json(nlohmann::ordered_json& j, Event const& event);
} // namespace Bulk

#endif // JSON_DOT_HPP
