#ifndef BULK_DOT_HPP
#define BULK_DOT_HPP

#include "Verify.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Checking many addresses, a batch at a time.

namespace Bulk {

// Column name and value, in column order.
using Record = std::vector<std::pair<std::string, std::string>>;

struct Row {
  Record                        fields;
  std::optional<Verify::Result> result; // none if there was no email field
};

enum class event_type : uint8_t {
  progress,
  complete,
  error,
};

char const* event_type_c_str(event_type type);

inline std::ostream& operator<<(std::ostream& os, event_type type)
{
  return os << event_type_c_str(type);
}

struct Event {
  event_type       type;
  double           progress{0}; // percent, progress events only
  std::vector<Row> rows;        // this batch, or everything on complete
  std::string      error;
};

using Check = std::function<Verify::Result(std::string_view)>;
using Sink  = std::function<void(Event const&)>;

constexpr std::size_t batch_size = 10;

// The first non-empty value of a column named "email", any case.
std::optional<std::string> email_field(Record const& record);

// Emits a progress event after each batch, then a single complete event;
// or, if anything throws, a single error event and nothing more.
void run(std::vector<Record> const& records,
         Check const&               check,
         Sink const&                sink,
         std::size_t                batch = batch_size);

} // namespace Bulk

#endif // BULK_DOT_HPP
