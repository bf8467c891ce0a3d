#include "Bulk.hpp"

#include "iequal.hpp"

#include <algorithm>
#include <exception>
#include <future>

#include <glog/logging.h>

using std::begin;
using std::end;

namespace Bulk {

char const* event_type_c_str(event_type type)
{
  switch (type) { // clang-format off
  case event_type::progress: return "progress";
  case event_type::complete: return "complete";
  case event_type::error:    return "error";
  } // clang-format on
  return "*** unknown event_type ***";
}

std::optional<std::string> email_field(Record const& record)
{
  auto const field = std::find_if(begin(record), end(record), [](auto const& f) {
    return iequal(f.first, "email") && !f.second.empty();
  });
  if (field == end(record))
    return {};
  return field->second;
}

void run(std::vector<Record> const& records,
         Check const&               check,
         Sink const&                sink,
         std::size_t                batch)
{
  CHECK_GT(batch, 0u) << "batch size must be positive";

  auto const total = records.size();

  std::vector<Row> all;
  all.reserve(total);

  try {
    for (std::size_t first = 0; first < total; first += batch) {
      auto const last = std::min(total, first + batch);

      std::vector<std::future<std::optional<Verify::Result>>> results;
      results.reserve(last - first);

      for (auto i = first; i < last; ++i) {
        results.push_back(std::async(
            std::launch::async,
            [&check, email = email_field(records[i])]()
                -> std::optional<Verify::Result> {
              if (!email)
                return {};
              return check(*email);
            }));
      }

      Event ev{event_type::progress};
      ev.rows.reserve(last - first);
      for (auto i = first; i < last; ++i) {
        ev.rows.push_back(Row{records[i], results[i - first].get()});
      }
      ev.progress = std::min(100.0, 100.0 * last / total);

      LOG(INFO) << "checked " << last << " of " << total;

      sink(ev);
      all.insert(end(all), begin(ev.rows), end(ev.rows));
    }

    Event done{event_type::complete};
    done.rows = std::move(all);
    sink(done);
  }
  catch (std::exception const& e) {
    LOG(ERROR) << "bulk check stopped: " << e.what();
    Event err{event_type::error};
    err.error = "Failed to process records";
    sink(err);
  }
}

} // namespace Bulk
