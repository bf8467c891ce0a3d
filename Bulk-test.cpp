#include "Bulk.hpp"

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

#include <glog/logging.h>

namespace {

Verify::Result fake_check(std::string_view address)
{
  Verify::Result r;
  r.email  = std::string(address);
  r.valid  = address.starts_with("good");
  r.reason = r.valid ? "Email verified successfully" : "Invalid email format";
  return r;
}

std::vector<Bulk::Record> make_records(int n)
{
  std::vector<Bulk::Record> records;
  for (auto i = 0; i < n; ++i) {
    records.push_back({{"name", "person " + std::to_string(i)},
                       {"Email", (i % 2 ? "bad" : "good")
                                     + std::to_string(i) + "@example.com"}});
  }
  return records;
}

void email_field()
{
  CHECK(!Bulk::email_field({}));
  CHECK(!Bulk::email_field({{"name", "x"}}));
  CHECK(!Bulk::email_field({{"email", ""}}));
  CHECK_EQ(*Bulk::email_field({{"EMAIL", "a@b.cd"}}), "a@b.cd");
  CHECK_EQ(*Bulk::email_field({{"name", "x"}, {"Email", "a@b.cd"}}), "a@b.cd");
  CHECK(!Bulk::email_field({{"e-mail", "a@b.cd"}}));
  CHECK(!Bulk::email_field({{"email", ""}, {"EMAIL", ""}}));
  CHECK_EQ(*Bulk::email_field({{"email", ""}, {"EMAIL", "c@d.ef"}}), "c@d.ef");
}

void twenty_five()
{
  auto const records = make_records(25);

  std::vector<Bulk::Event> events;
  Bulk::run(records, fake_check,
            [&events](Bulk::Event const& ev) { events.push_back(ev); });

  CHECK_EQ(events.size(), 4);
  CHECK_EQ(events[0].type, Bulk::event_type::progress);
  CHECK_EQ(events[0].progress, 40.0);
  CHECK_EQ(events[0].rows.size(), 10);
  CHECK_EQ(events[1].progress, 80.0);
  CHECK_EQ(events[1].rows.size(), 10);
  CHECK_EQ(events[2].progress, 100.0);
  CHECK_EQ(events[2].rows.size(), 5);
  CHECK_EQ(events[3].type, Bulk::event_type::complete);
  CHECK_EQ(events[3].rows.size(), 25);

  // Partial results, concatenated, are the input in order.
  std::vector<Bulk::Row> partial;
  for (auto i = 0; i < 3; ++i)
    partial.insert(partial.end(), events[i].rows.begin(), events[i].rows.end());
  CHECK_EQ(partial.size(), records.size());
  for (std::size_t i = 0; i < records.size(); ++i) {
    CHECK(partial[i].fields == records[i]);
    CHECK(events[3].rows[i].fields == records[i]);
    CHECK(partial[i].result);
    CHECK_EQ(partial[i].result->email, records[i][1].second);
    CHECK_EQ(partial[i].result->valid, i % 2 == 0);
  }
}

void batch_sizes()
{
  struct {
    int n;
    int batch;
    int expected; // progress events
  } const cases[]{{10, 10, 1}, {11, 10, 2}, {1, 10, 1}, {7, 3, 3}};

  for (auto const [n, batch, expected] : cases) {
    std::vector<Bulk::Event> events;
    Bulk::run(
        make_records(n), fake_check,
        [&events](Bulk::Event const& ev) { events.push_back(ev); }, batch);
    CHECK_EQ(events.size(), expected + 1) << n << " records by " << batch;
    CHECK_EQ(events[expected - 1].progress, 100.0);
    CHECK_EQ(events.back().type, Bulk::event_type::complete);
    CHECK_EQ(events.back().rows.size(), n);
  }
}

void empty()
{
  std::vector<Bulk::Event> events;
  Bulk::run({}, fake_check,
            [&events](Bulk::Event const& ev) { events.push_back(ev); });
  CHECK_EQ(events.size(), 1);
  CHECK_EQ(events[0].type, Bulk::event_type::complete);
  CHECK(events[0].rows.empty());
}

void no_email()
{
  std::atomic<int> checked{0};

  std::vector<Bulk::Record> records{
      {{"name", "no address"}},
      {{"email", ""}},
      {{"email", "good@example.com"}},
  };
  std::vector<Bulk::Event> events;
  Bulk::run(
      records,
      [&checked](std::string_view addr) {
        ++checked;
        return fake_check(addr);
      },
      [&events](Bulk::Event const& ev) { events.push_back(ev); });

  CHECK_EQ(checked.load(), 1);
  CHECK_EQ(events.size(), 2);
  auto const& rows = events.back().rows;
  CHECK(!rows[0].result);
  CHECK(!rows[1].result);
  CHECK(rows[2].result);
  CHECK(rows[1].fields == records[1]);
}

void failure()
{
  std::vector<Bulk::Event> events;
  Bulk::run(
      make_records(25),
      [](std::string_view addr) -> Verify::Result {
        if (addr == "bad13@example.com")
          throw std::runtime_error("boom");
        return fake_check(addr);
      },
      [&events](Bulk::Event const& ev) { events.push_back(ev); });

  // The first batch made it out, then one error and nothing more.
  CHECK_EQ(events.size(), 2);
  CHECK_EQ(events[0].type, Bulk::event_type::progress);
  CHECK_EQ(events[1].type, Bulk::event_type::error);
  CHECK_EQ(events[1].error, "Failed to process records");
}

void sink_failure()
{
  std::vector<Bulk::Event> events;
  auto                     writes = 0;
  Bulk::run(make_records(25), fake_check,
            [&events, &writes](Bulk::Event const& ev) {
              if (++writes == 2)
                throw std::runtime_error("disk full");
              events.push_back(ev);
            });

  CHECK_EQ(events.size(), 2);
  CHECK_EQ(events[0].type, Bulk::event_type::progress);
  CHECK_EQ(events[1].type, Bulk::event_type::error);
}

} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  email_field();
  twenty_five();
  batch_sizes();
  empty();
  no_email();
  failure();
  sink_failure();
}
