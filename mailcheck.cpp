#include "Bulk.hpp"
#include "CSV.hpp"
#include "JSON.hpp"
#include "Verify.hpp"

#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_string(csv, "", "check the \"email\" column of this CSV file, - for stdin");
DEFINE_uint64(batch_size, Bulk::batch_size, "addresses checked at once");
DEFINE_bool(pretty, false, "indent the JSON output");

namespace {
int constexpr exit_valid   = 0;
int constexpr exit_invalid = 1;
int constexpr exit_usage   = 2;

void emit(nlohmann::ordered_json const& j)
{
  std::cout << j.dump(FLAGS_pretty ? 2 : -1) << std::endl;
  if (!std::cout)
    throw std::runtime_error("write to stdout failed");
}

int check_csv(std::istream& in)
{
  std::vector<Bulk::Record> records;
  try {
    records = CSV::read(in);
  }
  catch (std::exception const& e) {
    LOG(ERROR) << FLAGS_csv << ": " << e.what();
    Bulk::Event err{Bulk::event_type::error};
    err.error = "Failed to process CSV file";
    emit(err);
    return exit_invalid;
  }

  LOG(INFO) << records.size() << " records from " << FLAGS_csv;

  auto all_valid = true;
  try {
    Bulk::run(
        records, Verify::validate_one,
        [&all_valid](Bulk::Event const& ev) {
          if (ev.type == Bulk::event_type::error)
            all_valid = false;
          for (auto const& row : ev.rows) {
            if (row.result && !row.result->valid)
              all_valid = false;
          }
          emit(ev);
        },
        FLAGS_batch_size);
  }
  catch (std::exception const& e) {
    LOG(ERROR) << e.what();
    return exit_invalid;
  }

  return all_valid ? exit_valid : exit_invalid;
}
} // namespace

int main(int argc, char* argv[])
{
  std::ios::sync_with_stdio(false);

  google::SetUsageMessage("check email addresses for deliverability\n"
                          "usage: mailcheck [flags] address...\n"
                          "       mailcheck [flags] --csv=FILE");
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  if (FLAGS_batch_size == 0) {
    LOG(ERROR) << "--batch_size must be positive";
    return exit_usage;
  }

  if (!FLAGS_csv.empty()) {
    if (argc > 1)
      LOG(WARNING) << "addresses on the command line are ignored with --csv";

    if (FLAGS_csv == "-")
      return check_csv(std::cin);

    std::ifstream in(FLAGS_csv);
    if (!in) {
      PLOG(ERROR) << "can't open " << FLAGS_csv;
      Bulk::Event err{Bulk::event_type::error};
      err.error = "Failed to process CSV file";
      emit(err);
      return exit_invalid;
    }
    return check_csv(in);
  }

  if (argc < 2) {
    std::cerr << google::ProgramUsage() << '\n';
    return exit_usage;
  }

  auto ret = exit_valid;
  for (int a = 1; a < argc; ++a) {
    std::string_view const address{argv[a]};
    if (address.empty()) {
      emit({{"valid", false}, {"reason", "Email is required"}});
      ret = exit_invalid;
      continue;
    }
    auto const result = Verify::validate_one(address);
    LOG(INFO) << result;
    if (!result.valid)
      ret = exit_invalid;
    emit(result);
  }
  return ret;
}
