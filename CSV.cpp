#include "CSV.hpp"

#include <stdexcept>

#include <boost/algorithm/string/trim.hpp>
#include <boost/tokenizer.hpp>

#include <glog/logging.h>

#include <fmt/format.h>

namespace CSV {

namespace {
// RFC 4180 writes a quote inside a quoted field as "", the tokenizer
// wants \".  Backslashes are data, so they are escaped too.
std::string escape_quotes(std::string const& line)
{
  std::string out;
  out.reserve(line.size());

  auto in_quote = false;
  for (std::string::size_type i = 0; i < line.size(); ++i) {
    switch (line[i]) {
    case '"':
      if (in_quote && (i + 1 < line.size()) && (line[i + 1] == '"')) {
        out += "\\\"";
        ++i;
      }
      else {
        in_quote = !in_quote;
        out += '"';
      }
      break;
    case '\\': out += "\\\\"; break;
    default: out += line[i]; break;
    }
  }

  // The tokenizer would quietly run an open quote to the end of line.
  if (in_quote)
    throw std::runtime_error(fmt::format("unbalanced quotes in: {}", line));

  return out;
}
} // namespace

std::vector<std::string> split(std::string const& line)
{
  auto const escaped = escape_quotes(line);

  boost::escaped_list_separator<char> sep("\\", ",", "\"");
  boost::tokenizer<boost::escaped_list_separator<char>> tok(escaped, sep);

  std::vector<std::string> fields;
  for (auto const& field : tok)
    fields.push_back(boost::algorithm::trim_copy(field));
  return fields;
}

std::vector<Bulk::Record> read(std::istream& in)
{
  constexpr char bom[] = "\xEF\xBB\xBF";

  std::vector<std::string>  header;
  std::vector<Bulk::Record> records;

  std::string line;
  for (auto lineno = 1; std::getline(in, line); ++lineno) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (lineno == 1 && line.starts_with(bom))
      line.erase(0, sizeof(bom) - 1);
    if (boost::algorithm::trim_copy(line).empty())
      continue;

    auto fields = split(line);

    if (header.empty()) {
      header = std::move(fields);
      continue;
    }

    if (fields.size() > header.size()) {
      LOG(WARNING) << "line " << lineno << ": " << fields.size()
                   << " fields, only " << header.size() << " columns";
    }
    fields.resize(header.size());

    Bulk::Record record;
    record.reserve(header.size());
    for (std::size_t i = 0; i < header.size(); ++i)
      record.emplace_back(header[i], std::move(fields[i]));
    records.push_back(std::move(record));
  }

  return records;
}

} // namespace CSV
