#ifndef CSV_DOT_HPP
#define CSV_DOT_HPP

#include "Bulk.hpp"

#include <istream>
#include <string>
#include <vector>

namespace CSV {

// One line of fields, trimmed.  A "" inside quotes is a literal quote.
// Throws on unbalanced quotes.
std::vector<std::string> split(std::string const& line);

// First non-blank line names the columns.  One record per line, so a
// quoted field may not contain a line break.  Short rows are padded, long
// ones truncated.
std::vector<Bulk::Record> read(std::istream& in);

} // namespace CSV

#endif // CSV_DOT_HPP
