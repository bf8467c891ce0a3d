#ifndef SYNTAX_DOT_HPP
#define SYNTAX_DOT_HPP

#include <cstddef>
#include <string_view>

// The address shape we are willing to probe, narrower than
// the RFC 5321 Mailbox grammar: dot-atom local parts from a small
// alphabet, LDH domain labels and an alphabetic top-level label.

namespace Syntax {

constexpr std::size_t max_local_length = 63;
constexpr std::size_t max_label_length = 63;

bool validate(std::string_view address);

// Everything after the '@' of an address that passed validate().
std::string_view domain(std::string_view address);

} // namespace Syntax

#endif // SYNTAX_DOT_HPP
