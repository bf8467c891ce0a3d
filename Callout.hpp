#ifndef CALLOUT_DOT_HPP
#define CALLOUT_DOT_HPP

#include "Provider.hpp"
#include "Resolve.hpp"

#include <cstdint>
#include <string>
#include <string_view>

// Asking a mail exchanger whether it would take mail for an address,
// without sending any.

namespace Callout {

class Prober {
public:
  virtual ~Prober() = default;

  virtual bool probe(std::string const&       exchanger,
                     std::string_view         address,
                     Provider::Dialect const& dialect)
      = 0;
};

uint16_t default_port();

class SMTP : public Prober {
public:
  SMTP(SMTP const&) = delete;
  SMTP& operator=(SMTP const&) = delete;

  explicit SMTP(Resolve::Lookup& lookup, uint16_t port = default_port());

  // One connection, one HELO/MAIL FROM/RCPT TO/QUIT dialogue.  Never
  // throws; every socket failure resolves to a verdict according to
  // the dialect.
  bool probe(std::string const&       exchanger,
             std::string_view         address,
             Provider::Dialect const& dialect) override;

private:
  Resolve::Lookup& lookup_;
  uint16_t         port_;
};

} // namespace Callout

#endif // CALLOUT_DOT_HPP
