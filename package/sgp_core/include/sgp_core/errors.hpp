#pragma once

#include <stdexcept>
#include <string>

namespace sgp_core {

// Malformed league settings. Raised before any valuation runs.
class ConfigurationError : public std::invalid_argument {
public:
  explicit ConfigurationError(const std::string &what)
      : std::invalid_argument(what) {}
};

// A draft transaction the pool refuses (unknown ids, double draft, price
// outside the team's means).
class DraftError : public std::invalid_argument {
public:
  explicit DraftError(const std::string &what) : std::invalid_argument(what) {}
};

// An epoch computed against a pool version that is no longer current. The
// caller should discard it and recompute.
class TransactionConflict : public std::runtime_error {
public:
  explicit TransactionConflict(const std::string &what)
      : std::runtime_error(what) {}
};

} // namespace sgp_core
