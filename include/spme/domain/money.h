#pragma once

#include <string>

namespace spme::domain {

// Money is a tagged amount. The engine never converts currencies: amounts with
// different currency tags are aggregated numerically only after a
// CurrencyMismatchWithinGroup warning has been raised for the group.
struct Money {
  double amount{0.0};
  std::string currency{"CNY"};

  bool operator==(const Money&) const = default;
};

}  // namespace spme::domain
