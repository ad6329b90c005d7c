#pragma once

#include <algorithm>

#include <Eigen/Dense>

namespace sgp_core {

struct MarketState {
  double budget{0.0}; // dollars left for this sub-pool
  double min_bid{1.0};
};

struct DollarValues {
  Eigen::VectorXd dollars;
  double dollars_per_sgp{0.0};
  double total_positive_sgp{0.0};
  double reserved{0.0}; // min_bid for every player at or below replacement
};

// SGP->dollars. Players at or below replacement are priced at the minimum
// bid and that money comes out of the budget first; the rest is shared at
// (budget - reserved) / total positive SGP, floored at the minimum bid. The
// sub-pool then sums to the budget plus whatever the floor adds to small
// positive values. With no positive SGP (or nothing left after the reserve)
// everyone is worth the minimum.
inline DollarValues sgp_to_dollars(const Eigen::VectorXd &sgp,
                                   const MarketState &ms) {
  DollarValues out;
  out.total_positive_sgp = sgp.array().max(0.0).sum();
  const double at_replacement = static_cast<double>((sgp.array() <= 0.0).count());
  out.reserved = ms.min_bid * at_replacement;
  if (out.total_positive_sgp > 0.0) {
    out.dollars_per_sgp =
        std::max(0.0, ms.budget - out.reserved) / out.total_positive_sgp;
  }

  out.dollars = out.dollars_per_sgp * sgp;
  for (int i = 0; i < out.dollars.size(); ++i) {
    if (out.dollars[i] < ms.min_bid)
      out.dollars[i] = ms.min_bid;
  }
  return out;
}

} // namespace sgp_core
