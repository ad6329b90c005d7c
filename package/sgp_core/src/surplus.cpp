#include "sgp_core/surplus.hpp"

namespace sgp_core {

std::map<std::string, double> category_surplus(const Valuation &v,
                                               double price_paid) {
  std::map<std::string, double> out;
  if (v.sgp_breakdown.empty())
    return out;

  const double surplus = v.dollar_value - price_paid;
  if (v.sgp == 0.0) {
    const double share = surplus / static_cast<double>(v.sgp_breakdown.size());
    for (const auto &kv : v.sgp_breakdown)
      out[kv.first] = share;
    return out;
  }
  for (const auto &kv : v.sgp_breakdown)
    out[kv.first] = kv.second / v.sgp * surplus;
  return out;
}

} // namespace sgp_core
