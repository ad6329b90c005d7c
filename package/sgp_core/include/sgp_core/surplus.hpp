#pragma once

#include <map>
#include <string>

#include "sgp_core/player.hpp"

namespace sgp_core {

// Splits (dollar value - price paid) across categories in proportion to each
// category's share of the player's SGP. Even split when total SGP is zero;
// empty when there is no breakdown.
std::map<std::string, double> category_surplus(const Valuation &v, double price_paid);

} // namespace sgp_core
