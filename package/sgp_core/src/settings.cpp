#include "sgp_core/settings.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include <fmt/format.h>

#include "sgp_core/errors.hpp"

namespace sgp_core {

namespace {

void validate_categories(const std::vector<CategorySpec> &cats,
                         const char *which) {
  if (cats.empty()) {
    throw ConfigurationError(
        fmt::format("LeagueSettings: {} category set is empty", which));
  }
  std::set<std::string> seen;
  for (const auto &c : cats) {
    if (c.name.empty()) {
      throw ConfigurationError(
          fmt::format("LeagueSettings: unnamed {} category", which));
    }
    if (!seen.insert(c.name).second) {
      throw ConfigurationError(fmt::format(
          "LeagueSettings: duplicate {} category '{}'", which, c.name));
    }
  }
}

} // namespace

void LeagueSettings::validate() const {
  if (num_teams < 1) {
    throw ConfigurationError(
        fmt::format("LeagueSettings: num_teams must be >= 1, got {}", num_teams));
  }
  if (budget_per_team <= 0) {
    throw ConfigurationError(fmt::format(
        "LeagueSettings: budget_per_team must be > 0, got {}", budget_per_team));
  }
  if (min_bid < 1) {
    throw ConfigurationError(
        fmt::format("LeagueSettings: min_bid must be >= 1, got {}", min_bid));
  }
  if (!std::isfinite(hitter_budget_fraction) || hitter_budget_fraction < 0.0 ||
      hitter_budget_fraction > 1.0) {
    throw ConfigurationError(fmt::format(
        "LeagueSettings: hitter_budget_fraction must lie in [0, 1], got {}",
        hitter_budget_fraction));
  }
  for (const auto &kv : roster_spots) {
    if (!find_slot(kv.first)) {
      throw ConfigurationError(
          fmt::format("LeagueSettings: unknown roster slot '{}'", kv.first));
    }
    if (kv.second < 0) {
      throw ConfigurationError(fmt::format(
          "LeagueSettings: roster slot '{}' has negative count {}", kv.first,
          kv.second));
    }
  }
  validate_categories(hitting_categories, "hitting");
  validate_categories(pitching_categories, "pitching");
}

double LeagueSettings::sub_budget(PlayerType t) const {
  const double total = static_cast<double>(total_league_budget());
  return t == PlayerType::Hitter ? total * hitter_budget_fraction
                                 : total * (1.0 - hitter_budget_fraction);
}

int LeagueSettings::slots_per_team(PlayerType t) const {
  return pool_size(roster_spots, t);
}

int LeagueSettings::roster_size() const {
  int total = 0;
  for (const auto &kv : roster_spots)
    total += std::max(0, kv.second);
  return total;
}

RosterDemand LeagueSettings::league_demand() const {
  RosterDemand out;
  for (const auto &kv : roster_spots)
    out[kv.first] = kv.second * num_teams;
  return out;
}

std::map<std::string, int> positional_demand(const RosterDemand &league_slots) {
  std::map<std::string, int> demand;
  for (const auto &info : slot_catalog()) {
    if (info.kind == SlotKind::Base)
      demand[info.label] = 0;
  }

  auto count = [&](const std::string &label) {
    auto it = league_slots.find(label);
    return it == league_slots.end() ? 0 : std::max(0, it->second);
  };
  auto split = [&](int slots, const std::string &a, const std::string &b) {
    demand[a] += slots / 2;
    demand[b] += slots - slots / 2;
  };

  for (const auto &info : slot_catalog()) {
    const int n = count(info.label);
    if (info.kind == SlotKind::Base) {
      demand[info.label] += n;
    } else if (info.kind == SlotKind::Composite && info.constituents.size() == 2) {
      split(n, info.constituents[0], info.constituents[1]);
    }
  }
  // Generic pitcher slots behave like a composite of SP and RP.
  split(count("P"), "SP", "RP");
  return demand;
}

int pool_size(const RosterDemand &slots, PlayerType t) {
  int n = 0;
  for (const auto &kv : slots) {
    const SlotInfo *info = find_slot(kv.first);
    if (info && info->side == t)
      n += std::max(0, kv.second);
  }
  return n;
}

} // namespace sgp_core
