#pragma once

#include <map>
#include <string>
#include <vector>

#include "sgp_core/positions.hpp"
#include "sgp_core/stats.hpp"

namespace sgp_core {

enum class DraftType { Auction, Snake };

inline const char *to_string(DraftType t) {
  return t == DraftType::Auction ? "auction" : "snake";
}

struct LeagueSettings {
  std::string name{"My League"};
  int num_teams{12};
  int budget_per_team{260};
  int min_bid{1};

  // Per-team slot counts
  RosterDemand roster_spots{
      {"C", 1},  {"1B", 1}, {"2B", 1},   {"3B", 1}, {"SS", 1},
      {"CI", 0}, {"MI", 0}, {"OF", 3},   {"UTIL", 1}, {"SP", 2},
      {"RP", 2}, {"P", 2},  {"BN", 3},
  };

  // Standard 5x5. StatLine keys must match these names.
  std::vector<CategorySpec> hitting_categories{
      {"R", CategoryKind::Counting},  {"HR", CategoryKind::Counting},
      {"RBI", CategoryKind::Counting}, {"SB", CategoryKind::Counting},
      {"AVG", CategoryKind::Rate},
  };
  std::vector<CategorySpec> pitching_categories{
      {"W", CategoryKind::Counting}, {"SV", CategoryKind::Counting},
      {"K", CategoryKind::Counting}, {"ERA", CategoryKind::Ratio},
      {"WHIP", CategoryKind::Ratio},
  };

  // Share of the league budget for hitters; pitchers get the rest.
  double hitter_budget_fraction{0.68};

  // Per-position replacement levels instead of one per player type.
  bool use_positional_adjustments{true};

  // Snake drafts record round and pick instead of a price. Values are still
  // computed from the nominal budgets.
  DraftType draft_type{DraftType::Auction};

  // Throws ConfigurationError naming the first offending field.
  void validate() const;

  int total_league_budget() const { return num_teams * budget_per_team; }
  double sub_budget(PlayerType t) const;

  const std::vector<CategorySpec> &categories(PlayerType t) const {
    return t == PlayerType::Hitter ? hitting_categories : pitching_categories;
  }

  // Bench excluded.
  int slots_per_team(PlayerType t) const;
  // Every slot, bench included; the number of rounds in a snake draft.
  int roster_size() const;
  int total_drafted(PlayerType t) const { return slots_per_team(t) * num_teams; }

  // roster_spots scaled by num_teams.
  RosterDemand league_demand() const;
};

// Players needed per base position, league-wide, from league slot counts.
// CI, MI and P slots are split half-and-half onto their constituents (odd
// slot to the second); UTIL only widens the hitter pool.
std::map<std::string, int> positional_demand(const RosterDemand &league_slots);

// Non-bench slots on one side of the roster.
int pool_size(const RosterDemand &slots, PlayerType t);

} // namespace sgp_core
