#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "sgp_core/player.hpp"

namespace sgp_core {

// Roster slot label -> count. Per team in LeagueSettings, summed over the
// league once the coordinator derives remaining demand.
using RosterDemand = std::map<std::string, int>;

enum class SlotKind { Base, Composite, Universal, Bench };

struct SlotInfo {
  std::string label;
  SlotKind kind{SlotKind::Base};
  std::optional<PlayerType> side;        // empty for bench
  std::vector<std::string> constituents; // composite slots only
};

// Every recognised slot, in greedy assignment order: base slots, then
// composite, then universal, then bench.
const std::vector<SlotInfo> &slot_catalog();

// nullptr for an unknown label.
const SlotInfo *find_slot(const std::string &label);

// Base positions behind a slot: itself for a base slot, its constituents for
// a composite, nothing for universal and bench slots.
std::vector<std::string> expand_slot(const std::string &label);

// Recognised base positions among the player's tags, restricted to the
// player's side. Unknown tags are ignored.
std::set<std::string> eligible_base_positions(const Player &p);

// Capability only; no assignment is implied.
bool can_fill(const Player &p, const std::string &slot);

// All slot labels (base, composite, universal, bench) the player could fill.
std::vector<std::string> eligible_slots(const Player &p);

struct SlotState {
  std::string slot;
  int required{0};
  int filled{0};
  int remaining{0};
  std::vector<std::int64_t> player_ids;
};

// Greedy most-constrained-slot-first assignment of one team's players (in
// pick order) to its roster slots. Each slot takes the least flexible
// eligible player first. Slots with no requirement are omitted.
std::vector<SlotState> assign_roster(const std::vector<const Player *> &players,
                                     const RosterDemand &per_team);

} // namespace sgp_core
