#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "sgp_core/positions.hpp"
#include "sgp_core/sgp.hpp"

namespace sgp_core {

enum class ReplacementMode { Global, Positional };

struct ReplacementLine {
  StatLine line;
  std::int64_t player_id{0}; // player whose line sets the level
  int depth{0};              // rank taken, 1-based
};

// Keyed by base position, or by global_key() for the per-type level.
using BaselineMap = std::map<std::string, ReplacementLine>;

inline std::string global_key(PlayerType t) { return to_string(t); }

// Orders one player type's pool by SGP against the pool's mean line. This is
// the coarse first pass that buckets players before any replacement level is
// known; its output is never fed back.
std::vector<const Player *>
rank_preliminary(const std::vector<const Player *> &pool, const SgpEngine &engine);

class ReplacementLevelResolver {
public:
  explicit ReplacementLevelResolver(ReplacementMode mode) : mode_(mode) {}

  // Replacement lines for one player type. `ranked` comes from
  // rank_preliminary(); `league_slots` is the remaining league-wide slot
  // demand. The global line is always present for a non-empty pool, the
  // positional lines only in positional mode and only for positions with
  // both demand and eligible players. Short pools fall back to their worst
  // player.
  BaselineMap baseline(const std::vector<const Player *> &ranked, PlayerType type,
                       const RosterDemand &league_slots) const;

  // Chooses the eligible position whose line scores the player highest, or
  // the global line when none applies. Returns the key and fills `out`.
  std::string select(const Player &p, const BaselineMap &baselines,
                     const SgpEngine &engine, SgpScore &out) const;

  ReplacementMode mode() const { return mode_; }

private:
  ReplacementMode mode_;
};

} // namespace sgp_core
