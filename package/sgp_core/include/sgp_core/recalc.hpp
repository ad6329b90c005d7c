#pragma once

#include <cstdint>
#include <unordered_map>

#include "sgp_core/draft_state.hpp"
#include "sgp_core/replacement.hpp"
#include "sgp_core/settings.hpp"

namespace sgp_core {

// One consistent set of derived values for the undrafted pool, tagged with
// the pool version it was computed from.
struct ValuationEpoch {
  std::uint64_t pool_version{0};
  std::unordered_map<std::int64_t, Valuation> values;
  BaselineMap baselines;
  RosterDemand remaining_slots; // league-wide
  double hitter_budget{0.0};
  double pitcher_budget{0.0};
  double hitter_dollars_per_sgp{0.0};
  double pitcher_dollars_per_sgp{0.0};
  std::size_t hitters{0};
  std::size_t pitchers{0};
};

// Re-derives every undrafted player's value from scratch: remaining demand,
// replacement lines, dispersion, SGP and dollars. Always a full pass.
class RecalculationCoordinator {
public:
  // Throws ConfigurationError for invalid settings.
  explicit RecalculationCoordinator(LeagueSettings settings);

  // Pure; reads the pool, writes nothing.
  ValuationEpoch recalculate(const DraftPool &pool) const;
  ValuationEpoch recalculate(const DraftPool &pool, ReplacementMode mode) const;

  // Writes the epoch onto the pool's undrafted players in one batch. Throws
  // TransactionConflict if the pool has moved past the epoch's version.
  void commit(DraftPool &pool, const ValuationEpoch &epoch) const;

  // recalculate() then commit().
  ValuationEpoch run(DraftPool &pool) const;

  // League slot demand minus slots already filled, using greedy assignment
  // of each team's roster.
  RosterDemand remaining_demand(const DraftPool &pool) const;

  // Sub-budget less what has been spent on that player type, never below 0.
  double remaining_budget(const DraftPool &pool, PlayerType t) const;

  const LeagueSettings &settings() const { return settings_; }
  ReplacementMode default_mode() const {
    return settings_.use_positional_adjustments ? ReplacementMode::Positional
                                                : ReplacementMode::Global;
  }

private:
  LeagueSettings settings_;
};

} // namespace sgp_core
