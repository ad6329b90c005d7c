#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sgp_core/draft_state.hpp"
#include "sgp_core/positions.hpp"
#include "sgp_core/recalc.hpp"

namespace sgp_core {

// A live draft. Each pick or undo is committed and followed by a full
// recalculation while holding one lock, so readers only ever see a pool whose
// values match its latest transaction.
class DraftSession {
public:
  DraftSession(LeagueSettings settings, PlayerTable players,
               const std::string &user_team_name = "My Team");

  DraftPick pick(std::int64_t player_id, int team_id, int price);
  // Snake drafts: the team on the clock takes the player.
  DraftPick snake_pick(std::int64_t player_id);
  std::optional<SnakeSlot> on_the_clock() const;
  std::optional<std::int64_t> undo_last();
  std::optional<std::int64_t> undo(std::int64_t pick_id);

  // Forces a fresh pass, e.g. after projections were replaced.
  ValuationEpoch recalculate();

  // Latest committed dollar value; drafted players keep the value they had
  // when they left the pool. Throws std::logic_error if never valued.
  double value(std::int64_t player_id) const;
  Valuation valuation(std::int64_t player_id) const;

  ValuationEpoch current_epoch() const;
  std::vector<DraftPick> history(std::size_t limit = 0) const;
  std::vector<SlotState> roster_state(int team_id) const;
  int remaining_budget(int team_id) const;

  // Copy of the pool, taken under the lock.
  DraftPool snapshot() const;

  const LeagueSettings &settings() const { return coordinator_.settings(); }

private:
  void recalculate_locked();

  mutable std::mutex mu_;
  RecalculationCoordinator coordinator_;
  DraftPool pool_;
  ValuationEpoch epoch_;
};

} // namespace sgp_core
