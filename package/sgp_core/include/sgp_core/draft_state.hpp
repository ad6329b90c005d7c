#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sgp_core/player.hpp"
#include "sgp_core/settings.hpp"
#include "sgp_core/snake.hpp"

namespace sgp_core {

struct TeamState {
  int team_id{0};
  std::string name;
  int budget{0};
  bool is_user_team{false};
};

struct DraftPick {
  std::int64_t pick_id{0};
  int pick_number{0};
  std::int64_t player_id{0};
  int team_id{0};
  std::optional<int> price;         // auction picks
  std::optional<int> round_number;  // snake picks
  std::optional<int> pick_in_round; // snake picks
  std::chrono::system_clock::time_point timestamp;
};

// Record store for a draft: the player pool, the teams and an append-only
// pick log. Every committed transaction bumps version(); derived values are
// only written through apply_valuations().
class DraftPool {
public:
  DraftPool() = default;
  explicit DraftPool(PlayerTable players) : players_(std::move(players)) {}

  void add_player(Player p);

  // Creates the teams (the first belongs to the user), clears the log and
  // every drafted flag. The draft order starts as team 1..N.
  void initialize(const LeagueSettings &settings,
                  const std::string &user_team_name = "My Team");

  // Auction pick. Throws DraftError when the player or team is unknown, the
  // player is already drafted, the price is below the minimum bid or above
  // the team's remaining budget, or this is a snake draft.
  DraftPick draft_player(std::int64_t player_id, int team_id, int price);

  // Snake pick for the team on the clock. Throws DraftError in an auction,
  // once every round is done, or for an unknown or drafted player.
  DraftPick draft_snake_pick(std::int64_t player_id);

  // First-round order for a snake draft; must list every team once and can
  // only change before the first pick.
  void set_draft_order(std::vector<int> order);
  const std::vector<int> &draft_order() const { return draft_order_; }
  DraftType draft_type() const { return draft_type_; }
  int rounds() const { return rounds_; }

  // The clock follows the number of picks in the log, so undoing the last
  // pick hands the slot back. Empty in an auction or once the draft is over.
  std::optional<SnakeSlot> on_the_clock() const;
  // Empty in an auction, for an unknown team, or once the draft is over.
  std::optional<int> picks_until(int team_id) const;

  // Returns the player put back in the pool, or nothing if there was no
  // such pick.
  std::optional<std::int64_t> undo_last_pick();
  std::optional<std::int64_t> undo_pick(std::int64_t pick_id);

  // Most recent first; limit 0 returns everything.
  std::vector<DraftPick> history(std::size_t limit = 0) const;

  const PlayerTable &players() const { return players_; }
  const Player &player(std::int64_t id) const { return players_.get(id); }
  const std::vector<TeamState> &teams() const { return teams_; }
  const TeamState &team(int team_id) const;

  int spent(int team_id) const;
  int remaining_budget(int team_id) const;
  int remaining_budget() const;
  // Dollars paid for drafted players of one type, league-wide.
  int spent_on(PlayerType t) const;

  std::vector<const Player *> undrafted() const;
  // A team's players in pick order.
  std::vector<const Player *> roster(int team_id) const;

  // Overwrites the derived values of undrafted players. All ids are checked
  // before anything is written.
  void apply_valuations(const std::unordered_map<std::int64_t, Valuation> &values,
                        std::uint64_t pool_version);

  std::uint64_t version() const { return version_; }
  bool values_stale() const { return valued_version_ != version_ || !valued_; }
  int current_pick() const { return current_pick_; }

private:
  Player &draftable(std::int64_t player_id);
  DraftPick &record(DraftPick pick, Player &p);

  PlayerTable players_;
  std::vector<TeamState> teams_;
  std::vector<DraftPick> picks_;
  int min_bid_{1};
  DraftType draft_type_{DraftType::Auction};
  std::vector<int> draft_order_;
  int rounds_{0};
  std::int64_t next_pick_id_{1};
  int current_pick_{0};
  std::uint64_t version_{0};
  std::uint64_t valued_version_{0};
  bool valued_{false};
};

} // namespace sgp_core
