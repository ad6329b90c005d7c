#include "sgp_core/session.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "sgp_core/errors.hpp"
#include "sgp_core/log.hpp"

namespace sgp_core {

DraftSession::DraftSession(LeagueSettings settings, PlayerTable players,
                           const std::string &user_team_name)
    : coordinator_(std::move(settings)), pool_(std::move(players)) {
  pool_.initialize(coordinator_.settings(), user_team_name);
  recalculate_locked();
}

void DraftSession::recalculate_locked() {
  epoch_ = coordinator_.run(pool_);
}

DraftPick DraftSession::pick(std::int64_t player_id, int team_id, int price) {
  std::lock_guard<std::mutex> lock(mu_);
  try {
    DraftPick p = pool_.draft_player(player_id, team_id, price);
    recalculate_locked();
    return p;
  } catch (const DraftError &e) {
    log_warn("Pick rejected: {}", e.what());
    throw;
  }
}

DraftPick DraftSession::snake_pick(std::int64_t player_id) {
  std::lock_guard<std::mutex> lock(mu_);
  try {
    DraftPick p = pool_.draft_snake_pick(player_id);
    recalculate_locked();
    return p;
  } catch (const DraftError &e) {
    log_warn("Pick rejected: {}", e.what());
    throw;
  }
}

std::optional<SnakeSlot> DraftSession::on_the_clock() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pool_.on_the_clock();
}

std::optional<std::int64_t> DraftSession::undo_last() {
  std::lock_guard<std::mutex> lock(mu_);
  std::optional<std::int64_t> player = pool_.undo_last_pick();
  if (player)
    recalculate_locked();
  return player;
}

std::optional<std::int64_t> DraftSession::undo(std::int64_t pick_id) {
  std::lock_guard<std::mutex> lock(mu_);
  std::optional<std::int64_t> player = pool_.undo_pick(pick_id);
  if (player)
    recalculate_locked();
  return player;
}

ValuationEpoch DraftSession::recalculate() {
  std::lock_guard<std::mutex> lock(mu_);
  recalculate_locked();
  return epoch_;
}

Valuation DraftSession::valuation(std::int64_t player_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const Player &p = pool_.player(player_id);
  if (!p.valuation) {
    throw std::logic_error(
        fmt::format("Player {} has not been valued yet", player_id));
  }
  return *p.valuation;
}

double DraftSession::value(std::int64_t player_id) const {
  return valuation(player_id).dollar_value;
}

ValuationEpoch DraftSession::current_epoch() const {
  std::lock_guard<std::mutex> lock(mu_);
  return epoch_;
}

std::vector<DraftPick> DraftSession::history(std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mu_);
  return pool_.history(limit);
}

std::vector<SlotState> DraftSession::roster_state(int team_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const TeamState &team = pool_.team(team_id);
  return assign_roster(pool_.roster(team.team_id),
                       coordinator_.settings().roster_spots);
}

int DraftSession::remaining_budget(int team_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return pool_.remaining_budget(team_id);
}

DraftPool DraftSession::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pool_;
}

} // namespace sgp_core
