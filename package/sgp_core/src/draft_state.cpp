#include "sgp_core/draft_state.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

#include "sgp_core/errors.hpp"
#include "sgp_core/log.hpp"

namespace sgp_core {

void DraftPool::add_player(Player p) {
  players_.add_player(std::move(p));
  ++version_;
}

void DraftPool::initialize(const LeagueSettings &settings,
                           const std::string &user_team_name) {
  settings.validate();
  teams_.clear();
  picks_.clear();
  for (int i = 0; i < settings.num_teams; ++i) {
    TeamState t;
    t.team_id = i + 1;
    t.name = i == 0 ? user_team_name : fmt::format("Team {}", i + 1);
    t.budget = settings.budget_per_team;
    t.is_user_team = i == 0;
    teams_.push_back(std::move(t));
  }
  for (auto &p : players_.mutable_players())
    p.is_drafted = false;
  min_bid_ = settings.min_bid;
  draft_type_ = settings.draft_type;
  draft_order_.clear();
  for (const auto &t : teams_)
    draft_order_.push_back(t.team_id);
  rounds_ = settings.roster_size();
  next_pick_id_ = 1;
  current_pick_ = 0;
  ++version_;
}

const TeamState &DraftPool::team(int team_id) const {
  for (const auto &t : teams_) {
    if (t.team_id == team_id)
      return t;
  }
  throw std::out_of_range(fmt::format("Team {} not found", team_id));
}

Player &DraftPool::draftable(std::int64_t player_id) {
  if (!players_.has_id(player_id))
    throw DraftError(fmt::format("Player {} not found", player_id));
  Player &p = players_.get_mutable(player_id);
  if (p.is_drafted)
    throw DraftError(fmt::format("{} has already been drafted", p.name));
  return p;
}

DraftPick &DraftPool::record(DraftPick pick, Player &p) {
  pick.pick_id = next_pick_id_++;
  pick.pick_number = ++current_pick_;
  pick.player_id = p.id;
  pick.timestamp = std::chrono::system_clock::now();
  picks_.push_back(pick);
  p.is_drafted = true;
  ++version_;
  log_debug("Pick {}: player {} to team {}", pick.pick_number, p.id, pick.team_id);
  return picks_.back();
}

DraftPick DraftPool::draft_player(std::int64_t player_id, int team_id, int price) {
  if (draft_type_ != DraftType::Auction)
    throw DraftError("Priced picks are only taken in an auction draft");
  const auto team_it =
      std::find_if(teams_.begin(), teams_.end(),
                   [&](const TeamState &t) { return t.team_id == team_id; });
  if (team_it == teams_.end())
    throw DraftError(fmt::format("Team {} not found", team_id));

  Player &p = draftable(player_id);
  if (price < min_bid_)
    throw DraftError(fmt::format("Price must be at least ${}", min_bid_));
  const int left = remaining_budget(team_id);
  if (price > left) {
    throw DraftError(fmt::format("{} only has ${} remaining (tried to spend ${})",
                                 team_it->name, left, price));
  }

  DraftPick pick;
  pick.team_id = team_id;
  pick.price = price;
  return record(std::move(pick), p);
}

DraftPick DraftPool::draft_snake_pick(std::int64_t player_id) {
  if (draft_type_ != DraftType::Snake)
    throw DraftError("Round picks are only taken in a snake draft");
  const std::optional<SnakeSlot> slot = on_the_clock();
  if (!slot)
    throw DraftError(fmt::format("All {} rounds have been drafted", rounds_));

  Player &p = draftable(player_id);
  DraftPick pick;
  pick.team_id = slot->team_id;
  pick.round_number = slot->round;
  pick.pick_in_round = slot->pick_in_round;
  return record(std::move(pick), p);
}

void DraftPool::set_draft_order(std::vector<int> order) {
  if (!picks_.empty())
    throw DraftError("The draft order is fixed once picks have been made");
  std::vector<int> expected;
  for (const auto &t : teams_)
    expected.push_back(t.team_id);
  std::vector<int> sorted = order;
  std::sort(sorted.begin(), sorted.end());
  std::sort(expected.begin(), expected.end());
  if (sorted != expected) {
    throw DraftError(fmt::format("Draft order must list each of the {} teams once",
                                 teams_.size()));
  }
  draft_order_ = std::move(order);
}

std::optional<SnakeSlot> DraftPool::on_the_clock() const {
  if (draft_type_ != DraftType::Snake || draft_order_.empty())
    return std::nullopt;
  const int made = static_cast<int>(picks_.size());
  if (made >= rounds_ * static_cast<int>(draft_order_.size()))
    return std::nullopt;
  return snake_slot(draft_order_, made);
}

std::optional<int> DraftPool::picks_until(int team_id) const {
  if (!on_the_clock())
    return std::nullopt;
  const int made = static_cast<int>(picks_.size());
  const std::optional<int> k = picks_until_turn(draft_order_, made, team_id);
  if (!k || made + *k >= rounds_ * static_cast<int>(draft_order_.size()))
    return std::nullopt;
  return k;
}

std::optional<std::int64_t> DraftPool::undo_last_pick() {
  if (picks_.empty())
    return std::nullopt;
  const auto last = std::max_element(
      picks_.begin(), picks_.end(), [](const DraftPick &a, const DraftPick &b) {
        return a.pick_number < b.pick_number;
      });
  return undo_pick(last->pick_id);
}

std::optional<std::int64_t> DraftPool::undo_pick(std::int64_t pick_id) {
  auto it = std::find_if(picks_.begin(), picks_.end(),
                         [&](const DraftPick &p) { return p.pick_id == pick_id; });
  if (it == picks_.end())
    return std::nullopt;

  const std::int64_t player_id = it->player_id;
  picks_.erase(it);
  players_.get_mutable(player_id).is_drafted = false;
  ++version_;
  return player_id;
}

std::vector<DraftPick> DraftPool::history(std::size_t limit) const {
  std::vector<DraftPick> out(picks_.begin(), picks_.end());
  std::sort(out.begin(), out.end(), [](const DraftPick &a, const DraftPick &b) {
    return a.pick_number > b.pick_number;
  });
  if (limit > 0 && out.size() > limit)
    out.resize(limit);
  return out;
}

int DraftPool::spent(int team_id) const {
  int total = 0;
  for (const auto &p : picks_) {
    if (p.team_id == team_id)
      total += p.price.value_or(0);
  }
  return total;
}

int DraftPool::remaining_budget(int team_id) const {
  return team(team_id).budget - spent(team_id);
}

int DraftPool::remaining_budget() const {
  int total = 0;
  for (const auto &t : teams_)
    total += t.budget - spent(t.team_id);
  return total;
}

int DraftPool::spent_on(PlayerType t) const {
  int total = 0;
  for (const auto &p : picks_) {
    if (players_.get(p.player_id).type == t)
      total += p.price.value_or(0);
  }
  return total;
}

std::vector<const Player *> DraftPool::undrafted() const {
  std::vector<const Player *> out;
  for (const auto &p : players_.players()) {
    if (!p.is_drafted)
      out.push_back(&p);
  }
  return out;
}

std::vector<const Player *> DraftPool::roster(int team_id) const {
  std::vector<const DraftPick *> picks;
  for (const auto &p : picks_) {
    if (p.team_id == team_id)
      picks.push_back(&p);
  }
  std::sort(picks.begin(), picks.end(),
            [](const DraftPick *a, const DraftPick *b) {
              return a->pick_number < b->pick_number;
            });
  std::vector<const Player *> out;
  out.reserve(picks.size());
  for (const DraftPick *p : picks)
    out.push_back(&players_.get(p->player_id));
  return out;
}

void DraftPool::apply_valuations(
    const std::unordered_map<std::int64_t, Valuation> &values,
    std::uint64_t pool_version) {
  for (const auto &kv : values) {
    if (!players_.has_id(kv.first))
      throw std::out_of_range(fmt::format("Player id {} not found", kv.first));
    if (players_.get(kv.first).is_drafted) {
      throw TransactionConflict(fmt::format(
          "Player {} was drafted after the valuation was computed", kv.first));
    }
  }
  for (const auto &kv : values)
    players_.get_mutable(kv.first).valuation = kv.second;
  valued_version_ = pool_version;
  valued_ = true;
}

} // namespace sgp_core
