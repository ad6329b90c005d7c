#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "sgp_core/stats.hpp"

namespace sgp_core {

// Derived values from one recalculation pass. Overwritten wholesale, never
// patched.
struct Valuation {
  double sgp{0.0};
  std::map<std::string, double> sgp_breakdown;
  double dollar_value{0.0};
  std::string baseline_key; // replacement line the player was scored against
  std::uint64_t epoch{0};   // pool version the pass was computed from
};

struct Player {
  // Data members
  std::int64_t id{0};
  std::string name;
  std::string team;
  std::vector<std::string> positions;
  PlayerType type{PlayerType::Hitter};
  StatLine stats;

  bool is_drafted{false};
  // Empty until the first committed epoch; frozen once drafted.
  std::optional<Valuation> valuation;

  // Default constructor
  Player() = default;
  // Constructor with parameters
  Player(std::int64_t id_, std::string name_, std::string team_,
         std::vector<std::string> positions_, PlayerType type_,
         StatLine stats_)
      : id(id_), name(std::move(name_)), team(std::move(team_)),
        positions(std::move(positions_)), type(type_),
        stats(std::move(stats_)) {}

  bool has_position(const std::string &pos) const {
    for (const auto &p : positions) {
      if (p == pos)
        return true;
    }
    return false;
  }
};

// Splits an eligibility list such as "SS, 2B" into tags.
inline std::vector<std::string> parse_positions(const std::string &csv) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= csv.size()) {
    std::size_t end = csv.find(',', start);
    if (end == std::string::npos)
      end = csv.size();
    std::size_t b = start, e = end;
    while (b < e && csv[b] == ' ')
      ++b;
    while (e > b && csv[e - 1] == ' ')
      --e;
    if (e > b)
      out.emplace_back(csv.substr(b, e - b));
    start = end + 1;
  }
  return out;
}

class PlayerTable {
public:
  PlayerTable() = default;

  void add_player(Player p) {
    if (has_id(p.id)) {
      throw std::invalid_argument(
          fmt::format("Duplicate player id {} ({})", p.id, p.name));
    }
    const std::size_t idx = players_.size();
    id_index_[p.id] = idx;
    players_.push_back(std::move(p));
  }

  std::size_t size() const { return players_.size(); }

  bool has_id(std::int64_t id) const {
    return id_index_.find(id) != id_index_.end();
  }

  const Player &get(std::int64_t id) const {
    auto it = id_index_.find(id);
    if (it == id_index_.end()) {
      throw std::out_of_range(fmt::format("Player id {} not found", id));
    }
    return players_.at(it->second);
  }

  Player &get_mutable(std::int64_t id) {
    auto it = id_index_.find(id);
    if (it == id_index_.end()) {
      throw std::out_of_range(fmt::format("Player id {} not found", id));
    }
    return players_.at(it->second);
  }

  // Insertion order; every pool-wide pass iterates in this order.
  const std::vector<Player> &players() const { return players_; }
  std::vector<Player> &mutable_players() { return players_; }

private:
  std::vector<Player> players_;
  std::unordered_map<std::int64_t, std::size_t> id_index_;
};

} // namespace sgp_core
