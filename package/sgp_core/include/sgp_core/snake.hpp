#pragma once

#include <optional>
#include <vector>

namespace sgp_core {

// One pick of a serpentine draft. Round and pick are 1-based.
struct SnakeSlot {
  int round{0};
  int pick_in_round{0};
  int team_id{0};
};

// Every pick of a snake draft: odd rounds follow draft_order, even rounds
// run it backwards.
std::vector<SnakeSlot> serpentine_order(const std::vector<int> &draft_order,
                                        int num_rounds);

// The slot on the clock once `picks_made` picks are in. Throws
// std::invalid_argument for an empty order or a negative count.
SnakeSlot snake_slot(const std::vector<int> &draft_order, int picks_made);

// Picks until `team_id` is on the clock, 0 if it already is. Empty when the
// team is not in the order.
std::optional<int> picks_until_turn(const std::vector<int> &draft_order,
                                    int picks_made, int team_id);

inline int overall_pick(int round, int pick_in_round, int num_teams) {
  return (round - 1) * num_teams + pick_in_round;
}

} // namespace sgp_core
