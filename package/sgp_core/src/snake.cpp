#include "sgp_core/snake.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace sgp_core {

std::vector<SnakeSlot> serpentine_order(const std::vector<int> &draft_order,
                                        int num_rounds) {
  std::vector<SnakeSlot> out;
  const int n = static_cast<int>(draft_order.size());
  if (n == 0 || num_rounds <= 0)
    return out;
  out.reserve(static_cast<std::size_t>(n * num_rounds));
  for (int r = 0; r < num_rounds; ++r)
    for (int i = 0; i < n; ++i)
      out.push_back(snake_slot(draft_order, r * n + i));
  return out;
}

SnakeSlot snake_slot(const std::vector<int> &draft_order, int picks_made) {
  if (draft_order.empty())
    throw std::invalid_argument("snake_slot: empty draft order");
  if (picks_made < 0) {
    throw std::invalid_argument(
        fmt::format("snake_slot: negative pick count {}", picks_made));
  }
  const int n = static_cast<int>(draft_order.size());
  SnakeSlot slot;
  slot.round = picks_made / n + 1;
  slot.pick_in_round = picks_made % n + 1;
  const int idx = slot.round % 2 == 1 ? slot.pick_in_round - 1 : n - slot.pick_in_round;
  slot.team_id = draft_order[static_cast<std::size_t>(idx)];
  return slot;
}

std::optional<int> picks_until_turn(const std::vector<int> &draft_order,
                                    int picks_made, int team_id) {
  if (std::find(draft_order.begin(), draft_order.end(), team_id) == draft_order.end())
    return std::nullopt;
  // Every team picks at least once in any two consecutive rounds
  const int horizon = 2 * static_cast<int>(draft_order.size());
  for (int k = 0; k < horizon; ++k) {
    if (snake_slot(draft_order, picks_made + k).team_id == team_id)
      return k;
  }
  return std::nullopt;
}

} // namespace sgp_core
