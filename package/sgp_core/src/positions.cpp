#include "sgp_core/positions.hpp"

#include <climits>

namespace sgp_core {

const std::vector<SlotInfo> &slot_catalog() {
  static const std::vector<SlotInfo> catalog = {
      {"C", SlotKind::Base, PlayerType::Hitter, {}},
      {"1B", SlotKind::Base, PlayerType::Hitter, {}},
      {"2B", SlotKind::Base, PlayerType::Hitter, {}},
      {"3B", SlotKind::Base, PlayerType::Hitter, {}},
      {"SS", SlotKind::Base, PlayerType::Hitter, {}},
      {"OF", SlotKind::Base, PlayerType::Hitter, {}},
      {"SP", SlotKind::Base, PlayerType::Pitcher, {}},
      {"RP", SlotKind::Base, PlayerType::Pitcher, {}},
      {"CI", SlotKind::Composite, PlayerType::Hitter, {"1B", "3B"}},
      {"MI", SlotKind::Composite, PlayerType::Hitter, {"2B", "SS"}},
      {"UTIL", SlotKind::Universal, PlayerType::Hitter, {}},
      {"P", SlotKind::Universal, PlayerType::Pitcher, {}},
      {"BN", SlotKind::Bench, std::nullopt, {}},
  };
  return catalog;
}

const SlotInfo *find_slot(const std::string &label) {
  for (const auto &s : slot_catalog()) {
    if (s.label == label)
      return &s;
  }
  return nullptr;
}

std::vector<std::string> expand_slot(const std::string &label) {
  const SlotInfo *info = find_slot(label);
  if (!info)
    return {};
  switch (info->kind) {
  case SlotKind::Base:
    return {info->label};
  case SlotKind::Composite:
    return info->constituents;
  default:
    return {};
  }
}

std::set<std::string> eligible_base_positions(const Player &p) {
  std::set<std::string> out;
  for (const auto &tag : p.positions) {
    const SlotInfo *info = find_slot(tag);
    if (info && info->kind == SlotKind::Base && info->side == p.type)
      out.insert(tag);
  }
  return out;
}

bool can_fill(const Player &p, const std::string &slot) {
  const SlotInfo *info = find_slot(slot);
  if (!info)
    return false;
  if (info->kind == SlotKind::Bench)
    return true;
  if (info->side != p.type)
    return false;
  if (info->kind == SlotKind::Universal)
    return true;
  const std::set<std::string> base = eligible_base_positions(p);
  for (const auto &pos : expand_slot(slot)) {
    if (base.count(pos))
      return true;
  }
  return false;
}

std::vector<std::string> eligible_slots(const Player &p) {
  std::vector<std::string> out;
  for (const auto &s : slot_catalog()) {
    if (can_fill(p, s.label))
      out.push_back(s.label);
  }
  return out;
}

std::vector<SlotState> assign_roster(const std::vector<const Player *> &players,
                                     const RosterDemand &per_team) {
  std::vector<SlotState> states;
  std::vector<char> used(players.size(), 0);
  std::vector<int> flexibility(players.size(), 0);
  for (std::size_t i = 0; i < players.size(); ++i)
    flexibility[i] = static_cast<int>(eligible_base_positions(*players[i]).size());

  for (const auto &info : slot_catalog()) {
    auto it = per_team.find(info.label);
    if (it == per_team.end() || it->second <= 0)
      continue;

    SlotState st;
    st.slot = info.label;
    st.required = it->second;
    for (int k = 0; k < st.required; ++k) {
      int best = -1;
      int best_flex = INT_MAX;
      for (std::size_t i = 0; i < players.size(); ++i) {
        if (used[i] || !can_fill(*players[i], info.label))
          continue;
        // Earlier picks win ties since the scan is in pick order.
        if (flexibility[i] < best_flex) {
          best_flex = flexibility[i];
          best = static_cast<int>(i);
        }
      }
      if (best < 0)
        break;
      used[static_cast<std::size_t>(best)] = 1;
      st.player_ids.push_back(players[static_cast<std::size_t>(best)]->id);
      ++st.filled;
    }
    st.remaining = st.required - st.filled;
    states.push_back(std::move(st));
  }
  return states;
}

} // namespace sgp_core
