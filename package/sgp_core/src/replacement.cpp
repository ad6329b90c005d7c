#include "sgp_core/replacement.hpp"

#include <algorithm>
#include <utility>

#include "sgp_core/log.hpp"
#include "sgp_core/settings.hpp"

namespace sgp_core {

namespace {

ReplacementLine line_at(const std::vector<const Player *> &ranked, int depth) {
  // Fewer candidates than demand: worst available, no extrapolation
  const int n = static_cast<int>(ranked.size());
  const int rank = std::max(1, std::min(depth, n));
  const Player *p = ranked[static_cast<std::size_t>(rank - 1)];
  return ReplacementLine{p->stats, p->id, rank};
}

} // namespace

std::vector<const Player *>
rank_preliminary(const std::vector<const Player *> &pool, const SgpEngine &engine) {
  const StatLine mean = SgpEngine::mean_line(pool, engine.categories());
  std::vector<std::pair<double, const Player *>> keyed;
  keyed.reserve(pool.size());
  for (const Player *p : pool)
    keyed.emplace_back(engine.score(p->stats, mean).total, p);

  std::stable_sort(keyed.begin(), keyed.end(), [](const auto &a, const auto &b) {
    if (a.first != b.first)
      return a.first > b.first;
    return a.second->id < b.second->id;
  });

  std::vector<const Player *> out;
  out.reserve(keyed.size());
  for (const auto &kv : keyed)
    out.push_back(kv.second);
  return out;
}

BaselineMap ReplacementLevelResolver::baseline(const std::vector<const Player *> &ranked,
                                               PlayerType type,
                                               const RosterDemand &league_slots) const {
  BaselineMap out;
  if (ranked.empty())
    return out;

  // With no slots left on this side the best remaining player is the level
  const int type_depth = pool_size(league_slots, type);
  out[global_key(type)] = line_at(ranked, type_depth);
  log_debug("{} replacement: depth {} of {} -> player {}", to_string(type),
            type_depth, ranked.size(), out[global_key(type)].player_id);

  if (mode_ != ReplacementMode::Positional)
    return out;

  const std::map<std::string, int> demand = positional_demand(league_slots);
  for (const auto &info : slot_catalog()) {
    if (info.kind != SlotKind::Base || info.side != type)
      continue;
    auto it = demand.find(info.label);
    const int depth = it == demand.end() ? 0 : it->second;
    if (depth <= 0)
      continue;

    std::vector<const Player *> eligible;
    for (const Player *p : ranked) {
      if (eligible_base_positions(*p).count(info.label))
        eligible.push_back(p);
    }
    if (eligible.empty())
      continue;

    out[info.label] = line_at(eligible, depth);
    log_debug("{} replacement: depth {} of {} -> player {}", info.label, depth,
              eligible.size(), out[info.label].player_id);
  }
  return out;
}

std::string ReplacementLevelResolver::select(const Player &p,
                                             const BaselineMap &baselines,
                                             const SgpEngine &engine,
                                             SgpScore &out) const {
  std::string best_key;
  bool found = false;
  if (mode_ == ReplacementMode::Positional) {
    // Catalog order breaks ties
    for (const auto &info : slot_catalog()) {
      if (info.kind != SlotKind::Base || !p.has_position(info.label) ||
          info.side != p.type)
        continue;
      auto it = baselines.find(info.label);
      if (it == baselines.end())
        continue;
      SgpScore s = engine.score(p.stats, it->second.line);
      if (!found || s.total > out.total) {
        out = std::move(s);
        best_key = info.label;
        found = true;
      }
    }
  }
  if (found)
    return best_key;

  const std::string key = global_key(p.type);
  auto it = baselines.find(key);
  out = it == baselines.end() ? engine.score(p.stats, p.stats)
                              : engine.score(p.stats, it->second.line);
  return key;
}

} // namespace sgp_core
