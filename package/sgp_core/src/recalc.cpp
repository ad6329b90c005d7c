#include "sgp_core/recalc.hpp"

#include <algorithm>
#include <initializer_list>
#include <utility>
#include <vector>

#include <Eigen/Dense>
#include <fmt/format.h>

#include "sgp_core/errors.hpp"
#include "sgp_core/log.hpp"
#include "sgp_core/market.hpp"
#include "sgp_core/positions.hpp"
#include "sgp_core/sgp.hpp"

namespace sgp_core {

RecalculationCoordinator::RecalculationCoordinator(LeagueSettings settings)
    : settings_(std::move(settings)) {
  settings_.validate();
}

RosterDemand RecalculationCoordinator::remaining_demand(const DraftPool &pool) const {
  RosterDemand remaining = settings_.league_demand();
  for (const auto &team : pool.teams()) {
    const std::vector<const Player *> roster = pool.roster(team.team_id);
    if (roster.empty())
      continue;
    for (const auto &st : assign_roster(roster, settings_.roster_spots))
      remaining[st.slot] -= st.filled;
  }
  return remaining;
}

double RecalculationCoordinator::remaining_budget(const DraftPool &pool,
                                                  PlayerType t) const {
  return std::max(0.0, settings_.sub_budget(t) - pool.spent_on(t));
}

ValuationEpoch RecalculationCoordinator::recalculate(const DraftPool &pool) const {
  return recalculate(pool, default_mode());
}

ValuationEpoch RecalculationCoordinator::recalculate(const DraftPool &pool,
                                                     ReplacementMode mode) const {
  ValuationEpoch epoch;
  epoch.pool_version = pool.version();
  epoch.remaining_slots = remaining_demand(pool);
  epoch.hitter_budget = remaining_budget(pool, PlayerType::Hitter);
  epoch.pitcher_budget = remaining_budget(pool, PlayerType::Pitcher);

  const std::vector<const Player *> undrafted = pool.undrafted();
  const ReplacementLevelResolver resolver(mode);

  for (PlayerType type : {PlayerType::Hitter, PlayerType::Pitcher}) {
    std::vector<const Player *> sub;
    for (const Player *p : undrafted) {
      if (p->type == type)
        sub.push_back(p);
    }
    if (type == PlayerType::Hitter)
      epoch.hitters = sub.size();
    else
      epoch.pitchers = sub.size();
    if (sub.empty())
      continue;

    const SgpEngine engine = SgpEngine::fit(sub, settings_.categories(type));
    const std::vector<const Player *> ranked = rank_preliminary(sub, engine);
    const BaselineMap baselines =
        resolver.baseline(ranked, type, epoch.remaining_slots);
    epoch.baselines.insert(baselines.begin(), baselines.end());

    const int n = static_cast<int>(sub.size());
    Eigen::VectorXd sgp(n);
    std::vector<Valuation> vals(sub.size());
    for (int i = 0; i < n; ++i) {
      const Player &p = *sub[static_cast<std::size_t>(i)];
      SgpScore s;
      Valuation &v = vals[static_cast<std::size_t>(i)];
      v.baseline_key = resolver.select(p, baselines, engine, s);
      v.sgp = s.total;
      v.sgp_breakdown = std::move(s.breakdown);
      v.epoch = epoch.pool_version;
      sgp[i] = v.sgp;
    }

    MarketState ms;
    ms.budget = type == PlayerType::Hitter ? epoch.hitter_budget : epoch.pitcher_budget;
    ms.min_bid = static_cast<double>(settings_.min_bid);
    const DollarValues dv = sgp_to_dollars(sgp, ms);
    if (type == PlayerType::Hitter)
      epoch.hitter_dollars_per_sgp = dv.dollars_per_sgp;
    else
      epoch.pitcher_dollars_per_sgp = dv.dollars_per_sgp;

    for (int i = 0; i < n; ++i) {
      Valuation &v = vals[static_cast<std::size_t>(i)];
      v.dollar_value = dv.dollars[i];
      epoch.values.emplace(sub[static_cast<std::size_t>(i)]->id, std::move(v));
    }
  }
  return epoch;
}

void RecalculationCoordinator::commit(DraftPool &pool,
                                      const ValuationEpoch &epoch) const {
  if (epoch.pool_version != pool.version()) {
    log_warn("Discarding valuation of pool version {}; pool is at {}",
             epoch.pool_version, pool.version());
    throw TransactionConflict(fmt::format(
        "Valuation computed at pool version {} but pool is at version {}",
        epoch.pool_version, pool.version()));
  }
  pool.apply_valuations(epoch.values, epoch.pool_version);
  log_info("Valued {} hitters (${:.2f}/SGP) and {} pitchers (${:.2f}/SGP) at "
           "pool version {}",
           epoch.hitters, epoch.hitter_dollars_per_sgp, epoch.pitchers,
           epoch.pitcher_dollars_per_sgp, epoch.pool_version);
}

ValuationEpoch RecalculationCoordinator::run(DraftPool &pool) const {
  ValuationEpoch epoch = recalculate(pool);
  commit(pool, epoch);
  return epoch;
}

} // namespace sgp_core
