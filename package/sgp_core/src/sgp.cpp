#include "sgp_core/sgp.hpp"

#include <algorithm>
#include <cmath>

namespace sgp_core {

namespace {

std::vector<const Player *> with_playing_time(const std::vector<const Player *> &pool) {
  std::vector<const Player *> out;
  out.reserve(pool.size());
  for (const Player *p : pool) {
    if (p->stats.playing_time() > 0.0)
      out.push_back(p);
  }
  return out;
}

double measure(const CategorySpec &cat, const StatLine &line) {
  return cat.kind == CategoryKind::Counting ? line.get(cat.name)
                                            : line.weighted(cat.name);
}

} // namespace

double sample_stddev(const Eigen::VectorXd &v) {
  const Eigen::Index n = v.size();
  if (n < 2)
    return 0.0;
  const double mean = v.mean();
  const double ss = (v.array() - mean).square().sum();
  const double sd = std::sqrt(ss / static_cast<double>(n - 1));
  // Identical values can leave rounding noise behind
  if (sd <= 1e-9 * std::max(1.0, std::abs(mean)))
    return 0.0;
  return sd;
}

SgpEngine SgpEngine::fit(const std::vector<const Player *> &pool,
                         const std::vector<CategorySpec> &categories) {
  const std::vector<const Player *> active = with_playing_time(pool);
  const Eigen::Index n = static_cast<Eigen::Index>(active.size());
  std::unordered_map<std::string, double> dispersion;
  for (const auto &cat : categories) {
    Eigen::VectorXd v(n);
    for (Eigen::Index i = 0; i < n; ++i)
      v[i] = measure(cat, active[static_cast<std::size_t>(i)]->stats);
    dispersion[cat.name] = sample_stddev(v);
  }
  return SgpEngine(categories, std::move(dispersion));
}

StatLine SgpEngine::mean_line(const std::vector<const Player *> &pool,
                              const std::vector<CategorySpec> &categories) {
  const std::vector<const Player *> active = with_playing_time(pool);
  if (active.empty())
    return StatLine();

  const Eigen::Index n = static_cast<Eigen::Index>(active.size());
  Eigen::VectorXd pt(n);
  for (Eigen::Index i = 0; i < n; ++i)
    pt[i] = active[static_cast<std::size_t>(i)]->stats.playing_time();
  const double total_pt = pt.sum();

  std::unordered_map<std::string, double> values;
  for (const auto &cat : categories) {
    Eigen::VectorXd v(n);
    for (Eigen::Index i = 0; i < n; ++i)
      v[i] = measure(cat, active[static_cast<std::size_t>(i)]->stats);
    values[cat.name] =
        cat.kind == CategoryKind::Counting ? v.mean() : v.sum() / total_pt;
  }
  return StatLine(std::move(values), pt.mean());
}

double SgpEngine::category_sgp(const CategorySpec &cat, const StatLine &player,
                               const StatLine &baseline) const {
  const double d = dispersion(cat.name);
  if (!(d > 0.0))
    return 0.0;

  const double pt = player.playing_time();
  switch (cat.kind) {
  case CategoryKind::Counting:
    return (player.get(cat.name) - baseline.get(cat.name)) / d;
  case CategoryKind::Rate:
    // Hits above what the baseline average would produce in the same at-bats
    if (pt <= 0.0)
      return 0.0;
    return (player.weighted(cat.name) - baseline.get(cat.name) * pt) / d;
  case CategoryKind::Ratio:
    if (pt <= 0.0)
      return 0.0;
    return (baseline.get(cat.name) * pt - player.weighted(cat.name)) / d;
  }
  return 0.0;
}

SgpScore SgpEngine::score(const StatLine &player,
                          const StatLine &baseline) const {
  SgpScore s;
  for (const auto &cat : categories_) {
    const double v = category_sgp(cat, player, baseline);
    s.breakdown[cat.name] = v;
    s.total += v;
  }
  return s;
}

} // namespace sgp_core
