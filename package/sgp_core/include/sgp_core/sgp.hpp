#pragma once

#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "sgp_core/player.hpp"

namespace sgp_core {

struct SgpScore {
  double total{0.0};
  std::map<std::string, double> breakdown;
};

// Sample (n - 1) standard deviation. 0 for fewer than two values or a
// numerically flat vector.
double sample_stddev(const Eigen::VectorXd &v);

// Standings gain points for one player type: value above a replacement line
// in units of the category's spread across the pool.
class SgpEngine {
public:
  SgpEngine() = default;
  SgpEngine(std::vector<CategorySpec> categories,
            std::unordered_map<std::string, double> dispersion)
      : categories_(std::move(categories)), dispersion_(std::move(dispersion)) {}

  // Measures dispersion per category across the pool. Players with no
  // playing time are left out; rate and ratio categories are measured as
  // stat * playing time.
  static SgpEngine fit(const std::vector<const Player *> &pool,
                       const std::vector<CategorySpec> &categories);

  // Average line of the pool. Rate and ratio categories are weighted by
  // playing time.
  static StatLine mean_line(const std::vector<const Player *> &pool,
                            const std::vector<CategorySpec> &categories);

  // Zero when the category has no spread, or for a rate/ratio category when
  // the player has no playing time.
  double category_sgp(const CategorySpec &cat, const StatLine &player,
                      const StatLine &baseline) const;

  SgpScore score(const StatLine &player, const StatLine &baseline) const;

  double dispersion(const std::string &category) const {
    auto it = dispersion_.find(category);
    return it == dispersion_.end() ? 0.0 : it->second;
  }

  const std::vector<CategorySpec> &categories() const { return categories_; }

private:
  std::vector<CategorySpec> categories_;
  std::unordered_map<std::string, double> dispersion_;
};

} // namespace sgp_core
