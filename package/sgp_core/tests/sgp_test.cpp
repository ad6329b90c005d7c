#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "fixtures.hpp"
#include "sgp_core/sgp.hpp"

using namespace sgp_core;
using namespace sgp_core_test;

// =============================================================================
// Dispersion
// =============================================================================

TEST(DispersionTest, SampleStddev) {
  Eigen::VectorXd v(3);
  v << 10.0, 20.0, 30.0;
  EXPECT_DOUBLE_EQ(sample_stddev(v), 10.0);
  EXPECT_DOUBLE_EQ(sample_stddev(Eigen::VectorXd::Constant(1, 5.0)), 0.0);
  EXPECT_DOUBLE_EQ(sample_stddev(Eigen::VectorXd::Constant(4, 0.1)), 0.0);
}

TEST(DispersionTest, CountingCategory_IgnoresZeroPlayingTime) {
  // Given three hitters with runs 10/20/30 and one with no at-bats
  const Player a = hitter(1, "OF", 10, 5, 10, 1, 0.250, 400);
  const Player b = hitter(2, "OF", 20, 5, 10, 1, 0.250, 400);
  const Player c = hitter(3, "OF", 30, 5, 10, 1, 0.250, 400);
  const Player idle = hitter(4, "OF", 1000, 0, 0, 0, 0.0, 0);

  // When dispersion is measured
  const SgpEngine engine =
      SgpEngine::fit({&a, &b, &c, &idle}, LeagueSettings().hitting_categories);

  // Then the idle player does not contribute
  EXPECT_DOUBLE_EQ(engine.dispersion("R"), 10.0);
  EXPECT_DOUBLE_EQ(engine.dispersion("HR"), 0.0);
}

TEST(DispersionTest, RateCategory_MeasuredOnVolume) {
  // .300 over 500 = 150 hits, .250 over 400 = 100 hits
  const Player a = hitter(1, "OF", 50, 5, 50, 1, 0.300, 500);
  const Player b = hitter(2, "OF", 50, 5, 50, 1, 0.250, 400);
  const SgpEngine engine = SgpEngine::fit({&a, &b}, {{"AVG", CategoryKind::Rate}});
  EXPECT_NEAR(engine.dispersion("AVG"), 50.0 / std::sqrt(2.0), 1e-9);
}

TEST(DispersionTest, MeanLine_WeightsRatesByPlayingTime) {
  const Player a = hitter(1, "OF", 80, 20, 70, 5, 0.300, 600);
  const Player b = hitter(2, "OF", 60, 10, 50, 15, 0.200, 400);
  const StatLine mean =
      SgpEngine::mean_line({&a, &b}, LeagueSettings().hitting_categories);
  EXPECT_DOUBLE_EQ(mean.get("R"), 70.0);
  EXPECT_NEAR(mean.get("AVG"), 0.26, 1e-12);
  EXPECT_DOUBLE_EQ(mean.playing_time(), 500.0);
}

// =============================================================================
// Scoring
// =============================================================================

TEST(SgpEngineTest, CountingCategory_IsDifferenceOverDispersion) {
  const SgpEngine engine({{"HR", CategoryKind::Counting}}, {{"HR", 5.0}});
  const StatLine player({{"HR", 35}}, 550);
  const StatLine baseline({{"HR", 20}}, 500);
  EXPECT_DOUBLE_EQ(engine.score(player, baseline).total, 3.0);
  EXPECT_DOUBLE_EQ(engine.score(baseline, player).total, -3.0);
}

TEST(SgpEngineTest, RateCategory_RewardsVolume) {
  // Given identical .250 baselines and a .300 hitter at 600 and at 60 at-bats
  const SgpEngine engine({{"AVG", CategoryKind::Rate}}, {{"AVG", 20.0}});
  const StatLine baseline({{"AVG", 0.250}}, 500);
  const StatLine full_time({{"AVG", 0.300}}, 600);
  const StatLine part_time({{"AVG", 0.300}}, 60);

  // When scored
  const double full = engine.score(full_time, baseline).breakdown.at("AVG");
  const double part = engine.score(part_time, baseline).breakdown.at("AVG");

  // Then the full-time hitter is worth strictly more
  EXPECT_GT(full, part);
  EXPECT_NEAR(full, 30.0 / 20.0, 1e-9);
  EXPECT_NEAR(part, 3.0 / 20.0, 1e-9);
}

TEST(SgpEngineTest, RatioCategory_LowerIsBetterAndSymmetric) {
  // Given a 4.00 ERA baseline
  const SgpEngine engine({{"ERA", CategoryKind::Ratio}}, {{"ERA", 50.0}});
  const StatLine baseline({{"ERA", 4.00}}, 150);
  const StatLine ace({{"ERA", 2.00}}, 180);
  const StatLine bad({{"ERA", 6.00}}, 180);

  const double good_sgp = engine.score(ace, baseline).total;
  const double bad_sgp = engine.score(bad, baseline).total;

  EXPECT_GT(good_sgp, 0.0);
  EXPECT_LT(bad_sgp, 0.0);
  EXPECT_NEAR(good_sgp, -bad_sgp, 1e-9);
  EXPECT_NEAR(good_sgp, 2.0 * 180.0 / 50.0, 1e-9);
}

TEST(SgpEngineTest, ZeroDispersion_ContributesNothing) {
  const SgpEngine engine({{"SB", CategoryKind::Counting}, {"R", CategoryKind::Counting}},
                         {{"SB", 0.0}, {"R", 10.0}});
  const StatLine player({{"SB", 40}, {"R", 90}}, 550);
  const StatLine baseline({{"SB", 5}, {"R", 70}}, 500);
  const SgpScore s = engine.score(player, baseline);
  EXPECT_DOUBLE_EQ(s.breakdown.at("SB"), 0.0);
  EXPECT_DOUBLE_EQ(s.total, 2.0);
}

TEST(SgpEngineTest, NoPlayingTime_ScoresZeroInRateCategories) {
  const SgpEngine engine({{"AVG", CategoryKind::Rate}, {"WHIP", CategoryKind::Ratio}},
                         {{"AVG", 20.0}, {"WHIP", 15.0}});
  const StatLine idle({{"AVG", 0.400}, {"WHIP", 0.5}}, 0);
  const StatLine baseline({{"AVG", 0.250}, {"WHIP", 1.3}}, 500);
  EXPECT_DOUBLE_EQ(engine.score(idle, baseline).total, 0.0);
}

TEST(SgpEngineTest, Breakdown_SumsToTotal) {
  const PlayerTable pool = league_pool();
  std::vector<const Player *> hitters;
  for (const auto &p : pool.players()) {
    if (p.type == PlayerType::Hitter)
      hitters.push_back(&p);
  }
  const SgpEngine engine = SgpEngine::fit(hitters, LeagueSettings().hitting_categories);
  const StatLine mean = SgpEngine::mean_line(hitters, engine.categories());

  // Top first baseman, the strongest hitter in the pool
  const SgpScore s = engine.score(pool.get(31).stats, mean);
  ASSERT_EQ(s.breakdown.size(), 5u);
  double sum = 0.0;
  for (const auto &kv : s.breakdown)
    sum += kv.second;
  EXPECT_NEAR(sum, s.total, 1e-12);
  EXPECT_GT(s.total, 0.0);
}
