#include <gtest/gtest.h>

#include "sgp_core/market.hpp"

using namespace sgp_core;

TEST(SgpToDollarsTest, PositiveSgpSharesWhatTheMinimumBidsLeave) {
  Eigen::VectorXd sgp(4);
  sgp << 3.0, 1.0, 0.0, -2.0;

  const DollarValues dv = sgp_to_dollars(sgp, MarketState{40.0, 1.0});

  EXPECT_DOUBLE_EQ(dv.total_positive_sgp, 4.0);
  EXPECT_DOUBLE_EQ(dv.reserved, 2.0);
  EXPECT_DOUBLE_EQ(dv.dollars_per_sgp, 9.5);
  EXPECT_DOUBLE_EQ(dv.dollars[0], 28.5);
  EXPECT_DOUBLE_EQ(dv.dollars[1], 9.5);
  // At or below replacement: still draftable at the minimum
  EXPECT_DOUBLE_EQ(dv.dollars[2], 1.0);
  EXPECT_DOUBLE_EQ(dv.dollars[3], 1.0);
}

TEST(SgpToDollarsTest, WholePool_SumsToTheBudget) {
  Eigen::VectorXd sgp(6);
  sgp << 6.0, 4.0, 2.5, 0.0, -0.5, -3.0;

  const DollarValues dv = sgp_to_dollars(sgp, MarketState{150.0, 2.0});

  EXPECT_DOUBLE_EQ(dv.reserved, 6.0);
  EXPECT_NEAR(dv.dollars.sum(), 150.0, 1e-9);
}

TEST(SgpToDollarsTest, ReserveExceedsBudget_EveryoneAtMinimum) {
  Eigen::VectorXd sgp(4);
  sgp << 2.0, -1.0, -2.0, -3.0;
  const DollarValues dv = sgp_to_dollars(sgp, MarketState{2.0, 1.0});
  EXPECT_DOUBLE_EQ(dv.dollars_per_sgp, 0.0);
  for (int i = 0; i < sgp.size(); ++i)
    EXPECT_DOUBLE_EQ(dv.dollars[i], 1.0);
}

TEST(SgpToDollarsTest, SmallPositiveValuesAreFloored) {
  Eigen::VectorXd sgp(2);
  sgp << 0.01, 9.99;
  const DollarValues dv = sgp_to_dollars(sgp, MarketState{10.0, 1.0});
  EXPECT_DOUBLE_EQ(dv.dollars[0], 1.0);
  EXPECT_NEAR(dv.dollars[1], 9.99, 1e-12);
}

TEST(SgpToDollarsTest, NoPositiveSgp_EveryoneAtMinimum) {
  Eigen::VectorXd sgp(3);
  sgp << 0.0, -1.0, -4.0;
  const DollarValues dv = sgp_to_dollars(sgp, MarketState{500.0, 2.0});
  EXPECT_DOUBLE_EQ(dv.dollars_per_sgp, 0.0);
  for (int i = 0; i < sgp.size(); ++i)
    EXPECT_DOUBLE_EQ(dv.dollars[i], 2.0);
}

TEST(SgpToDollarsTest, ExhaustedBudget_EveryoneAtMinimum) {
  Eigen::VectorXd sgp(2);
  sgp << 5.0, 2.0;
  const DollarValues dv = sgp_to_dollars(sgp, MarketState{-30.0, 1.0});
  EXPECT_DOUBLE_EQ(dv.dollars[0], 1.0);
  EXPECT_DOUBLE_EQ(dv.dollars[1], 1.0);
}

TEST(SgpToDollarsTest, DoesNotTouchSgp) {
  Eigen::VectorXd sgp(2);
  sgp << 4.0, -1.0;
  const Eigen::VectorXd before = sgp;
  sgp_to_dollars(sgp, MarketState{100.0, 1.0});
  EXPECT_EQ(sgp, before);
}

TEST(SgpToDollarsTest, EmptyPool) {
  const DollarValues dv = sgp_to_dollars(Eigen::VectorXd(0), MarketState{100.0, 1.0});
  EXPECT_EQ(dv.dollars.size(), 0);
  EXPECT_DOUBLE_EQ(dv.total_positive_sgp, 0.0);
}
