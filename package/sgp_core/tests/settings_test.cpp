#include <gtest/gtest.h>

#include <string>

#include "sgp_core/draft_state.hpp"
#include "sgp_core/errors.hpp"
#include "sgp_core/recalc.hpp"
#include "sgp_core/settings.hpp"

using namespace sgp_core;

// =============================================================================
// Validation
// =============================================================================

TEST(LeagueSettingsTest, Defaults_AreValid) {
  LeagueSettings s;
  EXPECT_NO_THROW(s.validate());
  EXPECT_EQ(s.total_league_budget(), 12 * 260);
  EXPECT_EQ(s.slots_per_team(PlayerType::Hitter), 9);
  EXPECT_EQ(s.slots_per_team(PlayerType::Pitcher), 6);
  EXPECT_EQ(s.total_drafted(PlayerType::Hitter), 108);
  EXPECT_TRUE(s.use_positional_adjustments);
}

TEST(LeagueSettingsTest, SubBudgets_SplitTheLeagueBudget) {
  LeagueSettings s;
  s.hitter_budget_fraction = 0.7;
  EXPECT_DOUBLE_EQ(s.sub_budget(PlayerType::Hitter), 3120.0 * 0.7);
  EXPECT_DOUBLE_EQ(s.sub_budget(PlayerType::Hitter) + s.sub_budget(PlayerType::Pitcher),
                   3120.0);
}

TEST(LeagueSettingsTest, BudgetFractionOutOfRange_Throws) {
  LeagueSettings s;
  s.hitter_budget_fraction = 1.2;
  EXPECT_THROW(s.validate(), ConfigurationError);
  s.hitter_budget_fraction = -0.1;
  EXPECT_THROW(s.validate(), ConfigurationError);
}

TEST(LeagueSettingsTest, NegativeRosterCount_Throws) {
  LeagueSettings s;
  s.roster_spots["OF"] = -1;
  EXPECT_THROW(s.validate(), ConfigurationError);
}

TEST(LeagueSettingsTest, UnknownRosterSlot_Throws) {
  LeagueSettings s;
  s.roster_spots["DH"] = 1;
  EXPECT_THROW(s.validate(), ConfigurationError);
}

TEST(LeagueSettingsTest, EmptyCategorySet_Throws) {
  LeagueSettings s;
  s.pitching_categories.clear();
  EXPECT_THROW(s.validate(), ConfigurationError);
}

TEST(LeagueSettingsTest, DuplicateCategory_Throws) {
  LeagueSettings s;
  s.hitting_categories.emplace_back("HR", CategoryKind::Counting);
  EXPECT_THROW(s.validate(), ConfigurationError);
}

TEST(LeagueSettingsTest, TeamsAndBudget_MustBePositive) {
  LeagueSettings s;
  s.num_teams = 0;
  EXPECT_THROW(s.validate(), ConfigurationError);
  s.num_teams = 12;
  s.budget_per_team = 0;
  EXPECT_THROW(s.validate(), ConfigurationError);
}

TEST(LeagueSettingsTest, MinimumBid_IsAtLeastOneDollar) {
  LeagueSettings s;
  s.min_bid = 0;
  EXPECT_THROW(s.validate(), ConfigurationError);
  s.min_bid = -1;
  EXPECT_THROW(s.validate(), ConfigurationError);
  s.min_bid = 1;
  EXPECT_NO_THROW(s.validate());

  // A zero minimum would otherwise let $0 picks through
  s.min_bid = 0;
  DraftPool pool;
  EXPECT_THROW(pool.initialize(s), ConfigurationError);
}

TEST(LeagueSettingsTest, ErrorMessage_NamesTheField) {
  LeagueSettings s;
  s.roster_spots["C"] = -2;
  try {
    s.validate();
    FAIL() << "expected ConfigurationError";
  } catch (const ConfigurationError &e) {
    EXPECT_NE(std::string(e.what()).find("'C'"), std::string::npos);
  }
}

TEST(LeagueSettingsTest, Coordinator_RejectsInvalidSettingsUpFront) {
  LeagueSettings s;
  s.hitter_budget_fraction = 2.0;
  EXPECT_THROW(RecalculationCoordinator{s}, ConfigurationError);
}

// =============================================================================
// Positional demand
// =============================================================================

TEST(PositionalDemandTest, StandardRoster) {
  LeagueSettings s;
  const auto demand = positional_demand(s.league_demand());
  EXPECT_EQ(demand.at("C"), 12);
  EXPECT_EQ(demand.at("1B"), 12);
  EXPECT_EQ(demand.at("2B"), 12);
  EXPECT_EQ(demand.at("3B"), 12);
  EXPECT_EQ(demand.at("SS"), 12);
  EXPECT_EQ(demand.at("OF"), 36);
  // Two generic P slots per team split onto SP and RP
  EXPECT_EQ(demand.at("SP"), 36);
  EXPECT_EQ(demand.at("RP"), 36);
}

TEST(PositionalDemandTest, TwoCatcherLeague) {
  LeagueSettings s;
  s.roster_spots["C"] = 2;
  EXPECT_EQ(positional_demand(s.league_demand()).at("C"), 24);
}

TEST(PositionalDemandTest, CornerAndMiddleSlotsSplitOntoConstituents) {
  LeagueSettings s;
  s.roster_spots["CI"] = 1;
  s.roster_spots["MI"] = 1;
  const auto demand = positional_demand(s.league_demand());
  EXPECT_EQ(demand.at("1B"), 18);
  EXPECT_EQ(demand.at("3B"), 18);
  EXPECT_EQ(demand.at("2B"), 18);
  EXPECT_EQ(demand.at("SS"), 18);
}

TEST(PositionalDemandTest, OddCompositeCount_GoesToSecondConstituent) {
  const auto demand = positional_demand({{"CI", 11}});
  EXPECT_EQ(demand.at("1B"), 5);
  EXPECT_EQ(demand.at("3B"), 6);
}

TEST(PositionalDemandTest, UtilityOnlyWidensTheHitterPool) {
  const RosterDemand slots{{"OF", 3}, {"UTIL", 2}, {"BN", 4}};
  const auto demand = positional_demand(slots);
  EXPECT_EQ(demand.at("OF"), 3);
  EXPECT_EQ(pool_size(slots, PlayerType::Hitter), 5);
  EXPECT_EQ(pool_size(slots, PlayerType::Pitcher), 0);
}
