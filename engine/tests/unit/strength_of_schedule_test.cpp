#include <gtest/gtest.h>

#include "ranking/strength_of_schedule.hpp"
#include "unit/test_fixtures.hpp"

namespace {

ranking::Game Processed(int game_id, int week, int home, int away) {
  auto game = ranking_test::CompletedGame(game_id, week, home, away, 21, 14);
  game.is_processed = true;
  return game;
}

TEST(StrengthOfScheduleTest, TeamWithoutGamesGetsNeutralValue) {
  ranking_test::StoreFixture fx;
  fx.AddTeam(1, 1720);
  ranking::StrengthOfScheduleCalculator calculator(fx.store, ranking::RatingParams{});
  EXPECT_DOUBLE_EQ(calculator.Calculate(ranking_test::kSeason, 1), 1500.0);
  EXPECT_DOUBLE_EQ(calculator.Calculate(ranking_test::kSeason, 404), 1500.0);
}

TEST(StrengthOfScheduleTest, AveragesCurrentOpponentRatings) {
  ranking_test::StoreFixture fx;
  fx.AddTeam(1, 1500);
  fx.AddTeam(2, 1600);
  fx.AddTeam(3, 1400);
  fx.AddTeam(4, 1700);
  ASSERT_EQ(fx.store->ApplyGameResult(Processed(10, 1, 1, 2)), ranking::ApplyStatus::kApplied);
  ASSERT_EQ(fx.store->ApplyGameResult(Processed(11, 2, 3, 1)), ranking::ApplyStatus::kApplied);
  ASSERT_EQ(fx.store->ApplyGameResult(Processed(12, 3, 1, 4)), ranking::ApplyStatus::kApplied);
  fx.store->UpsertGame(ranking_test::ScheduledGame(13, 4, 1, 2));

  ranking::StrengthOfScheduleCalculator calculator(fx.store, ranking::RatingParams{});
  EXPECT_DOUBLE_EQ(calculator.Calculate(ranking_test::kSeason, 1), (1600.0 + 1400.0 + 1700.0) / 3.0);
  EXPECT_DOUBLE_EQ(calculator.Calculate(ranking_test::kSeason, 1, 2), 1500.0);
  EXPECT_DOUBLE_EQ(calculator.Calculate(ranking_test::kSeason, 1, 0), 1500.0);
  EXPECT_DOUBLE_EQ(calculator.Calculate(ranking_test::kSeason, 4), 1500.0);
}

TEST(StrengthOfScheduleTest, UsesRatingsAtCalculationTime) {
  ranking_test::StoreFixture fx;
  fx.AddTeam(1, 1500);
  fx.AddTeam(2, 1600);
  fx.AddTeam(3, 1500);
  ASSERT_EQ(fx.store->ApplyGameResult(Processed(10, 1, 1, 2)), ranking::ApplyStatus::kApplied);
  ranking::StrengthOfScheduleCalculator calculator(fx.store, ranking::RatingParams{});
  double before = calculator.Calculate(ranking_test::kSeason, 1);

  // 상대 팀의 이후 경기 결과가 SOS에 반영된다.
  auto later = Processed(11, 2, 2, 3);
  later.home_delta = 25.0;
  later.away_delta = -25.0;
  ASSERT_EQ(fx.store->ApplyGameResult(later), ranking::ApplyStatus::kApplied);
  EXPECT_DOUBLE_EQ(calculator.Calculate(ranking_test::kSeason, 1), before + 25.0);
}

TEST(StrengthOfScheduleTest, CalculateAllCoversEveryTeam) {
  ranking_test::StoreFixture fx;
  fx.AddTeam(1, 1500);
  fx.AddTeam(2, 1600);
  fx.AddTeam(3, 1400);
  ASSERT_EQ(fx.store->ApplyGameResult(Processed(10, 1, 1, 2)), ranking::ApplyStatus::kApplied);
  ranking::StrengthOfScheduleCalculator calculator(fx.store, ranking::RatingParams{});
  auto all = calculator.CalculateAll(ranking_test::kSeason);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_DOUBLE_EQ(all.at(1), 1600.0);
  EXPECT_DOUBLE_EQ(all.at(2), 1500.0);
  EXPECT_DOUBLE_EQ(all.at(3), 1500.0);
}

}  // namespace
