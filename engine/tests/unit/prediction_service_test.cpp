#include <functional>
#include <memory>

#include <gtest/gtest.h>

#include "ranking/errors.hpp"
#include "ranking/game_processor.hpp"
#include "ranking/prediction_service.hpp"
#include "unit/test_fixtures.hpp"

namespace {

using ranking::Confidence;
using ranking_test::CompletedGame;
using ranking_test::ScheduledGame;

// 예측 삽입 직전에 한 번 콜백을 실행한다.
class InterleavingStore : public ranking::InMemoryRatingStore {
 public:
  ranking::PredictionInsertStatus InsertPrediction(const ranking::Prediction& prediction) override {
    if (before_insert) {
      auto hook = std::move(before_insert);
      before_insert = nullptr;
      hook();
    }
    return ranking::InMemoryRatingStore::InsertPrediction(prediction);
  }

  std::function<void()> before_insert;
};

class PredictionServiceTest : public ::testing::Test {
 protected:
  ranking_test::StoreFixture fx;
  ranking::RatingModel model;
  ranking::PredictionService service{fx.store, fx.observability, model};
};

TEST_F(PredictionServiceTest, EvenTeamsFavorHomeSide) {
  fx.AddTeam(1, 1500);
  fx.AddTeam(2, 1500);
  auto prediction = service.Predict(ScheduledGame(10, 1, 1, 2));
  EXPECT_EQ(prediction.predicted_winner_id, 1);
  EXPECT_NEAR(prediction.win_probability, 0.5924662305843318, 1e-12);
  EXPECT_EQ(prediction.predicted_home_score, 32);
  EXPECT_EQ(prediction.predicted_away_score, 28);
  EXPECT_EQ(prediction.PredictedMargin(), 4);
  EXPECT_FALSE(prediction.was_correct.has_value());
  EXPECT_EQ(fx.observability->Snapshot().predictions_created, 1u);
}

TEST_F(PredictionServiceTest, NeutralTieGoesToHomeTeam) {
  fx.AddTeam(1, 1500);
  fx.AddTeam(2, 1500);
  auto prediction = service.Predict(ScheduledGame(10, 1, 1, 2, true));
  EXPECT_EQ(prediction.predicted_winner_id, 1);
  EXPECT_DOUBLE_EQ(prediction.win_probability, 0.5);
  EXPECT_EQ(prediction.predicted_home_score, 30);
  EXPECT_EQ(prediction.predicted_away_score, 30);
}

TEST_F(PredictionServiceTest, ScoresFollowRatingGap) {
  fx.AddTeam(1, 1800);
  fx.AddTeam(2, 1500);
  fx.AddTeam(3, 1450);
  fx.AddTeam(4, 1600);
  auto lopsided = service.Predict(ScheduledGame(10, 1, 1, 2, true));
  EXPECT_EQ(lopsided.predicted_home_score, 41);
  EXPECT_EQ(lopsided.predicted_away_score, 20);

  auto road_favorite = service.Predict(ScheduledGame(11, 1, 3, 4, true));
  EXPECT_EQ(road_favorite.predicted_winner_id, 4);
  EXPECT_NEAR(road_favorite.win_probability, 0.70338, 1e-5);
  EXPECT_EQ(road_favorite.predicted_home_score, 25);
  EXPECT_EQ(road_favorite.predicted_away_score, 35);
}

TEST_F(PredictionServiceTest, ConfidenceThresholds) {
  EXPECT_EQ(service.ConfidenceFor(0.96935), Confidence::kHigh);
  EXPECT_EQ(service.ConfidenceFor(0.80), Confidence::kHigh);
  EXPECT_EQ(service.ConfidenceFor(0.70338), Confidence::kMedium);
  EXPECT_EQ(service.ConfidenceFor(0.65), Confidence::kMedium);
  EXPECT_EQ(service.ConfidenceFor(0.51439), Confidence::kLow);
  EXPECT_EQ(ranking::ConfidenceName(Confidence::kMedium), "Medium");
}

TEST_F(PredictionServiceTest, DuplicatePredictionIsRejected) {
  fx.AddTeam(1, 1500);
  fx.AddTeam(2, 1500);
  service.Predict(ScheduledGame(10, 1, 1, 2));
  EXPECT_THROW(service.Predict(ScheduledGame(10, 1, 1, 2)), ranking::AlreadyPredictedError);
  EXPECT_EQ(fx.store->ListPredictions(ranking_test::kSeason).size(), 1u);
}

TEST_F(PredictionServiceTest, SnapshotSurvivesLaterRatingChanges) {
  fx.AddTeam(1, 1500);
  fx.AddTeam(2, 1500);
  fx.AddTeam(3, 1500);
  service.Predict(ScheduledGame(10, 2, 1, 2));

  ranking::GameProcessor processor(fx.store, fx.observability, model);
  processor.Process(CompletedGame(9, 1, 1, 3, 42, 3));
  ASSERT_GT(fx.RatingOf(1), 1500.0);

  auto stored = fx.store->FindPrediction(10);
  ASSERT_TRUE(stored.has_value());
  EXPECT_DOUBLE_EQ(stored->ratings.home_rating, 1500.0);
  EXPECT_DOUBLE_EQ(stored->ratings.away_rating, 1500.0);
  EXPECT_NEAR(stored->win_probability, 0.5924662305843318, 1e-12);
}

TEST_F(PredictionServiceTest, RejectsPlayedProcessedAndUnknownGames) {
  fx.AddTeam(1, 1500);
  fx.AddTeam(2, 1500);
  ranking::GameProcessor processor(fx.store, fx.observability, model);
  auto played = CompletedGame(10, 1, 1, 2, 21, 14);
  processor.Process(played);

  auto expect_reason = [&](const ranking::Game& game, ranking::InvalidGameReason reason) {
    try {
      service.Predict(game);
      ADD_FAILURE() << "InvalidGameError가 발생하지 않음";
    } catch (const ranking::InvalidGameError& ex) {
      EXPECT_EQ(ex.reason, reason);
    }
  };
  expect_reason(ScheduledGame(10, 1, 1, 2), ranking::InvalidGameReason::kAlreadyProcessed);
  expect_reason(CompletedGame(11, 2, 1, 2, 10, 3), ranking::InvalidGameReason::kAlreadyPlayed);
  expect_reason(ScheduledGame(12, 2, 1, 77), ranking::InvalidGameReason::kMissingTeam);
  EXPECT_TRUE(fx.store->ListPredictions(ranking_test::kSeason).empty());
}

TEST(PredictionRaceTest, GameProcessedBeforeInsertIsRejected) {
  std::ostringstream log;
  auto store = std::make_shared<InterleavingStore>();
  auto observability = std::make_shared<ranking::Observability>(ranking::LogLevel::kDebug, log);
  ranking::RatingModel model;
  ranking::PredictionService service(store, observability, model);
  ranking::GameProcessor processor(store, observability, model);
  store->InsertTeam(ranking_test::MakeTeam(1, 1500));
  store->InsertTeam(ranking_test::MakeTeam(2, 1500));
  store->UpsertGame(ScheduledGame(10, 1, 1, 2));

  store->before_insert = [&] { processor.Process(CompletedGame(10, 1, 1, 2, 24, 10)); };
  try {
    service.Predict(ScheduledGame(10, 1, 1, 2));
    ADD_FAILURE() << "InvalidGameError가 발생하지 않음";
  } catch (const ranking::InvalidGameError& ex) {
    EXPECT_EQ(ex.reason, ranking::InvalidGameReason::kAlreadyProcessed);
  }
  EXPECT_TRUE(store->FindGame(10)->is_processed);
  EXPECT_FALSE(store->FindPrediction(10).has_value());
  EXPECT_EQ(observability->Snapshot().predictions_created, 0u);
}

TEST_F(PredictionServiceTest, GenerateUpcomingCoversScheduledGamesOfWeek) {
  fx.AddTeam(1, 1500);
  fx.AddTeam(2, 1520);
  fx.AddTeam(3, 1480);
  fx.AddTeam(4, 1510);
  fx.store->UpsertGame(ScheduledGame(20, 3, 1, 2));
  fx.store->UpsertGame(ScheduledGame(21, 3, 3, 4));
  fx.store->UpsertGame(ScheduledGame(22, 4, 1, 3));
  fx.store->UpsertGame(CompletedGame(23, 3, 2, 4, 14, 7));
  service.Predict(ScheduledGame(21, 3, 3, 4));

  auto created = service.GenerateUpcoming(ranking_test::kSeason, 3);
  ASSERT_EQ(created.size(), 1u);
  EXPECT_EQ(created[0].game_id, 20);

  auto week3 = service.ListPredictions(ranking_test::kSeason, 3);
  ASSERT_EQ(week3.size(), 2u);
  EXPECT_EQ(week3[0].game_id, 20);
  EXPECT_EQ(week3[1].game_id, 21);
  EXPECT_TRUE(service.ListPredictions(ranking_test::kSeason, 4).empty());
}

}  // namespace
