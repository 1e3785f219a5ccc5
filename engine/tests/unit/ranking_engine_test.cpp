#include <gtest/gtest.h>

#include "ranking/errors.hpp"
#include "ranking/ranking_engine.hpp"
#include "unit/test_fixtures.hpp"

namespace {

using ranking::ConferenceTier;
using ranking::PreseasonInputs;
using ranking::TeamSeed;
using ranking_test::CompletedGame;
using ranking_test::kSeason;
using ranking_test::ScheduledGame;

class RankingEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    engine.SeedTeam(TeamSeed{1, kSeason, "Alpha", ConferenceTier::kTopTier, PreseasonInputs{5, 10, 0.8}});
    engine.SeedTeam(TeamSeed{2, kSeason, "Bravo", ConferenceTier::kTopTier, PreseasonInputs{40, 60, 0.5}});
    engine.SeedTeam(TeamSeed{3, kSeason, "Charlie", ConferenceTier::kMidTier, PreseasonInputs{90, 99, 0.4}});
    engine.SeedTeam(TeamSeed{4, kSeason, "Delta", ConferenceTier::kSubDivision, PreseasonInputs{}});
  }

  ranking_test::StoreFixture fx;
  ranking::RankingEngine engine{fx.store, fx.observability};
};

TEST_F(RankingEngineTest, ProcessGameEvaluatesStoredPrediction) {
  engine.GeneratePrediction(ScheduledGame(10, 1, 1, 2));
  auto result = engine.ProcessGame(CompletedGame(10, 1, 1, 2, 27, 24));
  EXPECT_EQ(result.winner_id, 1);
  auto predictions = engine.GetPredictions(kSeason, 1);
  ASSERT_EQ(predictions.size(), 1u);
  ASSERT_TRUE(predictions[0].was_correct.has_value());
  EXPECT_TRUE(*predictions[0].was_correct);
}

TEST_F(RankingEngineTest, RunBatchProcessesInOrderSnapshotsAndPredicts) {
  // 가져오기 순서와 무관하게 주차/일자 순으로 처리된다.
  engine.ImportGame(CompletedGame(12, 2, 2, 1, 20, 17));
  engine.ImportGame(CompletedGame(11, 1, 3, 4, 31, 6));
  engine.ImportGame(CompletedGame(10, 1, 1, 2, 28, 14));
  engine.ImportGame(CompletedGame(13, 2, 3, 3, 10, 7));
  engine.ImportGame(CompletedGame(14, 3, 1, 3, 21, 0));
  engine.ImportGame(ScheduledGame(15, 3, 2, 4));
  engine.ImportGame(ScheduledGame(16, 4, 1, 2));

  auto summary = engine.RunBatch(kSeason, 2);
  EXPECT_EQ(summary.games_processed, 3);
  EXPECT_EQ(summary.games_rejected, 1);
  ASSERT_EQ(summary.rejections.size(), 1u);
  EXPECT_EQ(summary.rejections[0].game_id, 13);
  EXPECT_EQ(summary.rejections[0].code, "missing_team");
  EXPECT_EQ(summary.snapshot_teams, 4);
  EXPECT_EQ(summary.predictions_created, 1);
  EXPECT_TRUE(summary.audit.Passed());

  EXPECT_FALSE(fx.store->FindGame(14)->is_processed);
  EXPECT_TRUE(fx.store->FindPrediction(15).has_value());
  EXPECT_FALSE(fx.store->FindPrediction(16).has_value());
  EXPECT_EQ(engine.GetRankingHistory(1, kSeason).size(), 1u);

  auto alpha = fx.store->FindTeam(kSeason, 1);
  EXPECT_EQ(alpha->wins, 1);
  EXPECT_EQ(alpha->losses, 1);

  // 다시 실행해도 이미 처리된 경기는 건드리지 않는다.
  double rating_before = alpha->rating;
  auto rerun = engine.RunBatch(kSeason, 2);
  EXPECT_EQ(rerun.games_processed, 0);
  EXPECT_EQ(rerun.predictions_created, 0);
  EXPECT_DOUBLE_EQ(fx.store->FindTeam(kSeason, 1)->rating, rating_before);
}

TEST_F(RankingEngineTest, BatchEvaluatesPredictionsMadeEarlier) {
  engine.ImportGame(ScheduledGame(20, 1, 1, 4));
  engine.GeneratePrediction(ScheduledGame(20, 1, 1, 4));
  engine.ImportGame(CompletedGame(20, 1, 1, 4, 56, 3));

  auto summary = engine.RunBatch(kSeason, 1);
  EXPECT_EQ(summary.predictions_evaluated, 1);
  auto report = engine.GetAccuracyReport(kSeason);
  EXPECT_EQ(report.totals.evaluated, 1);
  EXPECT_EQ(report.totals.correct, 1);
}

TEST_F(RankingEngineTest, ReferenceRankingsFeedEvaluation) {
  engine.ImportReferenceRanking(ranking::ReferenceRankingEntry{2, kSeason, 1, 4});
  engine.ImportReferenceRanking(ranking::ReferenceRankingEntry{1, kSeason, 1, 11});
  engine.GeneratePrediction(ScheduledGame(25, 1, 1, 2));
  engine.ProcessGame(CompletedGame(25, 1, 1, 2, 31, 28));

  auto evaluation = engine.EvaluateGame(25);
  ASSERT_TRUE(evaluation.has_value());
  EXPECT_TRUE(evaluation->was_correct);
  EXPECT_EQ(evaluation->reference_winner_id.value_or(-1), 2);

  auto report = engine.GetAccuracyReport(kSeason);
  EXPECT_EQ(report.reference.compared, 1);
  EXPECT_EQ(report.reference.engine_only, 1);
  ASSERT_EQ(report.disagreements.size(), 1u);
}

TEST_F(RankingEngineTest, CurrentRankingsReflectProcessedResults) {
  auto before = engine.GetCurrentRankings(kSeason);
  ASSERT_EQ(before.size(), 4u);
  EXPECT_EQ(before[0].team.name, "Alpha");
  EXPECT_EQ(before[3].team.name, "Delta");

  engine.ProcessGame(CompletedGame(30, 1, 4, 1, 35, 0));
  auto after = engine.GetCurrentRankings(kSeason);
  EXPECT_EQ(after[0].team.wins + after[1].team.wins + after[2].team.wins + after[3].team.wins, 1);
  EXPECT_GT(fx.RatingOf(4), before[3].team.rating);
}

TEST_F(RankingEngineTest, MutatingEntryPointsPropagateRejections) {
  engine.ProcessGame(CompletedGame(40, 2, 1, 2, 14, 10));
  EXPECT_THROW(engine.ProcessGame(CompletedGame(41, 1, 1, 3, 14, 10)), ranking::OutOfOrderProcessingError);
  EXPECT_THROW(engine.ProcessGame(CompletedGame(40, 2, 1, 2, 14, 10)), ranking::InvalidGameError);
  EXPECT_THROW(engine.GeneratePrediction(ScheduledGame(40, 2, 1, 2)), ranking::InvalidGameError);
  engine.GeneratePrediction(ScheduledGame(42, 3, 2, 3));
  EXPECT_THROW(engine.GeneratePrediction(ScheduledGame(42, 3, 2, 3)), ranking::AlreadyPredictedError);
}

TEST_F(RankingEngineTest, ReseedRefusedOnceTeamHasPlayed) {
  EXPECT_TRUE(engine.ReseedTeam(TeamSeed{3, kSeason, "Charlie", ConferenceTier::kMidTier, PreseasonInputs{}}));
  engine.ProcessGame(CompletedGame(50, 1, 3, 2, 10, 9));
  EXPECT_FALSE(engine.ReseedTeam(TeamSeed{3, kSeason, "Charlie", ConferenceTier::kMidTier, PreseasonInputs{}}));
  EXPECT_TRUE(engine.Audit(kSeason).Passed());
}

TEST_F(RankingEngineTest, SnapshotWeekIsStable) {
  auto first = engine.SnapshotWeek(kSeason, 0);
  engine.ProcessGame(CompletedGame(60, 1, 2, 1, 30, 3));
  auto second = engine.SnapshotWeek(kSeason, 0);
  ASSERT_EQ(first.size(), second.size());
  for (std::size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].team_id, second[i].team_id);
    EXPECT_DOUBLE_EQ(first[i].rating, second[i].rating);
  }
}

}  // namespace
