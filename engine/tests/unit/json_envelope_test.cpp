#include <gtest/gtest.h>

#include "ranking/api_response.hpp"
#include "ranking/game_processor.hpp"
#include "unit/test_fixtures.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = ranking::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = ranking::MakeErrorEnvelope("out_of_order", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "out_of_order");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"]["detail"].is_null());

  auto with_detail = ranking::MakeErrorEnvelope("db_error", "실패", {{"retryable", true}});
  EXPECT_TRUE(with_detail["error"]["detail"]["retryable"].get<bool>());
}

TEST(JsonEnvelopeTest, TimestampIsUtcIso8601) {
  EXPECT_EQ(ranking::FormatTimestamp(ranking_test::WeekDate(0)), "2025-08-30T00:00:00Z");
}

TEST(JsonEnvelopeTest, PredictionCarriesRatingSnapshot) {
  ranking::Prediction prediction;
  prediction.game_id = 7;
  prediction.season = 2025;
  prediction.week = 3;
  prediction.predicted_winner_id = 1;
  prediction.win_probability = 0.7;
  prediction.ratings = ranking::RatingSnapshot{1600.0, 1450.0};
  prediction.created_at = ranking_test::WeekDate(2);

  auto j = ranking::ToJson(prediction);
  EXPECT_EQ(j["gameId"], 7);
  EXPECT_DOUBLE_EQ(j["homeRatingAtPrediction"].get<double>(), 1600.0);
  EXPECT_DOUBLE_EQ(j["awayRatingAtPrediction"].get<double>(), 1450.0);
  EXPECT_EQ(j["createdAt"], "2025-09-13T00:00:00Z");
  EXPECT_TRUE(j["wasCorrect"].is_null());

  prediction.was_correct = false;
  EXPECT_FALSE(ranking::ToJson(prediction)["wasCorrect"].get<bool>());
}

TEST(JsonEnvelopeTest, RankingEntryView) {
  ranking::RankingEntry entry{ranking_test::MakeTeam(5, 1612.5, ranking::ConferenceTier::kMidTier), 2, 1533.0, 9};
  entry.team.wins = 4;
  entry.team.losses = 1;
  auto j = ranking::ToJson(std::vector<ranking::RankingEntry>{entry});
  ASSERT_TRUE(j.is_array());
  EXPECT_EQ(j[0]["teamId"], 5);
  EXPECT_EQ(j[0]["tier"], "mid_tier");
  EXPECT_EQ(j[0]["rank"], 2);
  EXPECT_EQ(j[0]["wins"], 4);
  EXPECT_EQ(j[0]["sosRank"], 9);
}

TEST(JsonEnvelopeTest, AccuracyReportEmptyShape) {
  ranking::AccuracyReport report;
  report.season = 2025;
  auto j = ranking::ToJson(report);
  EXPECT_EQ(j["season"], 2025);
  EXPECT_TRUE(j["scope"]["week"].is_null());
  EXPECT_EQ(j["totals"]["total"], 0);
  EXPECT_DOUBLE_EQ(j["reference"]["engineAdvantage"].get<double>(), 0.0);
  EXPECT_TRUE(j["byWeek"].is_array());
  EXPECT_TRUE(j["disagreements"].empty());
  EXPECT_TRUE(j["team"].is_null());
}

TEST(JsonEnvelopeTest, GameResultCarriesDeltas) {
  ranking::GameResult result{10, 1, 2, 31.5, -31.5, 0.59, 2.7, 1.0, 1531.5, 1468.5};
  auto j = ranking::ToJson(result);
  EXPECT_EQ(j["gameId"], 10);
  EXPECT_EQ(j["winnerId"], 1);
  EXPECT_EQ(j["loserId"], 2);
  EXPECT_DOUBLE_EQ(j["homeDelta"].get<double>() + j["awayDelta"].get<double>(), 0.0);
  EXPECT_DOUBLE_EQ(j["tierMultiplier"].get<double>(), 1.0);
  EXPECT_DOUBLE_EQ(j["awayRatingAfter"].get<double>(), 1468.5);
}

TEST(JsonEnvelopeTest, RankingHistoryIsArrayInOrder) {
  ranking::RankingSnapshot week1;
  week1.team_id = 3;
  week1.season = 2025;
  week1.week = 1;
  week1.rank = 4;
  week1.rating = 1520.0;
  ranking::RankingSnapshot week2 = week1;
  week2.week = 2;
  week2.rank = 2;
  week2.wins = 2;

  auto j = ranking::ToJson(std::vector<ranking::RankingSnapshot>{week1, week2});
  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 2u);
  EXPECT_EQ(j[0]["week"], 1);
  EXPECT_EQ(j[1]["rank"], 2);
  EXPECT_EQ(j[1]["wins"], 2);
  EXPECT_EQ(j[1]["teamId"], 3);
}
