#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "ranking/observability.hpp"

namespace {

TEST(ObservabilityTest, WritesOneJsonObjectPerEvent) {
  std::ostringstream sink;
  ranking::Observability observability(ranking::LogLevel::kInfo, sink);

  ranking::LogContext ctx;
  ctx.trace_id = observability.NextTraceId();
  ctx.name = "game_processed";
  ctx.season = 2025;
  ctx.game_id = 42;
  ctx.detail = {{"homeDelta", 12.5}};
  ctx.latency_ms = 3;
  observability.Log(ctx);

  std::istringstream lines(sink.str());
  std::string line;
  ASSERT_TRUE(std::getline(lines, line));
  auto j = nlohmann::json::parse(line);
  EXPECT_EQ(j["eventName"], "game_processed");
  EXPECT_EQ(j["level"], "info");
  EXPECT_EQ(j["season"], 2025);
  EXPECT_EQ(j["gameId"], 42);
  EXPECT_FALSE(j.contains("teamId"));
  EXPECT_DOUBLE_EQ(j["detail"]["homeDelta"].get<double>(), 12.5);
  EXPECT_EQ(j["latencyMs"], 3);
  EXPECT_FALSE(std::getline(lines, line));
}

TEST(ObservabilityTest, DropsEventsBelowThreshold) {
  std::ostringstream sink;
  ranking::Observability observability(ranking::LogLevel::kWarn, sink);
  ranking::LogContext ctx;
  ctx.name = "debug_event";
  ctx.level = ranking::LogLevel::kInfo;
  observability.Log(ctx);
  EXPECT_TRUE(sink.str().empty());

  ctx.level = ranking::LogLevel::kError;
  observability.Log(ctx);
  EXPECT_NE(sink.str().find("\"level\":\"error\""), std::string::npos);
}

TEST(ObservabilityTest, ParseLogLevel) {
  EXPECT_EQ(ranking::ParseLogLevel("debug"), ranking::LogLevel::kDebug);
  EXPECT_EQ(ranking::ParseLogLevel("warn"), ranking::LogLevel::kWarn);
  EXPECT_EQ(ranking::ParseLogLevel("error"), ranking::LogLevel::kError);
  EXPECT_EQ(ranking::ParseLogLevel("unknown"), ranking::LogLevel::kInfo);
}

TEST(ObservabilityTest, CountersAndTraceIds) {
  std::ostringstream sink;
  ranking::Observability observability(ranking::LogLevel::kInfo, sink);
  observability.IncrementProcessed();
  observability.IncrementProcessed();
  observability.IncrementRejected();
  observability.IncrementPredicted();
  observability.IncrementEvaluated();
  auto snapshot = observability.Snapshot();
  EXPECT_EQ(snapshot.games_processed, 2u);
  EXPECT_EQ(snapshot.games_rejected, 1u);
  EXPECT_EQ(snapshot.predictions_created, 1u);
  EXPECT_EQ(snapshot.predictions_evaluated, 1u);
  EXPECT_NE(observability.NextTraceId(), observability.NextTraceId());
}

}  // namespace
