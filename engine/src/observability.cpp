/*
 * 설명: JSON 한 줄 로그와 엔진 처리 카운터를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/observability_test.cpp
 */
#include "ranking/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ranking {
namespace {
std::string_view LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

LogLevel ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

Observability::Observability(LogLevel threshold) : Observability(threshold, std::cout) {}

Observability::Observability(LogLevel threshold, std::ostream& sink) : threshold_(threshold), sink_(sink) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementProcessed() { games_processed_.fetch_add(1); }

void Observability::IncrementRejected() { games_rejected_.fetch_add(1); }

void Observability::IncrementPredicted() { predictions_created_.fetch_add(1); }

void Observability::IncrementEvaluated() { predictions_evaluated_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.games_processed = games_processed_.load();
  snapshot.games_rejected = games_rejected_.load();
  snapshot.predictions_created = predictions_created_.load();
  snapshot.predictions_evaluated = predictions_evaluated_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (ctx.level < threshold_) {
    return;
  }
  nlohmann::json log_json;
  log_json["traceId"] = ctx.trace_id;
  log_json["level"] = LevelName(ctx.level);
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.season) {
    log_json["season"] = *ctx.season;
  }
  if (ctx.game_id) {
    log_json["gameId"] = *ctx.game_id;
  }
  if (ctx.team_id) {
    log_json["teamId"] = *ctx.team_id;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  std::lock_guard<std::mutex> lock(sink_mutex_);
  sink_ << log_json.dump() << std::endl;
}

}  // namespace ranking
