/*
 * 설명: 구조화 로그와 엔진 처리 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace ranking {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view text);

struct LogContext {
  std::string trace_id;
  LogLevel level{LogLevel::kInfo};
  std::string name;
  std::optional<int> season;
  std::optional<int> game_id;
  std::optional<int> team_id;
  nlohmann::json detail;
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t games_processed{0};
  std::uint64_t games_rejected{0};
  std::uint64_t predictions_created{0};
  std::uint64_t predictions_evaluated{0};
};

class Observability {
 public:
  explicit Observability(LogLevel threshold = LogLevel::kInfo);
  Observability(LogLevel threshold, std::ostream& sink);

  std::string NextTraceId();
  void IncrementProcessed();
  void IncrementRejected();
  void IncrementPredicted();
  void IncrementEvaluated();
  MetricsSnapshot Snapshot() const;
  void Log(const LogContext& ctx) const;

 private:
  LogLevel threshold_;
  std::ostream& sink_;
  mutable std::mutex sink_mutex_;
  std::atomic<std::uint64_t> games_processed_{0};
  std::atomic<std::uint64_t> games_rejected_{0};
  std::atomic<std::uint64_t> predictions_created_{0};
  std::atomic<std::uint64_t> predictions_evaluated_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace ranking
