/*
 * 설명: 시즌 전체의 제로섬/레이팅 보존/전적 일관성을 점검하는 읽기 전용 감사.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/season_audit_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ranking/rating_store.hpp"

namespace ranking {

enum class AuditSeverity { kWarning, kError };

std::string_view SeverityName(AuditSeverity severity);

struct AuditFinding {
  AuditSeverity severity;
  std::string code;
  std::string message;
  std::optional<int> game_id;
  std::optional<int> team_id;
};

struct AuditReport {
  int season{0};
  int games_checked{0};
  int teams_checked{0};
  std::vector<AuditFinding> findings;

  int ErrorCount() const;
  int WarningCount() const;
  bool Passed() const { return ErrorCount() == 0; }
};

class SeasonAuditor {
 public:
  static constexpr double kTolerance = 0.01;
  static constexpr double kLargeSwing = 200.0;

  explicit SeasonAuditor(std::shared_ptr<TeamRatingStore> store);

  AuditReport Audit(int season) const;

 private:
  std::shared_ptr<TeamRatingStore> store_;
};

}  // namespace ranking
