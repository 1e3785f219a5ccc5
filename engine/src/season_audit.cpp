/*
 * 설명: 처리된 경기와 팀 레이팅을 대조해 불변식 위반을 오류/경고로 보고한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/season_audit_test.cpp
 */
#include "ranking/season_audit.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_map>

namespace ranking {

std::string_view SeverityName(AuditSeverity severity) {
  return severity == AuditSeverity::kError ? "error" : "warning";
}

int AuditReport::ErrorCount() const {
  return static_cast<int>(std::count_if(findings.begin(), findings.end(), [](const AuditFinding& finding) {
    return finding.severity == AuditSeverity::kError;
  }));
}

int AuditReport::WarningCount() const {
  return static_cast<int>(findings.size()) - ErrorCount();
}

SeasonAuditor::SeasonAuditor(std::shared_ptr<TeamRatingStore> store) : store_(std::move(store)) {}

AuditReport SeasonAuditor::Audit(int season) const {
  AuditReport report;
  report.season = season;

  struct TeamTally {
    double delta_sum{0.0};
    int wins{0};
    int losses{0};
  };
  std::unordered_map<int, TeamTally> tallies;

  for (const auto& game : store_->ListGames(season)) {
    if (!game.is_processed) {
      continue;
    }
    report.games_checked += 1;

    auto winner = game.WinnerId();
    if (!winner) {
      std::ostringstream msg;
      msg << "처리된 경기 " << game.game_id << "에 승패 결과가 없음";
      report.findings.push_back(
          AuditFinding{AuditSeverity::kError, "processed_without_result", msg.str(), game.game_id, std::nullopt});
    }

    double sum = game.home_delta + game.away_delta;
    if (std::fabs(sum) > kTolerance) {
      std::ostringstream msg;
      msg << "경기 " << game.game_id << " 변화량 합이 0이 아님: " << sum;
      report.findings.push_back(
          AuditFinding{AuditSeverity::kError, "zero_sum_violation", msg.str(), game.game_id, std::nullopt});
    }
    if (std::fabs(game.home_delta) > kLargeSwing || std::fabs(game.away_delta) > kLargeSwing) {
      std::ostringstream msg;
      msg << "경기 " << game.game_id << " 레이팅 변화가 " << kLargeSwing << "점을 넘음";
      report.findings.push_back(
          AuditFinding{AuditSeverity::kWarning, "large_rating_swing", msg.str(), game.game_id, std::nullopt});
    }

    tallies[game.home_team_id].delta_sum += game.home_delta;
    tallies[game.away_team_id].delta_sum += game.away_delta;
    if (winner) {
      int loser = game.OpponentOf(*winner);
      tallies[*winner].wins += 1;
      tallies[loser].losses += 1;
    }
  }

  for (const auto& team : store_->ListTeams(season)) {
    report.teams_checked += 1;
    const TeamTally& tally = tallies[team.team_id];

    double expected = team.initial_rating + tally.delta_sum;
    if (std::fabs(team.rating - expected) > kTolerance) {
      std::ostringstream msg;
      msg << team.name << " 레이팅 불일치: 기대값 " << expected << ", 실제 " << team.rating;
      report.findings.push_back(
          AuditFinding{AuditSeverity::kError, "rating_conservation", msg.str(), std::nullopt, team.team_id});
    }
    if (team.wins != tally.wins || team.losses != tally.losses) {
      std::ostringstream msg;
      msg << team.name << " 전적 불일치: 저장 " << team.wins << "-" << team.losses << ", 경기 기준 " << tally.wins
          << "-" << tally.losses;
      report.findings.push_back(
          AuditFinding{AuditSeverity::kError, "record_mismatch", msg.str(), std::nullopt, team.team_id});
    }
  }
  return report;
}

}  // namespace ranking
