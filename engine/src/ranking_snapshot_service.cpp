/*
 * 설명: 현재 순위 계산과 주차별 불변 스냅샷 저장을 구현한다. 팀/경기 상태는 읽기만 한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/ranking_snapshot_service_test.cpp
 */
#include "ranking/ranking_snapshot_service.hpp"

#include <algorithm>
#include <unordered_map>

namespace ranking {

RankingSnapshotService::RankingSnapshotService(std::shared_ptr<TeamRatingStore> store,
                                               std::shared_ptr<Observability> observability,
                                               const StrengthOfScheduleCalculator& sos_calculator)
    : store_(std::move(store)), observability_(std::move(observability)), sos_calculator_(sos_calculator) {}

std::vector<RankingEntry> RankingSnapshotService::CurrentRankings(int season, int as_of_week) const {
  auto sos_values = sos_calculator_.CalculateAll(season, as_of_week);
  std::vector<RankingEntry> entries;
  for (auto& team : store_->ListTeams(season)) {
    double sos = sos_values.count(team.team_id) ? sos_values[team.team_id] : 0.0;
    entries.push_back(RankingEntry{std::move(team), 0, sos, 0});
  }

  std::sort(entries.begin(), entries.end(), [](const RankingEntry& a, const RankingEntry& b) {
    if (a.team.rating != b.team.rating) {
      return a.team.rating > b.team.rating;
    }
    if (a.sos != b.sos) {
      return a.sos > b.sos;
    }
    if (a.team.WinPercentage() != b.team.WinPercentage()) {
      return a.team.WinPercentage() > b.team.WinPercentage();
    }
    return a.team.team_id < b.team.team_id;
  });
  for (std::size_t i = 0; i < entries.size(); ++i) {
    entries[i].rank = static_cast<int>(i + 1);
  }

  std::vector<const RankingEntry*> by_sos;
  for (const auto& entry : entries) {
    by_sos.push_back(&entry);
  }
  std::sort(by_sos.begin(), by_sos.end(), [](const RankingEntry* a, const RankingEntry* b) {
    if (a->sos != b->sos) {
      return a->sos > b->sos;
    }
    return a->team.team_id < b->team.team_id;
  });
  std::unordered_map<int, int> sos_ranks;
  for (std::size_t i = 0; i < by_sos.size(); ++i) {
    sos_ranks[by_sos[i]->team.team_id] = static_cast<int>(i + 1);
  }
  for (auto& entry : entries) {
    entry.sos_rank = sos_ranks[entry.team.team_id];
  }
  return entries;
}

std::vector<RankingSnapshot> RankingSnapshotService::Snapshot(int season, int week) {
  auto existing = store_->ListSnapshots(season, week);
  if (!existing.empty()) {
    return existing;
  }

  std::vector<RankingSnapshot> snapshots;
  for (const auto& entry : CurrentRankings(season, week)) {
    snapshots.push_back(RankingSnapshot{entry.team.team_id, season, week, entry.rank, entry.team.rating,
                                        entry.team.wins, entry.team.losses, entry.sos, entry.sos_rank});
  }
  if (!store_->InsertSnapshots(season, week, snapshots)) {
    // 다른 작업이 먼저 같은 주차를 기록했다.
    return store_->ListSnapshots(season, week);
  }

  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.name = "rankings_snapshot";
  ctx.season = season;
  ctx.detail = {{"week", week}, {"teams", snapshots.size()}};
  observability_->Log(ctx);
  return snapshots;
}

std::vector<RankingSnapshot> RankingSnapshotService::History(int season, int team_id) const {
  auto history = store_->ListTeamSnapshots(season, team_id);
  std::sort(history.begin(), history.end(),
            [](const RankingSnapshot& a, const RankingSnapshot& b) { return a.week < b.week; });
  return history;
}

}  // namespace ranking
