/*
 * 설명: 레이팅 순(동률 시 SOS, 승률) 순위를 계산하고 주차별 스냅샷을 저장/조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/ranking_snapshot_service_test.cpp
 */
#pragma once

#include <memory>
#include <vector>

#include "ranking/models.hpp"
#include "ranking/observability.hpp"
#include "ranking/rating_store.hpp"
#include "ranking/strength_of_schedule.hpp"

namespace ranking {

struct RankingEntry {
  Team team;
  int rank;
  double sos;
  int sos_rank;
};

class RankingSnapshotService {
 public:
  RankingSnapshotService(std::shared_ptr<TeamRatingStore> store, std::shared_ptr<Observability> observability,
                         const StrengthOfScheduleCalculator& sos_calculator);

  std::vector<RankingEntry> CurrentRankings(int season,
                                            int as_of_week = StrengthOfScheduleCalculator::kAllWeeks) const;
  // 이미 저장된 주차는 다시 쓰지 않고 저장된 스냅샷을 반환한다.
  std::vector<RankingSnapshot> Snapshot(int season, int week);
  std::vector<RankingSnapshot> History(int season, int team_id) const;

 private:
  std::shared_ptr<TeamRatingStore> store_;
  std::shared_ptr<Observability> observability_;
  StrengthOfScheduleCalculator sos_calculator_;
};

}  // namespace ranking
