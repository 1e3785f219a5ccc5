/*
 * 설명: 처리된 상대 팀들의 현재 레이팅 평균으로 일정 난이도(SOS)를 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/strength_of_schedule_test.cpp
 */
#pragma once

#include <limits>
#include <memory>
#include <unordered_map>

#include "ranking/config.hpp"
#include "ranking/rating_store.hpp"

namespace ranking {

class StrengthOfScheduleCalculator {
 public:
  static constexpr int kAllWeeks = std::numeric_limits<int>::max();

  StrengthOfScheduleCalculator(std::shared_ptr<TeamRatingStore> store, const RatingParams& params);

  // 경기가 없는 팀은 중립값을 반환한다.
  double Calculate(int season, int team_id, int as_of_week = kAllWeeks) const;
  std::unordered_map<int, double> CalculateAll(int season, int as_of_week = kAllWeeks) const;

 private:
  std::unordered_map<int, double> Compute(const std::vector<Team>& teams, const std::vector<Game>& games,
                                          int as_of_week) const;

  std::shared_ptr<TeamRatingStore> store_;
  double neutral_sos_;
};

}  // namespace ranking
