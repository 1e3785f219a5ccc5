/*
 * 설명: 경기 당시가 아닌 계산 시점의 상대 레이팅을 사용하는 라이브 SOS 계산.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/strength_of_schedule_test.cpp
 */
#include "ranking/strength_of_schedule.hpp"

namespace ranking {

StrengthOfScheduleCalculator::StrengthOfScheduleCalculator(std::shared_ptr<TeamRatingStore> store,
                                                           const RatingParams& params)
    : store_(std::move(store)), neutral_sos_(params.neutral_sos) {}

double StrengthOfScheduleCalculator::Calculate(int season, int team_id, int as_of_week) const {
  auto all = CalculateAll(season, as_of_week);
  auto it = all.find(team_id);
  return it == all.end() ? neutral_sos_ : it->second;
}

std::unordered_map<int, double> StrengthOfScheduleCalculator::CalculateAll(int season, int as_of_week) const {
  return Compute(store_->ListTeams(season), store_->ListGames(season), as_of_week);
}

std::unordered_map<int, double> StrengthOfScheduleCalculator::Compute(const std::vector<Team>& teams,
                                                                      const std::vector<Game>& games,
                                                                      int as_of_week) const {
  std::unordered_map<int, double> ratings;
  for (const auto& team : teams) {
    ratings[team.team_id] = team.rating;
  }

  struct Accumulator {
    double total{0.0};
    int count{0};
  };
  std::unordered_map<int, Accumulator> sums;
  for (const auto& game : games) {
    if (!game.is_processed || game.week > as_of_week) {
      continue;
    }
    for (int team_id : {game.home_team_id, game.away_team_id}) {
      auto opponent = ratings.find(game.OpponentOf(team_id));
      if (opponent == ratings.end()) {
        continue;
      }
      sums[team_id].total += opponent->second;
      sums[team_id].count += 1;
    }
  }

  std::unordered_map<int, double> result;
  for (const auto& team : teams) {
    auto it = sums.find(team.team_id);
    result[team.team_id] = (it == sums.end() || it->second.count == 0) ? neutral_sos_
                                                                       : it->second.total / it->second.count;
  }
  return result;
}

}  // namespace ranking
