/*
 * 설명: 수정 ELO 계산식(기대 승률, MOV/티어 배수, 제로섬 변화량)을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/rating_model_test.cpp, engine/tests/unit/game_processor_test.cpp
 */
#include "ranking/rating_model.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace ranking {

RatingModel::RatingModel(const RatingParams& params) : params_(params) {}

double RatingModel::ExpectedScore(double rating_a, double rating_b) const {
  double exponent = (rating_b - rating_a) / params_.rating_scale;
  return 1.0 / (1.0 + std::pow(10.0, exponent));
}

double RatingModel::HomeAdjusted(double home_rating, bool neutral_site) const {
  return neutral_site ? home_rating : home_rating + params_.home_field_advantage;
}

double RatingModel::HomeWinProbability(double home_rating, double away_rating, bool neutral_site) const {
  return ExpectedScore(HomeAdjusted(home_rating, neutral_site), away_rating);
}

double RatingModel::MovMultiplier(int point_differential, double winner_rating_gap) const {
  double base = 1.0;
  int diff = std::abs(point_differential);
  if (diff > 0) {
    base = std::min(std::log(static_cast<double>(diff) + 1.0), params_.max_mov_multiplier);
  }
  // 이미 격차가 큰 강팀의 승리는 적게 반영한다. 이변(음수 격차)은 감쇠하지 않는다.
  double gap = std::max(winner_rating_gap, 0.0);
  double damping = params_.mov_damping_base / (gap * params_.mov_damping_scale + params_.mov_damping_base);
  return base * damping;
}

double RatingModel::TierMultiplier(ConferenceTier winner_tier, ConferenceTier loser_tier) const {
  if (winner_tier == loser_tier) {
    return 1.0;
  }
  if (loser_tier == ConferenceTier::kSubDivision) {
    return 0.5;
  }
  if (winner_tier == ConferenceTier::kSubDivision) {
    return 2.0;
  }
  if (winner_tier == ConferenceTier::kTopTier && loser_tier == ConferenceTier::kMidTier) {
    return 0.9;
  }
  return 1.1;
}

RatingChange RatingModel::Evaluate(const Game& game, const Team& home, const Team& away) const {
  const FinalScore& score = *game.final_score;
  const bool home_won = score.home > score.away;

  double home_rating = HomeAdjusted(home.rating, game.neutral_site);
  double away_rating = away.rating;
  double home_expected = ExpectedScore(home_rating, away_rating);

  const Team& winner = home_won ? home : away;
  const Team& loser = home_won ? away : home;
  double winner_expected = home_won ? home_expected : 1.0 - home_expected;
  double gap = home_won ? home_rating - away_rating : away_rating - home_rating;

  RatingChange change{};
  change.winner_id = winner.team_id;
  change.loser_id = loser.team_id;
  change.winner_expected = winner_expected;
  change.mov_multiplier = MovMultiplier(score.home - score.away, gap);
  change.tier_multiplier = TierMultiplier(winner.tier, loser.tier);
  change.winner_delta =
      params_.k_factor * change.mov_multiplier * change.tier_multiplier * (1.0 - winner_expected);
  change.home_delta = home_won ? change.winner_delta : -change.winner_delta;
  change.away_delta = -change.home_delta;
  return change;
}

}  // namespace ranking
