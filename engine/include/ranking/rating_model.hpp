/*
 * 설명: 로지스틱 기대 승률, 점수차(MOV) 배수, 티어 배수와 경기당 레이팅 변화량을 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/rating_model_test.cpp
 */
#pragma once

#include "ranking/config.hpp"
#include "ranking/models.hpp"

namespace ranking {

struct RatingChange {
  int winner_id;
  int loser_id;
  double winner_expected;
  double mov_multiplier;
  double tier_multiplier;
  double winner_delta;
  double home_delta;
  double away_delta;
};

class RatingModel {
 public:
  explicit RatingModel(const RatingParams& params = RatingParams{});

  // rating_a가 rating_b를 이길 기대 확률.
  double ExpectedScore(double rating_a, double rating_b) const;
  double HomeWinProbability(double home_rating, double away_rating, bool neutral_site) const;
  double HomeAdjusted(double home_rating, bool neutral_site) const;

  double MovMultiplier(int point_differential, double winner_rating_gap) const;
  double TierMultiplier(ConferenceTier winner_tier, ConferenceTier loser_tier) const;

  // 종료 경기 하나에 대한 변화량. 패자 변화량은 승자 변화량의 부호 반전이다.
  RatingChange Evaluate(const Game& game, const Team& home, const Team& away) const;

  const RatingParams& params() const { return params_; }

 private:
  RatingParams params_;
};

}  // namespace ranking
