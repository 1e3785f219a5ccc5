/*
 * 설명: 종료 경기 하나를 검증하고 레이팅 변화량을 계산해 저장소에 원자적으로 반영한다.
 *       경기 상태는 예정(미처리) -> 처리 완료 단방향이며 시즌 내 시간순 처리를 강제한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/game_processor_test.cpp
 */
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "ranking/models.hpp"
#include "ranking/observability.hpp"
#include "ranking/rating_model.hpp"
#include "ranking/rating_store.hpp"

namespace ranking {

struct GameResult {
  int game_id;
  int winner_id;
  int loser_id;
  double home_delta;
  double away_delta;
  double winner_expected;
  double mov_multiplier;
  double tier_multiplier;
  double home_rating_after;
  double away_rating_after;
};

class GameProcessor {
 public:
  GameProcessor(std::shared_ptr<TeamRatingStore> store, std::shared_ptr<Observability> observability,
                const RatingModel& model);

  // InvalidGameError, OutOfOrderProcessingError를 던지며 실패 시 상태를 바꾸지 않는다.
  GameResult Process(const Game& game);

 private:
  void Validate(const Game& game) const;
  void CheckOrdering(const Game& game) const;
  void LogRejected(const Game& game, std::string_view code, const std::string& message) const;

  std::shared_ptr<TeamRatingStore> store_;
  std::shared_ptr<Observability> observability_;
  RatingModel model_;
  std::mutex process_mutex_;
};

}  // namespace ranking
