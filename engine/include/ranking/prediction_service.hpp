/*
 * 설명: 현재 레이팅으로 예정 경기의 승자/점수/승률을 예측하고 예측 시점 레이팅과 함께 저장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/prediction_service_test.cpp
 */
#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "ranking/config.hpp"
#include "ranking/models.hpp"
#include "ranking/observability.hpp"
#include "ranking/rating_model.hpp"
#include "ranking/rating_store.hpp"

namespace ranking {

enum class Confidence { kLow, kMedium, kHigh };

std::string_view ConfidenceName(Confidence confidence);
Confidence ClassifyConfidence(double win_probability, const RatingParams& params);

class PredictionService {
 public:
  PredictionService(std::shared_ptr<TeamRatingStore> store, std::shared_ptr<Observability> observability,
                    const RatingModel& model);

  // 저장 없이 계산만 한다. created_at은 비워 둔다.
  Prediction Calculate(const Game& game, const Team& home, const Team& away) const;
  Confidence ConfidenceFor(double win_probability) const;

  // AlreadyPredictedError, InvalidGameError를 던진다.
  Prediction Predict(const Game& game);
  // 해당 주차의 예측되지 않은 예정 경기를 모두 예측한다.
  std::vector<Prediction> GenerateUpcoming(int season, int week);
  std::vector<Prediction> ListPredictions(int season, int week) const;

 private:
  std::shared_ptr<TeamRatingStore> store_;
  std::shared_ptr<Observability> observability_;
  RatingModel model_;
};

}  // namespace ranking
