/*
 * 설명: 처리된 경기의 예측 적중 여부를 기록하고 주차/티어/신뢰도별 정확도와 외부 순위 비교 집계를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/accuracy_evaluator_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ranking/config.hpp"
#include "ranking/models.hpp"
#include "ranking/observability.hpp"
#include "ranking/prediction_service.hpp"
#include "ranking/rating_store.hpp"

namespace ranking {

struct EvaluationResult {
  int game_id;
  int predicted_winner_id;
  int actual_winner_id;
  bool was_correct;
  // 외부 순위로는 비교할 수 없는 경기면 비어 있다.
  std::optional<int> reference_winner_id;
};

struct AccuracyScope {
  std::optional<int> week;
  std::optional<int> team_id;
};

struct AccuracyTotals {
  int total{0};
  int evaluated{0};
  int correct{0};
  double accuracy{0.0};
};

struct ReferenceComparison {
  int compared{0};
  int engine_correct{0};
  int reference_correct{0};
  int both_correct{0};
  int engine_only{0};
  int reference_only{0};
  int both_wrong{0};
  double engine_accuracy{0.0};
  double reference_accuracy{0.0};
};

struct WeekAccuracy {
  int week{0};
  AccuracyTotals totals;
  int reference_compared{0};
  int reference_correct{0};
};

struct TierAccuracy {
  // "top_tier vs sub_division" 형태. 티어 순서로 정렬된다.
  std::string matchup;
  AccuracyTotals totals;
};

struct ConfidenceAccuracy {
  Confidence confidence{Confidence::kLow};
  AccuracyTotals totals;
};

struct Disagreement {
  int game_id{0};
  int week{0};
  int home_team_id{0};
  int away_team_id{0};
  int engine_winner_id{0};
  int reference_winner_id{0};
  int actual_winner_id{0};
};

struct TeamAccuracy {
  int team_id{0};
  AccuracyTotals overall;
  AccuracyTotals as_favorite;
  AccuracyTotals as_underdog;
};

struct AccuracyReport {
  int season{0};
  AccuracyScope scope;
  AccuracyTotals totals;
  ReferenceComparison reference;
  std::vector<WeekAccuracy> by_week;
  std::vector<TierAccuracy> by_tier;
  std::vector<ConfidenceAccuracy> by_confidence;
  std::vector<Disagreement> disagreements;
  std::optional<TeamAccuracy> team;
};

class AccuracyEvaluator {
 public:
  AccuracyEvaluator(std::shared_ptr<TeamRatingStore> store, std::shared_ptr<Observability> observability,
                    const RatingParams& params);

  // 처리되지 않았거나 예측이 없는 경기는 nullopt. 이미 기록된 결과는 다시 쓰지 않는다.
  std::optional<EvaluationResult> Evaluate(int game_id);
  // 높은 순위 팀 승. 순위가 같거나 둘 다 순위 밖이면 nullopt.
  std::optional<int> ReferenceWinner(const Game& game) const;
  AccuracyReport Report(int season, const AccuracyScope& scope = AccuracyScope{}) const;

 private:
  std::shared_ptr<TeamRatingStore> store_;
  std::shared_ptr<Observability> observability_;
  RatingParams params_;
};

}  // namespace ranking
