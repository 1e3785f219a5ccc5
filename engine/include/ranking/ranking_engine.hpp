/*
 * 설명: 저장소/레이팅 모델/각 서비스를 묶어 외부 진입점과 주차 배치 실행을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/ranking_engine_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ranking/accuracy_evaluator.hpp"
#include "ranking/config.hpp"
#include "ranking/game_processor.hpp"
#include "ranking/models.hpp"
#include "ranking/observability.hpp"
#include "ranking/prediction_service.hpp"
#include "ranking/preseason_initializer.hpp"
#include "ranking/ranking_snapshot_service.hpp"
#include "ranking/rating_model.hpp"
#include "ranking/rating_store.hpp"
#include "ranking/season_audit.hpp"
#include "ranking/strength_of_schedule.hpp"

namespace ranking {

struct BatchRejection {
  int game_id;
  std::string code;
  std::string message;
};

struct BatchSummary {
  int season{0};
  int week{0};
  int games_processed{0};
  int games_rejected{0};
  int predictions_evaluated{0};
  int snapshot_teams{0};
  int predictions_created{0};
  std::vector<BatchRejection> rejections;
  AuditReport audit;
};

class RankingEngine {
 public:
  RankingEngine(std::shared_ptr<TeamRatingStore> store, std::shared_ptr<Observability> observability,
                const RatingParams& params = RatingParams{});

  Team SeedTeam(const TeamSeed& seed);
  bool ReseedTeam(const TeamSeed& seed);
  // 처리된 경기는 덮어쓰지 않는다.
  bool ImportGame(const Game& game);
  void ImportReferenceRanking(const ReferenceRankingEntry& entry);

  // 처리 직후 저장된 예측을 평가한다.
  GameResult ProcessGame(const Game& game);
  Prediction GeneratePrediction(const Game& game);

  std::vector<RankingEntry> GetCurrentRankings(int season) const;
  std::vector<RankingSnapshot> GetRankingHistory(int team_id, int season) const;
  std::vector<Prediction> GetPredictions(int season, int week) const;
  AccuracyReport GetAccuracyReport(int season, const AccuracyScope& scope = AccuracyScope{}) const;
  std::optional<EvaluationResult> EvaluateGame(int game_id);

  std::vector<RankingSnapshot> SnapshotWeek(int season, int week);
  AuditReport Audit(int season) const;

  // week까지의 종료 경기 처리, 주차 스냅샷, 다음 주차 예측, 감사를 순서대로 수행한다.
  BatchSummary RunBatch(int season, int week);

 private:
  std::shared_ptr<TeamRatingStore> store_;
  std::shared_ptr<Observability> observability_;
  RatingModel model_;
  PreseasonInitializer preseason_;
  GameProcessor processor_;
  StrengthOfScheduleCalculator sos_;
  RankingSnapshotService snapshots_;
  PredictionService predictions_;
  AccuracyEvaluator accuracy_;
  SeasonAuditor auditor_;
};

}  // namespace ranking
