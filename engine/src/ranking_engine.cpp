/*
 * 설명: 엔진 진입점 구현. 배치 실행은 경기 순서 키로 정렬된 종료 경기만 순차 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/ranking_engine_test.cpp
 */
#include "ranking/ranking_engine.hpp"

#include <algorithm>
#include <chrono>

#include "ranking/errors.hpp"

namespace ranking {

RankingEngine::RankingEngine(std::shared_ptr<TeamRatingStore> store, std::shared_ptr<Observability> observability,
                             const RatingParams& params)
    : store_(store),
      observability_(observability),
      model_(params),
      preseason_(store, observability, params),
      processor_(store, observability, model_),
      sos_(store, params),
      snapshots_(store, observability, sos_),
      predictions_(store, observability, model_),
      accuracy_(store, observability, params),
      auditor_(store) {}

Team RankingEngine::SeedTeam(const TeamSeed& seed) {
  return preseason_.Initialize(seed);
}

bool RankingEngine::ReseedTeam(const TeamSeed& seed) {
  return preseason_.Reseed(seed);
}

bool RankingEngine::ImportGame(const Game& game) {
  if (!store_->UpsertGame(game)) {
    LogContext ctx;
    ctx.trace_id = observability_->NextTraceId();
    ctx.level = LogLevel::kDebug;
    ctx.name = "game_import_skipped";
    ctx.season = game.season;
    ctx.game_id = game.game_id;
    observability_->Log(ctx);
    return false;
  }
  return true;
}

void RankingEngine::ImportReferenceRanking(const ReferenceRankingEntry& entry) {
  store_->UpsertReferenceRanking(entry);
}

GameResult RankingEngine::ProcessGame(const Game& game) {
  GameResult result = processor_.Process(game);
  accuracy_.Evaluate(game.game_id);
  return result;
}

Prediction RankingEngine::GeneratePrediction(const Game& game) {
  return predictions_.Predict(game);
}

std::vector<RankingEntry> RankingEngine::GetCurrentRankings(int season) const {
  return snapshots_.CurrentRankings(season);
}

std::vector<RankingSnapshot> RankingEngine::GetRankingHistory(int team_id, int season) const {
  return snapshots_.History(season, team_id);
}

std::vector<Prediction> RankingEngine::GetPredictions(int season, int week) const {
  return predictions_.ListPredictions(season, week);
}

AccuracyReport RankingEngine::GetAccuracyReport(int season, const AccuracyScope& scope) const {
  return accuracy_.Report(season, scope);
}

std::optional<EvaluationResult> RankingEngine::EvaluateGame(int game_id) {
  return accuracy_.Evaluate(game_id);
}

std::vector<RankingSnapshot> RankingEngine::SnapshotWeek(int season, int week) {
  return snapshots_.Snapshot(season, week);
}

AuditReport RankingEngine::Audit(int season) const {
  return auditor_.Audit(season);
}

BatchSummary RankingEngine::RunBatch(int season, int week) {
  auto started = std::chrono::steady_clock::now();
  BatchSummary summary;
  summary.season = season;
  summary.week = week;

  std::vector<Game> pending;
  for (auto& game : store_->ListGames(season)) {
    if (!game.is_processed && game.IsCompleted() && game.week <= week) {
      pending.push_back(std::move(game));
    }
  }
  std::sort(pending.begin(), pending.end(),
            [](const Game& a, const Game& b) { return GameOrderKey::Of(a) < GameOrderKey::Of(b); });

  for (const auto& game : pending) {
    try {
      processor_.Process(game);
      summary.games_processed += 1;
    } catch (const InvalidGameError& ex) {
      summary.games_rejected += 1;
      summary.rejections.push_back(BatchRejection{game.game_id, std::string(ex.code()), ex.what()});
      continue;
    } catch (const OutOfOrderProcessingError& ex) {
      summary.games_rejected += 1;
      summary.rejections.push_back(BatchRejection{game.game_id, std::string(ex.code()), ex.what()});
      continue;
    }
    auto evaluation = accuracy_.Evaluate(game.game_id);
    if (evaluation) {
      summary.predictions_evaluated += 1;
    }
  }

  summary.snapshot_teams = static_cast<int>(snapshots_.Snapshot(season, week).size());
  summary.predictions_created = static_cast<int>(predictions_.GenerateUpcoming(season, week + 1).size());
  summary.audit = auditor_.Audit(season);

  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.level = summary.audit.Passed() ? LogLevel::kInfo : LogLevel::kWarn;
  ctx.name = "batch_completed";
  ctx.season = season;
  ctx.detail = {{"week", week},
                {"gamesProcessed", summary.games_processed},
                {"gamesRejected", summary.games_rejected},
                {"predictionsEvaluated", summary.predictions_evaluated},
                {"predictionsCreated", summary.predictions_created},
                {"auditErrors", summary.audit.ErrorCount()},
                {"auditWarnings", summary.audit.WarningCount()}};
  ctx.latency_ms = static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
  observability_->Log(ctx);
  return summary;
}

}  // namespace ranking
