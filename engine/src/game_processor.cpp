/*
 * 설명: 경기 처리 상태 머신. 검증 -> 순서 확인 -> 변화량 계산 -> 단일 반영 순으로 동작한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/game_processor_test.cpp, engine/tests/unit/ranking_engine_test.cpp
 */
#include "ranking/game_processor.hpp"

#include <chrono>
#include <sstream>

#include "ranking/errors.hpp"

namespace ranking {

GameProcessor::GameProcessor(std::shared_ptr<TeamRatingStore> store, std::shared_ptr<Observability> observability,
                             const RatingModel& model)
    : store_(std::move(store)), observability_(std::move(observability)), model_(model) {}

void GameProcessor::Validate(const Game& game) const {
  std::ostringstream where;
  where << "경기 " << game.game_id << ": ";

  if (game.is_processed) {
    throw InvalidGameError(game.game_id, InvalidGameReason::kAlreadyProcessed, where.str() + "이미 처리된 경기");
  }
  if (auto stored = store_->FindGame(game.game_id); stored && stored->is_processed) {
    throw InvalidGameError(game.game_id, InvalidGameReason::kAlreadyProcessed, where.str() + "이미 처리된 경기");
  }
  if (!game.final_score) {
    throw InvalidGameError(game.game_id, InvalidGameReason::kUnplayed, where.str() + "최종 점수가 없는 예정 경기");
  }
  if (game.final_score->home == game.final_score->away) {
    throw InvalidGameError(game.game_id, InvalidGameReason::kTieScore, where.str() + "동점 결과는 처리할 수 없음");
  }
  const auto& params = model_.params();
  if (game.week < params.min_week || game.week > params.max_week) {
    std::ostringstream oss;
    oss << where.str() << "주차 " << game.week << "가 허용 범위(" << params.min_week << "-" << params.max_week
        << ") 밖";
    throw InvalidGameError(game.game_id, InvalidGameReason::kWeekOutOfRange, oss.str());
  }
  if (game.home_team_id == game.away_team_id || !store_->FindTeam(game.season, game.home_team_id) ||
      !store_->FindTeam(game.season, game.away_team_id)) {
    throw InvalidGameError(game.game_id, InvalidGameReason::kMissingTeam, where.str() + "팀 참조 누락");
  }
}

void GameProcessor::CheckOrdering(const Game& game) const {
  GameOrderKey key = GameOrderKey::Of(game);
  for (int team_id : {game.home_team_id, game.away_team_id}) {
    auto latest = store_->LatestProcessedKey(game.season, team_id);
    if (latest && key.PrecedesChronologically(*latest)) {
      std::ostringstream oss;
      oss << "경기 " << game.game_id << ": 팀 " << team_id << "의 마지막 처리 경기(" << latest->game_id << ", "
          << latest->week << "주차)보다 앞선 경기";
      throw OutOfOrderProcessingError(game.game_id, team_id, oss.str());
    }
  }
}

void GameProcessor::LogRejected(const Game& game, std::string_view code, const std::string& message) const {
  observability_->IncrementRejected();
  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.level = LogLevel::kWarn;
  ctx.name = "game_rejected";
  ctx.season = game.season;
  ctx.game_id = game.game_id;
  ctx.detail = {{"code", code}, {"message", message}};
  observability_->Log(ctx);
}

GameResult GameProcessor::Process(const Game& game) {
  std::lock_guard<std::mutex> lock(process_mutex_);
  auto started = std::chrono::steady_clock::now();

  try {
    Validate(game);
    CheckOrdering(game);
  } catch (const InvalidGameError& ex) {
    LogRejected(game, ex.code(), ex.what());
    throw;
  } catch (const OutOfOrderProcessingError& ex) {
    LogRejected(game, ex.code(), ex.what());
    throw;
  }

  Team home = *store_->FindTeam(game.season, game.home_team_id);
  Team away = *store_->FindTeam(game.season, game.away_team_id);
  RatingChange change = model_.Evaluate(game, home, away);

  Game processed = game;
  processed.home_delta = change.home_delta;
  processed.away_delta = change.away_delta;
  processed.is_processed = true;

  switch (store_->ApplyGameResult(processed)) {
    case ApplyStatus::kApplied:
      break;
    case ApplyStatus::kAlreadyProcessed:
      LogRejected(game, ReasonCode(InvalidGameReason::kAlreadyProcessed), "동시 처리로 이미 반영됨");
      throw InvalidGameError(game.game_id, InvalidGameReason::kAlreadyProcessed, "이미 처리된 경기");
    case ApplyStatus::kMissingTeam:
      LogRejected(game, ReasonCode(InvalidGameReason::kMissingTeam), "반영 시점에 팀이 없음");
      throw InvalidGameError(game.game_id, InvalidGameReason::kMissingTeam, "팀 참조 누락");
  }

  GameResult result{game.game_id,
                    change.winner_id,
                    change.loser_id,
                    change.home_delta,
                    change.away_delta,
                    change.winner_expected,
                    change.mov_multiplier,
                    change.tier_multiplier,
                    home.rating + change.home_delta,
                    away.rating + change.away_delta};

  observability_->IncrementProcessed();
  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.name = "game_processed";
  ctx.season = game.season;
  ctx.game_id = game.game_id;
  ctx.detail = {{"winnerId", result.winner_id},
                {"loserId", result.loser_id},
                {"homeDelta", result.home_delta},
                {"awayDelta", result.away_delta},
                {"winnerExpected", result.winner_expected},
                {"movMultiplier", result.mov_multiplier},
                {"tierMultiplier", result.tier_multiplier}};
  ctx.latency_ms = static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count());
  observability_->Log(ctx);
  return result;
}

}  // namespace ranking
