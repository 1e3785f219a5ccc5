/*
 * 설명: 경기 처리와 동일한 기대 승률 공식으로 예측을 만들고 경기당 하나만 저장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/prediction_service_test.cpp
 */
#include "ranking/prediction_service.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>

#include "ranking/errors.hpp"

namespace ranking {

std::string_view ConfidenceName(Confidence confidence) {
  switch (confidence) {
    case Confidence::kHigh:
      return "High";
    case Confidence::kMedium:
      return "Medium";
    case Confidence::kLow:
      return "Low";
  }
  return "Low";
}

Confidence ClassifyConfidence(double win_probability, const RatingParams& params) {
  if (win_probability >= params.high_confidence) {
    return Confidence::kHigh;
  }
  if (win_probability >= params.medium_confidence) {
    return Confidence::kMedium;
  }
  return Confidence::kLow;
}

PredictionService::PredictionService(std::shared_ptr<TeamRatingStore> store,
                                     std::shared_ptr<Observability> observability, const RatingModel& model)
    : store_(std::move(store)), observability_(std::move(observability)), model_(model) {}

Confidence PredictionService::ConfidenceFor(double win_probability) const {
  return ClassifyConfidence(win_probability, model_.params());
}

Prediction PredictionService::Calculate(const Game& game, const Team& home, const Team& away) const {
  const auto& params = model_.params();
  double home_rating = model_.HomeAdjusted(home.rating, game.neutral_site);
  double home_probability = model_.ExpectedScore(home_rating, away.rating);

  // 레이팅 차이를 점수차로 단조 변환한다. 300점 차이는 양쪽 10.5점씩.
  double adjustment = (home_rating - away.rating) * params.points_per_rating_point;
  auto clamp_score = [&](double value) {
    return std::clamp(static_cast<int>(std::lround(value)), 0, params.max_predicted_score);
  };

  Prediction prediction;
  prediction.game_id = game.game_id;
  prediction.season = game.season;
  prediction.week = game.week;
  prediction.home_team_id = game.home_team_id;
  prediction.away_team_id = game.away_team_id;
  prediction.predicted_winner_id = home_probability >= 0.5 ? home.team_id : away.team_id;
  prediction.win_probability = std::max(home_probability, 1.0 - home_probability);
  prediction.predicted_home_score = clamp_score(params.base_predicted_score + adjustment);
  prediction.predicted_away_score = clamp_score(params.base_predicted_score - adjustment);
  prediction.ratings = RatingSnapshot{home.rating, away.rating};
  return prediction;
}

Prediction PredictionService::Predict(const Game& game) {
  std::ostringstream where;
  where << "경기 " << game.game_id << ": ";

  if (store_->FindPrediction(game.game_id)) {
    throw AlreadyPredictedError(game.game_id, where.str() + "이미 예측이 존재함");
  }
  auto stored = store_->FindGame(game.game_id);
  if (game.is_processed || (stored && stored->is_processed)) {
    throw InvalidGameError(game.game_id, InvalidGameReason::kAlreadyProcessed, where.str() + "이미 처리된 경기");
  }
  if (game.final_score) {
    throw InvalidGameError(game.game_id, InvalidGameReason::kAlreadyPlayed, where.str() + "이미 결과가 있는 경기");
  }
  auto home = store_->FindTeam(game.season, game.home_team_id);
  auto away = store_->FindTeam(game.season, game.away_team_id);
  if (!home || !away || game.home_team_id == game.away_team_id) {
    throw InvalidGameError(game.game_id, InvalidGameReason::kMissingTeam, where.str() + "팀 참조 누락");
  }

  Prediction prediction = Calculate(game, *home, *away);
  prediction.created_at = std::chrono::system_clock::now();
  switch (store_->InsertPrediction(prediction)) {
    case PredictionInsertStatus::kInserted:
      break;
    case PredictionInsertStatus::kDuplicate:
      throw AlreadyPredictedError(game.game_id, where.str() + "이미 예측이 존재함");
    case PredictionInsertStatus::kGameProcessed:
      // 위 확인 이후 다른 쪽에서 처리가 끝난 경우.
      throw InvalidGameError(game.game_id, InvalidGameReason::kAlreadyProcessed, where.str() + "이미 처리된 경기");
  }

  observability_->IncrementPredicted();
  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.name = "prediction_created";
  ctx.season = game.season;
  ctx.game_id = game.game_id;
  ctx.detail = {{"predictedWinnerId", prediction.predicted_winner_id},
                {"winProbability", prediction.win_probability},
                {"confidence", ConfidenceName(ConfidenceFor(prediction.win_probability))}};
  observability_->Log(ctx);
  return prediction;
}

std::vector<Prediction> PredictionService::GenerateUpcoming(int season, int week) {
  std::vector<Prediction> created;
  for (const auto& game : store_->ListGames(season)) {
    if (game.week != week || game.is_processed || game.final_score || store_->FindPrediction(game.game_id)) {
      continue;
    }
    try {
      created.push_back(Predict(game));
    } catch (const AlreadyPredictedError& ex) {
      LogContext ctx;
      ctx.trace_id = observability_->NextTraceId();
      ctx.level = LogLevel::kDebug;
      ctx.name = "prediction_skipped";
      ctx.season = season;
      ctx.game_id = game.game_id;
      ctx.detail = {{"code", ex.code()}, {"message", ex.what()}};
      observability_->Log(ctx);
    } catch (const InvalidGameError& ex) {
      LogContext ctx;
      ctx.trace_id = observability_->NextTraceId();
      ctx.level = LogLevel::kWarn;
      ctx.name = "prediction_skipped";
      ctx.season = season;
      ctx.game_id = game.game_id;
      ctx.detail = {{"code", ex.code()}, {"message", ex.what()}};
      observability_->Log(ctx);
    }
  }
  return created;
}

std::vector<Prediction> PredictionService::ListPredictions(int season, int week) const {
  std::vector<Prediction> result;
  for (auto& prediction : store_->ListPredictions(season)) {
    if (prediction.week == week) {
      result.push_back(std::move(prediction));
    }
  }
  std::sort(result.begin(), result.end(),
            [](const Prediction& a, const Prediction& b) { return a.game_id < b.game_id; });
  return result;
}

}  // namespace ranking
