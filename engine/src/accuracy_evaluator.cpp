/*
 * 설명: 예측 적중 기록과 정확도 집계. 집계는 저장된 예측/경기에서만 계산하는 읽기 전용 뷰다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/accuracy_evaluator_test.cpp
 */
#include "ranking/accuracy_evaluator.hpp"

#include <algorithm>
#include <map>
#include <unordered_map>

namespace ranking {

namespace {

void Count(AccuracyTotals& totals, const std::optional<bool>& was_correct) {
  totals.total += 1;
  if (was_correct) {
    totals.evaluated += 1;
    if (*was_correct) {
      totals.correct += 1;
    }
  }
}

void Finalize(AccuracyTotals& totals) {
  totals.accuracy = totals.evaluated == 0 ? 0.0 : static_cast<double>(totals.correct) / totals.evaluated;
}

double Ratio(int numerator, int denominator) {
  return denominator == 0 ? 0.0 : static_cast<double>(numerator) / denominator;
}

std::string MatchupName(ConferenceTier a, ConferenceTier b) {
  if (static_cast<int>(b) < static_cast<int>(a)) {
    std::swap(a, b);
  }
  return std::string(TierName(a)) + " vs " + std::string(TierName(b));
}

}  // namespace

AccuracyEvaluator::AccuracyEvaluator(std::shared_ptr<TeamRatingStore> store,
                                     std::shared_ptr<Observability> observability, const RatingParams& params)
    : store_(std::move(store)), observability_(std::move(observability)), params_(params) {}

std::optional<int> AccuracyEvaluator::ReferenceWinner(const Game& game) const {
  auto home_rank = store_->FindReferenceRank(game.season, game.week, game.home_team_id);
  auto away_rank = store_->FindReferenceRank(game.season, game.week, game.away_team_id);
  if (!home_rank && !away_rank) {
    return std::nullopt;
  }
  if (!home_rank) {
    return game.away_team_id;
  }
  if (!away_rank) {
    return game.home_team_id;
  }
  if (*home_rank == *away_rank) {
    return std::nullopt;
  }
  // 숫자가 작을수록 높은 순위.
  return *home_rank < *away_rank ? game.home_team_id : game.away_team_id;
}

std::optional<EvaluationResult> AccuracyEvaluator::Evaluate(int game_id) {
  auto game = store_->FindGame(game_id);
  if (!game || !game->is_processed) {
    return std::nullopt;
  }
  auto winner = game->WinnerId();
  auto prediction = store_->FindPrediction(game_id);
  if (!winner || !prediction) {
    return std::nullopt;
  }

  bool was_correct = prediction->predicted_winner_id == *winner;
  if (prediction->was_correct) {
    was_correct = *prediction->was_correct;
  } else if (store_->RecordPredictionResult(game_id, was_correct)) {
    observability_->IncrementEvaluated();
    LogContext ctx;
    ctx.trace_id = observability_->NextTraceId();
    ctx.name = "prediction_evaluated";
    ctx.season = game->season;
    ctx.game_id = game_id;
    ctx.detail = {{"predictedWinnerId", prediction->predicted_winner_id},
                  {"actualWinnerId", *winner},
                  {"wasCorrect", was_correct}};
    observability_->Log(ctx);
  }

  return EvaluationResult{game_id, prediction->predicted_winner_id, *winner, was_correct, ReferenceWinner(*game)};
}

AccuracyReport AccuracyEvaluator::Report(int season, const AccuracyScope& scope) const {
  AccuracyReport report;
  report.season = season;
  report.scope = scope;

  std::unordered_map<int, Game> games;
  for (auto& game : store_->ListGames(season)) {
    games.emplace(game.game_id, std::move(game));
  }
  std::unordered_map<int, ConferenceTier> tiers;
  for (const auto& team : store_->ListTeams(season)) {
    tiers.emplace(team.team_id, team.tier);
  }

  std::map<int, WeekAccuracy> by_week;
  std::map<std::string, AccuracyTotals> by_tier;
  std::map<Confidence, AccuracyTotals> by_confidence;
  TeamAccuracy team_accuracy;
  if (scope.team_id) {
    team_accuracy.team_id = *scope.team_id;
  }

  auto predictions = store_->ListPredictions(season);
  std::sort(predictions.begin(), predictions.end(), [](const Prediction& a, const Prediction& b) {
    return a.week != b.week ? a.week < b.week : a.game_id < b.game_id;
  });

  for (const auto& prediction : predictions) {
    if (scope.week && prediction.week != *scope.week) {
      continue;
    }
    if (scope.team_id && prediction.home_team_id != *scope.team_id && prediction.away_team_id != *scope.team_id) {
      continue;
    }

    Count(report.totals, prediction.was_correct);
    auto& week_row = by_week[prediction.week];
    week_row.week = prediction.week;
    Count(week_row.totals, prediction.was_correct);
    Count(by_confidence[ClassifyConfidence(prediction.win_probability, params_)], prediction.was_correct);

    auto home_tier = tiers.find(prediction.home_team_id);
    auto away_tier = tiers.find(prediction.away_team_id);
    if (home_tier != tiers.end() && away_tier != tiers.end()) {
      Count(by_tier[MatchupName(home_tier->second, away_tier->second)], prediction.was_correct);
    }

    if (scope.team_id) {
      Count(team_accuracy.overall, prediction.was_correct);
      if (prediction.predicted_winner_id == *scope.team_id) {
        Count(team_accuracy.as_favorite, prediction.was_correct);
      } else {
        Count(team_accuracy.as_underdog, prediction.was_correct);
      }
    }

    // 외부 순위 비교는 결과가 확정된 경기만 대상으로 한다.
    auto game_it = games.find(prediction.game_id);
    if (!prediction.was_correct || game_it == games.end() || !game_it->second.is_processed) {
      continue;
    }
    auto actual = game_it->second.WinnerId();
    auto reference = ReferenceWinner(game_it->second);
    if (!actual || !reference) {
      continue;
    }

    bool engine_correct = prediction.predicted_winner_id == *actual;
    bool reference_correct = *reference == *actual;
    auto& comparison = report.reference;
    comparison.compared += 1;
    comparison.engine_correct += engine_correct ? 1 : 0;
    comparison.reference_correct += reference_correct ? 1 : 0;
    if (engine_correct && reference_correct) {
      comparison.both_correct += 1;
    } else if (engine_correct) {
      comparison.engine_only += 1;
    } else if (reference_correct) {
      comparison.reference_only += 1;
    } else {
      comparison.both_wrong += 1;
    }
    week_row.reference_compared += 1;
    week_row.reference_correct += reference_correct ? 1 : 0;

    if (prediction.predicted_winner_id != *reference) {
      report.disagreements.push_back(Disagreement{prediction.game_id, prediction.week, prediction.home_team_id,
                                                  prediction.away_team_id, prediction.predicted_winner_id,
                                                  *reference, *actual});
    }
  }

  Finalize(report.totals);
  report.reference.engine_accuracy = Ratio(report.reference.engine_correct, report.reference.compared);
  report.reference.reference_accuracy = Ratio(report.reference.reference_correct, report.reference.compared);

  for (auto& [week, row] : by_week) {
    Finalize(row.totals);
    report.by_week.push_back(row);
  }
  for (auto& [matchup, totals] : by_tier) {
    Finalize(totals);
    report.by_tier.push_back(TierAccuracy{matchup, totals});
  }
  for (auto confidence : {Confidence::kHigh, Confidence::kMedium, Confidence::kLow}) {
    auto it = by_confidence.find(confidence);
    if (it == by_confidence.end()) {
      continue;
    }
    Finalize(it->second);
    report.by_confidence.push_back(ConfidenceAccuracy{confidence, it->second});
  }
  if (scope.team_id) {
    Finalize(team_accuracy.overall);
    Finalize(team_accuracy.as_favorite);
    Finalize(team_accuracy.as_underdog);
    report.team = team_accuracy;
  }
  return report;
}

}  // namespace ranking
