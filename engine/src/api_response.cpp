/*
 * 설명: JSON 응답 엔벨로프와 순위/예측/정확도/감사 결과의 JSON 뷰를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/json_envelope_test.cpp
 */
#include "ranking/api_response.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include "ranking/prediction_service.hpp"

namespace ranking {
namespace {
nlohmann::json TotalsJson(const AccuracyTotals& totals) {
  return {{"total", totals.total},
          {"evaluated", totals.evaluated},
          {"correct", totals.correct},
          {"accuracy", totals.accuracy}};
}

template <typename T>
nlohmann::json ArrayOf(const std::vector<T>& items) {
  nlohmann::json array = nlohmann::json::array();
  for (const auto& item : items) {
    array.push_back(ToJson(item));
  }
  return array;
}
}  // namespace

std::string FormatTimestamp(const std::chrono::system_clock::time_point& tp) {
  auto itt = std::chrono::system_clock::to_time_t(tp);
  std::tm utc{};
  gmtime_r(&itt, &utc);
  std::ostringstream ss;
  ss << std::put_time(&utc, "%FT%TZ");
  return ss.str();
}

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", FormatTimestamp(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", detail}};
  envelope["meta"] = {{"timestamp", FormatTimestamp(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json ToJson(const RankingEntry& entry) {
  return {{"teamId", entry.team.team_id},
          {"name", entry.team.name},
          {"tier", TierName(entry.team.tier)},
          {"rank", entry.rank},
          {"rating", entry.team.rating},
          {"wins", entry.team.wins},
          {"losses", entry.team.losses},
          {"sos", entry.sos},
          {"sosRank", entry.sos_rank}};
}

nlohmann::json ToJson(const std::vector<RankingEntry>& entries) {
  return ArrayOf(entries);
}

nlohmann::json ToJson(const RankingSnapshot& snapshot) {
  return {{"teamId", snapshot.team_id},
          {"season", snapshot.season},
          {"week", snapshot.week},
          {"rank", snapshot.rank},
          {"rating", snapshot.rating},
          {"wins", snapshot.wins},
          {"losses", snapshot.losses},
          {"sos", snapshot.sos},
          {"sosRank", snapshot.sos_rank}};
}

nlohmann::json ToJson(const std::vector<RankingSnapshot>& snapshots) {
  return ArrayOf(snapshots);
}

nlohmann::json ToJson(const Prediction& prediction) {
  nlohmann::json j{{"gameId", prediction.game_id},
                   {"season", prediction.season},
                   {"week", prediction.week},
                   {"homeTeamId", prediction.home_team_id},
                   {"awayTeamId", prediction.away_team_id},
                   {"predictedWinnerId", prediction.predicted_winner_id},
                   {"predictedHomeScore", prediction.predicted_home_score},
                   {"predictedAwayScore", prediction.predicted_away_score},
                   {"winProbability", prediction.win_probability},
                   {"homeRatingAtPrediction", prediction.ratings.home_rating},
                   {"awayRatingAtPrediction", prediction.ratings.away_rating},
                   {"createdAt", FormatTimestamp(prediction.created_at)}};
  if (prediction.was_correct) {
    j["wasCorrect"] = *prediction.was_correct;
  } else {
    j["wasCorrect"] = nullptr;
  }
  return j;
}

nlohmann::json ToJson(const std::vector<Prediction>& predictions) {
  return ArrayOf(predictions);
}

nlohmann::json ToJson(const GameResult& result) {
  return {{"gameId", result.game_id},
          {"winnerId", result.winner_id},
          {"loserId", result.loser_id},
          {"homeDelta", result.home_delta},
          {"awayDelta", result.away_delta},
          {"winnerExpected", result.winner_expected},
          {"movMultiplier", result.mov_multiplier},
          {"tierMultiplier", result.tier_multiplier},
          {"homeRatingAfter", result.home_rating_after},
          {"awayRatingAfter", result.away_rating_after}};
}

nlohmann::json ToJson(const AccuracyReport& report) {
  nlohmann::json j;
  j["season"] = report.season;
  j["scope"] = {{"week", nullptr}, {"teamId", nullptr}};
  if (report.scope.week) {
    j["scope"]["week"] = *report.scope.week;
  }
  if (report.scope.team_id) {
    j["scope"]["teamId"] = *report.scope.team_id;
  }
  j["totals"] = TotalsJson(report.totals);

  const auto& ref = report.reference;
  j["reference"] = {{"compared", ref.compared},
                    {"engineCorrect", ref.engine_correct},
                    {"referenceCorrect", ref.reference_correct},
                    {"bothCorrect", ref.both_correct},
                    {"engineOnly", ref.engine_only},
                    {"referenceOnly", ref.reference_only},
                    {"bothWrong", ref.both_wrong},
                    {"engineAccuracy", ref.engine_accuracy},
                    {"referenceAccuracy", ref.reference_accuracy},
                    {"engineAdvantage", ref.engine_accuracy - ref.reference_accuracy}};

  j["byWeek"] = nlohmann::json::array();
  for (const auto& row : report.by_week) {
    auto week_json = TotalsJson(row.totals);
    week_json["week"] = row.week;
    week_json["referenceCompared"] = row.reference_compared;
    week_json["referenceCorrect"] = row.reference_correct;
    j["byWeek"].push_back(week_json);
  }
  j["byTier"] = nlohmann::json::array();
  for (const auto& row : report.by_tier) {
    auto tier_json = TotalsJson(row.totals);
    tier_json["matchup"] = row.matchup;
    j["byTier"].push_back(tier_json);
  }
  j["byConfidence"] = nlohmann::json::array();
  for (const auto& row : report.by_confidence) {
    auto confidence_json = TotalsJson(row.totals);
    confidence_json["confidence"] = ConfidenceName(row.confidence);
    j["byConfidence"].push_back(confidence_json);
  }
  j["disagreements"] = nlohmann::json::array();
  for (const auto& d : report.disagreements) {
    j["disagreements"].push_back({{"gameId", d.game_id},
                                  {"week", d.week},
                                  {"homeTeamId", d.home_team_id},
                                  {"awayTeamId", d.away_team_id},
                                  {"engineWinnerId", d.engine_winner_id},
                                  {"referenceWinnerId", d.reference_winner_id},
                                  {"actualWinnerId", d.actual_winner_id}});
  }
  if (report.team) {
    j["team"] = {{"teamId", report.team->team_id},
                 {"overall", TotalsJson(report.team->overall)},
                 {"asFavorite", TotalsJson(report.team->as_favorite)},
                 {"asUnderdog", TotalsJson(report.team->as_underdog)}};
  } else {
    j["team"] = nullptr;
  }
  return j;
}

nlohmann::json ToJson(const AuditReport& report) {
  nlohmann::json findings = nlohmann::json::array();
  for (const auto& finding : report.findings) {
    nlohmann::json item{{"severity", SeverityName(finding.severity)},
                        {"code", finding.code},
                        {"message", finding.message}};
    item["gameId"] = finding.game_id ? nlohmann::json(*finding.game_id) : nlohmann::json(nullptr);
    item["teamId"] = finding.team_id ? nlohmann::json(*finding.team_id) : nlohmann::json(nullptr);
    findings.push_back(item);
  }
  return {{"season", report.season},
          {"passed", report.Passed()},
          {"gamesChecked", report.games_checked},
          {"teamsChecked", report.teams_checked},
          {"errors", report.ErrorCount()},
          {"warnings", report.WarningCount()},
          {"findings", findings}};
}

nlohmann::json ToJson(const BatchSummary& summary) {
  nlohmann::json rejections = nlohmann::json::array();
  for (const auto& rejection : summary.rejections) {
    rejections.push_back(
        {{"gameId", rejection.game_id}, {"code", rejection.code}, {"message", rejection.message}});
  }
  return {{"season", summary.season},
          {"week", summary.week},
          {"gamesProcessed", summary.games_processed},
          {"gamesRejected", summary.games_rejected},
          {"predictionsEvaluated", summary.predictions_evaluated},
          {"snapshotTeams", summary.snapshot_teams},
          {"predictionsCreated", summary.predictions_created},
          {"rejections", rejections},
          {"audit", ToJson(summary.audit)}};
}

}  // namespace ranking
