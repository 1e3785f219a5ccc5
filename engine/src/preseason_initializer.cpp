/*
 * 설명: 시즌 시작 레이팅 계산. 누락 입력은 중립값으로 대체하고 경고 로그만 남긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/preseason_initializer_test.cpp
 */
#include "ranking/preseason_initializer.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

#include "ranking/errors.hpp"

namespace ranking {

PreseasonInitializer::PreseasonInitializer(std::shared_ptr<TeamRatingStore> store,
                                           std::shared_ptr<Observability> observability, const RatingParams& params)
    : store_(std::move(store)), observability_(std::move(observability)), params_(params) {}

double PreseasonInitializer::RankStrength(int rank) const {
  if (rank < 1) {
    rank = params_.unranked_sentinel;
  }
  double strength = static_cast<double>(params_.rank_cutoff - rank) / static_cast<double>(params_.rank_cutoff - 1);
  return std::clamp(strength, 0.0, 1.0);
}

double PreseasonInitializer::CalculateSeed(ConferenceTier tier, const PreseasonInputs& inputs) const {
  double base = params_.baseline_rating;
  if (tier == ConferenceTier::kSubDivision) {
    base += params_.sub_division_offset;
  }
  int recruiting = inputs.recruiting_rank.value_or(params_.unranked_sentinel);
  int transfer = inputs.transfer_rank.value_or(params_.unranked_sentinel);
  double returning =
      std::clamp(inputs.returning_production.value_or(params_.neutral_returning_fraction), 0.0, 1.0);

  double seed = base + params_.recruiting_weight * RankStrength(recruiting) +
                params_.transfer_weight * RankStrength(transfer) +
                params_.returning_weight * (returning - params_.neutral_returning_fraction);
  return std::clamp(seed, params_.baseline_rating - params_.preseason_band,
                    params_.baseline_rating + params_.preseason_band);
}

void PreseasonInitializer::RequireComplete(const TeamSeed& seed) const {
  std::vector<std::string> missing;
  if (!seed.inputs.recruiting_rank) {
    missing.emplace_back("recruiting_rank");
  }
  if (!seed.inputs.transfer_rank) {
    missing.emplace_back("transfer_rank");
  }
  if (!seed.inputs.returning_production) {
    missing.emplace_back("returning_production");
  }
  if (missing.empty()) {
    return;
  }
  std::ostringstream oss;
  oss << "프리시즌 입력 누락:";
  for (const auto& field : missing) {
    oss << " " << field;
  }
  throw MissingPreseasonDataError(seed.team_id, oss.str());
}

void PreseasonInitializer::WarnOnMissingInputs(const TeamSeed& seed) const {
  try {
    RequireComplete(seed);
  } catch (const MissingPreseasonDataError& ex) {
    LogContext ctx;
    ctx.trace_id = observability_->NextTraceId();
    ctx.level = LogLevel::kWarn;
    ctx.name = "preseason_data_missing";
    ctx.season = seed.season;
    ctx.team_id = ex.team_id;
    ctx.detail = {{"message", ex.what()}};
    observability_->Log(ctx);
  }
}

Team PreseasonInitializer::Initialize(const TeamSeed& seed) {
  if (auto existing = store_->FindTeam(seed.season, seed.team_id)) {
    return *existing;
  }
  WarnOnMissingInputs(seed);

  Team team;
  team.team_id = seed.team_id;
  team.season = seed.season;
  team.name = seed.name;
  team.tier = seed.tier;
  team.rating = CalculateSeed(seed.tier, seed.inputs);
  team.initial_rating = team.rating;

  if (!store_->InsertTeam(team)) {
    // 동시 시드 경쟁에서 진 경우 먼저 저장된 값을 따른다.
    auto stored = store_->FindTeam(seed.season, seed.team_id);
    return stored ? *stored : team;
  }

  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.name = "team_seeded";
  ctx.season = seed.season;
  ctx.team_id = seed.team_id;
  ctx.detail = {{"rating", team.rating}, {"tier", TierName(seed.tier)}};
  observability_->Log(ctx);
  return team;
}

bool PreseasonInitializer::Reseed(const TeamSeed& seed) {
  WarnOnMissingInputs(seed);
  double rating = CalculateSeed(seed.tier, seed.inputs);
  bool reset = store_->ReseedTeam(seed.season, seed.team_id, rating);

  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  ctx.level = reset ? LogLevel::kInfo : LogLevel::kWarn;
  ctx.name = reset ? "team_reseeded" : "team_reseed_refused";
  ctx.season = seed.season;
  ctx.team_id = seed.team_id;
  ctx.detail = {{"rating", rating}};
  observability_->Log(ctx);
  return reset;
}

}  // namespace ranking
