/*
 * 설명: 리크루팅 순위, 트랜스퍼 포털 순위, 복귀 전력 비율로 시즌 시작 레이팅을 계산하고 저장한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/preseason_initializer_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "ranking/config.hpp"
#include "ranking/models.hpp"
#include "ranking/observability.hpp"
#include "ranking/rating_store.hpp"

namespace ranking {

struct PreseasonInputs {
  std::optional<int> recruiting_rank;
  std::optional<int> transfer_rank;
  std::optional<double> returning_production;
};

struct TeamSeed {
  int team_id;
  int season;
  std::string name;
  ConferenceTier tier;
  PreseasonInputs inputs;
};

class PreseasonInitializer {
 public:
  PreseasonInitializer(std::shared_ptr<TeamRatingStore> store, std::shared_ptr<Observability> observability,
                       const RatingParams& params);

  double CalculateSeed(ConferenceTier tier, const PreseasonInputs& inputs) const;

  // 이미 시드된 팀이면 저장된 팀을 그대로 반환한다.
  Team Initialize(const TeamSeed& seed);
  // 명시적 재설정. 처리된 경기가 있는 팀은 거부한다.
  bool Reseed(const TeamSeed& seed);

 private:
  double RankStrength(int rank) const;
  void RequireComplete(const TeamSeed& seed) const;
  void WarnOnMissingInputs(const TeamSeed& seed) const;

  std::shared_ptr<TeamRatingStore> store_;
  std::shared_ptr<Observability> observability_;
  RatingParams params_;
};

}  // namespace ranking
