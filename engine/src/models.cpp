/*
 * 설명: 레코드 타입의 보조 함수(티어 이름, 승자 판정)를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/game_processor_test.cpp
 */
#include "ranking/models.hpp"

namespace ranking {

std::string_view TierName(ConferenceTier tier) {
  switch (tier) {
    case ConferenceTier::kTopTier:
      return "top_tier";
    case ConferenceTier::kMidTier:
      return "mid_tier";
    case ConferenceTier::kSubDivision:
      return "sub_division";
  }
  return "unknown";
}

std::optional<ConferenceTier> ParseTier(std::string_view name) {
  if (name == "top_tier") {
    return ConferenceTier::kTopTier;
  }
  if (name == "mid_tier") {
    return ConferenceTier::kMidTier;
  }
  if (name == "sub_division") {
    return ConferenceTier::kSubDivision;
  }
  return std::nullopt;
}

std::optional<int> Game::WinnerId() const {
  if (!final_score || final_score->home == final_score->away) {
    return std::nullopt;
  }
  return final_score->home > final_score->away ? home_team_id : away_team_id;
}

}  // namespace ranking
