/*
 * 설명: 검증 오류 사유를 외부에 노출할 안정적인 코드 문자열로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/game_processor_test.cpp
 */
#include "ranking/errors.hpp"

namespace ranking {

std::string_view ReasonCode(InvalidGameReason reason) {
  switch (reason) {
    case InvalidGameReason::kUnplayed:
      return "unplayed_game";
    case InvalidGameReason::kTieScore:
      return "tie_score";
    case InvalidGameReason::kMissingTeam:
      return "missing_team";
    case InvalidGameReason::kWeekOutOfRange:
      return "week_out_of_range";
    case InvalidGameReason::kAlreadyProcessed:
      return "already_processed";
    case InvalidGameReason::kAlreadyPlayed:
      return "already_played";
  }
  return "invalid_game";
}

}  // namespace ranking
