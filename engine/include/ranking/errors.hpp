/*
 * 설명: 레이팅 엔진 경계에서 발생하는 검증 오류를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/game_processor_test.cpp, engine/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace ranking {

enum class InvalidGameReason {
  kUnplayed,
  kTieScore,
  kMissingTeam,
  kWeekOutOfRange,
  kAlreadyProcessed,
  kAlreadyPlayed,
};

std::string_view ReasonCode(InvalidGameReason reason);

class InvalidGameError : public std::runtime_error {
 public:
  InvalidGameError(int game_id, InvalidGameReason reason, const std::string& message)
      : std::runtime_error(message), game_id(game_id), reason(reason) {}
  std::string_view code() const { return ReasonCode(reason); }
  int game_id;
  InvalidGameReason reason;
};

class OutOfOrderProcessingError : public std::runtime_error {
 public:
  OutOfOrderProcessingError(int game_id, int team_id, const std::string& message)
      : std::runtime_error(message), game_id(game_id), team_id(team_id) {}
  std::string_view code() const { return "out_of_order"; }
  int game_id;
  int team_id;
};

class AlreadyPredictedError : public std::runtime_error {
 public:
  AlreadyPredictedError(int game_id, const std::string& message) : std::runtime_error(message), game_id(game_id) {}
  std::string_view code() const { return "already_predicted"; }
  int game_id;
};

class MissingPreseasonDataError : public std::runtime_error {
 public:
  MissingPreseasonDataError(int team_id, const std::string& message)
      : std::runtime_error(message), team_id(team_id) {}
  int team_id;
};

}  // namespace ranking
