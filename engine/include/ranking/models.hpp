/*
 * 설명: 팀/경기/스냅샷/예측/외부 랭킹 레코드와 경기 순서 키를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/game_processor_test.cpp, engine/tests/unit/prediction_service_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace ranking {

enum class ConferenceTier { kTopTier = 0, kMidTier = 1, kSubDivision = 2 };

std::string_view TierName(ConferenceTier tier);
std::optional<ConferenceTier> ParseTier(std::string_view name);

struct Team {
  int team_id{0};
  int season{0};
  std::string name;
  ConferenceTier tier{ConferenceTier::kTopTier};
  double rating{0.0};
  double initial_rating{0.0};
  int wins{0};
  int losses{0};

  int games() const { return wins + losses; }
  double WinPercentage() const { return games() == 0 ? 0.0 : static_cast<double>(wins) / games(); }
};

struct FinalScore {
  int home{0};
  int away{0};
};

struct Game {
  int game_id{0};
  int season{0};
  int week{0};
  std::chrono::system_clock::time_point game_date{};
  int home_team_id{0};
  int away_team_id{0};
  bool neutral_site{false};
  // 비어 있으면 예정 경기, 값이 있으면 종료 경기.
  std::optional<FinalScore> final_score;
  bool is_processed{false};
  double home_delta{0.0};
  double away_delta{0.0};

  bool IsCompleted() const { return final_score.has_value(); }
  bool Involves(int team_id) const { return home_team_id == team_id || away_team_id == team_id; }
  int OpponentOf(int team_id) const { return team_id == home_team_id ? away_team_id : home_team_id; }
  std::optional<int> WinnerId() const;
  double DeltaFor(int team_id) const { return team_id == home_team_id ? home_delta : away_delta; }
};

// 한 시즌 안에서 경기 처리 순서를 결정한다.
struct GameOrderKey {
  int week{0};
  std::chrono::system_clock::time_point game_date{};
  int game_id{0};

  static GameOrderKey Of(const Game& game) { return GameOrderKey{game.week, game.game_date, game.game_id}; }

  bool operator<(const GameOrderKey& other) const {
    return std::tie(week, game_date, game_id) < std::tie(other.week, other.game_date, other.game_id);
  }
  // 같은 주차/일자의 경기끼리는 순서 위반으로 보지 않는다.
  bool PrecedesChronologically(const GameOrderKey& other) const {
    return std::tie(week, game_date) < std::tie(other.week, other.game_date);
  }
};

struct RankingSnapshot {
  int team_id{0};
  int season{0};
  int week{0};
  int rank{0};
  double rating{0.0};
  int wins{0};
  int losses{0};
  double sos{0.0};
  int sos_rank{0};
};

// 예측 시점의 레이팅. 이후 레이팅 변동과 무관하게 고정된다.
struct RatingSnapshot {
  double home_rating{0.0};
  double away_rating{0.0};
};

struct Prediction {
  int game_id{0};
  int season{0};
  int week{0};
  int home_team_id{0};
  int away_team_id{0};
  int predicted_winner_id{0};
  int predicted_home_score{0};
  int predicted_away_score{0};
  double win_probability{0.0};
  RatingSnapshot ratings;
  std::chrono::system_clock::time_point created_at{};
  std::optional<bool> was_correct;

  int PredictedMargin() const {
    int margin = predicted_home_score - predicted_away_score;
    return margin < 0 ? -margin : margin;
  }
};

struct ReferenceRankingEntry {
  int team_id{0};
  int season{0};
  int week{0};
  int rank{0};
};

}  // namespace ranking
