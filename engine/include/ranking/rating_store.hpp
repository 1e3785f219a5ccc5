/*
 * 설명: 팀 레이팅/경기/스냅샷/예측 레코드에 대한 영속 계층 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/in_memory_store_test.cpp, engine/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <optional>
#include <vector>

#include "ranking/models.hpp"

namespace ranking {

enum class ApplyStatus { kApplied, kAlreadyProcessed, kMissingTeam };
enum class PredictionInsertStatus { kInserted, kDuplicate, kGameProcessed };

class TeamRatingStore {
 public:
  virtual ~TeamRatingStore() = default;

  // (season, team_id)가 이미 있으면 false.
  virtual bool InsertTeam(const Team& team) = 0;
  // 처리된 경기가 없는 팀만 초기 레이팅을 다시 설정한다.
  virtual bool ReseedTeam(int season, int team_id, double rating) = 0;
  virtual std::optional<Team> FindTeam(int season, int team_id) const = 0;
  virtual std::vector<Team> ListTeams(int season) const = 0;

  // 이미 처리된 경기는 덮어쓰지 않고 false.
  virtual bool UpsertGame(const Game& game) = 0;
  virtual std::optional<Game> FindGame(int game_id) const = 0;
  virtual std::vector<Game> ListGames(int season) const = 0;
  virtual std::optional<GameOrderKey> LatestProcessedKey(int season, int team_id) const = 0;
  // 두 팀 레이팅/전적과 경기 처리 상태를 하나의 단위로 반영한다.
  virtual ApplyStatus ApplyGameResult(const Game& processed) = 0;

  // 해당 주차 스냅샷이 이미 있으면 아무것도 쓰지 않고 false.
  virtual bool InsertSnapshots(int season, int week, const std::vector<RankingSnapshot>& snapshots) = 0;
  virtual std::vector<RankingSnapshot> ListSnapshots(int season, int week) const = 0;
  virtual std::vector<RankingSnapshot> ListTeamSnapshots(int season, int team_id) const = 0;

  // 처리 완료된 경기와 이미 예측된 경기는 거부한다. 처리 여부 확인과 삽입은 하나의 단위다.
  virtual PredictionInsertStatus InsertPrediction(const Prediction& prediction) = 0;
  virtual std::optional<Prediction> FindPrediction(int game_id) const = 0;
  virtual std::vector<Prediction> ListPredictions(int season) const = 0;
  // was_correct가 아직 비어 있을 때만 기록한다.
  virtual bool RecordPredictionResult(int game_id, bool was_correct) = 0;

  virtual void UpsertReferenceRanking(const ReferenceRankingEntry& entry) = 0;
  virtual std::optional<int> FindReferenceRank(int season, int week, int team_id) const = 0;
};

}  // namespace ranking
