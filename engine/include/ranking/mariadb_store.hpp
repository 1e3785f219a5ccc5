/*
 * 설명: MariaDB 기반 TeamRatingStore. 경기 결과 반영과 주차 스냅샷은 단일 트랜잭션으로 처리하고
 *       중복 예측/스냅샷은 DB 제약으로 차단한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/it/mariadb_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <mariadb/mysql.h>

#include "ranking/db_client.hpp"
#include "ranking/rating_store.hpp"

namespace ranking {

class MariaDbRatingStore : public TeamRatingStore {
 public:
  explicit MariaDbRatingStore(std::shared_ptr<MariaDbClient> db_client);

  void EnsureSchema() const;
  void ClearAll() const;

  bool InsertTeam(const Team& team) override;
  bool ReseedTeam(int season, int team_id, double rating) override;
  std::optional<Team> FindTeam(int season, int team_id) const override;
  std::vector<Team> ListTeams(int season) const override;

  bool UpsertGame(const Game& game) override;
  std::optional<Game> FindGame(int game_id) const override;
  std::vector<Game> ListGames(int season) const override;
  std::optional<GameOrderKey> LatestProcessedKey(int season, int team_id) const override;
  ApplyStatus ApplyGameResult(const Game& processed) override;

  bool InsertSnapshots(int season, int week, const std::vector<RankingSnapshot>& snapshots) override;
  std::vector<RankingSnapshot> ListSnapshots(int season, int week) const override;
  std::vector<RankingSnapshot> ListTeamSnapshots(int season, int team_id) const override;

  PredictionInsertStatus InsertPrediction(const Prediction& prediction) override;
  std::optional<Prediction> FindPrediction(int game_id) const override;
  std::vector<Prediction> ListPredictions(int season) const override;
  bool RecordPredictionResult(int game_id, bool was_correct) override;

  void UpsertReferenceRanking(const ReferenceRankingEntry& entry) override;
  std::optional<int> FindReferenceRank(int season, int week, int team_id) const override;

 private:
  std::optional<bool> LockGameProcessed(MYSQL* conn, int game_id) const;
  void WriteGame(MYSQL* conn, const Game& game, bool processed) const;
  Team BuildTeam(MYSQL_ROW row) const;
  Game BuildGame(MYSQL_ROW row) const;
  RankingSnapshot BuildSnapshot(MYSQL_ROW row) const;
  Prediction BuildPrediction(MYSQL_ROW row) const;
  std::string ToTimestamp(const std::chrono::system_clock::time_point& tp) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace ranking
