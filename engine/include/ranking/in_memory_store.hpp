/*
 * 설명: 뮤텍스로 보호되는 메모리 기반 TeamRatingStore 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/in_memory_store_test.cpp
 */
#pragma once

#include <map>
#include <mutex>
#include <tuple>
#include <utility>

#include "ranking/rating_store.hpp"

namespace ranking {

class InMemoryRatingStore : public TeamRatingStore {
 public:
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
  bool HasProcessedGameLocked(int season, int team_id) const;

  std::map<std::pair<int, int>, Team> teams_;
  std::map<int, Game> games_;
  std::map<std::tuple<int, int, int>, RankingSnapshot> snapshots_;
  std::map<int, Prediction> predictions_;
  std::map<std::tuple<int, int, int>, int> reference_ranks_;
  mutable std::mutex mutex_;
};

}  // namespace ranking
