/*
 * 설명: 메모리 기반 저장소. 경기 결과 반영은 단일 잠금 구간에서 원자적으로 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/in_memory_store_test.cpp
 */
#include "ranking/in_memory_store.hpp"

#include <algorithm>

namespace ranking {

bool InMemoryRatingStore::InsertTeam(const Team& team) {
  std::lock_guard<std::mutex> lock(mutex_);
  return teams_.emplace(std::make_pair(team.season, team.team_id), team).second;
}

bool InMemoryRatingStore::ReseedTeam(int season, int team_id, double rating) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = teams_.find({season, team_id});
  if (it == teams_.end() || HasProcessedGameLocked(season, team_id)) {
    return false;
  }
  it->second.rating = rating;
  it->second.initial_rating = rating;
  it->second.wins = 0;
  it->second.losses = 0;
  return true;
}

std::optional<Team> InMemoryRatingStore::FindTeam(int season, int team_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = teams_.find({season, team_id});
  if (it == teams_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Team> InMemoryRatingStore::ListTeams(int season) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Team> result;
  for (const auto& [key, team] : teams_) {
    if (key.first == season) {
      result.push_back(team);
    }
  }
  return result;
}

bool InMemoryRatingStore::UpsertGame(const Game& game) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = games_.find(game.game_id);
  if (it != games_.end() && it->second.is_processed) {
    return false;
  }
  Game stored = game;
  stored.is_processed = false;
  stored.home_delta = 0.0;
  stored.away_delta = 0.0;
  games_[game.game_id] = stored;
  return true;
}

std::optional<Game> InMemoryRatingStore::FindGame(int game_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = games_.find(game_id);
  if (it == games_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Game> InMemoryRatingStore::ListGames(int season) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Game> result;
  for (const auto& [id, game] : games_) {
    if (game.season == season) {
      result.push_back(game);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const Game& a, const Game& b) { return GameOrderKey::Of(a) < GameOrderKey::Of(b); });
  return result;
}

std::optional<GameOrderKey> InMemoryRatingStore::LatestProcessedKey(int season, int team_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<GameOrderKey> latest;
  for (const auto& [id, game] : games_) {
    if (game.season != season || !game.is_processed || !game.Involves(team_id)) {
      continue;
    }
    GameOrderKey key = GameOrderKey::Of(game);
    if (!latest || *latest < key) {
      latest = key;
    }
  }
  return latest;
}

ApplyStatus InMemoryRatingStore::ApplyGameResult(const Game& processed) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto game_it = games_.find(processed.game_id);
  if (game_it != games_.end() && game_it->second.is_processed) {
    return ApplyStatus::kAlreadyProcessed;
  }
  auto home_it = teams_.find({processed.season, processed.home_team_id});
  auto away_it = teams_.find({processed.season, processed.away_team_id});
  if (home_it == teams_.end() || away_it == teams_.end()) {
    return ApplyStatus::kMissingTeam;
  }

  Team& home = home_it->second;
  Team& away = away_it->second;
  home.rating += processed.home_delta;
  away.rating += processed.away_delta;
  if (processed.WinnerId() == home.team_id) {
    home.wins += 1;
    away.losses += 1;
  } else {
    away.wins += 1;
    home.losses += 1;
  }

  Game stored = processed;
  stored.is_processed = true;
  games_[processed.game_id] = stored;
  return ApplyStatus::kApplied;
}

bool InMemoryRatingStore::InsertSnapshots(int season, int week, const std::vector<RankingSnapshot>& snapshots) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto first = snapshots_.lower_bound({season, week, 0});
  if (first != snapshots_.end() && std::get<0>(first->first) == season && std::get<1>(first->first) == week) {
    return false;
  }
  for (const auto& snapshot : snapshots) {
    snapshots_[{season, week, snapshot.team_id}] = snapshot;
  }
  return true;
}

std::vector<RankingSnapshot> InMemoryRatingStore::ListSnapshots(int season, int week) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RankingSnapshot> result;
  for (const auto& [key, snapshot] : snapshots_) {
    if (std::get<0>(key) == season && std::get<1>(key) == week) {
      result.push_back(snapshot);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const RankingSnapshot& a, const RankingSnapshot& b) { return a.rank < b.rank; });
  return result;
}

std::vector<RankingSnapshot> InMemoryRatingStore::ListTeamSnapshots(int season, int team_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RankingSnapshot> result;
  for (const auto& [key, snapshot] : snapshots_) {
    if (std::get<0>(key) == season && std::get<2>(key) == team_id) {
      result.push_back(snapshot);
    }
  }
  return result;
}

PredictionInsertStatus InMemoryRatingStore::InsertPrediction(const Prediction& prediction) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto game_it = games_.find(prediction.game_id);
  if (game_it != games_.end() && game_it->second.is_processed) {
    return PredictionInsertStatus::kGameProcessed;
  }
  if (!predictions_.emplace(prediction.game_id, prediction).second) {
    return PredictionInsertStatus::kDuplicate;
  }
  return PredictionInsertStatus::kInserted;
}

std::optional<Prediction> InMemoryRatingStore::FindPrediction(int game_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = predictions_.find(game_id);
  if (it == predictions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<Prediction> InMemoryRatingStore::ListPredictions(int season) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Prediction> result;
  for (const auto& [id, prediction] : predictions_) {
    if (prediction.season == season) {
      result.push_back(prediction);
    }
  }
  return result;
}

bool InMemoryRatingStore::RecordPredictionResult(int game_id, bool was_correct) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = predictions_.find(game_id);
  if (it == predictions_.end() || it->second.was_correct.has_value()) {
    return false;
  }
  it->second.was_correct = was_correct;
  return true;
}

void InMemoryRatingStore::UpsertReferenceRanking(const ReferenceRankingEntry& entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  reference_ranks_[{entry.season, entry.week, entry.team_id}] = entry.rank;
}

std::optional<int> InMemoryRatingStore::FindReferenceRank(int season, int week, int team_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = reference_ranks_.find({season, week, team_id});
  if (it == reference_ranks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool InMemoryRatingStore::HasProcessedGameLocked(int season, int team_id) const {
  for (const auto& [id, game] : games_) {
    if (game.season == season && game.is_processed && game.Involves(team_id)) {
      return true;
    }
  }
  return false;
}

}  // namespace ranking
