/*
 * 설명: 팀/경기/스냅샷/예측/외부 랭킹 레코드를 MariaDB에 저장하고 조회한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/it/mariadb_store_it_test.cpp
 */
#include "ranking/mariadb_store.hpp"

#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace ranking {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;

constexpr const char* kTeamColumns = "team_id, season, name, tier, rating, initial_rating, wins, losses";
constexpr const char* kGameColumns =
    "game_id, season, week, game_date, home_team_id, away_team_id, neutral_site, played, home_score, away_score, "
    "is_processed, home_delta, away_delta";
constexpr const char* kSnapshotColumns = "team_id, season, week, rank_position, rating, wins, losses, sos, sos_rank";
constexpr const char* kPredictionColumns =
    "game_id, season, week, home_team_id, away_team_id, predicted_winner_id, predicted_home_score, "
    "predicted_away_score, win_probability, home_rating_at_prediction, away_rating_at_prediction, created_at, "
    "was_correct";

int ToInt(const char* value) { return value ? std::stoi(value) : 0; }
double ToDouble(const char* value) { return value ? std::stod(value) : 0.0; }

std::chrono::system_clock::time_point ParseTimestamp(const std::string& text) {
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::ostringstream PreciseStream() {
  std::ostringstream oss;
  oss << std::setprecision(std::numeric_limits<double>::max_digits10);
  return oss;
}
}  // namespace

MariaDbRatingStore::MariaDbRatingStore(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void MariaDbRatingStore::EnsureSchema() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn,
                        "CREATE TABLE IF NOT EXISTS teams ("
                        "season INT NOT NULL, team_id INT NOT NULL, name VARCHAR(128) NOT NULL, tier TINYINT NOT NULL, "
                        "rating DOUBLE NOT NULL, initial_rating DOUBLE NOT NULL, wins INT NOT NULL DEFAULT 0, "
                        "losses INT NOT NULL DEFAULT 0, PRIMARY KEY (season, team_id)) ENGINE=InnoDB;",
                        "teams 테이블 생성 실패");
    db_client_->Execute(conn,
                        "CREATE TABLE IF NOT EXISTS games ("
                        "game_id INT NOT NULL PRIMARY KEY, season INT NOT NULL, week INT NOT NULL, "
                        "game_date DATETIME NOT NULL, home_team_id INT NOT NULL, away_team_id INT NOT NULL, "
                        "neutral_site TINYINT NOT NULL DEFAULT 0, played TINYINT NOT NULL DEFAULT 0, "
                        "home_score INT NULL, away_score INT NULL, is_processed TINYINT NOT NULL DEFAULT 0, "
                        "home_delta DOUBLE NOT NULL DEFAULT 0, away_delta DOUBLE NOT NULL DEFAULT 0, "
                        "INDEX idx_games_season_week (season, week)) ENGINE=InnoDB;",
                        "games 테이블 생성 실패");
    db_client_->Execute(conn,
                        "CREATE TABLE IF NOT EXISTS ranking_snapshots ("
                        "season INT NOT NULL, week INT NOT NULL, team_id INT NOT NULL, rank_position INT NOT NULL, "
                        "rating DOUBLE NOT NULL, wins INT NOT NULL, losses INT NOT NULL, sos DOUBLE NOT NULL, "
                        "sos_rank INT NOT NULL, PRIMARY KEY (season, week, team_id)) ENGINE=InnoDB;",
                        "ranking_snapshots 테이블 생성 실패");
    db_client_->Execute(conn,
                        "CREATE TABLE IF NOT EXISTS predictions ("
                        "game_id INT NOT NULL PRIMARY KEY, season INT NOT NULL, week INT NOT NULL, "
                        "home_team_id INT NOT NULL, away_team_id INT NOT NULL, predicted_winner_id INT NOT NULL, "
                        "predicted_home_score INT NOT NULL, predicted_away_score INT NOT NULL, "
                        "win_probability DOUBLE NOT NULL, home_rating_at_prediction DOUBLE NOT NULL, "
                        "away_rating_at_prediction DOUBLE NOT NULL, created_at DATETIME NOT NULL, "
                        "was_correct TINYINT NULL, INDEX idx_predictions_season_week (season, week)) ENGINE=InnoDB;",
                        "predictions 테이블 생성 실패");
    db_client_->Execute(conn,
                        "CREATE TABLE IF NOT EXISTS reference_rankings ("
                        "season INT NOT NULL, week INT NOT NULL, team_id INT NOT NULL, rank_position INT NOT NULL, "
                        "PRIMARY KEY (season, week, team_id)) ENGINE=InnoDB;",
                        "reference_rankings 테이블 생성 실패");
  });
}

void MariaDbRatingStore::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    db_client_->Execute(conn, "DELETE FROM predictions;", "예측 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM ranking_snapshots;", "스냅샷 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM reference_rankings;", "외부 랭킹 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM games;", "경기 삭제 실패");
    db_client_->Execute(conn, "DELETE FROM teams;", "팀 삭제 실패");
  });
}

bool MariaDbRatingStore::InsertTeam(const Team& team) {
  bool inserted = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    auto oss = PreciseStream();
    oss << "INSERT INTO teams(" << kTeamColumns << ") VALUES (" << team.team_id << ", " << team.season << ", '"
        << db_client_->Escape(conn, team.name) << "', " << static_cast<int>(team.tier) << ", " << team.rating << ", "
        << team.initial_rating << ", " << team.wins << ", " << team.losses << ");";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      if (mysql_errno(conn) == kDuplicateEntry) {
        inserted = false;
        return;
      }
      db_client_->RaiseError(conn, "팀 저장 실패");
    }
    inserted = true;
  });
  return inserted;
}

bool MariaDbRatingStore::ReseedTeam(int season, int team_id, double rating) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream lock_team;
    lock_team << "SELECT team_id FROM teams WHERE season=" << season << " AND team_id=" << team_id << " FOR UPDATE;";
    bool found = false;
    db_client_->QueryRows(conn, lock_team.str(), "팀 잠금 실패", [&](MYSQL_ROW) { found = true; });
    if (!found) {
      return false;
    }

    std::ostringstream count;
    count << "SELECT COUNT(*) FROM games WHERE season=" << season << " AND is_processed=1 AND (home_team_id=" << team_id
          << " OR away_team_id=" << team_id << ");";
    int processed = 0;
    db_client_->QueryRows(conn, count.str(), "처리 경기 수 조회 실패", [&](MYSQL_ROW row) { processed = ToInt(row[0]); });
    if (processed > 0) {
      return false;
    }

    auto update = PreciseStream();
    update << "UPDATE teams SET rating=" << rating << ", initial_rating=" << rating
           << ", wins=0, losses=0 WHERE season=" << season << " AND team_id=" << team_id << ";";
    db_client_->Execute(conn, update.str(), "초기 레이팅 재설정 실패");
    return true;
  });
}

std::optional<Team> MariaDbRatingStore::FindTeam(int season, int team_id) const {
  std::optional<Team> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT " << kTeamColumns << " FROM teams WHERE season=" << season << " AND team_id=" << team_id << ";";
    db_client_->QueryRows(conn, oss.str(), "팀 조회 실패", [&](MYSQL_ROW row) { result = BuildTeam(row); });
  });
  return result;
}

std::vector<Team> MariaDbRatingStore::ListTeams(int season) const {
  std::vector<Team> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    result.clear();
    std::ostringstream oss;
    oss << "SELECT " << kTeamColumns << " FROM teams WHERE season=" << season << " ORDER BY team_id ASC;";
    db_client_->QueryRows(conn, oss.str(), "팀 목록 조회 실패", [&](MYSQL_ROW row) { result.push_back(BuildTeam(row)); });
  });
  return result;
}

std::optional<bool> MariaDbRatingStore::LockGameProcessed(MYSQL* conn, int game_id) const {
  std::ostringstream oss;
  oss << "SELECT is_processed FROM games WHERE game_id=" << game_id << " FOR UPDATE;";
  std::optional<bool> processed;
  db_client_->QueryRows(conn, oss.str(), "경기 잠금 실패", [&](MYSQL_ROW row) { processed = ToInt(row[0]) != 0; });
  return processed;
}

void MariaDbRatingStore::WriteGame(MYSQL* conn, const Game& game, bool processed) const {
  auto oss = PreciseStream();
  std::string home_score = game.final_score ? std::to_string(game.final_score->home) : "NULL";
  std::string away_score = game.final_score ? std::to_string(game.final_score->away) : "NULL";
  double home_delta = processed ? game.home_delta : 0.0;
  double away_delta = processed ? game.away_delta : 0.0;
  oss << "INSERT INTO games(" << kGameColumns << ") VALUES (" << game.game_id << ", " << game.season << ", "
      << game.week << ", '" << ToTimestamp(game.game_date) << "', " << game.home_team_id << ", " << game.away_team_id
      << ", " << (game.neutral_site ? 1 : 0) << ", " << (game.final_score ? 1 : 0) << ", " << home_score << ", "
      << away_score << ", " << (processed ? 1 : 0) << ", " << home_delta << ", " << away_delta << ")"
      << " ON DUPLICATE KEY UPDATE season=VALUES(season), week=VALUES(week), game_date=VALUES(game_date), "
         "home_team_id=VALUES(home_team_id), away_team_id=VALUES(away_team_id), neutral_site=VALUES(neutral_site), "
         "played=VALUES(played), home_score=VALUES(home_score), away_score=VALUES(away_score), "
         "is_processed=VALUES(is_processed), home_delta=VALUES(home_delta), away_delta=VALUES(away_delta);";
  db_client_->Execute(conn, oss.str(), "경기 저장 실패");
}

bool MariaDbRatingStore::UpsertGame(const Game& game) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    auto processed = LockGameProcessed(conn, game.game_id);
    if (processed && *processed) {
      return false;
    }
    WriteGame(conn, game, false);
    return true;
  });
}

std::optional<Game> MariaDbRatingStore::FindGame(int game_id) const {
  std::optional<Game> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT " << kGameColumns << " FROM games WHERE game_id=" << game_id << ";";
    db_client_->QueryRows(conn, oss.str(), "경기 조회 실패", [&](MYSQL_ROW row) { result = BuildGame(row); });
  });
  return result;
}

std::vector<Game> MariaDbRatingStore::ListGames(int season) const {
  std::vector<Game> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    result.clear();
    std::ostringstream oss;
    oss << "SELECT " << kGameColumns << " FROM games WHERE season=" << season
        << " ORDER BY week ASC, game_date ASC, game_id ASC;";
    db_client_->QueryRows(conn, oss.str(), "경기 목록 조회 실패", [&](MYSQL_ROW row) { result.push_back(BuildGame(row)); });
  });
  return result;
}

std::optional<GameOrderKey> MariaDbRatingStore::LatestProcessedKey(int season, int team_id) const {
  std::optional<GameOrderKey> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT week, game_date, game_id FROM games WHERE season=" << season
        << " AND is_processed=1 AND (home_team_id=" << team_id << " OR away_team_id=" << team_id
        << ") ORDER BY week DESC, game_date DESC, game_id DESC LIMIT 1;";
    db_client_->QueryRows(conn, oss.str(), "최근 처리 경기 조회 실패", [&](MYSQL_ROW row) {
      result = GameOrderKey{ToInt(row[0]), ParseTimestamp(row[1] ? row[1] : "1970-01-01 00:00:00"), ToInt(row[2])};
    });
  });
  return result;
}

ApplyStatus MariaDbRatingStore::ApplyGameResult(const Game& processed) {
  ApplyStatus status = ApplyStatus::kApplied;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    status = ApplyStatus::kApplied;
    // 팀 행을 먼저 잠가야 아직 저장되지 않은 경기의 동시 반영이 직렬화된다.
    std::ostringstream lock_teams;
    lock_teams << "SELECT team_id FROM teams WHERE season=" << processed.season << " AND team_id IN ("
               << processed.home_team_id << "," << processed.away_team_id << ") FOR UPDATE;";
    int locked = 0;
    db_client_->QueryRows(conn, lock_teams.str(), "팀 잠금 실패", [&](MYSQL_ROW) { ++locked; });

    auto already = LockGameProcessed(conn, processed.game_id);
    if (already && *already) {
      status = ApplyStatus::kAlreadyProcessed;
      return false;
    }
    if (locked < 2) {
      status = ApplyStatus::kMissingTeam;
      return false;
    }

    bool home_won = processed.WinnerId() == processed.home_team_id;
    auto update_home = PreciseStream();
    update_home << "UPDATE teams SET rating=rating+(" << processed.home_delta << "), wins=wins+" << (home_won ? 1 : 0)
                << ", losses=losses+" << (home_won ? 0 : 1) << " WHERE season=" << processed.season
                << " AND team_id=" << processed.home_team_id << ";";
    db_client_->Execute(conn, update_home.str(), "홈 팀 레이팅 갱신 실패");

    auto update_away = PreciseStream();
    update_away << "UPDATE teams SET rating=rating+(" << processed.away_delta << "), wins=wins+" << (home_won ? 0 : 1)
                << ", losses=losses+" << (home_won ? 1 : 0) << " WHERE season=" << processed.season
                << " AND team_id=" << processed.away_team_id << ";";
    db_client_->Execute(conn, update_away.str(), "원정 팀 레이팅 갱신 실패");

    WriteGame(conn, processed, true);
    return true;
  });
  return status;
}

bool MariaDbRatingStore::InsertSnapshots(int season, int week, const std::vector<RankingSnapshot>& snapshots) {
  return db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    std::ostringstream count;
    count << "SELECT COUNT(*) FROM ranking_snapshots WHERE season=" << season << " AND week=" << week << ";";
    int existing = 0;
    db_client_->QueryRows(conn, count.str(), "스냅샷 수 조회 실패", [&](MYSQL_ROW row) { existing = ToInt(row[0]); });
    if (existing > 0) {
      return false;
    }
    for (const auto& snapshot : snapshots) {
      auto oss = PreciseStream();
      oss << "INSERT INTO ranking_snapshots(" << kSnapshotColumns << ") VALUES (" << snapshot.team_id << ", " << season
          << ", " << week << ", " << snapshot.rank << ", " << snapshot.rating << ", " << snapshot.wins << ", "
          << snapshot.losses << ", " << snapshot.sos << ", " << snapshot.sos_rank << ");";
      if (mysql_query(conn, oss.str().c_str()) != 0) {
        if (mysql_errno(conn) == kDuplicateEntry) {
          return false;
        }
        db_client_->RaiseError(conn, "스냅샷 저장 실패");
      }
    }
    return true;
  });
}

std::vector<RankingSnapshot> MariaDbRatingStore::ListSnapshots(int season, int week) const {
  std::vector<RankingSnapshot> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    result.clear();
    std::ostringstream oss;
    oss << "SELECT " << kSnapshotColumns << " FROM ranking_snapshots WHERE season=" << season << " AND week=" << week
        << " ORDER BY rank_position ASC;";
    db_client_->QueryRows(conn, oss.str(), "스냅샷 조회 실패",
                          [&](MYSQL_ROW row) { result.push_back(BuildSnapshot(row)); });
  });
  return result;
}

std::vector<RankingSnapshot> MariaDbRatingStore::ListTeamSnapshots(int season, int team_id) const {
  std::vector<RankingSnapshot> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    result.clear();
    std::ostringstream oss;
    oss << "SELECT " << kSnapshotColumns << " FROM ranking_snapshots WHERE season=" << season
        << " AND team_id=" << team_id << " ORDER BY week ASC;";
    db_client_->QueryRows(conn, oss.str(), "팀 스냅샷 조회 실패",
                          [&](MYSQL_ROW row) { result.push_back(BuildSnapshot(row)); });
  });
  return result;
}

PredictionInsertStatus MariaDbRatingStore::InsertPrediction(const Prediction& prediction) {
  PredictionInsertStatus status = PredictionInsertStatus::kInserted;
  db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
    status = PredictionInsertStatus::kInserted;
    // ApplyGameResult와 같은 순서(팀 행, 경기 행)로 잠가 처리와 예측을 직렬화한다.
    std::ostringstream lock_teams;
    lock_teams << "SELECT team_id FROM teams WHERE season=" << prediction.season << " AND team_id IN ("
               << prediction.home_team_id << "," << prediction.away_team_id << ") FOR UPDATE;";
    db_client_->QueryRows(conn, lock_teams.str(), "팀 잠금 실패", [](MYSQL_ROW) {});
    auto processed = LockGameProcessed(conn, prediction.game_id);
    if (processed && *processed) {
      status = PredictionInsertStatus::kGameProcessed;
      return false;
    }

    auto oss = PreciseStream();
    std::string was_correct = prediction.was_correct ? (*prediction.was_correct ? "1" : "0") : "NULL";
    oss << "INSERT INTO predictions(" << kPredictionColumns << ") VALUES (" << prediction.game_id << ", "
        << prediction.season << ", " << prediction.week << ", " << prediction.home_team_id << ", "
        << prediction.away_team_id << ", " << prediction.predicted_winner_id << ", "
        << prediction.predicted_home_score << ", " << prediction.predicted_away_score << ", "
        << prediction.win_probability << ", " << prediction.ratings.home_rating << ", "
        << prediction.ratings.away_rating << ", '" << ToTimestamp(prediction.created_at) << "', " << was_correct
        << ");";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      if (mysql_errno(conn) == kDuplicateEntry) {
        status = PredictionInsertStatus::kDuplicate;
        return false;
      }
      db_client_->RaiseError(conn, "예측 저장 실패");
    }
    return true;
  });
  return status;
}

std::optional<Prediction> MariaDbRatingStore::FindPrediction(int game_id) const {
  std::optional<Prediction> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT " << kPredictionColumns << " FROM predictions WHERE game_id=" << game_id << ";";
    db_client_->QueryRows(conn, oss.str(), "예측 조회 실패", [&](MYSQL_ROW row) { result = BuildPrediction(row); });
  });
  return result;
}

std::vector<Prediction> MariaDbRatingStore::ListPredictions(int season) const {
  std::vector<Prediction> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    result.clear();
    std::ostringstream oss;
    oss << "SELECT " << kPredictionColumns << " FROM predictions WHERE season=" << season
        << " ORDER BY week ASC, game_id ASC;";
    db_client_->QueryRows(conn, oss.str(), "예측 목록 조회 실패",
                          [&](MYSQL_ROW row) { result.push_back(BuildPrediction(row)); });
  });
  return result;
}

bool MariaDbRatingStore::RecordPredictionResult(int game_id, bool was_correct) {
  bool updated = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "UPDATE predictions SET was_correct=" << (was_correct ? 1 : 0) << " WHERE game_id=" << game_id
        << " AND was_correct IS NULL;";
    db_client_->Execute(conn, oss.str(), "예측 평가 기록 실패");
    updated = mysql_affected_rows(conn) == 1;
  });
  return updated;
}

void MariaDbRatingStore::UpsertReferenceRanking(const ReferenceRankingEntry& entry) {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO reference_rankings(season, week, team_id, rank_position) VALUES (" << entry.season << ", "
        << entry.week << ", " << entry.team_id << ", " << entry.rank
        << ") ON DUPLICATE KEY UPDATE rank_position=VALUES(rank_position);";
    db_client_->Execute(conn, oss.str(), "외부 랭킹 저장 실패");
  });
}

std::optional<int> MariaDbRatingStore::FindReferenceRank(int season, int week, int team_id) const {
  std::optional<int> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT rank_position FROM reference_rankings WHERE season=" << season << " AND week=" << week
        << " AND team_id=" << team_id << ";";
    db_client_->QueryRows(conn, oss.str(), "외부 랭킹 조회 실패", [&](MYSQL_ROW row) { result = ToInt(row[0]); });
  });
  return result;
}

Team MariaDbRatingStore::BuildTeam(MYSQL_ROW row) const {
  Team team;
  team.team_id = ToInt(row[0]);
  team.season = ToInt(row[1]);
  team.name = row[2] ? row[2] : "";
  team.tier = static_cast<ConferenceTier>(ToInt(row[3]));
  team.rating = ToDouble(row[4]);
  team.initial_rating = ToDouble(row[5]);
  team.wins = ToInt(row[6]);
  team.losses = ToInt(row[7]);
  return team;
}

Game MariaDbRatingStore::BuildGame(MYSQL_ROW row) const {
  Game game;
  game.game_id = ToInt(row[0]);
  game.season = ToInt(row[1]);
  game.week = ToInt(row[2]);
  game.game_date = ParseTimestamp(row[3] ? row[3] : "1970-01-01 00:00:00");
  game.home_team_id = ToInt(row[4]);
  game.away_team_id = ToInt(row[5]);
  game.neutral_site = ToInt(row[6]) != 0;
  if (ToInt(row[7]) != 0) {
    game.final_score = FinalScore{ToInt(row[8]), ToInt(row[9])};
  }
  game.is_processed = ToInt(row[10]) != 0;
  game.home_delta = ToDouble(row[11]);
  game.away_delta = ToDouble(row[12]);
  return game;
}

RankingSnapshot MariaDbRatingStore::BuildSnapshot(MYSQL_ROW row) const {
  return RankingSnapshot{ToInt(row[0]), ToInt(row[1]), ToInt(row[2]), ToInt(row[3]), ToDouble(row[4]),
                         ToInt(row[5]), ToInt(row[6]), ToDouble(row[7]), ToInt(row[8])};
}

Prediction MariaDbRatingStore::BuildPrediction(MYSQL_ROW row) const {
  Prediction prediction;
  prediction.game_id = ToInt(row[0]);
  prediction.season = ToInt(row[1]);
  prediction.week = ToInt(row[2]);
  prediction.home_team_id = ToInt(row[3]);
  prediction.away_team_id = ToInt(row[4]);
  prediction.predicted_winner_id = ToInt(row[5]);
  prediction.predicted_home_score = ToInt(row[6]);
  prediction.predicted_away_score = ToInt(row[7]);
  prediction.win_probability = ToDouble(row[8]);
  prediction.ratings = RatingSnapshot{ToDouble(row[9]), ToDouble(row[10])};
  prediction.created_at = ParseTimestamp(row[11] ? row[11] : "1970-01-01 00:00:00");
  if (row[12]) {
    prediction.was_correct = ToInt(row[12]) != 0;
  }
  return prediction;
}

std::string MariaDbRatingStore::ToTimestamp(const std::chrono::system_clock::time_point& tp) const {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

}  // namespace ranking
