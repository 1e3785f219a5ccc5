/*
 * 설명: 환경변수에서 엔진 설정을 읽고 누락 시 기본값을 채운다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/config_test.cpp
 */
#include "ranking/config.hpp"

#include <cstdlib>

namespace ranking {

EngineConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  EngineConfig cfg;
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "ranking_db");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.season = std::stoi(get_env("SEASON", "2025"));
  cfg.week = std::stoi(get_env("WEEK", "1"));

  RatingParams defaults;
  cfg.rating = defaults;
  cfg.rating.k_factor = std::stod(get_env("RATING_K_FACTOR", std::to_string(defaults.k_factor).c_str()));
  cfg.rating.home_field_advantage =
      std::stod(get_env("RATING_HOME_FIELD_ADVANTAGE", std::to_string(defaults.home_field_advantage).c_str()));
  cfg.rating.max_mov_multiplier =
      std::stod(get_env("RATING_MAX_MOV_MULTIPLIER", std::to_string(defaults.max_mov_multiplier).c_str()));
  cfg.rating.baseline_rating = std::stod(get_env("RATING_BASELINE", std::to_string(defaults.baseline_rating).c_str()));
  cfg.rating.neutral_sos = cfg.rating.baseline_rating;
  cfg.rating.max_week = std::stoi(get_env("RATING_MAX_WEEK", std::to_string(defaults.max_week).c_str()));
  return cfg;
}

}  // namespace ranking
