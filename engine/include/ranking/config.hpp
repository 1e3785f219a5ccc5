/*
 * 설명: 엔진 환경설정(DB 접속, 로그 레벨, 레이팅 상수) 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: engine/tests/unit/config_test.cpp
 */
#pragma once

#include <string>

namespace ranking {

struct RatingParams {
  double k_factor{32.0};
  double rating_scale{400.0};
  double home_field_advantage{65.0};
  double max_mov_multiplier{2.5};
  double mov_damping_base{2.2};
  double mov_damping_scale{0.001};

  double baseline_rating{1500.0};
  double sub_division_offset{-200.0};
  double preseason_band{300.0};
  double recruiting_weight{200.0};
  double transfer_weight{100.0};
  double returning_weight{80.0};
  int rank_cutoff{100};
  int unranked_sentinel{999};
  double neutral_returning_fraction{0.5};

  int min_week{0};
  int max_week{20};

  double neutral_sos{1500.0};

  double base_predicted_score{30.0};
  double points_per_rating_point{0.035};
  int max_predicted_score{150};
  double high_confidence{0.80};
  double medium_confidence{0.65};
};

struct EngineConfig {
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
  int season;
  int week;
  RatingParams rating;
};

EngineConfig LoadConfigFromEnv();

}  // namespace ranking
