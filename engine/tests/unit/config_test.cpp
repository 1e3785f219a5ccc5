#include <cstdlib>

#include <gtest/gtest.h>

#include "ranking/config.hpp"

namespace {

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearOverrides(); }
  void TearDown() override { ClearOverrides(); }

  static void ClearOverrides() {
    for (const char* key : {"DB_NAME", "SEASON", "WEEK", "RATING_K_FACTOR", "RATING_HOME_FIELD_ADVANTAGE",
                            "RATING_MAX_MOV_MULTIPLIER", "RATING_BASELINE", "RATING_MAX_WEEK"}) {
      unsetenv(key);
    }
  }
};

TEST_F(ConfigTest, DefaultsMatchRatingConstants) {
  auto config = ranking::LoadConfigFromEnv();
  EXPECT_EQ(config.db_name, "ranking_db");
  EXPECT_EQ(config.season, 2025);
  EXPECT_DOUBLE_EQ(config.rating.k_factor, 32.0);
  EXPECT_DOUBLE_EQ(config.rating.home_field_advantage, 65.0);
  EXPECT_DOUBLE_EQ(config.rating.max_mov_multiplier, 2.5);
  EXPECT_DOUBLE_EQ(config.rating.baseline_rating, 1500.0);
  EXPECT_EQ(config.rating.max_week, 20);
}

TEST_F(ConfigTest, EnvironmentOverrides) {
  setenv("DB_NAME", "ranking_test", 1);
  setenv("SEASON", "2024", 1);
  setenv("WEEK", "7", 1);
  setenv("RATING_K_FACTOR", "24", 1);
  setenv("RATING_HOME_FIELD_ADVANTAGE", "0", 1);
  setenv("RATING_BASELINE", "1000", 1);
  setenv("RATING_MAX_WEEK", "16", 1);

  auto config = ranking::LoadConfigFromEnv();
  EXPECT_EQ(config.db_name, "ranking_test");
  EXPECT_EQ(config.season, 2024);
  EXPECT_EQ(config.week, 7);
  EXPECT_DOUBLE_EQ(config.rating.k_factor, 24.0);
  EXPECT_DOUBLE_EQ(config.rating.home_field_advantage, 0.0);
  EXPECT_DOUBLE_EQ(config.rating.baseline_rating, 1000.0);
  EXPECT_DOUBLE_EQ(config.rating.neutral_sos, 1000.0);
  EXPECT_EQ(config.rating.max_week, 16);
}

}  // namespace
