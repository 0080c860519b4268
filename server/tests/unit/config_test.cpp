#include <cstdlib>
#include <stdexcept>

#include <gtest/gtest.h>

#include "codebattle/config.hpp"

namespace {

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override { ClearEnv(); }

  static void ClearEnv() {
    for (const char* key : {"PORT", "SERVER_PORT", "PERSISTENCE_ENABLED", "SNAPSHOT_KEY", "WS_QUEUE_LIMIT_MESSAGES",
                            "WS_QUEUE_LIMIT_BYTES", "SESSION_TIME_BUDGET_SECONDS", "CHALLENGE_FILE", "WORKER_THREADS",
                            "LOG_LEVEL"}) {
      unsetenv(key);
    }
  }
};

TEST_F(ConfigTest, DefaultsApplyWhenUnset) {
  auto cfg = codebattle::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 3001);
  EXPECT_TRUE(cfg.persistence_enabled);
  EXPECT_EQ(cfg.snapshot_key, "rooms");
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_EQ(cfg.ws_queue_limit_messages, 64u);
  EXPECT_EQ(cfg.ws_queue_limit_bytes, 1048576u);
  EXPECT_EQ(cfg.session_time_budget_seconds, 300u);
  EXPECT_TRUE(cfg.challenge_file.empty());
  EXPECT_EQ(cfg.worker_threads, 0u);
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults) {
  setenv("SERVER_PORT", "4100", 1);
  setenv("PERSISTENCE_ENABLED", "False", 1);
  setenv("SNAPSHOT_KEY", "rooms_test", 1);
  setenv("SESSION_TIME_BUDGET_SECONDS", "120", 1);
  setenv("WORKER_THREADS", "2", 1);
  auto cfg = codebattle::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 4100);
  EXPECT_FALSE(cfg.persistence_enabled);
  EXPECT_EQ(cfg.snapshot_key, "rooms_test");
  EXPECT_EQ(cfg.session_time_budget_seconds, 120u);
  EXPECT_EQ(cfg.worker_threads, 2u);
}

TEST_F(ConfigTest, PortTakesPrecedenceOverServerPort) {
  setenv("SERVER_PORT", "4100", 1);
  EXPECT_EQ(codebattle::LoadConfigFromEnv().port, 4100);
  setenv("PORT", "8080", 1);
  EXPECT_EQ(codebattle::LoadConfigFromEnv().port, 8080);
}

TEST_F(ConfigTest, NonNumericValueThrows) {
  setenv("WS_QUEUE_LIMIT_MESSAGES", "many", 1);
  EXPECT_THROW(codebattle::LoadConfigFromEnv(), std::invalid_argument);
}

}  // namespace
