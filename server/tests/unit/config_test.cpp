#include <cstdlib>
#include <stdexcept>

#include <gtest/gtest.h>

#include "relay/config.hpp"

namespace {

const char* kKeys[] = {"SERVER_ADDRESS",          "SERVER_PORT",          "LOG_LEVEL",           "WORKER_THREADS",
                       "WS_QUEUE_LIMIT_MESSAGES", "WS_QUEUE_LIMIT_BYTES", "WS_MAX_MESSAGE_BYTES"};

class ConfigFixture : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override { ClearEnv(); }

  static void ClearEnv() {
    for (const char* key : kKeys) {
      unsetenv(key);
    }
  }
};

}  // namespace

TEST_F(ConfigFixture, DefaultsWhenUnset) {
  auto cfg = relay::LoadConfigFromEnv();
  EXPECT_EQ(cfg.address, "0.0.0.0");
  EXPECT_EQ(cfg.port, 8000);
  EXPECT_EQ(cfg.log_level, "info");
  EXPECT_EQ(cfg.worker_threads, 0u);
  EXPECT_EQ(cfg.ws_queue_limit_messages, 512u);
  EXPECT_EQ(cfg.ws_queue_limit_bytes, 8388608u);
  EXPECT_EQ(cfg.ws_max_message_bytes, 4194304u);
}

TEST_F(ConfigFixture, ReadsOverrides) {
  setenv("SERVER_ADDRESS", "127.0.0.1", 1);
  setenv("SERVER_PORT", "9100", 1);
  setenv("LOG_LEVEL", "debug", 1);
  setenv("WORKER_THREADS", "3", 1);
  setenv("WS_QUEUE_LIMIT_MESSAGES", "16", 1);
  setenv("WS_QUEUE_LIMIT_BYTES", "4096", 1);
  setenv("WS_MAX_MESSAGE_BYTES", "2048", 1);

  auto cfg = relay::LoadConfigFromEnv();
  EXPECT_EQ(cfg.address, "127.0.0.1");
  EXPECT_EQ(cfg.port, 9100);
  EXPECT_EQ(cfg.log_level, "debug");
  EXPECT_EQ(cfg.worker_threads, 3u);
  EXPECT_EQ(cfg.ws_queue_limit_messages, 16u);
  EXPECT_EQ(cfg.ws_queue_limit_bytes, 4096u);
  EXPECT_EQ(cfg.ws_max_message_bytes, 2048u);
}

TEST_F(ConfigFixture, NonNumericPortThrows) {
  setenv("SERVER_PORT", "abc", 1);
  EXPECT_THROW(relay::LoadConfigFromEnv(), std::invalid_argument);
}
