#include <gtest/gtest.h>

#include "relay/observability.hpp"

TEST(ObservabilityTest, ParsesLogLevels) {
  EXPECT_EQ(relay::ParseLogLevel("debug"), relay::LogLevel::kDebug);
  EXPECT_EQ(relay::ParseLogLevel("info"), relay::LogLevel::kInfo);
  EXPECT_EQ(relay::ParseLogLevel("warn"), relay::LogLevel::kWarn);
  EXPECT_EQ(relay::ParseLogLevel("warning"), relay::LogLevel::kWarn);
  EXPECT_EQ(relay::ParseLogLevel("error"), relay::LogLevel::kError);
  EXPECT_EQ(relay::ParseLogLevel("verbose"), relay::LogLevel::kInfo);
}

TEST(ObservabilityTest, LevelFilter) {
  relay::Observability obs(relay::LogLevel::kWarn);
  EXPECT_FALSE(obs.Enabled(relay::LogLevel::kDebug));
  EXPECT_FALSE(obs.Enabled(relay::LogLevel::kInfo));
  EXPECT_TRUE(obs.Enabled(relay::LogLevel::kWarn));
  EXPECT_TRUE(obs.Enabled(relay::LogLevel::kError));
}

TEST(ObservabilityTest, CountersAppearInSnapshot) {
  relay::Observability obs(relay::LogLevel::kError);
  obs.IncrementRequest();
  obs.IncrementRequest();
  obs.IncrementError();
  obs.IncrementRelayed(3);
  obs.IncrementRelayed();
  obs.IncrementDropped();
  obs.SetWebsocketActive(5);

  auto snapshot = obs.Snapshot(2, 1);
  EXPECT_EQ(snapshot.request_total, 2u);
  EXPECT_EQ(snapshot.request_errors, 1u);
  EXPECT_EQ(snapshot.messages_relayed, 4u);
  EXPECT_EQ(snapshot.messages_dropped, 1u);
  EXPECT_EQ(snapshot.websocket_active, 5u);
  EXPECT_EQ(snapshot.active_rooms, 2u);
  EXPECT_EQ(snapshot.active_negotiations, 1u);
}

TEST(ObservabilityTest, TraceIdsAreUnique) {
  relay::Observability obs;
  auto first = obs.NextTraceId();
  auto second = obs.NextTraceId();
  EXPECT_FALSE(first.empty());
  EXPECT_NE(first, second);
}

TEST(ObservabilityTest, LogWritesOneJsonLine) {
  relay::Observability obs(relay::LogLevel::kInfo);
  ::testing::internal::CaptureStdout();
  obs.Log(relay::LogContext{"info", "t-1", std::string{"c1"}, std::string{"r1"}, "presence.join", 0,
                            {{"identity", "alice"}}});
  obs.Log(relay::LogContext{"debug", "", std::nullopt, std::nullopt, "relay.dropped", 0});
  auto output = ::testing::internal::GetCapturedStdout();

  ASSERT_FALSE(output.empty());
  EXPECT_EQ(output.find('\n'), output.size() - 1);
  auto line = nlohmann::json::parse(output);
  EXPECT_EQ(line["level"], "info");
  EXPECT_EQ(line["traceId"], "t-1");
  EXPECT_EQ(line["eventName"], "presence.join");
  EXPECT_EQ(line["connectionId"], "c1");
  EXPECT_EQ(line["room"], "r1");
  EXPECT_EQ(line["detail"]["identity"], "alice");
}
