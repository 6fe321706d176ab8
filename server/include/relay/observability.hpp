/*
 * 설명: 구조화 로그와 중계 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace relay {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& value);

struct LogContext {
  std::string level{"info"};
  std::string trace_id;
  std::optional<std::string> connection_id;
  std::optional<std::string> room;
  std::string name;
  long latency_ms{0};
  nlohmann::json detail{};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t messages_relayed{0};
  std::uint64_t messages_dropped{0};
  std::uint64_t active_rooms{0};
  std::uint64_t active_negotiations{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementRelayed(std::uint64_t count = 1);
  void IncrementDropped();
  void SetWebsocketActive(std::uint64_t count);
  MetricsSnapshot Snapshot(std::uint64_t active_rooms, std::uint64_t active_negotiations) const;
  bool Enabled(LogLevel level) const { return static_cast<int>(level) >= static_cast<int>(min_level_); }
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> messages_relayed_{0};
  std::atomic<std::uint64_t> messages_dropped_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace relay
