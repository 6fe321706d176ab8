/*
 * 설명: 구조화 로그와 중계 메트릭 카운터를 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "relay/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace relay {
namespace {
std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}
}  // namespace

LogLevel ParseLogLevel(const std::string& value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementRelayed(std::uint64_t count) { messages_relayed_.fetch_add(count); }

void Observability::IncrementDropped() { messages_dropped_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_rooms, std::uint64_t active_negotiations) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.messages_relayed = messages_relayed_.load();
  snapshot.messages_dropped = messages_dropped_.load();
  snapshot.active_rooms = active_rooms;
  snapshot.active_negotiations = active_negotiations;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ParseLogLevel(ctx.level))) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = ctx.level;
  if (!ctx.trace_id.empty()) {
    log_json["traceId"] = ctx.trace_id;
  }
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.connection_id) {
    log_json["connectionId"] = *ctx.connection_id;
  }
  if (ctx.room) {
    log_json["room"] = *ctx.room;
  }
  if (!ctx.detail.is_null()) {
    log_json["detail"] = ctx.detail;
  }
  auto line = log_json.dump();
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::cout << line << std::endl;
}

}  // namespace relay
