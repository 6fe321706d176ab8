/*
 * 설명: 연결 ID별 이벤트 싱크를 관리하고 서버 측 이벤트 전달을 중계한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_test.cpp, server/tests/unit/lifecycle_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "relay/observability.hpp"
#include "relay/room_registry.hpp"

namespace relay {

// 전송 계층 연결이 구현하는 출력 인터페이스. 이미 닫히는 중이면 false를 반환한다.
class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual bool SendServerEvent(const std::string& event, const nlohmann::json& payload) = 0;
};

enum class DeliveryStatus { kDelivered, kNoTarget, kTransportFault };

class RealtimeCoordinator : public std::enable_shared_from_this<RealtimeCoordinator> {
 public:
  using FaultHandler = std::function<void(const ConnectionId& connection)>;

  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }
  void SetFaultHandler(FaultHandler handler);

  ConnectionId NextConnectionId();
  void Register(const ConnectionId& connection, const std::shared_ptr<EventSink>& sink);
  void Unregister(const ConnectionId& connection, const EventSink* sink);
  DeliveryStatus SendEventToConnection(const ConnectionId& connection, const std::string& event,
                                       const nlohmann::json& payload);
  std::size_t ActiveConnections() const;

 private:
  struct Entry {
    std::weak_ptr<EventSink> sink;
    const EventSink* raw{nullptr};
  };

  std::unordered_map<ConnectionId, Entry> connections_;
  mutable std::mutex mutex_;
  FaultHandler fault_handler_;
  std::atomic<std::uint64_t> connection_counter_{0};
  std::shared_ptr<Observability> observability_;
};

}  // namespace relay
