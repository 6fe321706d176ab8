/*
 * 설명: 연결별 이벤트 싱크를 관리하고 서버 이벤트를 안전하게 전달한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_test.cpp, server/tests/unit/lifecycle_test.cpp
 */
#include "relay/realtime.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <vector>

namespace relay {
namespace {
std::string BytesToHex(const std::vector<unsigned char>& data) {
  std::ostringstream oss;
  for (unsigned char byte : data) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return oss.str();
}
}  // namespace

void RealtimeCoordinator::SetFaultHandler(FaultHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  fault_handler_ = std::move(handler);
}

ConnectionId RealtimeCoordinator::NextConnectionId() {
  std::vector<unsigned char> buffer(8);
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 255);
  for (auto& b : buffer) {
    b = static_cast<unsigned char>(dist(gen));
  }
  // 난수 충돌을 피하기 위해 단조 증가 카운터를 접미사로 붙인다.
  std::ostringstream oss;
  oss << BytesToHex(buffer) << "-" << connection_counter_.fetch_add(1);
  return oss.str();
}

void RealtimeCoordinator::Register(const ConnectionId& connection, const std::shared_ptr<EventSink>& sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_[connection] = Entry{sink, sink.get()};
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
}

void RealtimeCoordinator::Unregister(const ConnectionId& connection, const EventSink* sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection);
  if (it == connections_.end()) {
    return;
  }
  if (it->second.raw == sink) {
    connections_.erase(it);
    if (observability_) {
      observability_->SetWebsocketActive(connections_.size());
    }
  }
}

DeliveryStatus RealtimeCoordinator::SendEventToConnection(const ConnectionId& connection, const std::string& event,
                                                          const nlohmann::json& payload) {
  std::shared_ptr<EventSink> sink_ptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection);
    if (it == connections_.end()) {
      return DeliveryStatus::kNoTarget;
    }
    sink_ptr = it->second.sink.lock();
    if (!sink_ptr) {
      connections_.erase(it);
    }
  }
  if (sink_ptr && sink_ptr->SendServerEvent(event, payload)) {
    return DeliveryStatus::kDelivered;
  }

  // 전송 실패는 해당 대상의 연결 종료와 동일하게 처리한다.
  FaultHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection);
    if (it != connections_.end() && it->second.raw == sink_ptr.get()) {
      connections_.erase(it);
    }
    if (observability_) {
      observability_->SetWebsocketActive(connections_.size());
    }
    handler = fault_handler_;
  }
  if (observability_) {
    observability_->Log(LogContext{"warn", "", connection, std::nullopt, "delivery.transport_fault", 0});
  }
  if (handler) {
    handler(connection);
  }
  return DeliveryStatus::kTransportFault;
}

std::size_t RealtimeCoordinator::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

}  // namespace relay
