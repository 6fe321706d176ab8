/*
 * 설명: 파싱된 클라이언트 메시지를 각 서비스(입장/협상/중계/수명주기)로 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/signaling_flow_test.cpp
 */
#pragma once

#include <memory>

#include "relay/call_negotiation.hpp"
#include "relay/lifecycle.hpp"
#include "relay/messages.hpp"
#include "relay/negotiation_state.hpp"
#include "relay/observability.hpp"
#include "relay/presence.hpp"
#include "relay/realtime.hpp"
#include "relay/relay.hpp"
#include "relay/room_registry.hpp"

namespace relay {

class SignalingRouter {
 public:
  SignalingRouter(std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<Observability> observability);

  void Dispatch(const ConnectionId& from, const ClientMessage& message);
  void HandleDisconnect(const ConnectionId& connection);

  std::shared_ptr<RoomRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<NegotiationTracker> GetTracker() { return tracker_; }
  std::shared_ptr<RealtimeCoordinator> GetCoordinator() { return coordinator_; }

 private:
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<RoomRegistry> registry_;
  std::shared_ptr<NegotiationTracker> tracker_;
  std::shared_ptr<RelayService> relay_;
  std::shared_ptr<PresenceService> presence_;
  std::shared_ptr<CallNegotiationService> negotiation_;
  std::shared_ptr<LifecycleManager> lifecycle_;
};

}  // namespace relay
