/*
 * 설명: 명시적 퇴장과 전송 계층 연결 종료 시 룸/매핑 정리, 상대 통지, 협상 세션 종료를 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/lifecycle_test.cpp
 */
#pragma once

#include <memory>
#include <string>

#include "relay/messages.hpp"
#include "relay/negotiation_state.hpp"
#include "relay/observability.hpp"
#include "relay/presence.hpp"
#include "relay/relay.hpp"
#include "relay/room_registry.hpp"

namespace relay {

// 두 진입점 모두 멱등이다. 이미 정리된 연결에 대해서는 아무 것도 보내지 않는다.
class LifecycleManager {
 public:
  LifecycleManager(std::shared_ptr<RoomRegistry> registry, std::shared_ptr<NegotiationTracker> tracker,
                   std::shared_ptr<RelayService> relay, std::shared_ptr<PresenceService> presence,
                   std::shared_ptr<Observability> observability);

  void HandleLeave(const ConnectionId& connection, const LeaveRequest& request);
  void HandleDisconnect(const ConnectionId& connection);

 private:
  void NotifyDeparture(const ConnectionId& connection, const std::string& identity, const RoomDeparture& departure,
                       const char* reason);

  std::shared_ptr<RoomRegistry> registry_;
  std::shared_ptr<NegotiationTracker> tracker_;
  std::shared_ptr<RelayService> relay_;
  std::shared_ptr<PresenceService> presence_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace relay
