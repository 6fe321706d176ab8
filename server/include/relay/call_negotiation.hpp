/*
 * 설명: 두 참가자 사이의 WebRTC offer/answer/재협상 메시지와 미디어 토글을 상대에게 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/call_negotiation_test.cpp
 */
#pragma once

#include <memory>
#include <optional>

#include "relay/messages.hpp"
#include "relay/negotiation_state.hpp"
#include "relay/observability.hpp"
#include "relay/relay.hpp"
#include "relay/room_registry.hpp"

namespace relay {

// SDP/ICE 내용은 검사하지 않는다. 대상이 같은 룸에 있으면 그대로 전달하고,
// 대상이 없으면 조용히 버린다. 순서가 어긋난 메시지는 전달하되 상태는 바꾸지 않는다.
class CallNegotiationService {
 public:
  CallNegotiationService(std::shared_ptr<RoomRegistry> registry, std::shared_ptr<NegotiationTracker> tracker,
                         std::shared_ptr<RelayService> relay, std::shared_ptr<Observability> observability);

  void HandleCallRequest(const ConnectionId& from, const CallRequest& request);
  void HandleCallAccept(const ConnectionId& from, const CallAccept& accept);
  void HandleRenegotiationRequest(const ConnectionId& from, const RenegotiationRequest& request);
  void HandleRenegotiationAnswer(const ConnectionId& from, const RenegotiationAnswer& answer);
  void HandleMediaToggle(const ConnectionId& from, const MediaToggle& toggle);

 private:
  std::optional<RoomId> ResolveRoom(const ConnectionId& from, const ConnectionId& to, const char* event) const;

  std::shared_ptr<RoomRegistry> registry_;
  std::shared_ptr<NegotiationTracker> tracker_;
  std::shared_ptr<RelayService> relay_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace relay
