/*
 * 설명: 협상 메시지를 같은 룸의 상대 연결로 라우팅하고 룸별 협상 상태를 갱신한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/call_negotiation_test.cpp
 */
#include "relay/call_negotiation.hpp"

namespace relay {

CallNegotiationService::CallNegotiationService(std::shared_ptr<RoomRegistry> registry,
                                               std::shared_ptr<NegotiationTracker> tracker,
                                               std::shared_ptr<RelayService> relay,
                                               std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), tracker_(std::move(tracker)), relay_(std::move(relay)),
      observability_(std::move(observability)) {}

void CallNegotiationService::HandleCallRequest(const ConnectionId& from, const CallRequest& request) {
  auto room = ResolveRoom(from, request.to, events::kCallRequest);
  if (!room) {
    return;
  }
  std::string identity = request.identity;
  if (identity.empty()) {
    identity = registry_->LookupIdentity(from).value_or(std::string{});
  }
  if (tracker_->OnCallRequest(*room, from, request.to) &&
      (!registry_->IsMember(from, *room) || !registry_->IsMember(request.to, *room))) {
    // 룸 확인 직후 한쪽이 떠났다면 그 정리 과정은 이 세션을 보지 못했으므로 여기서 폐기한다.
    tracker_->Teardown(*room, request.to);
    return;
  }
  relay_->SendTo(request.to, events::kIncomingCall,
                 {{"from", from}, {"offer", request.offer}, {"fromIdentity", identity}});
}

void CallNegotiationService::HandleCallAccept(const ConnectionId& from, const CallAccept& accept) {
  auto room = ResolveRoom(from, accept.to, events::kCallAccept);
  if (!room) {
    return;
  }
  if (tracker_->OnCallAccept(*room, from, accept.to)) {
    registry_->MarkActive(from, *room);
    registry_->MarkActive(accept.to, *room);
  }
  relay_->SendTo(accept.to, events::kCallAccepted, {{"from", from}, {"answer", accept.answer}});
}

void CallNegotiationService::HandleRenegotiationRequest(const ConnectionId& from,
                                                        const RenegotiationRequest& request) {
  auto room = ResolveRoom(from, request.to, events::kRenegotiationRequest);
  if (!room) {
    return;
  }
  tracker_->OnRenegotiationRequest(*room, from, request.to);
  relay_->SendTo(request.to, events::kRenegotiationRequest, {{"from", from}, {"offer", request.offer}});
}

void CallNegotiationService::HandleRenegotiationAnswer(const ConnectionId& from, const RenegotiationAnswer& answer) {
  auto room = ResolveRoom(from, answer.to, events::kRenegotiationAnswer);
  if (!room) {
    return;
  }
  tracker_->OnRenegotiationAnswer(*room, from, answer.to);
  relay_->SendTo(answer.to, events::kRenegotiationAnswer, {{"from", from}, {"answer", answer.answer}});
}

void CallNegotiationService::HandleMediaToggle(const ConnectionId& from, const MediaToggle& toggle) {
  auto room = ResolveRoom(from, toggle.to, EventName(toggle.kind));
  if (!room) {
    return;
  }
  // 수신자는 identity가 추적 중인 상대와 일치하는지 확인한 뒤 UI에 반영한다.
  std::string identity = toggle.identity;
  if (identity.empty()) {
    identity = registry_->LookupIdentity(from).value_or(std::string{});
  }
  relay_->SendTo(toggle.to, EventName(toggle.kind), {{"from", from}, {"isOff", toggle.is_off}, {"identity", identity}});
}

std::optional<RoomId> CallNegotiationService::ResolveRoom(const ConnectionId& from, const ConnectionId& to,
                                                          const char* event) const {
  auto room = registry_->SharedRoom(from, to);
  if (!room && observability_) {
    observability_->IncrementDropped();
    if (observability_->Enabled(LogLevel::kDebug)) {
      observability_->Log(LogContext{"debug", "", from, std::nullopt, "negotiation.dropped", 0,
                                     {{"event", event}, {"to", to}, {"reason", "no_shared_room"}}});
    }
  }
  return room;
}

}  // namespace relay
