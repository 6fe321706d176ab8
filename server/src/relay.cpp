/*
 * 설명: 룸 단위 브로드캐스트(발신자 제외)와 단일 연결 지정 전달을 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_test.cpp
 */
#include "relay/relay.hpp"

namespace relay {

RelayService::RelayService(std::shared_ptr<RoomRegistry> registry, std::shared_ptr<RealtimeCoordinator> coordinator,
                           std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), coordinator_(std::move(coordinator)),
      observability_(std::move(observability)) {}

std::size_t RelayService::Broadcast(const RoomId& room, const ConnectionId& sender, const std::string& event,
                                    const nlohmann::json& payload) {
  // 멤버 목록은 스냅샷이므로 전달 중 다른 연결이 끊겨도 나머지 수신자에게는 계속 전달한다.
  auto members = registry_->MembersOf(room);
  std::size_t delivered = 0;
  for (const auto& member : members) {
    if (member.connection == sender) {
      continue;
    }
    if (SendTo(member.connection, event, payload)) {
      ++delivered;
    }
  }
  return delivered;
}

bool RelayService::SendTo(const ConnectionId& target, const std::string& event, const nlohmann::json& payload) {
  auto status = coordinator_->SendEventToConnection(target, event, payload);
  if (status == DeliveryStatus::kDelivered) {
    if (observability_) {
      observability_->IncrementRelayed();
    }
    return true;
  }
  LogDrop(target, event, status == DeliveryStatus::kNoTarget ? "no_target" : "transport_fault");
  return false;
}

void RelayService::HandleArtifact(const ConnectionId& sender, const ArtifactBroadcast& message) {
  Broadcast(message.room, sender, EventName(message.kind), message.payload);
}

void RelayService::HandleWhiteboard(const ConnectionId& sender, const WhiteboardBroadcast& message) {
  Broadcast(message.room, sender, message.clear ? events::kWhiteboardClear : events::kWhiteboardUpdate,
            message.payload);
}

void RelayService::HandleDirectedSync(const ConnectionId& sender, const DirectedSync& message) {
  if (!registry_->SharedRoom(sender, message.target)) {
    LogDrop(message.target, events::kSyncToConnection, "no_shared_room");
    return;
  }
  // 늦게 들어온 참가자는 일반 코드 갱신과 같은 이벤트로 현재 버퍼를 받는다.
  SendTo(message.target, events::kCodeBroadcast, message.payload);
}

void RelayService::LogDrop(const ConnectionId& target, const std::string& event, const char* reason) const {
  if (!observability_) {
    return;
  }
  observability_->IncrementDropped();
  if (observability_->Enabled(LogLevel::kDebug)) {
    observability_->Log(
        LogContext{"debug", "", target, std::nullopt, "relay.dropped", 0, {{"event", event}, {"reason", reason}}});
  }
}

}  // namespace relay
