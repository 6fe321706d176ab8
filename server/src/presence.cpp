/*
 * 설명: 입장 요청을 등록하고 입장자/기존 멤버에게 각각 알림을 보낸다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/presence_test.cpp
 */
#include "relay/presence.hpp"

namespace relay {

PresenceService::PresenceService(std::shared_ptr<RoomRegistry> registry, std::shared_ptr<RelayService> relay,
                                 std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), relay_(std::move(relay)), observability_(std::move(observability)) {}

void PresenceService::HandleJoin(const ConnectionId& connection, const JoinRequest& request) {
  auto outcome = registry_->Register(request.identity, connection, request.room);
  if (observability_) {
    nlohmann::json detail{{"identity", request.identity}, {"existingMembers", outcome.existing_members.size()}};
    if (outcome.replaced_connection) {
      detail["replacedConnection"] = *outcome.replaced_connection;
    }
    observability_->Log(LogContext{"info", "", connection, request.room, "presence.join", 0, detail});
  }

  // 입장자는 자신의 입장 확인과 다른 참가자의 입장을 구분할 수 있어야 한다.
  relay_->SendTo(connection, events::kJoined,
                 {{"identity", request.identity}, {"room", request.room}, {"connection", connection}});

  if (outcome.already_member) {
    return;
  }

  for (const auto& member : outcome.existing_members) {
    relay_->SendTo(member.connection, events::kParticipantJoined,
                   {{"identity", request.identity}, {"connection", connection}, {"room", request.room}});
  }

  if (!outcome.existing_members.empty()) {
    const auto& host = outcome.existing_members.front();
    relay_->SendTo(connection, events::kWaitForAdmission,
                   {{"fromIdentity", host.identity}, {"from", host.connection}, {"room", request.room}});
  }

  PublishRoster(request.room);
}

void PresenceService::HandleAdmissionNotice(const ConnectionId& connection, const AdmissionNotice& notice) {
  auto room = registry_->SharedRoom(connection, notice.to);
  if (!room) {
    if (observability_) {
      observability_->IncrementDropped();
    }
    return;
  }
  std::string identity = notice.identity;
  if (identity.empty()) {
    identity = registry_->LookupIdentity(connection).value_or(std::string{});
  }
  relay_->SendTo(notice.to, events::kWaitForAdmission,
                 {{"fromIdentity", identity}, {"from", connection}, {"room", *room}});
}

void PresenceService::PublishRoster(const RoomId& room) {
  auto roster = BuildRoster(room);
  // 명단은 입장자를 포함한 전원에게 보내므로 발신자 제외 없이 빈 발신자로 브로드캐스트한다.
  relay_->Broadcast(room, ConnectionId{}, events::kRoomRoster, roster);
}

nlohmann::json PresenceService::BuildRoster(const RoomId& room) const {
  nlohmann::json members = nlohmann::json::array();
  for (const auto& member : registry_->MembersOf(room)) {
    members.push_back(
        {{"connection", member.connection}, {"identity", member.identity}, {"phase", ToString(member.phase)}});
  }
  return {{"room", room}, {"members", members}};
}

}  // namespace relay
