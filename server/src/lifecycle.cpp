/*
 * 설명: 퇴장/연결 종료를 하나의 정리 절차로 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/lifecycle_test.cpp
 */
#include "relay/lifecycle.hpp"

namespace relay {

LifecycleManager::LifecycleManager(std::shared_ptr<RoomRegistry> registry,
                                   std::shared_ptr<NegotiationTracker> tracker, std::shared_ptr<RelayService> relay,
                                   std::shared_ptr<PresenceService> presence,
                                   std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)), tracker_(std::move(tracker)), relay_(std::move(relay)),
      presence_(std::move(presence)), observability_(std::move(observability)) {}

void LifecycleManager::HandleLeave(const ConnectionId& connection, const LeaveRequest& request) {
  // 식별자는 제거 전에 조회해야 한다.
  auto identity = registry_->LookupIdentity(connection).value_or(request.identity);
  auto departure = registry_->Leave(connection, request.room);
  if (!departure) {
    return;
  }
  NotifyDeparture(connection, identity, *departure, "leave");
}

void LifecycleManager::HandleDisconnect(const ConnectionId& connection) {
  auto identity = registry_->LookupIdentity(connection);
  auto departures = registry_->Remove(connection);
  if (!identity && departures.empty()) {
    return;
  }
  for (const auto& departure : departures) {
    NotifyDeparture(connection, identity.value_or(std::string{}), departure, "disconnect");
  }
  if (observability_) {
    observability_->Log(LogContext{"info", "", connection, std::nullopt, "lifecycle.disconnect", 0,
                                   {{"identity", identity.value_or(std::string{})}, {"rooms", departures.size()}}});
  }
}

void LifecycleManager::NotifyDeparture(const ConnectionId& connection, const std::string& identity,
                                       const RoomDeparture& departure, const char* reason) {
  auto torn_down = tracker_->Teardown(departure.room, connection);
  if (observability_) {
    nlohmann::json detail{{"identity", identity}, {"reason", reason},
                          {"remaining", departure.remaining_members.size()}};
    if (torn_down) {
      detail["negotiationGeneration"] = torn_down->generation;
    }
    observability_->Log(LogContext{"info", "", connection, departure.room, "presence.left", 0, detail});
  }

  for (const auto& member : departure.remaining_members) {
    relay_->SendTo(member.connection, events::kParticipantLeft,
                   {{"identity", identity}, {"connection", connection}, {"room", departure.room}});
  }
  if (!departure.remaining_members.empty()) {
    presence_->PublishRoster(departure.room);
  }
}

}  // namespace relay
