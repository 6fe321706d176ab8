/*
 * 설명: 식별자/연결 매핑과 룸 멤버십을 단일 뮤텍스로 보호하며 갱신한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_registry_test.cpp
 */
#include "relay/room_registry.hpp"

namespace relay {

const char* ToString(PresencePhase phase) {
  switch (phase) {
    case PresencePhase::kActive:
      return "active";
    case PresencePhase::kAdmissionPending:
      return "admission_pending";
  }
  return "unknown";
}

RegisterOutcome RoomRegistry::Register(const std::string& identity, const ConnectionId& connection,
                                       const RoomId& room) {
  std::lock_guard<std::mutex> lock(mutex_);
  RegisterOutcome outcome;

  auto identity_it = identity_to_connection_.find(identity);
  if (identity_it != identity_to_connection_.end() && identity_it->second != connection) {
    outcome.replaced_connection = identity_it->second;
  }

  // 같은 연결이 다른 식별자로 재등록되면 이전 식별자 매핑을 정리한다.
  auto conn_it = connection_to_identity_.find(connection);
  if (conn_it != connection_to_identity_.end() && conn_it->second != identity) {
    auto stale = identity_to_connection_.find(conn_it->second);
    if (stale != identity_to_connection_.end() && stale->second == connection) {
      identity_to_connection_.erase(stale);
    }
  }

  identity_to_connection_[identity] = connection;
  connection_to_identity_[connection] = identity;

  outcome.existing_members = CollectMembers(room);
  auto& members = rooms_[room];
  auto self_it = members.find(connection);
  if (self_it != members.end()) {
    outcome.already_member = true;
    for (auto it = outcome.existing_members.begin(); it != outcome.existing_members.end(); ++it) {
      if (it->connection == connection) {
        outcome.existing_members.erase(it);
        break;
      }
    }
    return outcome;
  }

  MemberState state;
  state.phase = members.empty() ? PresencePhase::kActive : PresencePhase::kAdmissionPending;
  members.emplace(connection, state);
  connection_rooms_[connection].insert(room);
  return outcome;
}

std::optional<ConnectionId> RoomRegistry::LookupConnection(const std::string& identity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = identity_to_connection_.find(identity);
  if (it == identity_to_connection_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> RoomRegistry::LookupIdentity(const ConnectionId& connection) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connection_to_identity_.find(connection);
  if (it == connection_to_identity_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<RoomMember> RoomRegistry::MembersOf(const RoomId& room) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return CollectMembers(room);
}

std::vector<RoomId> RoomRegistry::RoomsOf(const ConnectionId& connection) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connection_rooms_.find(connection);
  if (it == connection_rooms_.end()) {
    return {};
  }
  return std::vector<RoomId>(it->second.begin(), it->second.end());
}

std::optional<RoomId> RoomRegistry::SharedRoom(const ConnectionId& a, const ConnectionId& b) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto a_it = connection_rooms_.find(a);
  auto b_it = connection_rooms_.find(b);
  if (a_it == connection_rooms_.end() || b_it == connection_rooms_.end()) {
    return std::nullopt;
  }
  for (const auto& room : a_it->second) {
    if (b_it->second.count(room) > 0) {
      return room;
    }
  }
  return std::nullopt;
}

bool RoomRegistry::IsMember(const ConnectionId& connection, const RoomId& room) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(room);
  return it != rooms_.end() && it->second.count(connection) > 0;
}

void RoomRegistry::MarkActive(const ConnectionId& connection, const RoomId& room) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto room_it = rooms_.find(room);
  if (room_it == rooms_.end()) {
    return;
  }
  auto member_it = room_it->second.find(connection);
  if (member_it != room_it->second.end()) {
    member_it->second.phase = PresencePhase::kActive;
  }
}

std::optional<RoomDeparture> RoomRegistry::Leave(const ConnectionId& connection, const RoomId& room) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto room_it = rooms_.find(room);
  if (room_it == rooms_.end() || room_it->second.erase(connection) == 0) {
    return std::nullopt;
  }
  if (room_it->second.empty()) {
    rooms_.erase(room_it);
  }

  auto rooms_it = connection_rooms_.find(connection);
  if (rooms_it != connection_rooms_.end()) {
    rooms_it->second.erase(room);
    if (rooms_it->second.empty()) {
      connection_rooms_.erase(rooms_it);
      DropIdentityIfOwned(connection);
    }
  }

  return RoomDeparture{room, CollectMembers(room)};
}

std::vector<RoomDeparture> RoomRegistry::Remove(const ConnectionId& connection) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RoomDeparture> departures;
  auto rooms_it = connection_rooms_.find(connection);
  if (rooms_it != connection_rooms_.end()) {
    for (const auto& room : rooms_it->second) {
      auto room_it = rooms_.find(room);
      if (room_it == rooms_.end()) {
        continue;
      }
      room_it->second.erase(connection);
      if (room_it->second.empty()) {
        rooms_.erase(room_it);
      }
      departures.push_back(RoomDeparture{room, CollectMembers(room)});
    }
    connection_rooms_.erase(rooms_it);
  }
  DropIdentityIfOwned(connection);
  return departures;
}

std::size_t RoomRegistry::RoomCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rooms_.size();
}

std::vector<RoomMember> RoomRegistry::CollectMembers(const RoomId& room) const {
  std::vector<RoomMember> members;
  auto room_it = rooms_.find(room);
  if (room_it == rooms_.end()) {
    return members;
  }
  members.reserve(room_it->second.size());
  for (const auto& [connection, state] : room_it->second) {
    auto identity_it = connection_to_identity_.find(connection);
    std::string identity = identity_it == connection_to_identity_.end() ? std::string{} : identity_it->second;
    members.push_back(RoomMember{connection, identity, state.phase});
  }
  return members;
}

void RoomRegistry::DropIdentityIfOwned(const ConnectionId& connection) {
  auto conn_it = connection_to_identity_.find(connection);
  if (conn_it == connection_to_identity_.end()) {
    return;
  }
  // 더 최근 연결이 같은 식별자를 가져갔다면 그 매핑은 유지한다.
  auto identity_it = identity_to_connection_.find(conn_it->second);
  if (identity_it != identity_to_connection_.end() && identity_it->second == connection) {
    identity_to_connection_.erase(identity_it);
  }
  connection_to_identity_.erase(conn_it);
}

}  // namespace relay
