/*
 * 설명: 참가자 식별자와 연결 핸들의 양방향 매핑 및 룸별 멤버 집합을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/room_registry_test.cpp
 */
#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace relay {

using ConnectionId = std::string;
using RoomId = std::string;

enum class PresencePhase { kActive, kAdmissionPending };

const char* ToString(PresencePhase phase);

struct RoomMember {
  ConnectionId connection;
  std::string identity;
  PresencePhase phase{PresencePhase::kActive};
};

struct RegisterOutcome {
  // 등록 직전에 룸에 있던 다른 멤버들
  std::vector<RoomMember> existing_members;
  bool already_member{false};
  // 같은 식별자로 먼저 등록되어 있던 연결 (last-writer-wins로 덮어씀)
  std::optional<ConnectionId> replaced_connection;
};

struct RoomDeparture {
  RoomId room;
  std::vector<RoomMember> remaining_members;
};

// 룸은 멤버가 하나 이상일 때만 존재한다. 빈 멤버 집합은 곧바로 삭제된다.
class RoomRegistry {
 public:
  RegisterOutcome Register(const std::string& identity, const ConnectionId& connection, const RoomId& room);

  std::optional<ConnectionId> LookupConnection(const std::string& identity) const;
  std::optional<std::string> LookupIdentity(const ConnectionId& connection) const;
  std::vector<RoomMember> MembersOf(const RoomId& room) const;
  std::vector<RoomId> RoomsOf(const ConnectionId& connection) const;
  std::optional<RoomId> SharedRoom(const ConnectionId& a, const ConnectionId& b) const;
  bool IsMember(const ConnectionId& connection, const RoomId& room) const;

  void MarkActive(const ConnectionId& connection, const RoomId& room);

  std::optional<RoomDeparture> Leave(const ConnectionId& connection, const RoomId& room);
  std::vector<RoomDeparture> Remove(const ConnectionId& connection);

  std::size_t RoomCount() const;

 private:
  struct MemberState {
    PresencePhase phase{PresencePhase::kActive};
  };

  std::vector<RoomMember> CollectMembers(const RoomId& room) const;
  void DropIdentityIfOwned(const ConnectionId& connection);

  std::unordered_map<std::string, ConnectionId> identity_to_connection_;
  std::unordered_map<ConnectionId, std::string> connection_to_identity_;
  std::unordered_map<RoomId, std::unordered_map<ConnectionId, MemberState>> rooms_;
  std::unordered_map<ConnectionId, std::unordered_set<RoomId>> connection_rooms_;
  mutable std::mutex mutex_;
};

}  // namespace relay
