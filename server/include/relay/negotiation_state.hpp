/*
 * 설명: 룸별 WebRTC 협상 세션(offer/answer/재협상) 상태를 추적한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/negotiation_state_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "relay/room_registry.hpp"

namespace relay {

enum class NegotiationPhase { kIdle, kOfferSent, kAnswerSent, kConnected, kRenegotiating, kTornDown };

const char* ToString(NegotiationPhase phase);

struct NegotiationSession {
  RoomId room;
  ConnectionId caller;
  ConnectionId callee;
  NegotiationPhase phase{NegotiationPhase::kIdle};
  std::uint64_t generation{0};
  std::optional<ConnectionId> renegotiation_initiator;

  bool Involves(const ConnectionId& connection) const { return caller == connection || callee == connection; }
  bool IsPair(const ConnectionId& a, const ConnectionId& b) const {
    return (caller == a && callee == b) || (caller == b && callee == a);
  }
};

// 서버 측 세션은 중계용 라벨일 뿐이며 실제 협상 상태는 각 피어의 WebRTC 스택에 있다.
// 순서가 맞지 않는 메시지는 상태를 바꾸지 않고 false를 반환한다.
class NegotiationTracker {
 public:
  using TransitionObserver =
      std::function<void(const NegotiationSession& session, NegotiationPhase from, NegotiationPhase to)>;

  void SetTransitionObserver(TransitionObserver observer);

  // 연결된 세션은 같은 두 피어의 새 offer로만 대체된다. 대체하지 않으면 false를 반환한다.
  bool OnCallRequest(const RoomId& room, const ConnectionId& from, const ConnectionId& to);
  bool OnCallAccept(const RoomId& room, const ConnectionId& from, const ConnectionId& to);
  bool OnRenegotiationRequest(const RoomId& room, const ConnectionId& from, const ConnectionId& to);
  bool OnRenegotiationAnswer(const RoomId& room, const ConnectionId& from, const ConnectionId& to);
  std::optional<NegotiationSession> Teardown(const RoomId& room, const ConnectionId& departing);

  NegotiationPhase PhaseOf(const RoomId& room) const;
  std::optional<NegotiationSession> Find(const RoomId& room) const;
  std::size_t ActiveCount() const;

 private:
  struct Transition {
    NegotiationSession session;
    NegotiationPhase from;
    NegotiationPhase to;
  };

  static void Advance(NegotiationSession& session, NegotiationPhase to, std::vector<Transition>& out);
  void Notify(const std::vector<Transition>& transitions) const;

  std::unordered_map<RoomId, NegotiationSession> sessions_;
  std::uint64_t next_generation_{1};
  TransitionObserver observer_;
  mutable std::mutex mutex_;
};

}  // namespace relay
