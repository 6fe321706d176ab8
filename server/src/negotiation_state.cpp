/*
 * 설명: 협상 상태 전이 규칙을 적용하고 전이 관찰자에게 통지한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/negotiation_state_test.cpp
 */
#include "relay/negotiation_state.hpp"

#include <utility>
#include <vector>

namespace relay {

const char* ToString(NegotiationPhase phase) {
  switch (phase) {
    case NegotiationPhase::kIdle:
      return "idle";
    case NegotiationPhase::kOfferSent:
      return "offer_sent";
    case NegotiationPhase::kAnswerSent:
      return "answer_sent";
    case NegotiationPhase::kConnected:
      return "connected";
    case NegotiationPhase::kRenegotiating:
      return "renegotiating";
    case NegotiationPhase::kTornDown:
      return "torn_down";
  }
  return "unknown";
}

void NegotiationTracker::SetTransitionObserver(TransitionObserver observer) {
  std::lock_guard<std::mutex> lock(mutex_);
  observer_ = std::move(observer);
}

bool NegotiationTracker::OnCallRequest(const RoomId& room, const ConnectionId& from, const ConnectionId& to) {
  std::vector<Transition> transitions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(room);
    if (it != sessions_.end()) {
      const bool established = it->second.phase == NegotiationPhase::kConnected ||
                               it->second.phase == NegotiationPhase::kRenegotiating;
      // 제3자는 이미 연결된 두 피어의 세션을 빼앗을 수 없다.
      if (established && !it->second.IsPair(from, to)) {
        return false;
      }
      // 그 외의 새 call-request는 기존 세션을 폐기하고 Idle에서 다시 시작한다.
      Advance(it->second, NegotiationPhase::kTornDown, transitions);
      sessions_.erase(it);
    }
    NegotiationSession session;
    session.room = room;
    session.caller = from;
    session.callee = to;
    session.generation = next_generation_++;
    Advance(session, NegotiationPhase::kOfferSent, transitions);
    sessions_.emplace(room, std::move(session));
  }
  Notify(transitions);
  return true;
}

bool NegotiationTracker::OnCallAccept(const RoomId& room, const ConnectionId& from, const ConnectionId& to) {
  std::vector<Transition> transitions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(room);
    if (it == sessions_.end()) {
      return false;
    }
    auto& session = it->second;
    if (session.phase != NegotiationPhase::kOfferSent || session.callee != from || session.caller != to) {
      return false;
    }
    // ICE 완료는 시그널링 계층에서 보이지 않으므로 answer 수신 즉시 Connected로 본다.
    Advance(session, NegotiationPhase::kAnswerSent, transitions);
    Advance(session, NegotiationPhase::kConnected, transitions);
  }
  Notify(transitions);
  return true;
}

bool NegotiationTracker::OnRenegotiationRequest(const RoomId& room, const ConnectionId& from,
                                                const ConnectionId& to) {
  std::vector<Transition> transitions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(room);
    if (it == sessions_.end()) {
      return false;
    }
    auto& session = it->second;
    if (session.phase != NegotiationPhase::kConnected || !session.IsPair(from, to)) {
      return false;
    }
    session.renegotiation_initiator = from;
    Advance(session, NegotiationPhase::kRenegotiating, transitions);
  }
  Notify(transitions);
  return true;
}

bool NegotiationTracker::OnRenegotiationAnswer(const RoomId& room, const ConnectionId& from,
                                               const ConnectionId& to) {
  std::vector<Transition> transitions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(room);
    if (it == sessions_.end()) {
      return false;
    }
    auto& session = it->second;
    if (session.phase != NegotiationPhase::kRenegotiating || !session.IsPair(from, to) ||
        session.renegotiation_initiator != to) {
      return false;
    }
    session.renegotiation_initiator.reset();
    Advance(session, NegotiationPhase::kConnected, transitions);
  }
  Notify(transitions);
  return true;
}

std::optional<NegotiationSession> NegotiationTracker::Teardown(const RoomId& room, const ConnectionId& departing) {
  std::vector<Transition> transitions;
  std::optional<NegotiationSession> torn_down;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(room);
    if (it == sessions_.end() || !it->second.Involves(departing)) {
      return std::nullopt;
    }
    Advance(it->second, NegotiationPhase::kTornDown, transitions);
    torn_down = std::move(it->second);
    sessions_.erase(it);
  }
  Notify(transitions);
  return torn_down;
}

NegotiationPhase NegotiationTracker::PhaseOf(const RoomId& room) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(room);
  return it == sessions_.end() ? NegotiationPhase::kIdle : it->second.phase;
}

std::optional<NegotiationSession> NegotiationTracker::Find(const RoomId& room) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(room);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t NegotiationTracker::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

void NegotiationTracker::Advance(NegotiationSession& session, NegotiationPhase to, std::vector<Transition>& out) {
  auto from = session.phase;
  session.phase = to;
  out.push_back(Transition{session, from, to});
}

void NegotiationTracker::Notify(const std::vector<Transition>& transitions) const {
  TransitionObserver observer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    observer = observer_;
  }
  if (!observer) {
    return;
  }
  for (const auto& t : transitions) {
    observer(t.session, t.from, t.to);
  }
}

}  // namespace relay
