/*
 * 설명: 클라이언트 메시지 variant를 서비스 핸들러로 분기하고 서비스 간 의존성을 구성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/signaling_flow_test.cpp
 */
#include "relay/signaling_router.hpp"

#include <variant>

namespace relay {
namespace {
struct MessageVisitor {
  const ConnectionId& from;
  PresenceService& presence;
  CallNegotiationService& negotiation;
  RelayService& relay;
  LifecycleManager& lifecycle;

  void operator()(const JoinRequest& m) const { presence.HandleJoin(from, m); }
  void operator()(const AdmissionNotice& m) const { presence.HandleAdmissionNotice(from, m); }
  void operator()(const CallRequest& m) const { negotiation.HandleCallRequest(from, m); }
  void operator()(const CallAccept& m) const { negotiation.HandleCallAccept(from, m); }
  void operator()(const RenegotiationRequest& m) const { negotiation.HandleRenegotiationRequest(from, m); }
  void operator()(const RenegotiationAnswer& m) const { negotiation.HandleRenegotiationAnswer(from, m); }
  void operator()(const MediaToggle& m) const { negotiation.HandleMediaToggle(from, m); }
  void operator()(const ArtifactBroadcast& m) const { relay.HandleArtifact(from, m); }
  void operator()(const DirectedSync& m) const { relay.HandleDirectedSync(from, m); }
  void operator()(const WhiteboardBroadcast& m) const { relay.HandleWhiteboard(from, m); }
  void operator()(const LeaveRequest& m) const { lifecycle.HandleLeave(from, m); }
};
}  // namespace

SignalingRouter::SignalingRouter(std::shared_ptr<RealtimeCoordinator> coordinator,
                                 std::shared_ptr<Observability> observability)
    : coordinator_(std::move(coordinator)), observability_(std::move(observability)) {
  registry_ = std::make_shared<RoomRegistry>();
  tracker_ = std::make_shared<NegotiationTracker>();
  relay_ = std::make_shared<RelayService>(registry_, coordinator_, observability_);
  presence_ = std::make_shared<PresenceService>(registry_, relay_, observability_);
  negotiation_ = std::make_shared<CallNegotiationService>(registry_, tracker_, relay_, observability_);
  lifecycle_ = std::make_shared<LifecycleManager>(registry_, tracker_, relay_, presence_, observability_);

  std::weak_ptr<LifecycleManager> weak_lifecycle = lifecycle_;
  coordinator_->SetFaultHandler([weak_lifecycle](const ConnectionId& connection) {
    if (auto lifecycle = weak_lifecycle.lock()) {
      lifecycle->HandleDisconnect(connection);
    }
  });

  std::weak_ptr<Observability> weak_obs = observability_;
  tracker_->SetTransitionObserver(
      [weak_obs](const NegotiationSession& session, NegotiationPhase from, NegotiationPhase to) {
        auto obs = weak_obs.lock();
        if (!obs) {
          return;
        }
        obs->Log(LogContext{"info", "", std::nullopt, session.room, "negotiation.transition", 0,
                            {{"from", ToString(from)},
                             {"to", ToString(to)},
                             {"caller", session.caller},
                             {"callee", session.callee},
                             {"generation", session.generation}}});
      });
}

void SignalingRouter::Dispatch(const ConnectionId& from, const ClientMessage& message) {
  std::visit(MessageVisitor{from, *presence_, *negotiation_, *relay_, *lifecycle_}, message);
}

void SignalingRouter::HandleDisconnect(const ConnectionId& connection) { lifecycle_->HandleDisconnect(connection); }

}  // namespace relay
