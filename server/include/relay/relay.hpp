/*
 * 설명: 공유 임시 상태(코드, 언어, 실행 결과, 화이트보드)를 룸 멤버에게 그대로 중계한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/relay_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "relay/messages.hpp"
#include "relay/observability.hpp"
#include "relay/realtime.hpp"
#include "relay/room_registry.hpp"

namespace relay {

// 서버는 아티팩트 사본을 보관하지 않으며 diff/배치/중복 제거도 하지 않는다.
class RelayService {
 public:
  RelayService(std::shared_ptr<RoomRegistry> registry, std::shared_ptr<RealtimeCoordinator> coordinator,
               std::shared_ptr<Observability> observability);

  // 발신자를 제외한 룸 멤버 전원에게 전달하고 전달 성공 수를 반환한다.
  std::size_t Broadcast(const RoomId& room, const ConnectionId& sender, const std::string& event,
                        const nlohmann::json& payload);
  bool SendTo(const ConnectionId& target, const std::string& event, const nlohmann::json& payload);

  void HandleArtifact(const ConnectionId& sender, const ArtifactBroadcast& message);
  void HandleWhiteboard(const ConnectionId& sender, const WhiteboardBroadcast& message);
  void HandleDirectedSync(const ConnectionId& sender, const DirectedSync& message);

 private:
  void LogDrop(const ConnectionId& target, const std::string& event, const char* reason) const;

  std::shared_ptr<RoomRegistry> registry_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace relay
