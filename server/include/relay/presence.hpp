/*
 * 설명: 룸 입장 알림, 입장 승인 대기 안내, 참가자 명단 전파를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/presence_test.cpp
 */
#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include "relay/messages.hpp"
#include "relay/observability.hpp"
#include "relay/relay.hpp"
#include "relay/room_registry.hpp"

namespace relay {

// 승인(admit) 여부는 클라이언트 UI가 결정한다. 이 서비스는 안내 메시지만 전달하며
// call-request를 승인 여부로 막지 않는다.
class PresenceService {
 public:
  PresenceService(std::shared_ptr<RoomRegistry> registry, std::shared_ptr<RelayService> relay,
                  std::shared_ptr<Observability> observability);

  void HandleJoin(const ConnectionId& connection, const JoinRequest& request);
  void HandleAdmissionNotice(const ConnectionId& connection, const AdmissionNotice& notice);
  void PublishRoster(const RoomId& room);

 private:
  nlohmann::json BuildRoster(const RoomId& room) const;

  std::shared_ptr<RoomRegistry> registry_;
  std::shared_ptr<RelayService> relay_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace relay
