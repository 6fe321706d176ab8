/*
 * 설명: 시그널링 이벤트 이름과 클라이언트 메시지의 타입별 페이로드(variant)를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_parse_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "relay/room_registry.hpp"

namespace relay {

namespace events {
// client -> server
inline constexpr const char* kJoin = "join";
inline constexpr const char* kCallRequest = "call-request";
inline constexpr const char* kCallAccept = "call-accept";
inline constexpr const char* kRenegotiationRequest = "renegotiation-request";
inline constexpr const char* kRenegotiationAnswer = "renegotiation-answer";
inline constexpr const char* kVideoToggle = "video-toggle";
inline constexpr const char* kAudioToggle = "audio-toggle";
inline constexpr const char* kCodeBroadcast = "code-broadcast";
inline constexpr const char* kLanguageBroadcast = "language-broadcast";
inline constexpr const char* kOutputBroadcast = "output-broadcast";
inline constexpr const char* kSyncToConnection = "sync-to-connection";
inline constexpr const char* kWhiteboardUpdate = "whiteboard-update";
inline constexpr const char* kWhiteboardClear = "whiteboard-clear";
inline constexpr const char* kLeave = "leave";
inline constexpr const char* kWaitForAdmission = "wait-for-admission";

// server -> client
inline constexpr const char* kJoined = "joined";
inline constexpr const char* kParticipantJoined = "participant-joined";
inline constexpr const char* kParticipantLeft = "participant-left";
inline constexpr const char* kRoomRoster = "room-roster";
inline constexpr const char* kIncomingCall = "incoming-call";
inline constexpr const char* kCallAccepted = "call-accepted";
}  // namespace events

struct JoinRequest {
  std::string identity;
  RoomId room;
};

struct AdmissionNotice {
  ConnectionId to;
  std::string identity;
};

struct CallRequest {
  ConnectionId to;
  nlohmann::json offer;
  std::string identity;
};

struct CallAccept {
  ConnectionId to;
  nlohmann::json answer;
};

struct RenegotiationRequest {
  ConnectionId to;
  nlohmann::json offer;
};

struct RenegotiationAnswer {
  ConnectionId to;
  nlohmann::json answer;
};

enum class MediaKind { kVideo, kAudio };

struct MediaToggle {
  MediaKind kind;
  ConnectionId to;
  bool is_off;
  std::string identity;
};

enum class ArtifactKind { kCode, kLanguage, kOutput };

// 코드/언어/실행 결과 갱신. payload는 받은 그대로 전달한다.
struct ArtifactBroadcast {
  ArtifactKind kind;
  RoomId room;
  nlohmann::json payload;
};

struct DirectedSync {
  ConnectionId target;
  nlohmann::json payload;
};

struct WhiteboardBroadcast {
  bool clear;
  RoomId room;
  nlohmann::json payload;
};

struct LeaveRequest {
  RoomId room;
  std::string identity;
};

using ClientMessage = std::variant<JoinRequest, AdmissionNotice, CallRequest, CallAccept, RenegotiationRequest,
                                   RenegotiationAnswer, MediaToggle, ArtifactBroadcast, DirectedSync,
                                   WhiteboardBroadcast, LeaveRequest>;

const char* EventName(MediaKind kind);
const char* EventName(ArtifactKind kind);

std::optional<ClientMessage> ParseClientMessage(const std::string& event, const nlohmann::json& payload,
                                                std::string& error_code, std::string& error_message);

}  // namespace relay
