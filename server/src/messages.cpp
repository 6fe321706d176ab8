/*
 * 설명: 이벤트 이름과 JSON payload를 타입별 클라이언트 메시지로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_parse_test.cpp
 */
#include "relay/messages.hpp"

namespace relay {
namespace {
bool RequireString(const nlohmann::json& payload, const char* key, std::string& out, std::string& error_code,
                   std::string& error_message) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
    error_code = "bad_request";
    error_message = std::string(key) + " 필드가 필요합니다";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

// 식별자는 토글/통화 요청에서 부가 정보일 뿐이므로 없으면 빈 문자열로 둔다.
std::string OptionalString(const nlohmann::json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

nlohmann::json OpaqueField(const nlohmann::json& payload, const char* key) {
  auto it = payload.find(key);
  return it == payload.end() ? nlohmann::json(nullptr) : *it;
}

std::optional<ClientMessage> ParseToggle(MediaKind kind, const nlohmann::json& payload, std::string& error_code,
                                         std::string& error_message) {
  MediaToggle toggle{kind, {}, false, OptionalString(payload, "identity")};
  if (!RequireString(payload, "to", toggle.to, error_code, error_message)) {
    return std::nullopt;
  }
  auto it = payload.find("isOff");
  if (it == payload.end() || !it->is_boolean()) {
    error_code = "bad_request";
    error_message = "isOff 필드가 필요합니다";
    return std::nullopt;
  }
  toggle.is_off = it->get<bool>();
  return toggle;
}

std::optional<ClientMessage> ParseArtifact(ArtifactKind kind, const nlohmann::json& payload,
                                           std::string& error_code, std::string& error_message) {
  ArtifactBroadcast broadcast{kind, {}, payload};
  if (!RequireString(payload, "room", broadcast.room, error_code, error_message)) {
    return std::nullopt;
  }
  return broadcast;
}

std::optional<ClientMessage> ParseWhiteboard(bool clear, const nlohmann::json& payload, std::string& error_code,
                                             std::string& error_message) {
  WhiteboardBroadcast broadcast{clear, {}, payload};
  if (!RequireString(payload, "room", broadcast.room, error_code, error_message)) {
    return std::nullopt;
  }
  if (!clear) {
    auto it = payload.find("strokes");
    if (it == payload.end() || !it->is_array()) {
      error_code = "bad_request";
      error_message = "strokes 배열이 필요합니다";
      return std::nullopt;
    }
  }
  return broadcast;
}
}  // namespace

const char* EventName(MediaKind kind) {
  return kind == MediaKind::kVideo ? events::kVideoToggle : events::kAudioToggle;
}

const char* EventName(ArtifactKind kind) {
  switch (kind) {
    case ArtifactKind::kCode:
      return events::kCodeBroadcast;
    case ArtifactKind::kLanguage:
      return events::kLanguageBroadcast;
    case ArtifactKind::kOutput:
      return events::kOutputBroadcast;
  }
  return events::kCodeBroadcast;
}

std::optional<ClientMessage> ParseClientMessage(const std::string& event, const nlohmann::json& payload,
                                                std::string& error_code, std::string& error_message) {
  if (!payload.is_object()) {
    error_code = "bad_request";
    error_message = "payload가 누락되었습니다";
    return std::nullopt;
  }

  if (event == events::kJoin) {
    JoinRequest req;
    if (!RequireString(payload, "identity", req.identity, error_code, error_message) ||
        !RequireString(payload, "room", req.room, error_code, error_message)) {
      return std::nullopt;
    }
    return req;
  }
  if (event == events::kWaitForAdmission) {
    AdmissionNotice notice{{}, OptionalString(payload, "identity")};
    if (!RequireString(payload, "to", notice.to, error_code, error_message)) {
      return std::nullopt;
    }
    return notice;
  }
  if (event == events::kCallRequest) {
    CallRequest req{{}, OpaqueField(payload, "offer"), OptionalString(payload, "identity")};
    if (!RequireString(payload, "to", req.to, error_code, error_message)) {
      return std::nullopt;
    }
    return req;
  }
  if (event == events::kCallAccept) {
    CallAccept req{{}, OpaqueField(payload, "answer")};
    if (!RequireString(payload, "to", req.to, error_code, error_message)) {
      return std::nullopt;
    }
    return req;
  }
  if (event == events::kRenegotiationRequest) {
    RenegotiationRequest req{{}, OpaqueField(payload, "offer")};
    if (!RequireString(payload, "to", req.to, error_code, error_message)) {
      return std::nullopt;
    }
    return req;
  }
  if (event == events::kRenegotiationAnswer) {
    RenegotiationAnswer req{{}, OpaqueField(payload, "answer")};
    if (!RequireString(payload, "to", req.to, error_code, error_message)) {
      return std::nullopt;
    }
    return req;
  }
  if (event == events::kVideoToggle) {
    return ParseToggle(MediaKind::kVideo, payload, error_code, error_message);
  }
  if (event == events::kAudioToggle) {
    return ParseToggle(MediaKind::kAudio, payload, error_code, error_message);
  }
  if (event == events::kCodeBroadcast) {
    return ParseArtifact(ArtifactKind::kCode, payload, error_code, error_message);
  }
  if (event == events::kLanguageBroadcast) {
    return ParseArtifact(ArtifactKind::kLanguage, payload, error_code, error_message);
  }
  if (event == events::kOutputBroadcast) {
    return ParseArtifact(ArtifactKind::kOutput, payload, error_code, error_message);
  }
  if (event == events::kSyncToConnection) {
    DirectedSync sync{{}, OpaqueField(payload, "payload")};
    if (!RequireString(payload, "targetConnection", sync.target, error_code, error_message)) {
      return std::nullopt;
    }
    if (!sync.payload.is_object()) {
      error_code = "bad_request";
      error_message = "payload 객체가 필요합니다";
      return std::nullopt;
    }
    return sync;
  }
  if (event == events::kWhiteboardUpdate) {
    return ParseWhiteboard(false, payload, error_code, error_message);
  }
  if (event == events::kWhiteboardClear) {
    return ParseWhiteboard(true, payload, error_code, error_message);
  }
  if (event == events::kLeave) {
    LeaveRequest req{{}, OptionalString(payload, "identity")};
    if (!RequireString(payload, "room", req.room, error_code, error_message)) {
      return std::nullopt;
    }
    return req;
  }

  error_code = "bad_request";
  error_message = "알 수 없는 이벤트";
  return std::nullopt;
}

}  // namespace relay
