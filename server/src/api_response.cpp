/*
 * 설명: JSON 응답 엔벨로프와 WS 프레임을 생성하고 파싱한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "relay/api_response.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace relay {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::ostringstream ss;
  ss << std::put_time(std::gmtime(&itt), "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  if (env.type == "event") {
    j["event"] = env.event;
  } else {
    j["event"] = nullptr;
  }
  j["p"] = env.payload;
  return j;
}

std::string SerializeServerEvent(const std::string& event, const nlohmann::json& payload, std::uint64_t seq) {
  WsEnvelope env{.type = "event", .event = event, .seq = seq, .payload = payload};
  return ToWsJson(env).dump();
}

std::string SerializeServerError(std::string_view code, std::string_view message, std::uint64_t seq) {
  WsEnvelope env{.type = "error", .event = "", .seq = seq, .payload = {{"code", code}, {"message", message}}};
  return ToWsJson(env).dump();
}

std::optional<WsEnvelope> ParseClientFrame(std::string_view raw, std::uint64_t& seq, std::string& error_code,
                                           std::string& error_message) {
  seq = 0;
  auto message = nlohmann::json::parse(raw, nullptr, false);
  if (message.is_discarded() || !message.is_object()) {
    error_code = "bad_request";
    error_message = "JSON 파싱 오류";
    return std::nullopt;
  }
  auto seq_it = message.find("seq");
  if (seq_it != message.end() && seq_it->is_number_unsigned()) {
    seq = seq_it->get<std::uint64_t>();
  }
  auto type_it = message.find("t");
  if (type_it == message.end() || !type_it->is_string() || *type_it != "event") {
    error_code = "bad_request";
    error_message = "알 수 없는 메시지 유형";
    return std::nullopt;
  }
  auto event_it = message.find("event");
  if (event_it == message.end() || !event_it->is_string()) {
    error_code = "bad_request";
    error_message = "event 필드가 필요합니다";
    return std::nullopt;
  }
  auto payload_it = message.find("p");
  if (payload_it == message.end() || !payload_it->is_object()) {
    error_code = "bad_request";
    error_message = "payload가 누락되었습니다";
    return std::nullopt;
  }
  return WsEnvelope{"event", event_it->get<std::string>(), seq, *payload_it};
}

}  // namespace relay
