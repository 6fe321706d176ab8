/*
 * 설명: REST 응답 엔벨로프와 WS 프레임({t, event, seq, p})의 직렬화/파싱을 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace relay {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

struct WsEnvelope {
  std::string type;
  std::string event;
  std::uint64_t seq;
  nlohmann::json payload;
};

nlohmann::json ToWsJson(const WsEnvelope& env);
std::string SerializeServerEvent(const std::string& event, const nlohmann::json& payload, std::uint64_t seq = 0);
std::string SerializeServerError(std::string_view code, std::string_view message, std::uint64_t seq);

// 클라이언트 프레임은 t == "event"이고 event 이름과 객체 payload(p)를 가져야 한다.
// 실패 시 seq는 가능한 범위에서 채워져 오류 응답에 사용된다.
std::optional<WsEnvelope> ParseClientFrame(std::string_view raw, std::uint64_t& seq, std::string& error_code,
                                           std::string& error_message);

}  // namespace relay
