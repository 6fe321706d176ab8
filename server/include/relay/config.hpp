/*
 * 설명: 시그널링 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/signaling_e2e_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace relay {

struct AppConfig {
  std::string address;
  unsigned short port;
  std::string log_level;
  std::size_t worker_threads;
  std::size_t ws_queue_limit_messages;
  std::size_t ws_queue_limit_bytes;
  std::size_t ws_max_message_bytes;
};

AppConfig LoadConfigFromEnv();

}  // namespace relay
