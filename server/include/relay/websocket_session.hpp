/*
 * 설명: WebSocket 연결의 메시지 읽기/분기, 백프레셔, 서버 이벤트 전달을 관리한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/signaling_e2e_test.cpp
 */
#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "relay/api_response.hpp"
#include "relay/observability.hpp"
#include "relay/realtime.hpp"
#include "relay/signaling_router.hpp"

namespace relay {

class WebSocketSession : public EventSink, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, ConnectionId connection_id,
                   std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<SignalingRouter> router,
                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                   std::size_t max_queue_bytes);
  ~WebSocketSession() override;
  void Run();

  // 임의 스레드에서 호출될 수 있으며 실제 쓰기는 연결의 strand에서 순서대로 수행된다.
  bool SendServerEvent(const std::string& event, const nlohmann::json& payload) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void StartClose();
  void OnDisconnected();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  ConnectionId connection_id_;
  std::shared_ptr<RealtimeCoordinator> coordinator_;
  std::shared_ptr<SignalingRouter> router_;
  std::shared_ptr<Observability> observability_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  std::atomic<bool> closing_{false};
  bool close_requested_{false};
  bool close_started_{false};
  bool disconnected_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace relay
