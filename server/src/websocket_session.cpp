/*
 * 설명: WebSocket 프레임을 읽어 시그널링 메시지로 분기하고, 연결별 송신 큐로 서버 이벤트를 전달한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/signaling_e2e_test.cpp
 */
#include "relay/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

#include "relay/messages.hpp"

namespace relay {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   ConnectionId connection_id, std::shared_ptr<RealtimeCoordinator> coordinator,
                                   std::shared_ptr<SignalingRouter> router,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), connection_id_(std::move(connection_id)), coordinator_(std::move(coordinator)),
      router_(std::move(router)), observability_(std::move(observability)),
      max_queue_messages_(max_queue_messages), max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() { coordinator_->Unregister(connection_id_, this); }

void WebSocketSession::Run() {
  coordinator_->Register(connection_id_, shared_from_this());
  if (observability_) {
    observability_->Log(LogContext{"info", "", connection_id_, std::nullopt, "ws.connected", 0});
  }
  DoRead();
}

void WebSocketSession::DoRead() {
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec || closing_) {
    return OnDisconnected();
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());

  std::uint64_t seq = 0;
  std::string error_code;
  std::string error_message;
  auto frame = ParseClientFrame(data, seq, error_code, error_message);
  if (!frame) {
    SendError(error_code, error_message, seq);
    return DoRead();
  }
  auto message = ParseClientMessage(frame->event, frame->payload, error_code, error_message);
  if (!message) {
    SendError(error_code, error_message, seq);
    return DoRead();
  }

  try {
    router_->Dispatch(connection_id_, *message);
  } catch (const std::exception& ex) {
    // 한 메시지 처리 실패가 연결 전체를 끊지 않도록 오류 응답만 보낸다.
    if (observability_) {
      observability_->Log(LogContext{"error", "", connection_id_, std::nullopt, "ws.dispatch_failed", 0,
                                     {{"event", frame->event}, {"what", ex.what()}}});
    }
    SendError("internal_error", "메시지 처리 중 오류가 발생했습니다", seq);
  }

  if (!closing_) {
    DoRead();
  } else {
    OnDisconnected();
  }
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  EnqueueMessage(SerializeServerError(code, message, seq));
}

bool WebSocketSession::SendServerEvent(const std::string& event, const nlohmann::json& payload) {
  if (closing_) {
    return false;
  }
  auto message = SerializeServerEvent(event, payload);
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), message = std::move(message)]() mutable {
    self->EnqueueMessage(std::move(message));
  });
  return true;
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    return OnDisconnected();
  }
  if (close_requested_) {
    return StartClose();
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_.exchange(true)) {
    return;
  }
  // 진행 중인 쓰기의 버퍼(front)는 완료될 때까지 유지해야 한다.
  while (send_queue_.size() > (writing_ ? 1u : 0u)) {
    send_queue_.pop_back();
  }
  queued_bytes_ = send_queue_.empty() ? 0 : send_queue_.front().size();
  if (observability_) {
    observability_->Log(LogContext{"warn", "", connection_id_, std::nullopt, "ws.backpressure_close", 0});
  }
  close_requested_ = true;
  if (!writing_) {
    StartClose();
  }
}

void WebSocketSession::StartClose() {
  if (close_started_) {
    return;
  }
  close_started_ = true;
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) { self->OnDisconnected(); });
}

void WebSocketSession::OnDisconnected() {
  // 읽기 오류, 쓰기 오류, 백프레셔 종료 중 어느 경로로 와도 정리는 한 번만 한다.
  if (disconnected_) {
    return;
  }
  disconnected_ = true;
  closing_ = true;
  coordinator_->Unregister(connection_id_, this);
  router_->HandleDisconnect(connection_id_);
  if (observability_) {
    observability_->Log(LogContext{"info", "", connection_id_, std::nullopt, "ws.disconnected", 0});
  }
}

}  // namespace relay
