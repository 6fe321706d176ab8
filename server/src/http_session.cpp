/*
 * 설명: HTTP 요청을 처리하고 헬스/메트릭/WS 업그레이드를 분기한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/signaling_e2e_test.cpp
 */
#include "relay/http_session.hpp"

#include <string_view>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "relay/websocket_session.hpp"

namespace relay {

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<RealtimeCoordinator> coordinator, std::shared_ptr<SignalingRouter> router,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), coordinator_(std::move(coordinator)), router_(std::move(router)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  std::string_view target{req_.target().data(), req_.target().size()};
  if (boost::beast::websocket::is_upgrade(req_) && target.substr(0, target.find('?')) == "/ws") {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "collab-relay");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() == http::verb::get && path == "/api/health") {
    nlohmann::json payload{{"status", "ok"}, {"version", "v1.0.0"}};
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(payload));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot =
        observability_->Snapshot(router_->GetRegistry()->RoomCount(), router_->GetTracker()->ActiveCount());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"relay", {{"delivered", snapshot.messages_relayed}, {"dropped", snapshot.messages_dropped}}},
                        {"rooms", {{"active", snapshot.active_rooms}}},
                        {"negotiations", {{"active", snapshot.active_negotiations}}}};
    return WriteJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  WriteJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::WriteJson(const std::shared_ptr<Response>& res, boost::beast::http::status status,
                            const nlohmann::json& body) {
  res->result(status);
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{"info", trace_id_, std::nullopt, std::nullopt, std::string(req_.target()), latency});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  // 참가자 인증은 범위 밖이므로 업그레이드 요청은 모두 수락한다.
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  // HTTP 읽기용 타임아웃을 해제하고 WS 자체 타임아웃 정책을 쓴다.
  boost::beast::get_lowest_layer(ws).expires_never();
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "collab-relay");
  }));
  ws.read_message_max(config_.ws_max_message_bytes);
  try {
    ws.accept(req_);
    std::make_shared<WebSocketSession>(std::move(ws), coordinator_->NextConnectionId(), coordinator_, router_,
                                       observability_, config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
        ->Run();
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Log(LogContext{"warn", "", std::nullopt, std::nullopt, "ws.accept_failed", 0, {{"what", ex.what()}}});
    }
    boost::beast::error_code ec;
    ws.next_layer().socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  }
}

}  // namespace relay
