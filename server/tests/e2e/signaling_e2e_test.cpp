#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "relay/app.hpp"

namespace {

struct SimpleHttpResponse {
  boost::beast::http::status status;
  nlohmann::json body;
};

void ExpectWsEventEnvelope(const nlohmann::json& msg, const std::string& event_name) {
  ASSERT_TRUE(msg.is_object());
  EXPECT_EQ(msg["t"], "event");
  ASSERT_TRUE(msg.contains("seq"));
  EXPECT_EQ(msg["event"], event_name);
  ASSERT_TRUE(msg.contains("p"));
  EXPECT_TRUE(msg["p"].is_object());
}

void ExpectWsError(const nlohmann::json& msg, const std::string& code) {
  ASSERT_TRUE(msg.is_object());
  EXPECT_EQ(msg["t"], "error");
  ASSERT_TRUE(msg.contains("p"));
  EXPECT_TRUE(msg["p"].is_object());
  EXPECT_EQ(msg["p"]["code"], code);
}

// 동기식 Beast 웹소켓 클라이언트
class WsClient {
 public:
  WsClient(const std::string& host, unsigned short port, const std::string& path = "/ws")
      : resolver_(ioc_), ws_(ioc_) {
    auto const results = resolver_.resolve(host, std::to_string(port));
    boost::asio::connect(ws_.next_layer(), results.begin(), results.end());
    ws_.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::request_type& req) {
      req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    }));
    ws_.handshake(host + ":" + std::to_string(port), path);
  }

  void Send(const std::string& event, const nlohmann::json& payload) {
    nlohmann::json frame{{"t", "event"}, {"event", event}, {"seq", ++seq_}, {"p", payload}};
    ws_.write(boost::asio::buffer(frame.dump()));
  }

  void SendRaw(const std::string& text) { ws_.write(boost::asio::buffer(text)); }

  nlohmann::json ReadFrame() {
    boost::beast::flat_buffer buffer;
    ws_.read(buffer);
    return nlohmann::json::parse(boost::beast::buffers_to_string(buffer.data()));
  }

  // 원하는 이벤트가 올 때까지 읽고, 건너뛴 이벤트 이름은 skipped에 모은다.
  nlohmann::json ReadUntil(const std::string& event, std::vector<std::string>* skipped = nullptr) {
    while (true) {
      auto frame = ReadFrame();
      if (frame["t"] == "event" && frame["event"] == event) {
        return frame;
      }
      if (skipped) {
        skipped->push_back(frame["event"].is_string() ? frame["event"].get<std::string>() : std::string{"<error>"});
      }
    }
  }

  void Close() {
    boost::beast::error_code ec;
    ws_.close(boost::beast::websocket::close_code::normal, ec);
  }

 private:
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::resolver resolver_;
  boost::beast::websocket::stream<boost::asio::ip::tcp::socket> ws_;
  std::uint64_t seq_{0};
};

class SignalingServerFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    relay::AppConfig config{"127.0.0.1", 0, "error", 2, 512, 8388608, 4194304};
    app_ = std::make_unique<relay::ServerApp>(config);
    port_ = app_->Listen();
    runner_ = std::thread([this]() { app_->Run(); });
    WaitForReady();
  }

  void TearDown() override {
    app_->Stop();
    if (runner_.joinable()) {
      runner_.join();
    }
    app_.reset();
  }

  SimpleHttpResponse Get(const std::string& target) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve(host_, std::to_string(port_));
    stream.connect(results);

    boost::beast::http::request<boost::beast::http::string_body> req{boost::beast::http::verb::get, target, 11};
    req.set(boost::beast::http::field::host, host_);
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    SimpleHttpResponse result{res.result(), nlohmann::json::parse(res.body())};
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return result;
  }

  void WaitForReady() {
    for (int i = 0; i < 50; ++i) {
      try {
        auto res = Get("/api/health");
        if (res.status == boost::beast::http::status::ok) {
          return;
        }
      } catch (const std::exception&) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    FAIL() << "서버가 준비되지 않았습니다";
  }

  std::unique_ptr<WsClient> Connect() { return std::make_unique<WsClient>(host_, port_); }

  std::string host_{"127.0.0.1"};
  unsigned short port_{0};
  std::unique_ptr<relay::ServerApp> app_;
  std::thread runner_;
};

}  // namespace

TEST_F(SignalingServerFixture, HealthAndMetrics) {
  auto health = Get("/api/health");
  EXPECT_EQ(health.status, boost::beast::http::status::ok);
  EXPECT_TRUE(health.body["success"].get<bool>());
  EXPECT_EQ(health.body["data"]["status"], "ok");

  auto metrics = Get("/metrics");
  EXPECT_EQ(metrics.status, boost::beast::http::status::ok);
  ASSERT_TRUE(metrics.body["data"].contains("relay"));
  EXPECT_EQ(metrics.body["data"]["rooms"]["active"], 0);

  auto missing = Get("/nope");
  EXPECT_EQ(missing.status, boost::beast::http::status::not_found);
  EXPECT_EQ(missing.body["error"]["code"], "not_found");
}

TEST_F(SignalingServerFixture, TwoParticipantsCallShareCodeAndLeave) {
  auto alice = Connect();
  alice->Send("join", {{"identity", "alice"}, {"room", "r1"}});
  auto alice_joined = alice->ReadUntil("joined");
  ExpectWsEventEnvelope(alice_joined, "joined");
  EXPECT_EQ(alice_joined["p"]["identity"], "alice");
  auto alice_conn = alice_joined["p"]["connection"].get<std::string>();

  auto bob = Connect();
  bob->Send("join", {{"identity", "bob"}, {"room", "r1"}});
  auto bob_joined = bob->ReadUntil("joined");
  auto bob_conn = bob_joined["p"]["connection"].get<std::string>();
  EXPECT_NE(alice_conn, bob_conn);

  auto announced = alice->ReadUntil("participant-joined");
  EXPECT_EQ(announced["p"]["identity"], "bob");
  EXPECT_EQ(announced["p"]["connection"], bob_conn);
  auto waiting = bob->ReadUntil("wait-for-admission");
  EXPECT_EQ(waiting["p"]["from"], alice_conn);

  nlohmann::json offer{{"type", "offer"}, {"sdp", "O1"}};
  alice->Send("call-request", {{"to", bob_conn}, {"offer", offer}, {"identity", "alice"}});
  auto incoming = bob->ReadUntil("incoming-call");
  EXPECT_EQ(incoming["p"]["from"], alice_conn);
  EXPECT_EQ(incoming["p"]["offer"], offer);

  nlohmann::json answer{{"type", "answer"}, {"sdp", "A1"}};
  bob->Send("call-accept", {{"to", alice_conn}, {"answer", answer}});
  auto accepted = alice->ReadUntil("call-accepted");
  EXPECT_EQ(accepted["p"]["from"], bob_conn);
  EXPECT_EQ(accepted["p"]["answer"], answer);
  EXPECT_EQ(app_->GetRouter()->GetTracker()->PhaseOf("r1"), relay::NegotiationPhase::kConnected);

  nlohmann::json code{{"room", "r1"}, {"code", "print(1)"}};
  alice->Send("code-broadcast", code);
  auto shared = bob->ReadUntil("code-broadcast");
  EXPECT_EQ(shared["p"], code);

  // 발신자에게 되돌아온 코드가 없음을 이후 토글 수신 순서로 확인한다.
  bob->Send("video-toggle", {{"to", alice_conn}, {"isOff", true}});
  std::vector<std::string> skipped;
  auto toggle = alice->ReadUntil("video-toggle", &skipped);
  EXPECT_TRUE(toggle["p"]["isOff"].get<bool>());
  EXPECT_EQ(toggle["p"]["identity"], "bob");
  for (const auto& name : skipped) {
    EXPECT_NE(name, "code-broadcast");
  }

  bob->Close();
  auto left = alice->ReadUntil("participant-left");
  EXPECT_EQ(left["p"]["identity"], "bob");
  EXPECT_EQ(left["p"]["connection"], bob_conn);
  EXPECT_EQ(app_->GetRouter()->GetTracker()->PhaseOf("r1"), relay::NegotiationPhase::kIdle);
  EXPECT_FALSE(app_->GetRouter()->GetRegistry()->IsMember(bob_conn, "r1"));

  alice->Close();
}

TEST_F(SignalingServerFixture, MalformedFramesGetErrorEnvelopeAndConnectionStaysOpen) {
  auto client = Connect();
  client->SendRaw("not json");
  ExpectWsError(client->ReadFrame(), "bad_request");

  client->Send("teleport", nlohmann::json::object());
  ExpectWsError(client->ReadFrame(), "bad_request");

  client->Send("join", {{"room", "r1"}});
  ExpectWsError(client->ReadFrame(), "bad_request");

  client->Send("join", {{"identity", "carol"}, {"room", "r1"}});
  auto joined = client->ReadUntil("joined");
  EXPECT_EQ(joined["p"]["identity"], "carol");
  client->Close();
}

TEST_F(SignalingServerFixture, UpgradeOnlyOnWebSocketPath) {
  EXPECT_THROW({ WsClient rejected(host_, port_, "/api/health"); }, boost::system::system_error);

  auto client = Connect();
  client->Send("join", {{"identity", "dave"}, {"room", "r9"}});
  EXPECT_EQ(client->ReadUntil("joined")["p"]["identity"], "dave");
  client->Close();
}
