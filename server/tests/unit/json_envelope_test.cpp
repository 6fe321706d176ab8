#include <gtest/gtest.h>

#include "relay/api_response.hpp"

TEST(JsonEnvelopeTest, SuccessShape) {
  nlohmann::json payload{{"status", "ok"}};
  auto env = relay::MakeSuccessEnvelope(payload);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"], payload);
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env.contains("meta"));
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, ErrorShape) {
  auto env = relay::MakeErrorEnvelope("bad_request", "에러");
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "bad_request");
  EXPECT_EQ(env["error"]["message"], "에러");
  EXPECT_TRUE(env["error"].contains("detail"));
}

TEST(JsonEnvelopeTest, ServerEventFrame) {
  auto frame = nlohmann::json::parse(relay::SerializeServerEvent("joined", {{"room", "r1"}}, 4));
  EXPECT_EQ(frame["t"], "event");
  EXPECT_EQ(frame["event"], "joined");
  EXPECT_EQ(frame["seq"], 4);
  EXPECT_EQ(frame["p"]["room"], "r1");
}

TEST(JsonEnvelopeTest, ServerErrorFrame) {
  auto frame = nlohmann::json::parse(relay::SerializeServerError("bad_request", "JSON 파싱 오류", 9));
  EXPECT_EQ(frame["t"], "error");
  EXPECT_TRUE(frame["event"].is_null());
  EXPECT_EQ(frame["seq"], 9);
  EXPECT_EQ(frame["p"]["code"], "bad_request");
  EXPECT_EQ(frame["p"]["message"], "JSON 파싱 오류");
}

TEST(JsonEnvelopeTest, ParseClientFrameAcceptsEvent) {
  std::uint64_t seq = 0;
  std::string code;
  std::string message;
  auto env = relay::ParseClientFrame(R"({"t":"event","event":"join","seq":3,"p":{"room":"r1"}})", seq, code,
                                     message);
  ASSERT_TRUE(env.has_value());
  EXPECT_EQ(env->event, "join");
  EXPECT_EQ(env->seq, 3u);
  EXPECT_EQ(seq, 3u);
  EXPECT_EQ(env->payload["room"], "r1");
}

TEST(JsonEnvelopeTest, ParseClientFrameRejectsMalformedInput) {
  std::uint64_t seq = 0;
  std::string code;
  std::string message;

  EXPECT_FALSE(relay::ParseClientFrame("{not json", seq, code, message).has_value());
  EXPECT_EQ(code, "bad_request");
  EXPECT_EQ(message, "JSON 파싱 오류");

  EXPECT_FALSE(relay::ParseClientFrame(R"({"t":"ping","seq":5,"p":{}})", seq, code, message).has_value());
  EXPECT_EQ(seq, 5u);

  EXPECT_FALSE(relay::ParseClientFrame(R"({"t":"event","p":{}})", seq, code, message).has_value());
  EXPECT_EQ(seq, 0u);

  EXPECT_FALSE(relay::ParseClientFrame(R"({"t":"event","event":"join","p":[]})", seq, code, message).has_value());
  EXPECT_EQ(message, "payload가 누락되었습니다");
}
