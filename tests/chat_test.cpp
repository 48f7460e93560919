#include <gtest/gtest.h>

#include "assist/chat.hpp"
#include "assist/error.hpp"

#include <nlohmann/json.hpp>

#include <string>

TEST(ChatRequestTest, SerializesRolesAndStreamFlag) {
  using namespace assist;

  ChatRequest request;
  request.model = "gpt-4";
  request.messages.emplace_back(ChatRole::System, "be brief");
  request.messages.emplace_back(ChatRole::User, "hello");
  request.messages.emplace_back(ChatRole::Assistant, "hi");
  request.stream = true;

  auto body = nlohmann::json::parse(serialize_chat_request(request));
  EXPECT_EQ(body.at("model"), "gpt-4");
  EXPECT_EQ(body.at("stream"), true);
  ASSERT_EQ(body.at("messages").size(), 3u);
  EXPECT_EQ(body["messages"][0]["role"], "system");
  EXPECT_EQ(body["messages"][0]["content"], "be brief");
  EXPECT_EQ(body["messages"][1]["role"], "user");
  EXPECT_EQ(body["messages"][2]["role"], "assistant");
  EXPECT_EQ(body["messages"][2]["content"], "hi");
}

TEST(ChatRequestTest, InvalidUtf8IsASerializationError) {
  using namespace assist;

  ChatRequest request;
  request.model = "gpt-4";
  request.messages.emplace_back(ChatRole::User, std::string("bad \xff byte"));

  EXPECT_THROW(serialize_chat_request(request), SerializationError);
}

TEST(ChatRoleTest, ParsesLowercaseNamesOnly) {
  using namespace assist;

  EXPECT_EQ(parse_chat_role("system"), ChatRole::System);
  EXPECT_EQ(parse_chat_role("user"), ChatRole::User);
  EXPECT_EQ(parse_chat_role("assistant"), ChatRole::Assistant);
  EXPECT_FALSE(parse_chat_role("User").has_value());
  EXPECT_FALSE(parse_chat_role("tool").has_value());
}

TEST(ChatStreamEventTest, DecodesContentDelta) {
  using namespace assist;

  auto event = decode_chat_stream_event(
      R"({"id":"chatcmpl-1","object":"chat.completion.chunk","created":1680000000,"model":"gpt-4",)"
      R"("choices":[{"index":0,"delta":{"role":"assistant","content":"Hel"},"finish_reason":null}]})");

  ASSERT_TRUE(event.id.has_value());
  EXPECT_EQ(*event.id, "chatcmpl-1");
  EXPECT_EQ(event.object, "chat.completion.chunk");
  EXPECT_EQ(event.created, 1680000000u);
  EXPECT_EQ(event.model, "gpt-4");
  ASSERT_EQ(event.choices.size(), 1u);
  EXPECT_EQ(event.choices[0].index, 0u);
  EXPECT_EQ(event.choices[0].delta.role, ChatRole::Assistant);
  ASSERT_TRUE(event.choices[0].delta.content.has_value());
  EXPECT_EQ(*event.choices[0].delta.content, "Hel");
  EXPECT_FALSE(event.choices[0].finish_reason.has_value());
  EXPECT_FALSE(event.usage.has_value());
}

TEST(ChatStreamEventTest, NullAndMissingContentStayAbsent) {
  using namespace assist;

  auto with_null = decode_chat_stream_event(
      R"({"object":"chat.completion.chunk","created":1,"model":"m",)"
      R"("choices":[{"index":0,"delta":{"content":null},"finish_reason":"stop"}]})");
  ASSERT_EQ(with_null.choices.size(), 1u);
  EXPECT_FALSE(with_null.choices[0].delta.content.has_value());
  EXPECT_EQ(with_null.choices[0].finish_reason, std::optional<std::string>("stop"));
  EXPECT_FALSE(with_null.id.has_value());

  auto without = decode_chat_stream_event(
      R"({"object":"chat.completion.chunk","created":1,"model":"m","choices":[{"index":0,"delta":{}}]})");
  EXPECT_FALSE(without.choices[0].delta.content.has_value());
  EXPECT_FALSE(without.choices[0].delta.role.has_value());

  auto empty = decode_chat_stream_event(
      R"({"object":"chat.completion.chunk","created":1,"model":"m","choices":[{"index":0,"delta":{"content":""}}]})");
  ASSERT_TRUE(empty.choices[0].delta.content.has_value());
  EXPECT_EQ(*empty.choices[0].delta.content, "");
}

TEST(ChatStreamEventTest, ParsesUsage) {
  using namespace assist;

  auto event = decode_chat_stream_event(
      R"({"object":"chat.completion.chunk","created":1,"model":"m","choices":[],)"
      R"("usage":{"prompt_tokens":12,"completion_tokens":3,"total_tokens":15}})");
  ASSERT_TRUE(event.usage.has_value());
  EXPECT_EQ(event.usage->prompt_tokens, 12u);
  EXPECT_EQ(event.usage->completion_tokens, 3u);
  EXPECT_EQ(event.usage->total_tokens, 15u);
  EXPECT_TRUE(event.choices.empty());
}

TEST(ChatStreamEventTest, RejectsMalformedPayloads) {
  using namespace assist;

  EXPECT_THROW(decode_chat_stream_event("{malformed}"), FrameDecodeError);
  EXPECT_THROW(decode_chat_stream_event("[DONE]"), FrameDecodeError);
  EXPECT_THROW(decode_chat_stream_event("[]"), FrameDecodeError);
  // Missing required `model`.
  EXPECT_THROW(decode_chat_stream_event(R"({"object":"o","created":1,"choices":[]})"), FrameDecodeError);
  // Negative timestamp.
  EXPECT_THROW(decode_chat_stream_event(R"({"object":"o","created":-1,"model":"m","choices":[]})"), FrameDecodeError);
  // Unknown role.
  EXPECT_THROW(decode_chat_stream_event(
                   R"({"object":"o","created":1,"model":"m","choices":[{"index":0,"delta":{"role":"robot"}}]})"),
               FrameDecodeError);
  // Content must be text.
  EXPECT_THROW(decode_chat_stream_event(
                   R"({"object":"o","created":1,"model":"m","choices":[{"index":0,"delta":{"content":5}}]})"),
               FrameDecodeError);
}

TEST(ChatStreamEventTest, DecodeErrorKeepsPayload) {
  using namespace assist;

  try {
    decode_chat_stream_event("{malformed}");
    FAIL() << "expected FrameDecodeError";
  } catch (const FrameDecodeError& error) {
    EXPECT_EQ(error.payload(), "{malformed}");
    EXPECT_NE(std::string(error.what()).find("Failed to parse stream event"), std::string::npos);
  }
}
