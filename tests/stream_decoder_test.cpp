#include <gtest/gtest.h>

#include "assist/stream_decoder.hpp"

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace {

std::string content_frame(const std::string& id, const std::string& text) {
  return "data: {\"id\":\"" + id + "\",\"object\":\"chat.completion.chunk\",\"created\":1,\"model\":\"gpt-4\","
         "\"choices\":[{\"index\":0,\"delta\":{\"content\":\"" + text + "\"},\"finish_reason\":null}]}\n";
}

std::vector<assist::StreamItem> drain(assist::StreamChannel& channel) {
  std::vector<assist::StreamItem> items;
  while (auto item = channel.try_receive()) {
    items.push_back(std::move(*item));
  }
  return items;
}

}  // namespace

TEST(EventStreamDecoderTest, SkipsKeepAlivesAndRecoversFromBadFrames) {
  using namespace assist;

  auto channel = std::make_shared<StreamChannel>();
  std::vector<std::string> warnings;
  Logger logger(
      [&warnings](LogLevel level, const std::string& message, const nlohmann::json&) {
        if (level == LogLevel::Warn) warnings.push_back(message);
      },
      LogLevel::Debug);
  EventStreamDecoder decoder(channel, logger);

  const std::string body = content_frame("a", "first") + ":\n" + "data: {malformed}\n" + content_frame("b", "second");
  decoder.feed(body.data(), body.size());
  decoder.finish();

  EXPECT_TRUE(channel->closed());
  auto items = drain(*channel);
  ASSERT_EQ(items.size(), 3u);

  ASSERT_TRUE(std::holds_alternative<ChatStreamEvent>(items[0]));
  EXPECT_EQ(std::get<ChatStreamEvent>(items[0]).id, std::optional<std::string>("a"));

  ASSERT_TRUE(std::holds_alternative<StreamError>(items[1]));
  const auto& error = std::get<StreamError>(items[1]);
  EXPECT_EQ(error.kind, StreamError::Kind::Decode);
  EXPECT_EQ(error.line, "data: {malformed}");

  ASSERT_TRUE(std::holds_alternative<ChatStreamEvent>(items[2]));
  EXPECT_EQ(*std::get<ChatStreamEvent>(items[2]).choices[0].delta.content, "second");

  EXPECT_EQ(decoder.frames_decoded(), 2u);
  EXPECT_EQ(decoder.frames_failed(), 1u);
  EXPECT_EQ(decoder.lines_discarded(), 1u);
  ASSERT_EQ(warnings.size(), 1u);
}

TEST(EventStreamDecoderTest, HandlesFramesSplitAcrossChunks) {
  using namespace assist;

  auto channel = std::make_shared<StreamChannel>();
  EventStreamDecoder decoder(channel);

  const std::string body = content_frame("a", "Hel") + "\r\n" + content_frame("b", "lo");
  for (char ch : body) {
    decoder.feed(&ch, 1);
  }
  decoder.finish();

  auto items = drain(*channel);
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(*std::get<ChatStreamEvent>(items[0]).choices[0].delta.content, "Hel");
  EXPECT_EQ(*std::get<ChatStreamEvent>(items[1]).choices[0].delta.content, "lo");
}

TEST(EventStreamDecoderTest, IgnoresNonDataLines) {
  using namespace assist;

  auto channel = std::make_shared<StreamChannel>();
  EventStreamDecoder decoder(channel);

  const std::string body =
      "event: message\n"
      "data:{\"no\":\"space\"}\n"
      "id: 7\n"
      "\n"
      ": comment\n";
  decoder.feed(body.data(), body.size());
  decoder.finish();

  EXPECT_TRUE(drain(*channel).empty());
  EXPECT_EQ(decoder.lines_discarded(), 5u);
}

TEST(EventStreamDecoderTest, DoneMarkerIsReportedAsBadFrame) {
  using namespace assist;

  auto channel = std::make_shared<StreamChannel>();
  EventStreamDecoder decoder(channel);

  const std::string body = content_frame("a", "x") + "data: [DONE]\n";
  decoder.feed(body.data(), body.size());
  decoder.finish();

  auto items = drain(*channel);
  ASSERT_EQ(items.size(), 2u);
  EXPECT_TRUE(std::holds_alternative<ChatStreamEvent>(items[0]));
  EXPECT_TRUE(std::holds_alternative<StreamError>(items[1]));
}

TEST(EventStreamDecoderTest, DropsPartialTrailingFrame) {
  using namespace assist;

  auto channel = std::make_shared<StreamChannel>();
  EventStreamDecoder decoder(channel);

  std::string body = content_frame("a", "kept") + content_frame("b", "lost");
  body.pop_back();
  decoder.feed(body.data(), body.size());
  decoder.finish();

  auto items = drain(*channel);
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(*std::get<ChatStreamEvent>(items[0]).choices[0].delta.content, "kept");
}

TEST(EventStreamDecoderTest, DestructorClosesChannel) {
  using namespace assist;

  auto channel = std::make_shared<StreamChannel>();
  {
    EventStreamDecoder decoder(channel);
    const std::string frame = content_frame("a", "x");
    decoder.feed(frame.data(), frame.size());
  }
  EXPECT_TRUE(channel->closed());
  EXPECT_EQ(channel->size(), 1u);
}
