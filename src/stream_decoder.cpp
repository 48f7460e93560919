#include "assist/stream_decoder.hpp"

#include "assist/error.hpp"

#include <cstring>
#include <utility>

namespace assist {
namespace {

bool starts_with(const std::string& value, const char* prefix) {
  const std::size_t length = std::strlen(prefix);
  return value.size() >= length && value.compare(0, length, prefix) == 0;
}

}  // namespace

EventStreamDecoder::EventStreamDecoder(std::shared_ptr<StreamChannel> channel, Logger logger)
    : channel_(std::move(channel)), logger_(std::move(logger)) {}

EventStreamDecoder::~EventStreamDecoder() {
  if (!finished_ && channel_) {
    channel_->close();
  }
}

void EventStreamDecoder::feed(const char* data, std::size_t size) {
  if (finished_) return;
  for (const auto& line : reader_.feed(data, size)) {
    process_line(line);
  }
}

void EventStreamDecoder::finish() {
  if (finished_) return;
  const std::size_t dropped = reader_.finish();
  if (dropped > 0) {
    logger_.log(LogLevel::Debug, "dropping unterminated trailing line", {{"bytes", dropped}});
  }
  finished_ = true;
  logger_.log(LogLevel::Debug, "event stream finished",
              {{"frames_decoded", frames_decoded_},
               {"frames_failed", frames_failed_},
               {"lines_discarded", lines_discarded_}});
  channel_->close();
}

void EventStreamDecoder::process_line(const std::string& line) {
  if (!starts_with(line, kDataPrefix)) {
    ++lines_discarded_;
    return;
  }

  const std::string payload = line.substr(std::strlen(kDataPrefix));
  try {
    ChatStreamEvent event = decode_chat_stream_event(payload);
    ++frames_decoded_;
    publish(StreamItem(std::move(event)));
  } catch (const FrameDecodeError& error) {
    ++frames_failed_;
    logger_.log(LogLevel::Warn, "skipping malformed stream frame",
                {{"error", error.what()}, {"line", line}});
    publish(StreamItem(StreamError{StreamError::Kind::Decode, error.what(), line}));
  }
}

void EventStreamDecoder::publish(StreamItem item) {
  if (!channel_->send(std::move(item))) {
    logger_.log(LogLevel::Debug, "stream channel closed, dropping item");
  }
}

}  // namespace assist
