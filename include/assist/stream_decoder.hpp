#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <variant>

#include "assist/channel.hpp"
#include "assist/chat.hpp"
#include "assist/line_reader.hpp"
#include "assist/logging.hpp"

namespace assist {

struct StreamError {
  enum class Kind { Decode, Transport };

  Kind kind = Kind::Decode;
  std::string message;
  // Raw line for decode failures, empty for transport failures.
  std::string line;
};

using StreamItem = std::variant<ChatStreamEvent, StreamError>;
using StreamChannel = Channel<StreamItem>;

/**
 * Turns response body bytes into ChatStreamEvents on a channel.
 *
 * Only lines of the form `data: <json>` are significant; every other line,
 * keep-alives included, is discarded. The service's `data: [DONE]` marker is
 * not special: it fails to parse and is reported like any other bad frame.
 * A bad frame never stops the stream. End of input is the only terminator.
 */
class EventStreamDecoder {
public:
  static constexpr const char* kDataPrefix = "data: ";

  EventStreamDecoder(std::shared_ptr<StreamChannel> channel, Logger logger = {});
  ~EventStreamDecoder();

  EventStreamDecoder(const EventStreamDecoder&) = delete;
  EventStreamDecoder& operator=(const EventStreamDecoder&) = delete;

  void feed(const char* data, std::size_t size);

  /// End of input: drops a partial trailing line and closes the channel.
  void finish();

  [[nodiscard]] std::size_t frames_decoded() const { return frames_decoded_; }
  [[nodiscard]] std::size_t frames_failed() const { return frames_failed_; }
  [[nodiscard]] std::size_t lines_discarded() const { return lines_discarded_; }
  [[nodiscard]] bool finished() const { return finished_; }

private:
  void process_line(const std::string& line);
  void publish(StreamItem item);

  std::shared_ptr<StreamChannel> channel_;
  Logger logger_;
  LineReader reader_;
  std::size_t frames_decoded_ = 0;
  std::size_t frames_failed_ = 0;
  std::size_t lines_discarded_ = 0;
  bool finished_ = false;
};

}  // namespace assist
