#include "assist/insertion_sink.hpp"

#include <utility>
#include <variant>

namespace assist {

InsertionSink::InsertionSink(Document& document, Anchor anchor, Logger logger)
    : document_(document), anchor_(anchor), logger_(std::move(logger)) {}

bool InsertionSink::apply(const ChatStreamEvent& event) {
  ++report_.events;
  if (event.choices.empty()) {
    return false;
  }

  // Single-choice streaming: anything but the last choice is ignored.
  const ChoiceDelta& choice = event.choices.back();
  if (!choice.delta.content || choice.delta.content->empty()) {
    if (choice.finish_reason) {
      logger_.log(LogLevel::Debug, "choice finished", {{"finish_reason", *choice.finish_reason}});
    }
    return false;
  }

  const std::string& text = *choice.delta.content;
  document_.update([this, &text](Buffer& buffer) {
    const std::size_t offset = buffer.offset_of(anchor_);
    buffer.edit({BufferEdit{offset, offset, text}});
  });
  ++report_.insertions;
  report_.inserted_bytes += text.size();
  return true;
}

SinkReport InsertionSink::drain(StreamChannel& channel) {
  while (auto item = channel.receive()) {
    if (const auto* event = std::get_if<ChatStreamEvent>(&*item)) {
      apply(*event);
      continue;
    }

    const auto& error = std::get<StreamError>(*item);
    if (error.kind == StreamError::Kind::Decode) {
      ++report_.decode_errors;
      logger_.log(LogLevel::Warn, "stream frame skipped", {{"error", error.message}});
    } else {
      report_.transport_error = error.message;
      logger_.log(LogLevel::Error, "stream ended by transport failure", {{"error", error.message}});
    }
  }

  logger_.log(LogLevel::Debug, "insertion finished",
              {{"events", report_.events},
               {"insertions", report_.insertions},
               {"inserted_bytes", report_.inserted_bytes},
               {"decode_errors", report_.decode_errors}});
  return report_;
}

}  // namespace assist
