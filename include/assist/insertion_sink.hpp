#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "assist/chat.hpp"
#include "assist/document.hpp"
#include "assist/logging.hpp"
#include "assist/stream_decoder.hpp"

namespace assist {

struct SinkReport {
  std::size_t events = 0;
  std::size_t insertions = 0;
  std::size_t inserted_bytes = 0;
  std::size_t decode_errors = 0;
  std::optional<std::string> transport_error;
};

/**
 * Applies streamed deltas to a document at an anchor.
 *
 * Only the last choice of each event is considered. Text goes in at the
 * anchor's current offset, so edits made elsewhere in the meantime are
 * tolerated, and the right-biased anchor moves past every insertion.
 */
class InsertionSink {
public:
  InsertionSink(Document& document, Anchor anchor, Logger logger = {});

  /// Returns true when the event changed the document.
  bool apply(const ChatStreamEvent& event);

  /// Consumes the channel in order until it is closed and empty.
  SinkReport drain(StreamChannel& channel);

  const SinkReport& report() const { return report_; }

private:
  Document& document_;
  Anchor anchor_;
  Logger logger_;
  SinkReport report_;
};

}  // namespace assist
