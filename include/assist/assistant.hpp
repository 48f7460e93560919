#pragma once

#include <memory>
#include <string>
#include <vector>

#include "assist/completion_client.hpp"
#include "assist/config.hpp"
#include "assist/document.hpp"
#include "assist/executor.hpp"
#include "assist/http_client.hpp"
#include "assist/insertion_sink.hpp"
#include "assist/logging.hpp"
#include "assist/selection_framer.hpp"

namespace assist {

enum class AssistStatus { Completed, Skipped, Failed };

const char* to_string(AssistStatus status);

struct AssistOutcome {
  std::string prompt;
  SinkReport report;
};

/**
 * The "Assist" command: frames the current selections, streams a completion
 * and writes it into the document below the text.
 */
class Assistant {
public:
  explicit Assistant(AssistOptions options,
                     std::unique_ptr<HttpClient> http_client = nullptr,
                     std::shared_ptr<Executor> executor = nullptr);

  const AssistOptions& options() const { return options_; }

  /// Runs the full exchange. Errors propagate; requires an API key.
  AssistOutcome run(Document& document, const std::vector<SelectionRange>& selections);

  /**
   * User-facing entry point. Without an API key nothing happens and Skipped is
   * returned. Failures are logged once and reported as Failed.
   */
  AssistStatus invoke(Document& document, const std::vector<SelectionRange>& selections);

private:
  AssistOptions options_;
  Logger logger_;
  // Null when no API key is configured.
  std::unique_ptr<CompletionClient> client_;
};

}  // namespace assist
