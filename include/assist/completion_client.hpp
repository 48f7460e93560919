#pragma once

#include <map>
#include <memory>
#include <string>

#include "assist/chat.hpp"
#include "assist/config.hpp"
#include "assist/executor.hpp"
#include "assist/http_client.hpp"
#include "assist/logging.hpp"
#include "assist/stream_decoder.hpp"

namespace assist {

/**
 * Issues streaming chat-completion requests.
 *
 * Each call opens one connection on a background task. The caller waits only
 * for the status line: a 200 hands back the channel the decoder fills while
 * the body is still arriving; anything else throws ServiceError once the body
 * has been drained. Nothing is retried.
 */
class CompletionClient {
public:
  explicit CompletionClient(AssistOptions options,
                            std::unique_ptr<HttpClient> http_client = nullptr,
                            std::shared_ptr<Executor> executor = nullptr);

  const AssistOptions& options() const { return options_; }

  std::shared_ptr<StreamChannel> stream_completion(ChatRequest request) const;

private:
  HttpRequest build_request(const std::string& body) const;

  AssistOptions options_;
  Logger logger_;
  std::shared_ptr<HttpClient> http_client_;
  std::shared_ptr<Executor> executor_;
};

}  // namespace assist
