#include "assist/completion_client.hpp"

#include "assist/error.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <future>
#include <utility>

namespace assist {
namespace {

constexpr const char* kChatCompletionsPath = "/chat/completions";
constexpr long kStatusOk = 200;

std::string build_url(const std::string& base_url, const std::string& path) {
  std::string url = base_url;
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url + path;
}

nlohmann::json sanitize_headers(const std::map<std::string, std::string>& headers) {
  nlohmann::json sanitized = nlohmann::json::object();
  for (const auto& [key, value] : headers) {
    sanitized[key] = key == "Authorization" ? std::string("***") : value;
  }
  return sanitized;
}

// Shared between the caller and the background transfer.
struct TransferState {
  std::promise<void> started;
  bool streaming = false;
  std::string error_body;
  std::unique_ptr<EventStreamDecoder> decoder;
};

void start_streaming(TransferState& state, const std::shared_ptr<StreamChannel>& channel, const Logger& logger) {
  state.decoder = std::make_unique<EventStreamDecoder>(channel, logger);
  state.streaming = true;
  state.started.set_value();
}

}  // namespace

CompletionClient::CompletionClient(AssistOptions options,
                                   std::unique_ptr<HttpClient> http_client,
                                   std::shared_ptr<Executor> executor)
    : options_(std::move(options)),
      logger_(options_.logger, options_.log_level),
      http_client_(http_client ? std::move(http_client) : make_default_http_client()),
      executor_(executor ? std::move(executor) : make_thread_executor()) {
  if (options_.api_key.empty()) {
    throw ConfigurationError("Missing API key. Provide AssistOptions.api_key or set the OPENAI_API_KEY environment variable.");
  }
  validate_options(options_);
}

HttpRequest CompletionClient::build_request(const std::string& body) const {
  HttpRequest http_request;
  http_request.method = "POST";
  http_request.url = build_url(options_.base_url, kChatCompletionsPath);
  http_request.body = body;
  http_request.timeout = options_.timeout;
  http_request.collect_body = false;
  http_request.headers["Content-Type"] = "application/json";
  http_request.headers["Authorization"] = std::string("Bearer ") + options_.api_key;
  http_request.headers["Accept"] = "text/event-stream";
  return http_request;
}

std::shared_ptr<StreamChannel> CompletionClient::stream_completion(ChatRequest request) const {
  request.stream = true;
  const std::string body = serialize_chat_request(request);

  auto channel = std::make_shared<StreamChannel>();
  auto state = std::make_shared<TransferState>();
  std::future<void> started = state->started.get_future();

  HttpRequest http_request = build_request(body);
  const Logger logger = logger_;

  http_request.on_response = [state, channel, logger](long status_code, const std::map<std::string, std::string>& headers) {
    if (status_code != kStatusOk) {
      return;
    }
    logger.log(LogLevel::Info, "response stream opened",
               {{"status", status_code}, {"response_headers", sanitize_headers(headers)}});
    start_streaming(*state, channel, logger);
  };
  http_request.on_chunk = [state](const char* data, std::size_t size) {
    if (state->decoder) {
      state->decoder->feed(data, size);
    } else {
      state->error_body.append(data, size);
    }
  };

  logger.log(LogLevel::Debug, "sending request",
             {{"method", http_request.method},
              {"url", http_request.url},
              {"headers", sanitize_headers(http_request.headers)},
              {"model", request.model},
              {"messages", request.messages.size()}});

  executor_->spawn([http_client = http_client_, http_request, state, channel, logger]() {
    HttpResponse response;
    try {
      response = http_client->request(http_request);
    } catch (const std::exception& error) {
      if (state->streaming) {
        logger.log(LogLevel::Debug, "response stream interrupted", {{"error", error.what()}});
        if (!channel->send(StreamItem(StreamError{StreamError::Kind::Transport, error.what(), {}}))) {
          logger.log(LogLevel::Debug, "stream channel closed, dropping transport error");
        }
        state->decoder->finish();
      } else {
        logger.log(LogLevel::Debug, "request failed", {{"url", http_request.url}, {"error", error.what()}});
        state->started.set_exception(std::make_exception_ptr(TransportError(error.what())));
        channel->close();
      }
      return;
    }

    if (!state->streaming && response.status_code == kStatusOk) {
      // The transport never announced the response; decode what on_chunk buffered.
      std::string buffered = std::move(state->error_body);
      state->error_body.clear();
      buffered += response.body;
      start_streaming(*state, channel, logger);
      state->decoder->feed(buffered.data(), buffered.size());
    }

    if (state->streaming) {
      state->decoder->finish();
      return;
    }

    std::string error_body = state->error_body.empty() ? response.body : state->error_body;
    logger.log(LogLevel::Debug, "request failed",
               {{"url", http_request.url},
                {"status", response.status_code},
                {"response_headers", sanitize_headers(response.headers)}});
    std::string message = "Failed to connect to chat completion API: " + std::to_string(response.status_code) + " " + error_body;
    state->started.set_exception(std::make_exception_ptr(
        ServiceError(std::move(message), response.status_code, std::move(error_body), response.headers)));
    channel->close();
  });

  started.get();
  return channel;
}

}  // namespace assist
