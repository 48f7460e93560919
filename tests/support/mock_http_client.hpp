#pragma once

#include "assist/error.hpp"
#include "assist/http_client.hpp"

#include <algorithm>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <variant>
#include <vector>

namespace assist::testing {

/**
 * In-memory HttpClient that replays scripted responses.
 * The body is delivered through on_chunk in pieces of `chunk_size` bytes so
 * tests exercise frames split across reads. A scripted failure can be raised
 * before the response or after a number of body bytes.
 */
class MockHttpClient final : public HttpClient {
public:
  struct ScriptedResponse {
    HttpResponse response;
    std::size_t chunk_size = 0;
    // Throws TransportError after this many body bytes when set.
    std::optional<std::size_t> fail_after_bytes;
    std::string failure_message = "connection reset by peer";
  };

  struct ScriptedError {
    std::string message;
  };

  using Scripted = std::variant<ScriptedResponse, ScriptedError>;

  HttpResponse request(const HttpRequest& request) override {
    Scripted next = take(request);

    if (std::holds_alternative<ScriptedError>(next)) {
      throw TransportError(std::get<ScriptedError>(next).message);
    }
    auto& scripted = std::get<ScriptedResponse>(next);
    HttpResponse response = scripted.response;

    if (request.on_response) {
      request.on_response(response.status_code, response.headers);
    }

    const std::string& body = response.body;
    const std::size_t limit = scripted.fail_after_bytes.value_or(body.size());
    const std::size_t step = scripted.chunk_size == 0 ? std::max<std::size_t>(body.size(), 1) : scripted.chunk_size;
    std::size_t offset = 0;
    while (offset < std::min(limit, body.size())) {
      const std::size_t size = std::min(step, std::min(limit, body.size()) - offset);
      if (request.on_chunk) {
        request.on_chunk(body.data() + offset, size);
      }
      offset += size;
    }
    if (scripted.fail_after_bytes) {
      throw TransportError(scripted.failure_message);
    }

    if (!request.collect_body) {
      response.body.clear();
    }
    return response;
  }

  void enqueue_response(HttpResponse response, std::size_t chunk_size = 0) {
    ScriptedResponse scripted;
    scripted.response = std::move(response);
    scripted.chunk_size = chunk_size;
    enqueue(std::move(scripted));
  }

  void enqueue_interrupted(HttpResponse response, std::size_t fail_after_bytes, std::string message) {
    ScriptedResponse scripted;
    scripted.response = std::move(response);
    scripted.fail_after_bytes = fail_after_bytes;
    scripted.failure_message = std::move(message);
    enqueue(std::move(scripted));
  }

  void enqueue_error(std::string message) {
    enqueue(ScriptedError{std::move(message)});
  }

  [[nodiscard]] std::optional<HttpRequest> last_request() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_request_;
  }

  [[nodiscard]] std::size_t request_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_count_;
  }

private:
  void enqueue(Scripted scripted) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push(std::move(scripted));
  }

  Scripted take(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_request_ = request;
    ++request_count_;
    if (responses_.empty()) {
      throw TransportError("MockHttpClient queue underflow");
    }
    Scripted next = std::move(responses_.front());
    responses_.pop();
    return next;
  }

  std::queue<Scripted> responses_;
  std::optional<HttpRequest> last_request_;
  std::size_t request_count_ = 0;
  mutable std::mutex mutex_;
};

}  // namespace assist::testing
