#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace assist {

struct HttpRequest {
  std::string method;
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{600000};
  // Called once with the final status and headers, before the first on_chunk.
  std::function<void(long, const std::map<std::string, std::string>&)> on_response;
  std::function<void(const char*, std::size_t)> on_chunk;
  bool collect_body = true;
};

struct HttpResponse {
  long status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
};

/**
 * Blocking transport. Implementations throw TransportError for
 * connection-level failures and for exceptions escaping the callbacks.
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse request(const HttpRequest& request) = 0;
};

std::unique_ptr<HttpClient> make_default_http_client();

}  // namespace assist
