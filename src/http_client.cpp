#include "assist/http_client.hpp"

#include "assist/error.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <memory>
#include <string>

namespace assist {
namespace {

constexpr const char* kUserAgent = "assist-cpp/0.1";

struct TransferContext {
  CURL* curl = nullptr;
  const HttpRequest* request = nullptr;
  std::string* body = nullptr;
  std::map<std::string, std::string>* headers = nullptr;
  bool response_announced = false;
  bool error = false;
  std::string error_message;
};

void announce_response(TransferContext& context) {
  if (context.response_announced) {
    return;
  }
  context.response_announced = true;
  if (context.request->on_response) {
    long status_code = 0;
    curl_easy_getinfo(context.curl, CURLINFO_RESPONSE_CODE, &status_code);
    context.request->on_response(status_code, *context.headers);
  }
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* context = static_cast<TransferContext*>(userdata);
  const size_t total = size * nmemb;
  try {
    announce_response(*context);
    if (context->request->on_chunk) {
      context->request->on_chunk(ptr, total);
    }
  } catch (const std::exception& ex) {
    context->error = true;
    context->error_message = ex.what();
    return 0;
  }
  if (context->body) {
    context->body->append(ptr, total);
  }
  return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
  std::size_t total_size = size * nitems;
  std::string line(buffer, total_size);

  auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
  // A new status line starts a fresh header block (redirects, 100-continue).
  if (line.rfind("HTTP/", 0) == 0) {
    headers->clear();
    return total_size;
  }

  auto colon_pos = line.find(':');
  if (colon_pos != std::string::npos) {
    std::string key = line.substr(0, colon_pos);
    std::string value = line.substr(colon_pos + 1);

    auto trim = [](std::string& s) {
      auto not_space = [](unsigned char ch) { return !std::isspace(static_cast<unsigned char>(ch)); };
      s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
      s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    };

    trim(key);
    trim(value);
    if (!key.empty()) {
      (*headers)[key] = value;
    }
  }

  return total_size;
}

struct CurlDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

class CurlHttpClient : public HttpClient {
public:
  CurlHttpClient() = default;

  HttpResponse request(const HttpRequest& request) override {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
      throw TransportError("Failed to initialize libcurl");
    }

    std::unique_ptr<curl_slist, SlistDeleter> header_list;
    for (const auto& [key, value] : request.headers) {
      std::string header = key + ": " + value;
      curl_slist* appended = curl_slist_append(header_list.get(), header.c_str());
      if (!appended) {
        throw TransportError("Failed to build request headers");
      }
      header_list.release();
      header_list.reset(appended);
    }

    std::string response_body;
    std::map<std::string, std::string> response_headers;

    TransferContext context;
    context.curl = curl.get();
    context.request = &request;
    context.body = request.collect_body ? &response_body : nullptr;
    context.headers = &response_headers;

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, kUserAgent);

    if (!request.body.empty()) {
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    CURLcode res = curl_easy_perform(curl.get());

    if (context.error) {
      throw TransportError(context.error_message.empty() ? "Streaming callback failed" : context.error_message);
    }
    if (res != CURLE_OK) {
      throw TransportError(std::string("libcurl error: ") + curl_easy_strerror(res));
    }

    long status_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);

    // Responses without a body never reach write_callback.
    try {
      announce_response(context);
    } catch (const std::exception& ex) {
      throw TransportError(ex.what());
    }

    return HttpResponse{status_code, response_headers, response_body};
  }
};

struct CurlGlobalState {
  CurlGlobalState() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobalState() { curl_global_cleanup(); }
};

CurlGlobalState& curl_state() {
  static CurlGlobalState state;
  return state;
}

}  // namespace

std::unique_ptr<HttpClient> make_default_http_client() {
  (void)curl_state();
  return std::make_unique<CurlHttpClient>();
}

}  // namespace assist
