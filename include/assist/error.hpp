#pragma once

#include <map>
#include <stdexcept>
#include <string>

namespace assist {

class AssistError : public std::runtime_error {
public:
  explicit AssistError(const std::string& message)
      : std::runtime_error(message) {}
};

/**
 * Raised for unusable options. A missing API key is reported through this type
 * but the assist command treats it as a silent skip.
 */
class ConfigurationError : public AssistError {
public:
  using AssistError::AssistError;
};

/**
 * The service answered with a non-200 status. The body is kept verbatim.
 */
class ServiceError : public AssistError {
public:
  ServiceError(std::string message,
               long status_code,
               std::string body,
               std::map<std::string, std::string> headers)
      : AssistError(std::move(message)),
        status_code_(status_code),
        body_(std::move(body)),
        headers_(std::move(headers)) {}

  long status_code() const { return status_code_; }
  const std::string& body() const { return body_; }
  const std::map<std::string, std::string>& headers() const { return headers_; }

private:
  long status_code_;
  std::string body_;
  std::map<std::string, std::string> headers_;
};

class TransportError : public AssistError {
public:
  using AssistError::AssistError;
};

class FrameDecodeError : public AssistError {
public:
  FrameDecodeError(const std::string& message, std::string payload)
      : AssistError(message), payload_(std::move(payload)) {}

  const std::string& payload() const { return payload_; }

private:
  std::string payload_;
};

class SerializationError : public AssistError {
public:
  using AssistError::AssistError;
};

}  // namespace assist
