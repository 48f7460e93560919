#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "assist/logging.hpp"

namespace assist {

constexpr const char* kDefaultBaseUrl = "https://api.openai.com/v1";
constexpr const char* kDefaultModel = "gpt-4";

/**
 * System message sent ahead of the framed document. It explains the selection
 * markers and the `> ... <` answer framing to the model.
 */
const std::string& default_system_prompt();

struct AssistOptions {
  std::string api_key;
  std::string base_url = kDefaultBaseUrl;
  std::string model = kDefaultModel;
  std::string system_prompt = default_system_prompt();
  std::chrono::milliseconds timeout{600000};
  LogLevel log_level = LogLevel::Off;
  LoggerCallback logger;
};

namespace utils {

/**
 * Reads an environment variable and trims leading/trailing whitespace.
 * Returns std::nullopt when the variable is unset or blank.
 */
std::optional<std::string> read_env(const std::string& name);

}  // namespace utils

/**
 * Fills fields still at their defaults from OPENAI_API_KEY, OPENAI_BASE_URL,
 * ASSIST_MODEL and OPENAI_LOG. Explicitly set fields win.
 */
AssistOptions load_options_from_env(AssistOptions base = {});

/// Throws ConfigurationError for an empty model or base URL or a non-positive timeout.
void validate_options(const AssistOptions& options);

}  // namespace assist
