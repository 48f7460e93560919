#include "assist/config.hpp"

#include "assist/error.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace assist {
namespace {

std::string trim(std::string value) {
  auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(value.begin(), value.end(), is_space);
  auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

}  // namespace

const std::string& default_system_prompt() {
  static const std::string prompt =
      "You are an AI language model embedded in a text editor.\n"
      "The input you are processing is the full text of a document that is open in the editor.\n"
      "A model mention is indicated via a leading / on a line.\n"
      "The user's currently selected text is indicated via ->->selected text<-<- surrounding the selection.\n"
      "In this sentence, the word ->->example<-<- is selected.\n"
      "Respond to any selected model mention.\n"
      "Wrap your responses in > < as follows.\n"
      ">\n"
      "I think that's a great idea.\n"
      "<\n"
      "If you're responding to a distant mention or multiple mentions, provide context.\n"
      "> Summarize the open questions in this section.\n"
      "* First question\n"
      "    - Supporting detail\n"
      "* Second question\n"
      "<\n";
  return prompt;
}

namespace utils {

std::optional<std::string> read_env(const std::string& name) {
  const char* raw = std::getenv(name.c_str());
  if (!raw) {
    return std::nullopt;
  }
  std::string trimmed = trim(raw);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

}  // namespace utils

AssistOptions load_options_from_env(AssistOptions base) {
  if (base.api_key.empty()) {
    if (auto env_api = utils::read_env("OPENAI_API_KEY")) {
      base.api_key = *env_api;
    }
  }

  if (base.base_url.empty() || base.base_url == kDefaultBaseUrl) {
    base.base_url = utils::read_env("OPENAI_BASE_URL").value_or(kDefaultBaseUrl);
  }

  if (base.model.empty() || base.model == kDefaultModel) {
    base.model = utils::read_env("ASSIST_MODEL").value_or(kDefaultModel);
  }

  if (base.log_level == LogLevel::Off) {
    if (auto env_log = utils::read_env("OPENAI_LOG")) {
      base.log_level = parse_log_level(*env_log, base.log_level);
    }
  }

  return base;
}

void validate_options(const AssistOptions& options) {
  if (options.model.empty()) {
    throw ConfigurationError("AssistOptions.model must not be empty");
  }
  if (options.base_url.empty()) {
    throw ConfigurationError("AssistOptions.base_url must not be empty");
  }
  if (options.timeout.count() <= 0) {
    throw ConfigurationError("AssistOptions.timeout must be a positive duration");
  }
}

}  // namespace assist
