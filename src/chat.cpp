#include "assist/chat.hpp"

#include "assist/error.hpp"

#include <nlohmann/json.hpp>

#include <limits>
#include <string>
#include <utility>

namespace assist {
namespace {

using json = nlohmann::json;

const json& require_field(const json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end()) {
    throw FrameDecodeError(std::string("missing field `") + key + "`", payload.dump());
  }
  return *it;
}

std::string require_string(const json& payload, const char* key) {
  const json& value = require_field(payload, key);
  if (!value.is_string()) {
    throw FrameDecodeError(std::string("field `") + key + "` must be a string", payload.dump());
  }
  return value.get<std::string>();
}

std::uint32_t require_u32(const json& payload, const char* key) {
  const json& value = require_field(payload, key);
  if (!value.is_number_unsigned() || value.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
    throw FrameDecodeError(std::string("field `") + key + "` must be an unsigned 32-bit integer", payload.dump());
  }
  return value.get<std::uint32_t>();
}

std::optional<std::string> optional_string(const json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw FrameDecodeError(std::string("field `") + key + "` must be a string or null", payload.dump());
  }
  return it->get<std::string>();
}

ChatUsage parse_usage(const json& payload) {
  if (!payload.is_object()) {
    throw FrameDecodeError("`usage` must be an object", payload.dump());
  }
  ChatUsage usage;
  usage.prompt_tokens = require_u32(payload, "prompt_tokens");
  usage.completion_tokens = require_u32(payload, "completion_tokens");
  usage.total_tokens = require_u32(payload, "total_tokens");
  return usage;
}

ChatDelta parse_delta(const json& payload) {
  if (!payload.is_object()) {
    throw FrameDecodeError("`delta` must be an object", payload.dump());
  }
  ChatDelta delta;
  if (auto role = optional_string(payload, "role")) {
    delta.role = parse_chat_role(*role);
    if (!delta.role) {
      throw FrameDecodeError("unknown role `" + *role + "`", payload.dump());
    }
  }
  delta.content = optional_string(payload, "content");
  return delta;
}

ChoiceDelta parse_choice(const json& payload) {
  if (!payload.is_object()) {
    throw FrameDecodeError("choice must be an object", payload.dump());
  }
  ChoiceDelta choice;
  choice.index = require_u32(payload, "index");
  choice.delta = parse_delta(require_field(payload, "delta"));
  choice.finish_reason = optional_string(payload, "finish_reason");
  return choice;
}

}  // namespace

const char* to_string(ChatRole role) {
  switch (role) {
    case ChatRole::System:
      return "system";
    case ChatRole::User:
      return "user";
    case ChatRole::Assistant:
      return "assistant";
  }
  return "user";
}

std::optional<ChatRole> parse_chat_role(const std::string& value) {
  if (value == "system") return ChatRole::System;
  if (value == "user") return ChatRole::User;
  if (value == "assistant") return ChatRole::Assistant;
  return std::nullopt;
}

json chat_request_to_json(const ChatRequest& request) {
  json body;
  body["model"] = request.model;

  json messages = json::array();
  for (const auto& message : request.messages) {
    messages.push_back(json{{"role", to_string(message.role())}, {"content", message.content()}});
  }
  body["messages"] = std::move(messages);
  body["stream"] = request.stream;
  return body;
}

std::string serialize_chat_request(const ChatRequest& request) {
  try {
    return chat_request_to_json(request).dump();
  } catch (const json::exception& ex) {
    throw SerializationError(std::string("Failed to serialize chat request: ") + ex.what());
  }
}

ChatStreamEvent parse_chat_stream_event(const json& payload) {
  if (!payload.is_object()) {
    throw FrameDecodeError("stream event must be a JSON object", payload.dump());
  }

  ChatStreamEvent event;
  event.id = optional_string(payload, "id");
  event.object = require_string(payload, "object");
  event.created = require_u32(payload, "created");
  event.model = require_string(payload, "model");

  const json& choices = require_field(payload, "choices");
  if (!choices.is_array()) {
    throw FrameDecodeError("`choices` must be an array", payload.dump());
  }
  for (const auto& choice_json : choices) {
    event.choices.push_back(parse_choice(choice_json));
  }

  auto usage = payload.find("usage");
  if (usage != payload.end() && !usage->is_null()) {
    event.usage = parse_usage(*usage);
  }
  return event;
}

ChatStreamEvent decode_chat_stream_event(const std::string& payload) {
  json parsed;
  try {
    parsed = json::parse(payload);
  } catch (const json::exception& ex) {
    throw FrameDecodeError(std::string("Failed to parse stream event: ") + ex.what(), payload);
  }
  return parse_chat_stream_event(parsed);
}

}  // namespace assist
