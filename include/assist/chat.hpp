#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace assist {

enum class ChatRole { System, User, Assistant };

const char* to_string(ChatRole role);
std::optional<ChatRole> parse_chat_role(const std::string& value);

class ChatMessage {
public:
  ChatMessage(ChatRole role, std::string content)
      : role_(role), content_(std::move(content)) {}

  ChatRole role() const { return role_; }
  const std::string& content() const { return content_; }

private:
  ChatRole role_;
  std::string content_;
};

struct ChatRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  bool stream = false;
};

struct ChatUsage {
  std::uint32_t prompt_tokens = 0;
  std::uint32_t completion_tokens = 0;
  std::uint32_t total_tokens = 0;
};

struct ChatDelta {
  std::optional<ChatRole> role;
  // Absent or null means the frame carries no new text.
  std::optional<std::string> content;
};

struct ChoiceDelta {
  std::uint32_t index = 0;
  ChatDelta delta;
  std::optional<std::string> finish_reason;
};

struct ChatStreamEvent {
  std::optional<std::string> id;
  std::string object;
  std::uint32_t created = 0;
  std::string model;
  std::vector<ChoiceDelta> choices;
  std::optional<ChatUsage> usage;
};

nlohmann::json chat_request_to_json(const ChatRequest& request);

/**
 * Serializes the request body. Throws SerializationError when the payload
 * cannot be encoded (for example invalid UTF-8 in a message).
 */
std::string serialize_chat_request(const ChatRequest& request);

ChatStreamEvent parse_chat_stream_event(const nlohmann::json& payload);

/**
 * Parses the text of one `data:` frame. Throws FrameDecodeError on malformed
 * JSON or a payload that does not match the event schema.
 */
ChatStreamEvent decode_chat_stream_event(const std::string& payload);

}  // namespace assist
