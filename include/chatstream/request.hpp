#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatstream/content_segment.hpp"

namespace chatstream {

struct InputContent {
  enum class Type { Text, Image, File };

  Type type = Type::Text;
  std::string text;
  std::string image_url;
  std::string image_detail;
  std::string file_data;
  std::string filename;
};

/**
 * One role-tagged message of the request input. A message with no content
 * parts is sent with `text` as its plain string content.
 */
struct InputItem {
  std::string role;
  std::string text;
  std::vector<InputContent> content;
};

struct ResponseRequest {
  std::string model;
  std::vector<InputItem> input;
  std::optional<std::string> instructions;
  std::optional<int> max_output_tokens;
  std::optional<std::string> previous_response_id;
  std::optional<double> temperature;
  std::map<std::string, std::string> metadata;
  std::optional<bool> store;
};

/// A file attached to an outgoing user message, with its bytes.
struct Attachment {
  std::string filename;
  std::string mime_type;
  std::vector<std::uint8_t> data;

  bool is_image() const;
  AttachmentRef ref() const;
};

/// A finished turn of the conversation, replayed as request input.
struct ConversationTurn {
  Role role = Role::User;
  std::string text;
  bool is_streaming = false;
};

struct StreamRequestDefaults {
  std::string instructions =
      "You are a helpful assistant. Use the conversation history to provide contextual responses.";
  int max_output_tokens = 1000;
  double temperature = 0.7;
};

nlohmann::json build_request_body(const ResponseRequest& request, bool stream);

InputItem make_user_message(const std::string& text, const std::vector<Attachment>& attachments = {});

/// History turns that are blank or still streaming are skipped; the new user
/// message is appended last.
std::vector<InputItem> build_conversation_input(const std::vector<ConversationTurn>& history,
                                                InputItem user_message);

ResponseRequest make_stream_request(std::string model,
                                    std::vector<InputItem> input,
                                    const StreamRequestDefaults& defaults = {});

}  // namespace chatstream
