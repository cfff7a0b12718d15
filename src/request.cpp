#include "chatstream/request.hpp"

#include <cctype>
#include <utility>

#include "chatstream/error.hpp"
#include "chatstream/utils/base64.hpp"

namespace chatstream {

namespace {

using json = nlohmann::json;

bool is_blank(const std::string& value) {
  for (char ch : value) {
    if (!std::isspace(static_cast<unsigned char>(ch))) {
      return false;
    }
  }
  return true;
}

json serialize_content(const InputContent& piece) {
  json content_item = json::object();
  switch (piece.type) {
    case InputContent::Type::Text:
      content_item["type"] = "input_text";
      content_item["text"] = piece.text;
      break;
    case InputContent::Type::Image:
      content_item["type"] = "input_image";
      if (!piece.image_url.empty()) content_item["image_url"] = piece.image_url;
      if (!piece.image_detail.empty()) content_item["detail"] = piece.image_detail;
      break;
    case InputContent::Type::File:
      content_item["type"] = "input_file";
      if (!piece.file_data.empty()) content_item["file_data"] = piece.file_data;
      if (!piece.filename.empty()) content_item["filename"] = piece.filename;
      break;
  }
  return content_item;
}

}  // namespace

bool Attachment::is_image() const {
  return mime_type.rfind("image/", 0) == 0;
}

AttachmentRef Attachment::ref() const {
  return AttachmentRef{.filename = filename, .mime_type = mime_type, .byte_size = data.size()};
}

json build_request_body(const ResponseRequest& request, bool stream) {
  if (request.model.empty()) {
    throw ChatStreamError("ResponseRequest.model must not be empty");
  }

  json body = json::object();
  body["model"] = request.model;

  json input = json::array();
  for (const auto& item : request.input) {
    json serialized_item = json::object();
    serialized_item["type"] = "message";
    serialized_item["role"] = item.role;
    if (item.content.empty()) {
      serialized_item["content"] = item.text;
    } else {
      json content = json::array();
      for (const auto& piece : item.content) {
        content.push_back(serialize_content(piece));
      }
      serialized_item["content"] = std::move(content);
    }
    input.push_back(std::move(serialized_item));
  }
  body["input"] = std::move(input);

  if (request.instructions) body["instructions"] = *request.instructions;
  if (request.max_output_tokens) body["max_output_tokens"] = *request.max_output_tokens;
  if (request.previous_response_id) body["previous_response_id"] = *request.previous_response_id;
  if (request.temperature) body["temperature"] = *request.temperature;
  if (!request.metadata.empty()) body["metadata"] = request.metadata;
  if (request.store) body["store"] = *request.store;
  if (stream) body["stream"] = true;
  return body;
}

InputItem make_user_message(const std::string& text, const std::vector<Attachment>& attachments) {
  InputItem item;
  item.role = "user";
  item.text = text;
  if (attachments.empty()) {
    return item;
  }

  if (!is_blank(text)) {
    InputContent text_content;
    text_content.type = InputContent::Type::Text;
    text_content.text = text;
    item.content.push_back(std::move(text_content));
  }

  for (const auto& attachment : attachments) {
    InputContent piece;
    if (attachment.is_image()) {
      piece.type = InputContent::Type::Image;
      piece.image_url = "data:" + attachment.mime_type + ";base64," + utils::encode_base64(attachment.data);
      piece.image_detail = "auto";
    } else {
      piece.type = InputContent::Type::File;
      piece.file_data = utils::encode_base64(attachment.data);
      piece.filename = attachment.filename;
    }
    item.content.push_back(std::move(piece));
  }
  return item;
}

std::vector<InputItem> build_conversation_input(const std::vector<ConversationTurn>& history,
                                                InputItem user_message) {
  std::vector<InputItem> input;
  input.reserve(history.size() + 1);
  for (const auto& turn : history) {
    if (turn.is_streaming || is_blank(turn.text)) {
      continue;
    }
    InputItem item;
    item.role = to_string(turn.role);
    item.text = turn.text;
    input.push_back(std::move(item));
  }
  input.push_back(std::move(user_message));
  return input;
}

ResponseRequest make_stream_request(std::string model,
                                    std::vector<InputItem> input,
                                    const StreamRequestDefaults& defaults) {
  ResponseRequest request;
  request.model = std::move(model);
  request.input = std::move(input);
  request.instructions = defaults.instructions;
  request.max_output_tokens = defaults.max_output_tokens;
  request.temperature = defaults.temperature;
  return request;
}

}  // namespace chatstream
