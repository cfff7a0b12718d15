#include "chatstream/stream_event.hpp"

#include "chatstream/error.hpp"
#include "chatstream/utils/base64.hpp"

#include <nlohmann/json.hpp>

#include <type_traits>

namespace chatstream {
namespace {

using json = nlohmann::json;

constexpr const char* kCreated = "response.created";
constexpr const char* kInProgress = "response.in_progress";
constexpr const char* kCompleted = "response.completed";
constexpr const char* kFailed = "response.failed";
constexpr const char* kIncomplete = "response.incomplete";
constexpr const char* kQueued = "response.queued";
constexpr const char* kTextDelta = "response.output_text.delta";
constexpr const char* kTextDone = "response.output_text.done";
constexpr const char* kContentPartDone = "response.content_part.done";
constexpr const char* kError = "error";

// Field readers for one JSON object, reporting missing keys against `path`.
class FieldReader {
public:
  FieldReader(const json& object, std::string event_type, std::string path)
      : object_(object), event_type_(std::move(event_type)), path_(std::move(path)) {}

  const json& require(const std::string& key) const {
    auto it = object_.find(key);
    if (it == object_.end() || it->is_null()) {
      throw DecodeError::missing_field(event_type_, key, path_);
    }
    return *it;
  }

  std::string require_string(const std::string& key) const {
    const json& value = require(key);
    if (!value.is_string()) {
      throw DecodeError::malformed("field '" + key + "' at " + path_ + " must be a string", event_type_);
    }
    return value.get<std::string>();
  }

  int require_int(const std::string& key) const {
    const json& value = require(key);
    if (!value.is_number_integer()) {
      throw DecodeError::malformed("field '" + key + "' at " + path_ + " must be an integer", event_type_);
    }
    return value.get<int>();
  }

  const json& require_object(const std::string& key) const {
    const json& value = require(key);
    if (!value.is_object()) {
      throw DecodeError::malformed("field '" + key + "' at " + path_ + " must be an object", event_type_);
    }
    return value;
  }

  std::optional<std::string> optional_string(const std::string& key) const {
    auto it = object_.find(key);
    if (it != object_.end() && it->is_string()) {
      return it->get<std::string>();
    }
    return std::nullopt;
  }

  std::optional<int> optional_int(const std::string& key) const {
    auto it = object_.find(key);
    if (it != object_.end() && it->is_number_integer()) {
      return it->get<int>();
    }
    return std::nullopt;
  }

  FieldReader child(const std::string& key) const {
    return FieldReader(require_object(key), event_type_, path_ + "." + key);
  }

  const json& object() const { return object_; }

private:
  const json& object_;
  std::string event_type_;
  std::string path_;
};

std::vector<std::vector<std::uint8_t>> parse_generated_images(const json& response, const std::string& event_type) {
  std::vector<std::vector<std::uint8_t>> images;
  auto output = response.find("output");
  if (output == response.end() || !output->is_array()) {
    return images;
  }
  for (const auto& item : *output) {
    if (!item.is_object() || item.value("type", std::string{}) != "image_generation_call") {
      continue;
    }
    auto result = item.find("result");
    if (result == item.end() || !result->is_string() || result->get_ref<const std::string&>().empty()) {
      continue;
    }
    try {
      images.push_back(utils::decode_base64(result->get_ref<const std::string&>()));
    } catch (const ChatStreamError& ex) {
      throw DecodeError::malformed(std::string("image_generation_call result: ") + ex.what(), event_type);
    }
  }
  return images;
}

StreamEvent decode_payload(const json& payload, const std::string& type) {
  FieldReader root(payload, type, "$");
  const auto sequence_number = root.optional_int("sequence_number");

  if (type == kTextDelta) {
    TextDeltaEvent delta;
    delta.item_id = root.require_string("item_id");
    delta.output_index = root.require_int("output_index");
    delta.content_index = root.require_int("content_index");
    delta.text = root.require_string("delta");
    delta.sequence_number = sequence_number;
    return delta;
  }

  if (type == kTextDone) {
    TextDoneEvent done;
    done.item_id = root.require_string("item_id");
    done.output_index = root.optional_int("output_index").value_or(0);
    done.content_index = root.require_int("content_index");
    done.text = root.require_string("text");
    done.sequence_number = sequence_number;
    return done;
  }

  if (type == kContentPartDone) {
    ContentPartDoneEvent done;
    done.item_id = root.require_string("item_id");
    done.output_index = root.optional_int("output_index").value_or(0);
    done.content_index = root.require_int("content_index");
    done.text = root.child("part").optional_string("text");
    done.sequence_number = sequence_number;
    return done;
  }

  if (type == kCreated) {
    auto response = root.child("response");
    return CreatedEvent{.response_id = response.require_string("id"),
                        .status = response.optional_string("status").value_or(""),
                        .sequence_number = sequence_number};
  }

  if (type == kCompleted) {
    auto response = root.child("response");
    CompletedEvent completed;
    completed.response_id = response.require_string("id");
    completed.status = response.optional_string("status").value_or("completed");
    completed.output_text = response.optional_string("output_text");
    completed.generated_images = parse_generated_images(response.object(), type);
    completed.sequence_number = sequence_number;
    return completed;
  }

  if (type == kFailed) {
    auto response = root.child("response");
    FailedEvent failed;
    failed.response_id = response.optional_string("id");
    failed.message = "Response failed";
    auto error = response.object().find("error");
    if (error != response.object().end() && error->is_object()) {
      FieldReader error_reader(*error, type, "$.response.error");
      failed.code = error_reader.optional_string("code");
      if (auto message = error_reader.optional_string("message")) {
        failed.message = *message;
      }
    }
    failed.sequence_number = sequence_number;
    return failed;
  }

  if (type == kIncomplete) {
    auto response = root.child("response");
    IncompleteEvent incomplete;
    incomplete.response_id = response.optional_string("id");
    auto details = response.object().find("incomplete_details");
    if (details != response.object().end() && details->is_object()) {
      incomplete.reason = FieldReader(*details, type, "$.response.incomplete_details").optional_string("reason");
    }
    incomplete.sequence_number = sequence_number;
    return incomplete;
  }

  if (type == kInProgress) {
    auto response = root.child("response");
    return InProgressEvent{.response_id = response.optional_string("id"), .sequence_number = sequence_number};
  }

  if (type == kQueued) {
    auto response = root.child("response");
    return QueuedEvent{.response_id = response.optional_string("id"), .sequence_number = sequence_number};
  }

  if (type == kError) {
    ErrorEvent error;
    error.code = root.optional_string("code");
    error.message = root.require_string("message");
    error.param = root.optional_string("param");
    error.sequence_number = sequence_number;
    return error;
  }

  return IgnoredEvent{.raw_type = type};
}

}  // namespace

StreamEvent decode_stream_event(std::string_view frame) {
  json payload;
  try {
    payload = json::parse(frame.begin(), frame.end());
  } catch (const json::exception& ex) {
    throw DecodeError::malformed(ex.what());
  }

  if (!payload.is_object()) {
    throw DecodeError::malformed("expected a JSON object");
  }
  auto type = payload.find("type");
  if (type == payload.end() || type->is_null()) {
    throw DecodeError::missing_field("", "type", "$");
  }
  if (!type->is_string()) {
    throw DecodeError::malformed("discriminator 'type' must be a string");
  }

  return decode_payload(payload, type->get<std::string>());
}

std::string event_type_name(const StreamEvent& event) {
  return std::visit(
      [](const auto& ev) -> std::string {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, CreatedEvent>) {
          return kCreated;
        } else if constexpr (std::is_same_v<T, InProgressEvent>) {
          return kInProgress;
        } else if constexpr (std::is_same_v<T, QueuedEvent>) {
          return kQueued;
        } else if constexpr (std::is_same_v<T, TextDeltaEvent>) {
          return kTextDelta;
        } else if constexpr (std::is_same_v<T, TextDoneEvent>) {
          return kTextDone;
        } else if constexpr (std::is_same_v<T, ContentPartDoneEvent>) {
          return kContentPartDone;
        } else if constexpr (std::is_same_v<T, CompletedEvent>) {
          return kCompleted;
        } else if constexpr (std::is_same_v<T, FailedEvent>) {
          return kFailed;
        } else if constexpr (std::is_same_v<T, IncompleteEvent>) {
          return kIncomplete;
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          return kError;
        } else {
          return ev.raw_type;
        }
      },
      event);
}

}  // namespace chatstream
