#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace chatstream {

struct CreatedEvent {
  std::string response_id;
  std::string status;
  std::optional<int> sequence_number;
};

struct InProgressEvent {
  std::optional<std::string> response_id;
  std::optional<int> sequence_number;
};

struct QueuedEvent {
  std::optional<std::string> response_id;
  std::optional<int> sequence_number;
};

struct TextDeltaEvent {
  std::string item_id;
  int output_index = 0;
  int content_index = 0;
  std::string text;
  std::optional<int> sequence_number;
};

struct TextDoneEvent {
  std::string item_id;
  int output_index = 0;
  int content_index = 0;
  std::string text;
  std::optional<int> sequence_number;
};

struct ContentPartDoneEvent {
  std::string item_id;
  int output_index = 0;
  int content_index = 0;
  std::optional<std::string> text;
  std::optional<int> sequence_number;
};

struct CompletedEvent {
  std::string response_id;
  std::string status;
  std::optional<std::string> output_text;
  /// Decoded `result` payloads of `image_generation_call` output items.
  std::vector<std::vector<std::uint8_t>> generated_images;
  std::optional<int> sequence_number;
};

struct FailedEvent {
  std::optional<std::string> response_id;
  std::optional<std::string> code;
  std::string message;
  std::optional<int> sequence_number;
};

struct IncompleteEvent {
  std::optional<std::string> response_id;
  std::optional<std::string> reason;
  std::optional<int> sequence_number;
};

struct ErrorEvent {
  std::optional<std::string> code;
  std::string message;
  std::optional<std::string> param;
  std::optional<int> sequence_number;
};

/// Any event type this library does not model. Kept so newer API versions
/// do not break older clients.
struct IgnoredEvent {
  std::string raw_type;
};

using StreamEvent = std::variant<CreatedEvent,
                                 InProgressEvent,
                                 QueuedEvent,
                                 TextDeltaEvent,
                                 TextDoneEvent,
                                 ContentPartDoneEvent,
                                 CompletedEvent,
                                 FailedEvent,
                                 IncompleteEvent,
                                 ErrorEvent,
                                 IgnoredEvent>;

/**
 * Decodes one SSE data payload (without the `data:` prefix) into a typed
 * event. The `[DONE]` sentinel must be handled by the caller.
 *
 * Throws DecodeError with kind MalformedPayload when the frame is not a JSON
 * object with a string `type`, and MissingField when a required key of a known
 * event type is absent. Unknown types decode to IgnoredEvent.
 */
StreamEvent decode_stream_event(std::string_view frame);

/// Wire `type` string of a decoded event.
std::string event_type_name(const StreamEvent& event);

}  // namespace chatstream
