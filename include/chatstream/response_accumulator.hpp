#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "chatstream/stream_event.hpp"

namespace chatstream {

enum class ResponseStatus { Idle, Created, Streaming, Completed, Failed, Cancelled };

const char* to_string(ResponseStatus status);

struct ResponseState {
  std::optional<std::string> response_id;
  std::string accumulated_text;
  ResponseStatus status = ResponseStatus::Idle;
  std::optional<std::string> previous_response_id;
};

/**
 * Per-conversation continuity state. Owned by the caller and handed to every
 * accumulation or streaming call of that conversation; independent
 * conversations use independent contexts.
 */
struct ConversationContext {
  std::optional<std::string> previous_response_id;
};

struct StartedUpdate {
  std::string response_id;
};

struct DeltaUpdate {
  std::string text;
};

struct SnapshotUpdate {
  std::string text;
};

struct CompletedUpdate {
  std::string text;
  std::string response_id;
  std::vector<std::vector<std::uint8_t>> generated_images;
  bool incomplete = false;
  std::optional<std::string> incomplete_reason;
};

struct FailedUpdate {
  std::string message;
  std::optional<std::string> code;
  std::exception_ptr cause;
};

struct CancelledUpdate {};

using StreamUpdate =
    std::variant<StartedUpdate, DeltaUpdate, SnapshotUpdate, CompletedUpdate, FailedUpdate, CancelledUpdate>;

bool is_terminal(const StreamUpdate& update);

/**
 * Assembles the events of one streamed response into a running message.
 *
 * Deltas are appended to the accumulated text; `output_text.done` and
 * `content_part.done` replace it. Completed, Failed and Cancelled are terminal:
 * exactly one terminal update is produced and every later call is a no-op.
 * One instance serves one response and is not shared between threads.
 */
class ResponseAccumulator {
public:
  std::optional<StreamUpdate> ingest(const StreamEvent& event);
  std::optional<StreamUpdate> ingest(const StreamEvent& event, ConversationContext& context);

  /// Owner-initiated cancellation. Emits CancelledUpdate once, from any
  /// non-terminal state, and discards the unfinalized text.
  std::optional<StreamUpdate> cancel();

  /// Aborts the stream because of a transport or decode failure.
  std::optional<StreamUpdate> fail(std::string message, std::exception_ptr cause = nullptr);

  /// End of the transport stream. Fails the response when no terminal event
  /// arrived.
  std::optional<StreamUpdate> finish();

  const ResponseState& state() const { return state_; }
  ResponseStatus status() const { return state_.status; }
  const std::optional<std::string>& response_id() const { return state_.response_id; }
  const std::string& accumulated_text() const { return state_.accumulated_text; }
  bool is_terminal() const;

private:
  std::optional<StreamUpdate> handle_created(const CreatedEvent& created);
  std::optional<StreamUpdate> handle_delta(const TextDeltaEvent& delta);
  std::optional<StreamUpdate> handle_snapshot(const std::string& text);
  std::optional<StreamUpdate> handle_completed(const CompletedEvent& completed);
  std::optional<StreamUpdate> handle_incomplete(const IncompleteEvent& incomplete);
  std::optional<StreamUpdate> handle_failure(std::string message, std::optional<std::string> code);

  void mark_streaming();

  ResponseState state_;
};

}  // namespace chatstream
