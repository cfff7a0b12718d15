#include "chatstream/response_accumulator.hpp"

#include <type_traits>
#include <utility>

namespace chatstream {

const char* to_string(ResponseStatus status) {
  switch (status) {
    case ResponseStatus::Idle:
      return "idle";
    case ResponseStatus::Created:
      return "created";
    case ResponseStatus::Streaming:
      return "streaming";
    case ResponseStatus::Completed:
      return "completed";
    case ResponseStatus::Failed:
      return "failed";
    case ResponseStatus::Cancelled:
      return "cancelled";
  }
  return "idle";
}

bool is_terminal(const StreamUpdate& update) {
  return std::holds_alternative<CompletedUpdate>(update) || std::holds_alternative<FailedUpdate>(update) ||
         std::holds_alternative<CancelledUpdate>(update);
}

bool ResponseAccumulator::is_terminal() const {
  return state_.status == ResponseStatus::Completed || state_.status == ResponseStatus::Failed ||
         state_.status == ResponseStatus::Cancelled;
}

std::optional<StreamUpdate> ResponseAccumulator::ingest(const StreamEvent& event) {
  if (is_terminal()) {
    return std::nullopt;
  }
  return std::visit(
      [&](const auto& ev) -> std::optional<StreamUpdate> {
        using T = std::decay_t<decltype(ev)>;
        if constexpr (std::is_same_v<T, CreatedEvent>) {
          return handle_created(ev);
        } else if constexpr (std::is_same_v<T, TextDeltaEvent>) {
          return handle_delta(ev);
        } else if constexpr (std::is_same_v<T, TextDoneEvent>) {
          return handle_snapshot(ev.text);
        } else if constexpr (std::is_same_v<T, ContentPartDoneEvent>) {
          if (!ev.text) {
            return std::nullopt;
          }
          return handle_snapshot(*ev.text);
        } else if constexpr (std::is_same_v<T, CompletedEvent>) {
          return handle_completed(ev);
        } else if constexpr (std::is_same_v<T, IncompleteEvent>) {
          return handle_incomplete(ev);
        } else if constexpr (std::is_same_v<T, FailedEvent>) {
          return handle_failure(ev.message, ev.code);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          return handle_failure(ev.message, ev.code);
        } else {
          // InProgress, Queued and Ignored carry nothing the message needs.
          return std::nullopt;
        }
      },
      event);
}

std::optional<StreamUpdate> ResponseAccumulator::ingest(const StreamEvent& event, ConversationContext& context) {
  auto update = ingest(event);
  if (update) {
    if (const auto* completed = std::get_if<CompletedUpdate>(&*update); completed && !completed->response_id.empty()) {
      context.previous_response_id = completed->response_id;
    }
  }
  return update;
}

std::optional<StreamUpdate> ResponseAccumulator::cancel() {
  if (is_terminal()) {
    return std::nullopt;
  }
  state_.status = ResponseStatus::Cancelled;
  state_.accumulated_text.clear();
  return CancelledUpdate{};
}

std::optional<StreamUpdate> ResponseAccumulator::fail(std::string message, std::exception_ptr cause) {
  if (is_terminal()) {
    return std::nullopt;
  }
  state_.status = ResponseStatus::Failed;
  return FailedUpdate{.message = std::move(message), .code = std::nullopt, .cause = std::move(cause)};
}

std::optional<StreamUpdate> ResponseAccumulator::finish() {
  if (is_terminal()) {
    return std::nullopt;
  }
  return fail("stream ended before the response completed");
}

void ResponseAccumulator::mark_streaming() {
  state_.status = ResponseStatus::Streaming;
}

std::optional<StreamUpdate> ResponseAccumulator::handle_created(const CreatedEvent& created) {
  if (state_.status != ResponseStatus::Idle || state_.response_id) {
    return std::nullopt;
  }
  state_.response_id = created.response_id;
  state_.status = ResponseStatus::Created;
  return StartedUpdate{.response_id = created.response_id};
}

std::optional<StreamUpdate> ResponseAccumulator::handle_delta(const TextDeltaEvent& delta) {
  mark_streaming();
  state_.accumulated_text += delta.text;
  return DeltaUpdate{.text = delta.text};
}

std::optional<StreamUpdate> ResponseAccumulator::handle_snapshot(const std::string& text) {
  mark_streaming();
  state_.accumulated_text = text;
  return SnapshotUpdate{.text = state_.accumulated_text};
}

std::optional<StreamUpdate> ResponseAccumulator::handle_completed(const CompletedEvent& completed) {
  state_.previous_response_id = completed.response_id;
  if (!state_.response_id) {
    state_.response_id = completed.response_id;
  }
  state_.status = ResponseStatus::Completed;

  CompletedUpdate update;
  // Without an authoritative snapshot the delta-built text is a best effort.
  update.text = completed.output_text.value_or(state_.accumulated_text);
  update.response_id = completed.response_id;
  update.generated_images = completed.generated_images;
  return update;
}

std::optional<StreamUpdate> ResponseAccumulator::handle_incomplete(const IncompleteEvent& incomplete) {
  const std::string response_id = incomplete.response_id.value_or(state_.response_id.value_or(""));
  if (!response_id.empty()) {
    state_.previous_response_id = response_id;
    if (!state_.response_id) {
      state_.response_id = response_id;
    }
  }
  state_.status = ResponseStatus::Completed;

  CompletedUpdate update;
  update.text = state_.accumulated_text;
  update.response_id = response_id;
  update.incomplete = true;
  update.incomplete_reason = incomplete.reason;
  return update;
}

std::optional<StreamUpdate> ResponseAccumulator::handle_failure(std::string message, std::optional<std::string> code) {
  state_.status = ResponseStatus::Failed;
  return FailedUpdate{.message = std::move(message), .code = std::move(code), .cause = nullptr};
}

}  // namespace chatstream
