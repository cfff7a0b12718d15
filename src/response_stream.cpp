#include "chatstream/response_stream.hpp"

#include <type_traits>
#include <utility>

#include <nlohmann/json.hpp>

#include "chatstream/error.hpp"
#include "chatstream/stream_event.hpp"

namespace chatstream {
namespace {

using json = nlohmann::json;

// A missing field in these events leaves the response without a usable
// outcome, so the stream cannot continue.
bool is_critical_event_type(const std::string& type) {
  return type == "response.completed" || type == "response.failed" || type == "error";
}

const char* update_name(const StreamUpdate& update) {
  return std::visit(
      [](const auto& value) -> const char* {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, StartedUpdate>) {
          return "started";
        } else if constexpr (std::is_same_v<T, DeltaUpdate>) {
          return "delta";
        } else if constexpr (std::is_same_v<T, SnapshotUpdate>) {
          return "snapshot";
        } else if constexpr (std::is_same_v<T, CompletedUpdate>) {
          return "completed";
        } else if constexpr (std::is_same_v<T, FailedUpdate>) {
          return "failed";
        } else {
          return "cancelled";
        }
      },
      update);
}

}  // namespace

ResponseStreamSession::ResponseStreamSession(ConversationContext& context, UpdateHandler on_update, Logger logger)
    : context_(context),
      on_update_(std::move(on_update)),
      logger_(std::move(logger)),
      events_([this](const ServerSentEvent& event) { return handle_event(event); }) {}

bool ResponseStreamSession::feed(const char* data, std::size_t size) {
  if (done()) {
    return false;
  }
  try {
    events_.feed(data, size);
  } catch (const StreamBufferOverflowError& error) {
    logger_.log(LogLevel::Error, "stream buffer overflow", json{{"size", error.size()}, {"limit", error.limit()}});
    fail(error.what(), std::current_exception());
  }
  return !done();
}

void ResponseStreamSession::finish() {
  if (accumulator_.is_terminal()) {
    return;
  }
  if (!done_frame_seen_) {
    events_.finalize();
  }
  if (!accumulator_.is_terminal()) {
    logger_.log(LogLevel::Warn, "stream ended without a terminal event",
                json{{"status", to_string(accumulator_.status())}});
    emit(accumulator_.finish());
  }
}

void ResponseStreamSession::cancel() {
  events_.stop();
  emit(accumulator_.cancel());
}

void ResponseStreamSession::fail(const std::string& message, std::exception_ptr cause) {
  events_.stop();
  emit(accumulator_.fail(message, std::move(cause)));
}

StreamResult ResponseStreamSession::result() const {
  StreamResult result;
  result.updates = updates_;
  result.state = accumulator_.state();
  for (const auto& update : updates_) {
    if (const auto* completed = std::get_if<CompletedUpdate>(&update)) {
      result.final_text = completed->text;
    }
  }
  return result;
}

bool ResponseStreamSession::handle_event(const ServerSentEvent& event) {
  if (!event.has_data) {
    return true;
  }
  if (is_done_frame(event.data)) {
    done_frame_seen_ = true;
    return false;
  }

  StreamEvent decoded;
  try {
    decoded = decode_stream_event(event.data);
  } catch (const DecodeError& error) {
    json details{{"event_type", error.event_type()}, {"key", error.key()}, {"path", error.path()}};
    if (error.kind() == DecodeError::Kind::MalformedPayload || is_critical_event_type(error.event_type())) {
      logger_.log(LogLevel::Error, "failed to decode stream event", details);
      fail(error.what(), std::current_exception());
      return false;
    }
    logger_.log(LogLevel::Warn, "ignoring undecodable stream event", details);
    decoded = IgnoredEvent{error.event_type()};
  }

  if (logger_.enabled(LogLevel::Debug)) {
    logger_.log(LogLevel::Debug, "stream event", json{{"type", event_type_name(decoded)}});
  }
  emit(accumulator_.ingest(decoded, context_));
  return !accumulator_.is_terminal();
}

void ResponseStreamSession::emit(std::optional<StreamUpdate> update) {
  if (!update) {
    return;
  }
  if (is_terminal(*update)) {
    logger_.log(LogLevel::Info, "stream finished",
                json{{"outcome", update_name(*update)},
                     {"response_id", accumulator_.response_id().value_or("")},
                     {"updates", updates_.size() + 1}});
  }
  updates_.push_back(*update);
  if (on_update_) {
    on_update_(updates_.back());
  }
}

}  // namespace chatstream
