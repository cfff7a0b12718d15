#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "chatstream/logging.hpp"
#include "chatstream/response_accumulator.hpp"
#include "chatstream/streaming.hpp"

namespace chatstream {

using UpdateHandler = std::function<void(const StreamUpdate&)>;

struct StreamResult {
  std::vector<StreamUpdate> updates;
  ResponseState state;
  std::optional<std::string> final_text;
};

/**
 * Drives one streamed response from raw transport bytes to StreamUpdates:
 * SSE framing, `[DONE]` detection, event decoding and accumulation.
 *
 * Updates are delivered to the handler in order on the thread that calls
 * feed(). Exactly one terminal update is produced over the session lifetime.
 * The session refers to `context` and must not outlive it.
 */
class ResponseStreamSession {
public:
  explicit ResponseStreamSession(ConversationContext& context, UpdateHandler on_update = nullptr, Logger logger = {});

  ResponseStreamSession(const ResponseStreamSession&) = delete;
  ResponseStreamSession& operator=(const ResponseStreamSession&) = delete;

  /// Consumes transport bytes. Returns false once no further bytes are
  /// wanted: a terminal update was emitted or `[DONE]` arrived.
  bool feed(const char* data, std::size_t size);

  /// Transport reached end of body. Flushes a trailing frame and fails the
  /// response if it never reached a terminal state.
  void finish();

  void cancel();
  void fail(const std::string& message, std::exception_ptr cause = nullptr);

  bool done() const { return done_frame_seen_ || accumulator_.is_terminal(); }
  const ResponseAccumulator& accumulator() const { return accumulator_; }
  const std::vector<StreamUpdate>& updates() const { return updates_; }

  StreamResult result() const;

private:
  bool handle_event(const ServerSentEvent& event);
  void emit(std::optional<StreamUpdate> update);

  ConversationContext& context_;
  UpdateHandler on_update_;
  Logger logger_;
  ResponseAccumulator accumulator_;
  std::vector<StreamUpdate> updates_;
  SSEEventStream events_;
  bool done_frame_seen_ = false;
};

}  // namespace chatstream
