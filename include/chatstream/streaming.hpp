#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chatstream {

struct ServerSentEvent {
  std::optional<std::string> event;
  std::optional<std::string> id;
  std::string data;
  bool has_data = false;
};

/// Literal payload the Responses API sends after the last event.
inline constexpr std::string_view kDoneFrame = "[DONE]";

bool is_done_frame(std::string_view data);

std::vector<ServerSentEvent> parse_sse_stream(const std::string& payload);

/**
 * Incremental SSE frame splitter. Bytes may arrive split at any position;
 * incomplete lines stay buffered until the next feed() or finalize().
 *
 * A partial line longer than `max_buffer_size` raises
 * StreamBufferOverflowError. Complete events extracted from the same chunk are
 * still returned; the overflow is then held back and raised by
 * throw_if_overflowed() or the next feed() or finalize().
 */
class SSEParser {
public:
  static constexpr std::size_t kDefaultMaxBufferSize = 1024 * 1024;

  explicit SSEParser(std::size_t max_buffer_size = kDefaultMaxBufferSize) : max_buffer_size_(max_buffer_size) {}

  std::vector<ServerSentEvent> feed(const char* data, std::size_t size);
  std::vector<ServerSentEvent> finalize();
  void reset();

  void throw_if_overflowed();

private:
  std::vector<ServerSentEvent> extract_events();
  void process_line(std::string_view line, std::vector<ServerSentEvent>& events);
  void flush_current(std::vector<ServerSentEvent>& events);

  std::size_t max_buffer_size_;
  std::string buffer_;
  ServerSentEvent current_;
  bool current_started_ = false;
  std::optional<std::size_t> overflow_size_;
};

class SSEEventStream {
public:
  using EventHandler = std::function<bool(const ServerSentEvent&)>;

  explicit SSEEventStream(EventHandler handler = nullptr,
                          std::size_t max_buffer_size = SSEParser::kDefaultMaxBufferSize);

  void feed(const char* data, std::size_t size);
  void finalize();
  void stop();

  [[nodiscard]] bool stopped() const { return stopped_; }
  [[nodiscard]] std::size_t dispatched() const { return dispatched_; }

private:
  void dispatch_events(std::vector<ServerSentEvent>&& events);

  SSEParser parser_;
  EventHandler handler_;
  std::size_t dispatched_ = 0;
  bool stopped_ = false;
};

}  // namespace chatstream
