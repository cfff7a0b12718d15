#include "chatstream/streaming.hpp"

#include "chatstream/error.hpp"

namespace chatstream {
namespace {

std::string_view trim_carriage_return(std::string_view line) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }
  return line;
}

}  // namespace

bool is_done_frame(std::string_view data) {
  while (!data.empty() && (data.back() == ' ' || data.back() == '\r' || data.back() == '\n')) {
    data.remove_suffix(1);
  }
  return data == kDoneFrame;
}

std::vector<ServerSentEvent> SSEParser::feed(const char* data, std::size_t size) {
  throw_if_overflowed();
  buffer_.append(data, size);
  auto events = extract_events();
  if (buffer_.size() > max_buffer_size_) {
    overflow_size_ = buffer_.size();
    buffer_.clear();
    if (events.empty()) {
      throw_if_overflowed();
    }
  }
  return events;
}

void SSEParser::throw_if_overflowed() {
  if (!overflow_size_) {
    return;
  }
  const auto overflow = *overflow_size_;
  overflow_size_.reset();
  throw StreamBufferOverflowError(overflow, max_buffer_size_);
}

std::vector<ServerSentEvent> SSEParser::finalize() {
  throw_if_overflowed();
  buffer_.append("\n");
  auto events = extract_events();
  flush_current(events);
  buffer_.clear();
  return events;
}

void SSEParser::reset() {
  buffer_.clear();
  current_ = ServerSentEvent{};
  current_started_ = false;
  overflow_size_.reset();
}

std::vector<ServerSentEvent> SSEParser::extract_events() {
  std::vector<ServerSentEvent> events;
  std::size_t start = 0;

  while (true) {
    auto newline_pos = buffer_.find('\n', start);
    if (newline_pos == std::string::npos) {
      break;
    }

    std::string_view line(buffer_.data() + start, newline_pos - start);
    process_line(trim_carriage_return(line), events);
    start = newline_pos + 1;
  }

  buffer_.erase(0, start);

  return events;
}

void SSEParser::flush_current(std::vector<ServerSentEvent>& events) {
  if (current_started_) {
    events.push_back(std::move(current_));
  }
  current_ = ServerSentEvent{};
  current_started_ = false;
}

void SSEParser::process_line(std::string_view line, std::vector<ServerSentEvent>& events) {
  if (line.empty()) {
    flush_current(events);
    return;
  }

  if (line.front() == ':') {
    return;
  }

  auto colon_pos = line.find(':');
  std::string_view field = colon_pos == std::string_view::npos ? line : line.substr(0, colon_pos);
  std::string_view value = colon_pos == std::string_view::npos ? std::string_view{} : line.substr(colon_pos + 1);
  if (!value.empty() && value.front() == ' ') {
    value.remove_prefix(1);
  }

  if (field == "event") {
    current_.event = std::string(value);
    current_started_ = true;
  } else if (field == "data") {
    if (current_.has_data) {
      current_.data.push_back('\n');
    }
    current_.data.append(value);
    current_.has_data = true;
    current_started_ = true;
  } else if (field == "id") {
    current_.id = std::string(value);
    current_started_ = true;
  }
}

std::vector<ServerSentEvent> parse_sse_stream(const std::string& payload) {
  SSEParser parser;
  auto events = parser.feed(payload.data(), payload.size());
  auto remaining = parser.finalize();
  events.insert(events.end(), remaining.begin(), remaining.end());
  return events;
}

SSEEventStream::SSEEventStream(EventHandler handler, std::size_t max_buffer_size)
    : parser_(max_buffer_size), handler_(std::move(handler)) {}

void SSEEventStream::feed(const char* data, std::size_t size) {
  if (stopped_) return;
  auto events = parser_.feed(data, size);
  dispatch_events(std::move(events));
  // A handler that stopped the stream has already consumed what it needed.
  if (!stopped_) {
    parser_.throw_if_overflowed();
  }
}

void SSEEventStream::finalize() {
  if (stopped_) return;
  auto events = parser_.finalize();
  dispatch_events(std::move(events));
}

void SSEEventStream::stop() {
  stopped_ = true;
  parser_.reset();
}

void SSEEventStream::dispatch_events(std::vector<ServerSentEvent>&& events) {
  for (const auto& event : events) {
    if (stopped_) break;
    ++dispatched_;
    if (handler_ && !handler_(event)) {
      stop();
    }
  }
}

}  // namespace chatstream
