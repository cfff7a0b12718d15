#pragma once

#include <map>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace chatstream {

class ChatStreamError : public std::runtime_error {
public:
  explicit ChatStreamError(const std::string& message)
      : std::runtime_error(message) {}
};

/**
 * Raised when the server answers a streaming request with a non-2xx status.
 * `server_message` is the `error.message` field of the response body when
 * the body could be read as JSON.
 */
class TransportError : public ChatStreamError {
public:
  TransportError(std::string message,
                 long status_code,
                 std::string server_message,
                 nlohmann::json error_body,
                 std::map<std::string, std::string> headers)
      : ChatStreamError(std::move(message)),
        status_code_(status_code),
        server_message_(std::move(server_message)),
        error_body_(std::move(error_body)),
        headers_(std::move(headers)) {}

  long status_code() const { return status_code_; }
  const std::string& server_message() const { return server_message_; }
  const nlohmann::json& error_body() const { return error_body_; }
  const std::map<std::string, std::string>& headers() const { return headers_; }

private:
  long status_code_;
  std::string server_message_;
  nlohmann::json error_body_;
  std::map<std::string, std::string> headers_;
};

class APIConnectionError : public TransportError {
public:
  explicit APIConnectionError(const std::string& message)
      : TransportError(message, 0, message, nlohmann::json::object(), {}) {}
};

class DecodeError : public ChatStreamError {
public:
  enum class Kind { MalformedPayload, MissingField };

  DecodeError(Kind kind, std::string message, std::string event_type, std::string key, std::string path)
      : ChatStreamError(std::move(message)),
        kind_(kind),
        event_type_(std::move(event_type)),
        key_(std::move(key)),
        path_(std::move(path)) {}

  static DecodeError malformed(const std::string& detail, const std::string& event_type = {}) {
    return DecodeError(Kind::MalformedPayload, "Malformed stream payload: " + detail, event_type, {}, {});
  }

  static DecodeError missing_field(const std::string& event_type, const std::string& key, const std::string& path) {
    std::string message = "Missing required field '" + key + "' at " + path;
    if (!event_type.empty()) {
      message += " in " + event_type + " event";
    }
    return DecodeError(Kind::MissingField, std::move(message), event_type, key, path);
  }

  Kind kind() const { return kind_; }
  const std::string& event_type() const { return event_type_; }
  const std::string& key() const { return key_; }
  const std::string& path() const { return path_; }

private:
  Kind kind_;
  std::string event_type_;
  std::string key_;
  std::string path_;
};

class StreamBufferOverflowError : public ChatStreamError {
public:
  StreamBufferOverflowError(std::size_t size, std::size_t limit)
      : ChatStreamError("SSE buffer overflow: " + std::to_string(size) + " bytes exceeds limit of " +
                        std::to_string(limit)),
        size_(size),
        limit_(limit) {}

  std::size_t size() const { return size_; }
  std::size_t limit() const { return limit_; }

private:
  std::size_t size_;
  std::size_t limit_;
};

}  // namespace chatstream
