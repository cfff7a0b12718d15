#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "chatstream/http_client.hpp"
#include "chatstream/logging.hpp"
#include "chatstream/request.hpp"
#include "chatstream/response_stream.hpp"

namespace chatstream {

struct ClientOptions {
  std::string api_key;
  std::optional<std::string> organization;
  std::optional<std::string> project;
  std::string base_url = "https://api.openai.com/v1";
  std::chrono::milliseconds timeout{600000};
  std::map<std::string, std::string> default_headers;
  LogLevel log_level = LogLevel::Off;
  LoggerCallback logger;
};

/**
 * Owner-side cancellation flag. cancel() may be called from any thread; the
 * stream observes it at the next chunk boundary or transport progress poll.
 */
class CancellationToken {
public:
  void cancel() { cancelled_.store(true); }
  bool cancelled() const { return cancelled_.load(); }

private:
  std::atomic<bool> cancelled_{false};
};

class ResponseStreamClient {
public:
  explicit ResponseStreamClient(ClientOptions options, std::unique_ptr<HttpClient> http_client = nullptr);

  const ClientOptions& options() const { return options_; }

  /**
   * POSTs `request` to `/responses` with streaming enabled and blocks until the
   * response reaches a terminal state. Each update is handed to `on_update`
   * as soon as it is produced and is also recorded in the returned result.
   *
   * `context.previous_response_id` is sent when the request carries none, and
   * is replaced with the new response id on completion. Transport failures
   * and non-2xx statuses end the stream with a FailedUpdate whose cause is a
   * TransportError; they are not thrown. An exception from `on_update` ends it
   * the same way with that exception as the cause. Once `cancellation` is set
   * the transfer is stopped, even while waiting for bytes, and the stream
   * ends with a CancelledUpdate whatever the transport reports. An empty
   * model throws ChatStreamError before any request is made.
   */
  StreamResult stream(const ResponseRequest& request,
                      ConversationContext& context,
                      const UpdateHandler& on_update = nullptr,
                      const CancellationToken* cancellation = nullptr) const;

private:
  HttpRequest build_http_request(const ResponseRequest& request, const ConversationContext& context) const;

  void log(LogLevel level, const std::string& message, const nlohmann::json& details = {}) const;

  ClientOptions options_;
  std::unique_ptr<HttpClient> http_client_;
  Logger logger_;
};

}  // namespace chatstream
