#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace chatstream {

/// Receives response body bytes as they arrive. Returning false stops the
/// transfer and releases the connection.
using ChunkCallback = std::function<bool(const char*, std::size_t)>;

/// Polled while the transfer is in progress, including while it waits for
/// bytes. Returning true stops the transfer.
using AbortPredicate = std::function<bool()>;

struct HttpRequest {
  std::string method;
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{600000};
  ChunkCallback on_chunk;
  AbortPredicate should_abort;
  bool collect_body = true;
};

struct HttpResponse {
  long status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
  /// Set when `on_chunk` or `should_abort` stopped the transfer before the
  /// body ended.
  bool aborted = false;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse request(const HttpRequest& request) = 0;
};

std::unique_ptr<HttpClient> make_default_http_client();

}  // namespace chatstream
