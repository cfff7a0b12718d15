#pragma once

#include "chatstream/http_client.hpp"
#include "chatstream/error.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <variant>
#include <vector>

namespace chatstream::testing {

/**
 * In-memory HttpClient that replays queued responses. Bodies are delivered
 * to `on_chunk` in the enqueued pieces so tests can control where the
 * transport splits the stream. `should_abort` is polled before each piece,
 * as the curl progress callback polls it between reads.
 */
class MockHttpClient final : public HttpClient {
public:
  struct EnqueuedError {
    std::string message;
  };

  struct ChunkedResponse {
    HttpResponse response;
    std::vector<std::string> chunks;
  };

  using Enqueued = std::variant<ChunkedResponse, EnqueuedError>;

  /// Called before chunk `index` is delivered. A hook may throw to simulate a
  /// transport failure in the middle of the body.
  using ChunkHook = std::function<void(std::size_t index)>;

  HttpResponse request(const HttpRequest& request) override {
    std::lock_guard<std::mutex> lock(mutex_);
    last_request_ = request;
    ++request_count_;
    if (responses_.empty()) {
      throw ChatStreamError("MockHttpClient queue underflow");
    }

    auto next = std::move(responses_.front());
    responses_.pop();

    if (std::holds_alternative<EnqueuedError>(next)) {
      throw APIConnectionError(std::get<EnqueuedError>(next).message);
    }
    auto& chunked = std::get<ChunkedResponse>(next);
    HttpResponse response = chunked.response;
    for (std::size_t i = 0; i < chunked.chunks.size(); ++i) {
      if (before_chunk_) {
        before_chunk_(i);
      }
      if (request.should_abort && request.should_abort()) {
        response.aborted = true;
        break;
      }
      const auto& chunk = chunked.chunks[i];
      ++delivered_chunks_;
      if (request.on_chunk && !request.on_chunk(chunk.data(), chunk.size())) {
        response.aborted = true;
        break;
      }
      if (request.collect_body) {
        response.body.append(chunk);
      }
    }
    return response;
  }

  void enqueue_response(HttpResponse response) {
    std::vector<std::string> chunks{response.body};
    response.body.clear();
    enqueue_chunks(std::move(response), std::move(chunks));
  }

  void enqueue_chunks(HttpResponse response, std::vector<std::string> chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push(ChunkedResponse{std::move(response), std::move(chunks)});
  }

  void enqueue_error(std::string message) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push(EnqueuedError{std::move(message)});
  }

  void set_before_chunk(ChunkHook hook) { before_chunk_ = std::move(hook); }

  [[nodiscard]] const std::optional<HttpRequest>& last_request() const {
    return last_request_;
  }

  [[nodiscard]] std::size_t request_count() const { return request_count_; }
  [[nodiscard]] std::size_t delivered_chunks() const { return delivered_chunks_; }

  void reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_ = {};
    last_request_.reset();
    request_count_ = 0;
    delivered_chunks_ = 0;
  }

private:
  std::queue<Enqueued> responses_;
  std::optional<HttpRequest> last_request_;
  ChunkHook before_chunk_;
  std::size_t request_count_ = 0;
  std::size_t delivered_chunks_ = 0;
  mutable std::mutex mutex_;
};

}  // namespace chatstream::testing
