#include "chatstream/client.hpp"

#include "chatstream/error.hpp"
#include "chatstream/http_client.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>
#include <utility>

#include "chatstream/utils/env.hpp"

namespace chatstream {
namespace {

using json = nlohmann::json;

constexpr const char* kDefaultBaseUrl = "https://api.openai.com/v1";
constexpr const char* kResponsesPath = "/responses";
// Non-2xx bodies are short JSON documents; anything past this is not needed
// to extract the server message.
constexpr std::size_t kMaxErrorBodySize = 64 * 1024;

std::string build_url(const std::string& base, const std::string& path) {
  std::string url = base;
  if (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  url += path;
  return url;
}

std::optional<json> safe_json(const std::string& text) {
  auto parsed = json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    return std::nullopt;
  }
  return parsed;
}

std::string extract_error_message(const json& payload) {
  if (payload.is_object() && payload.contains("error")) {
    const auto& err = payload.at("error");
    if (err.is_object()) {
      return err.value("message", "");
    }
    if (err.is_string()) {
      return err.get<std::string>();
    }
  }
  return {};
}

json extract_error_payload(const json& payload) {
  if (payload.is_object() && payload.contains("error")) {
    const auto& err = payload.at("error");
    if (err.is_object()) {
      return err;
    }
  }
  return payload;
}

std::map<std::string, std::string> sanitize_headers(const std::map<std::string, std::string>& headers) {
  static const std::set<std::string> kSensitive = {"authorization", "cookie", "set-cookie"};
  std::map<std::string, std::string> sanitized;
  for (const auto& [key, value] : headers) {
    std::string lowered;
    lowered.reserve(key.size());
    std::transform(key.begin(), key.end(), std::back_inserter(lowered), [](unsigned char c) {
      return static_cast<char>(std::tolower(c));
    });
    if (kSensitive.count(lowered)) {
      sanitized[key] = "***";
    } else {
      sanitized[key] = value;
    }
  }
  return sanitized;
}

json build_request_log_details(const HttpRequest& request) {
  json details;
  details["method"] = request.method;
  details["url"] = request.url;
  details["headers"] = sanitize_headers(request.headers);
  return details;
}

TransportError make_transport_error(const HttpResponse& response, const std::string& error_body) {
  json error_payload = json::object();
  std::string server_message;
  if (auto payload = safe_json(error_body)) {
    server_message = extract_error_message(*payload);
    error_payload = extract_error_payload(*payload);
  }
  const std::string message =
      server_message.empty() ? ("HTTP " + std::to_string(response.status_code) + " error") : server_message;
  return TransportError(message, response.status_code, server_message, error_payload, response.headers);
}

}  // namespace

ResponseStreamClient::ResponseStreamClient(ClientOptions options, std::unique_ptr<HttpClient> http_client)
    : options_(std::move(options)),
      http_client_(http_client ? std::move(http_client) : make_default_http_client()) {
  if (options_.api_key.empty()) {
    if (auto env_api = utils::read_env("OPENAI_API_KEY")) {
      options_.api_key = *env_api;
    }
  }

  if (auto env_base = utils::read_env("OPENAI_BASE_URL")) {
    if (!env_base->empty()) {
      if (options_.base_url == kDefaultBaseUrl) {
        options_.base_url = *env_base;
      }
    } else if (options_.base_url.empty()) {
      options_.base_url = kDefaultBaseUrl;
    }
  }

  if (!options_.organization) {
    if (auto env_org = utils::read_env("OPENAI_ORG_ID")) {
      options_.organization = *env_org;
    }
  }

  if (!options_.project) {
    if (auto env_project = utils::read_env("OPENAI_PROJECT_ID")) {
      options_.project = *env_project;
    }
  }

  if (options_.log_level == LogLevel::Off) {
    if (auto env_log = utils::read_env("CHATSTREAM_LOG")) {
      if (!env_log->empty()) {
        options_.log_level = parse_log_level(*env_log, options_.log_level);
      }
    }
  }

  if (options_.api_key.empty()) {
    throw ChatStreamError("Missing API key. Provide ClientOptions.api_key or set the OPENAI_API_KEY environment variable.");
  }
  if (options_.timeout.count() <= 0) {
    throw ChatStreamError("ClientOptions.timeout must be a positive duration");
  }

  logger_ = Logger(options_.log_level, options_.logger);
}

void ResponseStreamClient::log(LogLevel level, const std::string& message, const nlohmann::json& details) const {
  logger_.log(level, message, details);
}

HttpRequest ResponseStreamClient::build_http_request(const ResponseRequest& request,
                                                     const ConversationContext& context) const {
  ResponseRequest outgoing = request;
  if (!outgoing.previous_response_id && context.previous_response_id) {
    outgoing.previous_response_id = context.previous_response_id;
  }

  HttpRequest http_request;
  http_request.method = "POST";
  http_request.url = build_url(options_.base_url, kResponsesPath);
  http_request.body = build_request_body(outgoing, true).dump();
  http_request.timeout = options_.timeout;
  http_request.collect_body = false;

  std::map<std::string, std::string> headers;
  headers["Accept"] = "text/event-stream";
  headers["Content-Type"] = "application/json";
  headers["Authorization"] = std::string("Bearer ") + options_.api_key;
  if (options_.organization) {
    headers["OpenAI-Organization"] = *options_.organization;
  }
  if (options_.project) {
    headers["OpenAI-Project"] = *options_.project;
  }
  for (const auto& [key, value] : options_.default_headers) {
    headers[key] = value;
  }
  http_request.headers = std::move(headers);
  return http_request;
}

StreamResult ResponseStreamClient::stream(const ResponseRequest& request,
                                          ConversationContext& context,
                                          const UpdateHandler& on_update,
                                          const CancellationToken* cancellation) const {
  ResponseStreamSession session(context, on_update, logger_);
  HttpRequest http_request = build_http_request(request, context);

  if (cancellation && cancellation->cancelled()) {
    log(LogLevel::Info, "stream cancelled before request");
    session.cancel();
    return session.result();
  }

  std::string error_body;
  http_request.on_chunk = [&](const char* data, std::size_t size) {
    if (cancellation && cancellation->cancelled()) {
      session.cancel();
      return false;
    }
    if (error_body.size() < kMaxErrorBodySize) {
      error_body.append(data, std::min(size, kMaxErrorBodySize - error_body.size()));
    }
    return session.feed(data, size);
  };
  if (cancellation) {
    http_request.should_abort = [cancellation] { return cancellation->cancelled(); };
  }

  log(LogLevel::Debug, "sending request", build_request_log_details(http_request));
  auto start_time = std::chrono::steady_clock::now();
  HttpResponse response;
  try {
    response = http_client_->request(http_request);
  } catch (const TransportError& error) {
    if (cancellation && cancellation->cancelled()) {
      log(LogLevel::Info, "stream cancelled", json{{"transport_error", error.what()}});
      session.cancel();
      return session.result();
    }
    log(LogLevel::Error, "request failed", build_request_log_details(http_request));
    session.fail(error.what(), std::current_exception());
    return session.result();
  } catch (const std::exception& error) {
    // Not a transport failure, e.g. thrown by the update handler. The original
    // exception is kept as the cause.
    if (cancellation && cancellation->cancelled()) {
      log(LogLevel::Info, "stream cancelled", json{{"error", error.what()}});
      session.cancel();
      return session.result();
    }
    log(LogLevel::Error, "stream failed", json{{"error", error.what()}});
    session.fail(error.what(), std::current_exception());
    return session.result();
  }

  auto details = build_request_log_details(http_request);
  details["status"] = response.status_code;
  details["duration_ms"] =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_time).count();
  details["response_headers"] = sanitize_headers(response.headers);

  if (cancellation && cancellation->cancelled()) {
    log(LogLevel::Info, "stream cancelled", details);
    session.cancel();
    return session.result();
  }

  if (response.status_code < 200 || response.status_code >= 300) {
    log(LogLevel::Error, "request failed", details);
    auto error = make_transport_error(response, error_body);
    session.fail(error.what(), std::make_exception_ptr(error));
    return session.result();
  }

  log(LogLevel::Info, "request succeeded", details);
  session.finish();
  return session.result();
}

}  // namespace chatstream
