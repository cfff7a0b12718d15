#include "chatstream/http_client.hpp"

#include "chatstream/error.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <exception>
#include <map>
#include <memory>
#include <string>

namespace chatstream {
namespace {

#ifdef CHATSTREAM_VERSION
constexpr const char* kUserAgent = "chatstream/" CHATSTREAM_VERSION;
#else
constexpr const char* kUserAgent = "chatstream/0.0.0-dev";
#endif

struct WriteContext {
  std::string* body;
  const ChunkCallback* on_chunk;
  const AbortPredicate* should_abort;
  bool aborted = false;
  // Exceptions must not unwind through libcurl; they are rethrown after cleanup.
  std::exception_ptr error;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* context = static_cast<WriteContext*>(userdata);
  const size_t total = size * nmemb;
  if (context->on_chunk && *context->on_chunk) {
    try {
      if (!(*context->on_chunk)(ptr, total)) {
        context->aborted = true;
        return 0;
      }
    } catch (...) {
      context->error = std::current_exception();
      return 0;
    }
  }
  if (context->body) {
    context->body->append(ptr, total);
  }
  return total;
}

// Called by curl about once per second and on every transfer progress; a
// non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto* context = static_cast<WriteContext*>(userdata);
  try {
    if ((*context->should_abort)()) {
      context->aborted = true;
      return 1;
    }
  } catch (...) {
    context->error = std::current_exception();
    return 1;
  }
  return 0;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
  std::size_t total_size = size * nitems;
  std::string line(buffer, total_size);

  auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
  auto colon_pos = line.find(':');
  if (colon_pos != std::string::npos) {
    std::string key = line.substr(0, colon_pos);
    std::string value = line.substr(colon_pos + 1);

    auto trim = [](std::string& s) {
      auto not_space = [](unsigned char ch) { return !std::isspace(static_cast<unsigned char>(ch)); };
      s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
      s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    };

    trim(key);
    trim(value);
    if (!key.empty()) {
      (*headers)[key] = value;
    }
  }

  return total_size;
}

class CurlHttpClient : public HttpClient {
public:
  CurlHttpClient() = default;

  HttpResponse request(const HttpRequest& request) override {
    CURL* curl = curl_easy_init();
    if (!curl) {
      throw APIConnectionError("Failed to initialize libcurl");
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : request.headers) {
      std::string header = key + ": " + value;
      header_list = curl_slist_append(header_list, header.c_str());
    }

    HttpResponse response;
    WriteContext context{
        request.collect_body ? &response.body : nullptr,
        request.on_chunk ? &request.on_chunk : nullptr,
        request.should_abort ? &request.should_abort : nullptr,
    };

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
    if (context.should_abort) {
      curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
      curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
      curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &context);
    }

    if (!request.body.empty()) {
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    if (context.error) {
      std::rethrow_exception(context.error);
    }
    if (context.aborted) {
      response.aborted = true;
      return response;
    }
    if (res != CURLE_OK) {
      throw APIConnectionError(std::string("libcurl error: ") + curl_easy_strerror(res));
    }
    return response;
  }
};

struct CurlGlobalState {
  CurlGlobalState() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobalState() { curl_global_cleanup(); }
};

CurlGlobalState& curl_state() {
  static CurlGlobalState state;
  return state;
}

}  // namespace

std::unique_ptr<HttpClient> make_default_http_client() {
  (void)curl_state();
  return std::make_unique<CurlHttpClient>();
}

}  // namespace chatstream
