#include "finagent/http_client.hpp"

#include "finagent/error.hpp"
#include "finagent/utils/values.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <string>

namespace finagent {
namespace {

struct ResponseSink {
  std::string body;
  std::map<std::string, std::string> headers;
};

size_t on_body(char* data, size_t size, size_t count, void* user) {
  static_cast<ResponseSink*>(user)->body.append(data, size * count);
  return size * count;
}

size_t on_header(char* data, size_t size, size_t count, void* user) {
  auto* sink = static_cast<ResponseSink*>(user);
  std::string line(data, size * count);
  // Interim responses (100 Continue) start a new header block; keep only the final one.
  if (line.rfind("HTTP/", 0) == 0) {
    sink->headers.clear();
    return line.size();
  }
  auto colon = line.find(':');
  if (colon != std::string::npos) {
    std::string key = utils::trim(line.substr(0, colon));
    if (!key.empty()) {
      sink->headers[key] = utils::trim(line.substr(colon + 1));
    }
  }
  return line.size();
}

void ensure_global_init() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw ConnectivityError("curl_global_init failed");
    }
  });
}

class CurlEasy {
public:
  CurlEasy() : handle_(curl_easy_init()) {
    if (!handle_) {
      throw ConnectivityError("Failed to initialize libcurl");
    }
    error_[0] = '\0';
    curl_easy_setopt(handle_.get(), CURLOPT_ERRORBUFFER, error_);
  }

  template <typename T>
  void set(CURLoption option, T value) {
    CURLcode rc = curl_easy_setopt(handle_.get(), option, value);
    if (rc != CURLE_OK) {
      throw ConnectivityError(std::string("libcurl option rejected: ") + curl_easy_strerror(rc));
    }
  }

  void perform() {
    CURLcode rc = curl_easy_perform(handle_.get());
    if (rc == CURLE_OK) {
      return;
    }
    std::string reason = error_[0] != '\0' ? std::string(error_) : curl_easy_strerror(rc);
    if (rc == CURLE_OPERATION_TIMEDOUT) {
      throw ConnectivityTimeoutError(reason);
    }
    throw ConnectivityError(reason);
  }

  long status_code() const {
    long status = 0;
    curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE, &status);
    return status;
  }

private:
  struct Cleanup {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
  };

  std::unique_ptr<CURL, Cleanup> handle_;
  char error_[CURL_ERROR_SIZE];
};

struct HeaderList {
  ~HeaderList() { curl_slist_free_all(list); }
  curl_slist* list = nullptr;
};

class CurlHttpClient final : public HttpClient {
public:
  HttpResponse request(const HttpRequest& request) override {
    CurlEasy curl;
    HeaderList header_list;
    for (const auto& [key, value] : request.headers) {
      curl_slist* appended = curl_slist_append(header_list.list, (key + ": " + value).c_str());
      if (appended == nullptr) {
        throw ConnectivityError("Failed to build request headers");
      }
      header_list.list = appended;
    }

    ResponseSink sink;
    curl.set(CURLOPT_URL, request.url.c_str());
    curl.set(CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl.set(CURLOPT_HTTPHEADER, header_list.list);
    curl.set(CURLOPT_WRITEFUNCTION, on_body);
    curl.set(CURLOPT_WRITEDATA, static_cast<void*>(&sink));
    curl.set(CURLOPT_HEADERFUNCTION, on_header);
    curl.set(CURLOPT_HEADERDATA, static_cast<void*>(&sink));
    curl.set(CURLOPT_NOSIGNAL, 1L);
    curl.set(CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    if (!request.body.empty()) {
      curl.set(CURLOPT_POSTFIELDS, request.body.data());
      curl.set(CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }

    curl.perform();
    return HttpResponse{curl.status_code(), std::move(sink.headers), std::move(sink.body)};
  }
};

}  // namespace

std::unique_ptr<HttpClient> make_default_http_client() {
  ensure_global_init();
  return std::make_unique<CurlHttpClient>();
}

}  // namespace finagent
