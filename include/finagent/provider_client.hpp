#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "finagent/config.hpp"
#include "finagent/files.hpp"
#include "finagent/http_client.hpp"
#include "finagent/logging.hpp"
#include "finagent/runs.hpp"
#include "finagent/threads.hpp"

namespace finagent {

constexpr std::size_t kMaxErrorBodyChars = 500;

struct RequestOptions {
  std::map<std::string, std::string> headers;
  std::optional<std::chrono::milliseconds> timeout;
};

struct ProviderOptions {
  std::optional<std::string> api_key;
  std::string base_url = kDefaultBaseUrl;
  std::chrono::milliseconds timeout{60000};
  std::size_t max_connectivity_retries = 0;
  std::map<std::string, std::string> default_headers;
  Logger logger;
};

ProviderOptions provider_options_from(const Settings& settings, Logger logger = {});

class ProviderClient {
public:
  explicit ProviderClient(ProviderOptions options,
                          std::unique_ptr<HttpClient> http_client = nullptr);

  const ProviderOptions& options() const { return options_; }

  bool has_api_key() const { return options_.api_key.has_value() && !options_.api_key->empty(); }

  FilesResource& files() { return files_; }
  const FilesResource& files() const { return files_; }

  ThreadsResource& threads() { return threads_; }
  const ThreadsResource& threads() const { return threads_; }

  RunsResource& runs() { return runs_; }
  const RunsResource& runs() const { return runs_; }

private:
  friend class FilesResource;
  friend class ThreadsResource;
  friend class RunsResource;

  HttpResponse perform_request(const std::string& method,
                               const std::string& path,
                               const std::string& body,
                               const std::string& content_type,
                               const std::string& api_name,
                               const RequestOptions& options) const;

  nlohmann::json parse_json_body(const HttpResponse& response, const std::string& api_name) const;

  ProviderOptions options_;
  std::unique_ptr<HttpClient> http_client_;
  FilesResource files_;
  ThreadsResource threads_;
  RunsResource runs_;
};

}  // namespace finagent
