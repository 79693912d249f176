#include "finagent/provider_client.hpp"

#include "finagent/error.hpp"
#include "finagent/utils/platform.hpp"
#include "finagent/utils/time.hpp"
#include "finagent/utils/values.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <set>
#include <utility>

namespace finagent {
namespace {

constexpr const char* kBetaHeaderName = "OpenAI-Beta";
constexpr const char* kBetaHeaderValue = "assistants=v2";

std::string build_url(const std::string& base_url, const std::string& path) {
  std::string base = base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  if (path.empty()) {
    return base;
  }
  if (path.front() == '/') {
    return base + path;
  }
  return base + "/" + path;
}

std::map<std::string, std::string> sanitize_headers(const std::map<std::string, std::string>& headers) {
  static const std::set<std::string> kSensitive = {"authorization", "cookie", "set-cookie"};
  std::map<std::string, std::string> sanitized;
  for (const auto& [key, value] : headers) {
    std::string lowered; lowered.reserve(key.size());
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

nlohmann::json build_request_log_details(const HttpRequest& request, std::size_t attempt) {
  nlohmann::json details;
  details["method"] = request.method;
  details["url"] = request.url;
  details["attempt"] = static_cast<int>(attempt);
  details["headers"] = sanitize_headers(request.headers);
  details["body_bytes"] = request.body.size();
  return details;
}

nlohmann::json build_response_log_details(const HttpRequest& request,
                                          const HttpResponse& response,
                                          std::chrono::steady_clock::duration duration,
                                          std::size_t attempt) {
  nlohmann::json details = build_request_log_details(request, attempt);
  details["status"] = response.status_code;
  details["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
  return details;
}

bool is_success(long status) {
  return status >= 200 && status < 300;
}

}  // namespace

ProviderOptions provider_options_from(const Settings& settings, Logger logger) {
  ProviderOptions options;
  options.api_key = settings.api_key;
  options.base_url = settings.base_url;
  options.timeout = settings.timeout;
  options.max_connectivity_retries = settings.max_connectivity_retries;
  options.logger = std::move(logger);
  return options;
}

ProviderClient::ProviderClient(ProviderOptions options,
                               std::unique_ptr<HttpClient> http_client)
    : options_(std::move(options)),
      http_client_(http_client ? std::move(http_client) : make_default_http_client()),
      files_(*this),
      threads_(*this),
      runs_(*this) {
  if (options_.base_url.empty()) {
    options_.base_url = kDefaultBaseUrl;
  }
  if (options_.timeout.count() <= 0) {
    throw ConfigurationError("ProviderOptions.timeout must be positive");
  }
}

HttpResponse ProviderClient::perform_request(const std::string& method,
                                             const std::string& path,
                                             const std::string& body,
                                             const std::string& content_type,
                                             const std::string& api_name,
                                             const RequestOptions& options) const {
  if (!has_api_key()) {
    throw ConfigurationError("OPENAI_API_KEY is not configured.");
  }

  HttpRequest http_request;
  http_request.method = method;
  http_request.url = build_url(options_.base_url, path);
  http_request.body = body;
  http_request.timeout = options.timeout.value_or(options_.timeout);

  std::map<std::string, std::string> headers;
  headers["Accept"] = "application/json";
  headers["User-Agent"] = utils::user_agent();
  headers["Authorization"] = std::string("Bearer ") + *options_.api_key;
  headers[kBetaHeaderName] = kBetaHeaderValue;
  for (const auto& [key, value] : options_.default_headers) {
    headers[key] = value;
  }
  if (!body.empty() && !content_type.empty()) {
    headers["Content-Type"] = content_type;
  }
  for (const auto& [key, value] : options.headers) {
    headers[key] = value;
  }
  http_request.headers = std::move(headers);

  const Logger& logger = options_.logger;
  std::size_t attempt = 0;
  while (true) {
    logger.debug("sending request", build_request_log_details(http_request, attempt));
    auto start_time = std::chrono::steady_clock::now();
    HttpResponse response;
    try {
      response = http_client_->request(http_request);
    } catch (const std::exception& error) {
      auto details = build_request_log_details(http_request, attempt);
      details["error"] = error.what();
      if (attempt < options_.max_connectivity_retries) {
        auto delay = utils::calculate_retry_delay(attempt);
        details["retry_delay_ms"] = delay.count();
        logger.warn("request failed, retrying", details);
        utils::sleep_for(delay);
        ++attempt;
        continue;
      }
      logger.error("Failed to reach OpenAI " + api_name, details);
      const std::string message = "Failed to reach OpenAI " + api_name + ": " + error.what();
      if (dynamic_cast<const ConnectivityTimeoutError*>(&error) != nullptr) {
        throw ConnectivityTimeoutError(message);
      }
      throw ConnectivityError(message);
    }

    auto duration = std::chrono::steady_clock::now() - start_time;
    if (is_success(response.status_code)) {
      logger.info("request succeeded", build_response_log_details(http_request, response, duration, attempt));
      return response;
    }

    std::string error_body = utils::truncate_chars(response.body, kMaxErrorBodyChars);
    auto details = build_response_log_details(http_request, response, duration, attempt);
    details["body"] = error_body;
    logger.error("OpenAI " + api_name + " error", details);
    throw UpstreamStatusError("OpenAI " + api_name + " error (" + std::to_string(response.status_code) +
                                  "): " + error_body,
                              response.status_code,
                              std::move(error_body));
  }
}

nlohmann::json ProviderClient::parse_json_body(const HttpResponse& response, const std::string& api_name) const {
  auto payload = utils::safe_json(response.body);
  if (!payload || !payload->is_object()) {
    options_.logger.error("OpenAI " + api_name + " returned a non-object payload",
                          {{"body", utils::truncate_chars(response.body, kMaxErrorBodyChars)}});
    throw ProtocolError("OpenAI " + api_name + " response was not a JSON object.");
  }
  return std::move(*payload);
}

}  // namespace finagent
