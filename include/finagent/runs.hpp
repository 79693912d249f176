#pragma once

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace finagent {

struct RunCreateRequest {
  std::string assistant_id;
  std::optional<std::string> instructions;
  std::map<std::string, std::string> metadata;
  // Passed through verbatim; see schema_profiles.hpp.
  std::optional<nlohmann::json> response_format;
};

struct Run {
  std::string id;
  std::string thread_id;
  std::optional<std::string> status;
  std::optional<double> created_at;
  std::optional<std::string> assistant_id;
  std::optional<std::string> dashboard_url;
  std::map<std::string, std::string> metadata;
  nlohmann::json raw = nlohmann::json::object();
};

struct RequestOptions;
class ProviderClient;

class RunsResource {
public:
  explicit RunsResource(ProviderClient& client) : client_(client) {}

  Run create(const std::string& thread_id, const RunCreateRequest& request) const;
  Run create(const std::string& thread_id, const RunCreateRequest& request, const RequestOptions& options) const;

private:
  ProviderClient& client_;
};

}  // namespace finagent
