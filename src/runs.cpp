#include "finagent/runs.hpp"

#include "finagent/provider_client.hpp"
#include "finagent/utils/values.hpp"

#include <nlohmann/json.hpp>

namespace finagent {
namespace {

using json = nlohmann::json;

constexpr const char* kAgentsApi = "Agents API";

json run_request_to_json(const RunCreateRequest& request) {
  json body = json::object();
  body["assistant_id"] = request.assistant_id;
  if (!request.metadata.empty()) body["metadata"] = request.metadata;
  if (request.response_format) body["response_format"] = *request.response_format;
  if (request.instructions) body["instructions"] = *request.instructions;
  return body;
}

Run parse_run(const json& payload) {
  Run run;
  run.raw = payload;
  run.id = utils::string_field(payload, "id").value_or("");
  run.thread_id = utils::string_field(payload, "thread_id").value_or("");
  run.status = utils::string_field(payload, "status");
  run.assistant_id = utils::string_field(payload, "assistant_id");
  run.dashboard_url = utils::string_field(payload, "dashboard_url");
  // nlohmann treats booleans as non-numbers, so `true` is rejected here.
  if (payload.contains("created_at") && payload.at("created_at").is_number()) {
    run.created_at = payload.at("created_at").get<double>();
  }
  if (payload.contains("metadata") && payload.at("metadata").is_object()) {
    for (auto it = payload.at("metadata").begin(); it != payload.at("metadata").end(); ++it) {
      if (it.value().is_string()) run.metadata[it.key()] = it.value().get<std::string>();
    }
  }
  return run;
}

}  // namespace

Run RunsResource::create(const std::string& thread_id, const RunCreateRequest& request) const {
  return create(thread_id, request, RequestOptions{});
}

Run RunsResource::create(const std::string& thread_id,
                         const RunCreateRequest& request,
                         const RequestOptions& options) const {
  auto body = run_request_to_json(request).dump(-1, ' ', false, json::error_handler_t::replace);
  auto path = "/threads/" + thread_id + "/runs";
  auto response = client_.perform_request("POST", path, body, "application/json", kAgentsApi, options);
  return parse_run(client_.parse_json_body(response, kAgentsApi));
}

}  // namespace finagent
