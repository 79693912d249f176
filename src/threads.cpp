#include "finagent/threads.hpp"

#include "finagent/provider_client.hpp"
#include "finagent/utils/values.hpp"

#include <nlohmann/json.hpp>

namespace finagent {
namespace {

using json = nlohmann::json;

constexpr const char* kThreadsPath = "/threads";
constexpr const char* kAgentsApi = "Agents API";

json attachments_to_json(const std::vector<ThreadMessageAttachment>& attachments) {
  json array = json::array();
  for (const auto& attachment : attachments) {
    array.push_back(json::object({{"file_id", attachment.file_id}}));
  }
  return array;
}

json content_to_json(const std::vector<ThreadMessageContentPart>& content) {
  json array = json::array();
  for (const auto& part : content) {
    array.push_back(json::object({{"type", part.type}, {"text", part.text}}));
  }
  return array;
}

json message_to_json(const ThreadMessageCreate& message) {
  json value = json::object();
  value["role"] = message.role;
  value["content"] = content_to_json(message.content);
  if (!message.attachments.empty()) {
    value["attachments"] = attachments_to_json(message.attachments);
  }
  return value;
}

json thread_request_to_json(const ThreadCreateRequest& request) {
  json body = json::object();
  if (!request.messages.empty()) {
    json messages = json::array();
    for (const auto& message : request.messages) {
      messages.push_back(message_to_json(message));
    }
    body["messages"] = std::move(messages);
  }
  if (!request.metadata.empty()) {
    body["metadata"] = request.metadata;
  }
  return body;
}

Thread parse_thread(const json& payload) {
  Thread thread;
  thread.raw = payload;
  thread.id = utils::string_field(payload, "id").value_or("");
  if (payload.contains("created_at") && payload.at("created_at").is_number_integer()) {
    thread.created_at = payload.at("created_at").get<std::int64_t>();
  }
  thread.object = utils::string_field(payload, "object").value_or("");
  if (payload.contains("metadata") && payload.at("metadata").is_object()) {
    for (auto it = payload.at("metadata").begin(); it != payload.at("metadata").end(); ++it) {
      if (it.value().is_string()) thread.metadata[it.key()] = it.value().get<std::string>();
    }
  }
  return thread;
}

}  // namespace

Thread ThreadsResource::create(const ThreadCreateRequest& request) const {
  return create(request, RequestOptions{});
}

Thread ThreadsResource::create(const ThreadCreateRequest& request, const RequestOptions& options) const {
  auto body = thread_request_to_json(request).dump(-1, ' ', false, json::error_handler_t::replace);
  auto response = client_.perform_request("POST", kThreadsPath, body, "application/json", kAgentsApi, options);
  return parse_thread(client_.parse_json_body(response, kAgentsApi));
}

}  // namespace finagent
