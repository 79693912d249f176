#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace finagent {

struct ThreadMessageAttachment {
  std::string file_id;
};

struct ThreadMessageContentPart {
  std::string type = "text";
  std::string text;
};

struct ThreadMessageCreate {
  std::string role = "user";
  std::vector<ThreadMessageContentPart> content;
  std::vector<ThreadMessageAttachment> attachments;
};

struct ThreadCreateRequest {
  std::vector<ThreadMessageCreate> messages;
  std::map<std::string, std::string> metadata;
};

struct Thread {
  std::string id;
  std::int64_t created_at = 0;
  std::map<std::string, std::string> metadata;
  std::string object;
  nlohmann::json raw = nlohmann::json::object();
};

struct RequestOptions;
class ProviderClient;

class ThreadsResource {
public:
  explicit ThreadsResource(ProviderClient& client) : client_(client) {}

  Thread create(const ThreadCreateRequest& request) const;
  Thread create(const ThreadCreateRequest& request, const RequestOptions& options) const;

private:
  ProviderClient& client_;
};

}  // namespace finagent
