#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "finagent/utils/to_file.hpp"

namespace finagent {

struct FileObject {
  std::string id;
  std::size_t bytes = 0;
  std::int64_t created_at = 0;
  std::string filename;
  std::string object;
  std::string purpose;
  std::string status;
  nlohmann::json raw = nlohmann::json::object();
};

struct FileCreateRequest {
  std::string purpose = "assistants";
  utils::UploadSource file;
};

struct RequestOptions;
class ProviderClient;

class FilesResource {
public:
  explicit FilesResource(ProviderClient& client) : client_(client) {}

  FileObject create(const FileCreateRequest& request) const;
  FileObject create(const FileCreateRequest& request, const RequestOptions& options) const;

private:
  ProviderClient& client_;
};

}  // namespace finagent
