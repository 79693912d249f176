#include "finagent/files.hpp"

#include "finagent/provider_client.hpp"
#include "finagent/utils/multipart.hpp"
#include "finagent/utils/values.hpp"

#include <nlohmann/json.hpp>

namespace finagent {
namespace {

using json = nlohmann::json;

constexpr const char* kFilesPath = "/files";
constexpr const char* kFilesApi = "Files API";

FileObject parse_file(const json& payload) {
  FileObject file;
  file.raw = payload;
  file.id = utils::string_field(payload, "id").value_or("");
  if (payload.contains("bytes") && payload.at("bytes").is_number_unsigned()) {
    file.bytes = payload.at("bytes").get<std::size_t>();
  }
  if (payload.contains("created_at") && payload.at("created_at").is_number_integer()) {
    file.created_at = payload.at("created_at").get<std::int64_t>();
  }
  file.filename = utils::string_field(payload, "filename").value_or("");
  file.object = utils::string_field(payload, "object").value_or("");
  file.purpose = utils::string_field(payload, "purpose").value_or("");
  file.status = utils::string_field(payload, "status").value_or("");
  return file;
}

}  // namespace

FileObject FilesResource::create(const FileCreateRequest& request) const {
  return create(request, RequestOptions{});
}

FileObject FilesResource::create(const FileCreateRequest& request, const RequestOptions& options) const {
  utils::MultipartFormData form;
  form.append_text("purpose", request.purpose);
  form.append_file("file", request.file.filename, request.file.content_type, request.file.data);
  auto encoded = form.build();

  auto response = client_.perform_request("POST", kFilesPath, encoded.body, encoded.content_type, kFilesApi, options);
  return parse_file(client_.parse_json_body(response, kFilesApi));
}

}  // namespace finagent
