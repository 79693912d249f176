#pragma once

#include <cstddef>
#include <future>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "finagent/config.hpp"
#include "finagent/logging.hpp"
#include "finagent/metadata_recorder.hpp"
#include "finagent/provider_client.hpp"
#include "finagent/schema_profiles.hpp"
#include "finagent/utils/time.hpp"
#include "finagent/utils/to_file.hpp"

namespace finagent {

constexpr const char* kThreadSeedMessage =
    "Please review the attached spreadsheets. Follow the run instructions to generate the required financial "
    "summaries.";
constexpr const char* kDefaultRunInstructions =
    "Read the uploaded spreadsheets and produce the structured JSON outputs defined by the schema.";
constexpr const char* kDefaultFilename = "upload";
constexpr const char* kDefaultContentType = "application/octet-stream";

struct UploadResult {
  std::string file_id;
  std::string filename;
  std::optional<std::string> provider;
  std::string content_type;
  std::size_t bytes = 0;
  utils::Timestamp uploaded_at;
};

struct AgentRunRequest {
  // Must be non-empty; order is preserved in the thread attachments.
  std::vector<std::string> file_ids;
  std::string instructions;
  std::string schema_profile = kDefaultSchemaProfile;
  std::optional<std::map<std::string, std::string>> metadata;
};

struct RunResult {
  std::string run_id;
  std::string status;
  std::string thread_id;
  utils::Timestamp started_at;
  std::optional<std::string> dashboard_url;
  std::optional<std::string> assistant_id;
  std::string requested_schema;
  std::map<std::string, std::string> metadata;
};

nlohmann::json upload_result_to_json(const UploadResult& result);
nlohmann::json run_result_to_json(const RunResult& result);

// Successful results are recorded best-effort; persistence failures never reach the caller.
class AgentService {
public:
  AgentService(Settings settings,
               ProviderClient& provider,
               MetadataRecorder* recorder = nullptr,
               Logger logger = {});

  UploadResult upload_source(std::istream& stream,
                             const std::string& filename,
                             const std::string& content_type,
                             const std::optional<std::string>& provider) const;

  UploadResult upload_source(const utils::UploadSource& source,
                             const std::optional<std::string>& provider) const;

  RunResult start_agent_run(const AgentRunRequest& request) const;

  std::future<UploadResult> upload_source_async(utils::UploadSource source,
                                                std::optional<std::string> provider) const;

  std::future<RunResult> start_agent_run_async(AgentRunRequest request) const;

  void update_run_status(const std::string& run_id, RunStatus status) const;

  nlohmann::json health() const;

  const Settings& settings() const { return settings_; }

private:
  void require_api_key() const;
  const std::string& require_assistant_id() const;

  Settings settings_;
  ProviderClient& provider_;
  MetadataRecorder* recorder_;
  Logger logger_;
};

}  // namespace finagent
