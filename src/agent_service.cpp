#include "finagent/agent_service.hpp"

#include "finagent/error.hpp"
#include "finagent/utils/values.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace finagent {
namespace {

using json = nlohmann::json;

ThreadCreateRequest build_thread_request(const std::vector<std::string>& file_ids) {
  ThreadMessageCreate message;
  message.role = "user";
  message.content.push_back(ThreadMessageContentPart{"text", kThreadSeedMessage});
  for (const auto& file_id : file_ids) {
    message.attachments.push_back(ThreadMessageAttachment{file_id});
  }

  ThreadCreateRequest request;
  request.messages.push_back(std::move(message));
  return request;
}

}  // namespace

json upload_result_to_json(const UploadResult& result) {
  json value = json::object();
  value["file_id"] = result.file_id;
  value["filename"] = result.filename;
  value["provider"] = result.provider ? json(*result.provider) : json(nullptr);
  value["content_type"] = result.content_type;
  value["bytes"] = result.bytes;
  value["uploaded_at"] = utils::format_iso8601_utc(result.uploaded_at);
  return value;
}

json run_result_to_json(const RunResult& result) {
  json value = json::object();
  value["run_id"] = result.run_id;
  value["status"] = result.status;
  value["thread_id"] = result.thread_id;
  value["started_at"] = utils::format_iso8601_utc(result.started_at);
  value["dashboard_url"] = result.dashboard_url ? json(*result.dashboard_url) : json(nullptr);
  value["assistant_id"] = result.assistant_id ? json(*result.assistant_id) : json(nullptr);
  value["requested_schema"] = result.requested_schema;
  value["metadata"] = result.metadata;
  return value;
}

AgentService::AgentService(Settings settings, ProviderClient& provider, MetadataRecorder* recorder, Logger logger)
    : settings_(std::move(settings)), provider_(provider), recorder_(recorder), logger_(std::move(logger)) {}

void AgentService::require_api_key() const {
  if (!provider_.has_api_key()) {
    throw ConfigurationError("OPENAI_API_KEY is not configured.");
  }
}

const std::string& AgentService::require_assistant_id() const {
  if (!settings_.assistant_id || settings_.assistant_id->empty()) {
    throw ConfigurationError("OPENAI_ASSISTANT_ID is not configured.");
  }
  return *settings_.assistant_id;
}

UploadResult AgentService::upload_source(std::istream& stream,
                                         const std::string& filename,
                                         const std::string& content_type,
                                         const std::optional<std::string>& provider) const {
  require_api_key();
  utils::UploadSource source;
  source.data = utils::read_all(stream);
  source.filename = filename;
  source.content_type = content_type;
  return upload_source(source, provider);
}

UploadResult AgentService::upload_source(const utils::UploadSource& source,
                                         const std::optional<std::string>& provider) const {
  require_api_key();

  FileCreateRequest request;
  request.purpose = "assistants";
  request.file = source;
  if (request.file.filename.empty()) {
    request.file.filename = kDefaultFilename;
  }
  if (request.file.content_type.empty()) {
    request.file.content_type = kDefaultContentType;
  }

  logger_.info("Uploading file to OpenAI Files API",
               {{"filename", request.file.filename}, {"bytes", request.file.data.size()}});

  FileObject file = provider_.files().create(request);
  if (file.id.empty()) {
    logger_.error("OpenAI Files API response missing file id", file.raw);
    throw ProtocolError("OpenAI Files API response did not include a file id.");
  }

  UploadResult result;
  result.file_id = file.id;
  result.filename = file.filename.empty() ? request.file.filename : file.filename;
  result.provider = provider;
  result.content_type = request.file.content_type;
  result.bytes = request.file.data.size();
  result.uploaded_at = std::chrono::system_clock::now();

  if (recorder_) {
    recorder_->record_upload(UploadRecord{result.file_id,
                                          result.filename,
                                          result.provider,
                                          result.content_type,
                                          static_cast<std::int64_t>(result.bytes),
                                          result.uploaded_at});
  }

  return result;
}

RunResult AgentService::start_agent_run(const AgentRunRequest& request) const {
  require_api_key();
  const std::string& assistant_id = require_assistant_id();
  if (request.file_ids.empty()) {
    throw std::invalid_argument("AgentRunRequest.file_ids must not be empty");
  }

  logger_.info("Creating OpenAI thread", {{"attachments", request.file_ids.size()}});
  Thread thread = provider_.threads().create(build_thread_request(request.file_ids));
  if (thread.id.empty()) {
    logger_.error("OpenAI Threads API response missing id", thread.raw);
    throw ProtocolError("OpenAI Threads API response did not include a thread id.");
  }

  RunCreateRequest run_request;
  run_request.assistant_id = assistant_id;
  if (request.metadata) {
    run_request.metadata = *request.metadata;
  }
  run_request.response_format = response_format_for(request.schema_profile);
  std::string instructions = utils::trim(request.instructions);
  run_request.instructions = instructions.empty() ? std::string(kDefaultRunInstructions) : instructions;

  Run run = provider_.runs().create(thread.id, run_request);
  if (run.id.empty()) {
    logger_.error("OpenAI Agents API response missing run id", run.raw);
    throw ProtocolError("OpenAI Agents API response did not include a run id.");
  }

  RunResult result;
  result.run_id = run.id;
  result.status = run.status.value_or(to_string(RunStatus::Queued));
  result.thread_id = thread.id;
  std::optional<utils::Timestamp> created_at;
  if (run.created_at) {
    created_at = utils::from_unix_seconds(*run.created_at);
  }
  result.started_at = created_at.value_or(std::chrono::system_clock::now());
  result.dashboard_url = run.dashboard_url;
  result.assistant_id = run.assistant_id.value_or(assistant_id);
  result.requested_schema = request.schema_profile;
  result.metadata = request.metadata.value_or(std::map<std::string, std::string>{});

  logger_.info("OpenAI run created", {{"run_id", result.run_id}, {"thread_id", result.thread_id}, {"status", result.status}});

  if (recorder_) {
    recorder_->record_run(RunRecord{result.run_id,
                                    result.thread_id,
                                    result.assistant_id,
                                    result.status,
                                    result.requested_schema,
                                    result.metadata,
                                    result.started_at});
  }

  return result;
}

std::future<UploadResult> AgentService::upload_source_async(utils::UploadSource source,
                                                            std::optional<std::string> provider) const {
  return std::async(std::launch::async, [this, source = std::move(source), provider = std::move(provider)] {
    return upload_source(source, provider);
  });
}

std::future<RunResult> AgentService::start_agent_run_async(AgentRunRequest request) const {
  return std::async(std::launch::async, [this, request = std::move(request)] { return start_agent_run(request); });
}

void AgentService::update_run_status(const std::string& run_id, RunStatus status) const {
  if (!recorder_) {
    logger_.warn("run status update dropped, no metadata recorder", {{"run_id", run_id}});
    return;
  }
  recorder_->update_run_status(run_id, to_string(status));
}

json AgentService::health() const {
  return json{{"status", "ok"}, {"environment", settings_.environment}};
}

}  // namespace finagent
