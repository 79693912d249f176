#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "finagent/logging.hpp"
#include "finagent/utils/time.hpp"

namespace finagent {

enum class RunStatus { Queued, Running, Completed, Failed, Cancelled };

const char* to_string(RunStatus status);

std::optional<RunStatus> parse_run_status(std::string_view value);

struct UploadRecord {
  std::string file_id;
  std::string filename;
  std::optional<std::string> provider;
  std::string content_type;
  std::int64_t bytes = 0;
  utils::Timestamp uploaded_at;
};

struct RunRecord {
  std::string run_id;
  std::string thread_id;
  std::optional<std::string> assistant_id;
  // Kept as text so statuses outside RunStatus survive a round trip.
  std::string status = "queued";
  std::optional<std::string> schema_profile;
  std::map<std::string, std::string> metadata;
  utils::Timestamp started_at;
};

class MetadataStore {
public:
  explicit MetadataStore(std::filesystem::path database_path, Logger logger = {});

  const std::filesystem::path& database_path() const { return database_path_; }

  void log_upload(const UploadRecord& record) const;
  void log_run(const RunRecord& record) const;

  // An unknown run_id affects no rows.
  void update_run_status(const std::string& run_id, const std::string& status) const;
  void update_run_status(const std::string& run_id, RunStatus status) const;

private:
  void initialise() const;

  std::filesystem::path database_path_;
  Logger logger_;
};

}  // namespace finagent
