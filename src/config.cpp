#include "finagent/config.hpp"

#include "finagent/error.hpp"
#include "finagent/utils/env.hpp"

#include <stdexcept>
#include <system_error>

namespace finagent {
namespace {

void ensure_directory(const std::filesystem::path& directory) {
  if (directory.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    throw ConfigurationError("Unable to create directory " + directory.string() + ": " + ec.message());
  }
}

}  // namespace

Settings load_settings() {
  Settings settings;

  settings.environment = utils::read_env_or("ENVIRONMENT", settings.environment);
  settings.api_key = utils::read_env("OPENAI_API_KEY");
  settings.base_url = utils::read_env_or("OPENAI_BASE_URL", kDefaultBaseUrl);
  settings.assistant_id = utils::read_env("OPENAI_ASSISTANT_ID");

  settings.data_directory = utils::read_env_path("DATA_DIRECTORY").value_or(settings.data_directory);
  ensure_directory(settings.data_directory);

  if (auto database_path = utils::read_env_path("DATABASE_PATH")) {
    settings.database_path = *database_path;
    ensure_directory(settings.database_path.parent_path());
  } else {
    settings.database_path = settings.data_directory / "metadata.db";
  }

  try {
    settings.max_connectivity_retries =
        utils::read_env_count("FINAGENT_MAX_RETRIES").value_or(settings.max_connectivity_retries);
  } catch (const std::invalid_argument& ex) {
    throw ConfigurationError(ex.what());
  }

  if (auto level = utils::read_env("FINAGENT_LOG")) {
    settings.log_level = parse_log_level(*level, settings.log_level);
  }

  return settings;
}

}  // namespace finagent
