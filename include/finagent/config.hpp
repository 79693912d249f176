#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "finagent/logging.hpp"

namespace finagent {

constexpr const char* kDefaultBaseUrl = "https://api.openai.com/v1";

struct Settings {
  std::string environment = "staging";
  std::optional<std::string> api_key;
  std::string base_url = kDefaultBaseUrl;
  std::optional<std::string> assistant_id;
  std::filesystem::path data_directory = "./data";
  std::filesystem::path database_path = "./data/metadata.db";
  std::chrono::milliseconds timeout{60000};
  // Applies to connectivity failures only; upstream status errors are final.
  std::size_t max_connectivity_retries = 0;
  LogLevel log_level = LogLevel::Off;
};

Settings load_settings();

}  // namespace finagent
