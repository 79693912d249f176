#include <gtest/gtest.h>

#include "finagent/config.hpp"
#include "finagent/error.hpp"
#include "support/env_guard.hpp"
#include "support/temp_dir.hpp"

#include <filesystem>

using finagent::testing::EnvVarGuard;
using finagent::testing::TempDir;

namespace {

// Clears everything load_settings reads so the host environment cannot leak in.
struct CleanEnvironment {
  EnvVarGuard environment{"ENVIRONMENT", std::nullopt};
  EnvVarGuard api_key{"OPENAI_API_KEY", std::nullopt};
  EnvVarGuard base_url{"OPENAI_BASE_URL", std::nullopt};
  EnvVarGuard assistant{"OPENAI_ASSISTANT_ID", std::nullopt};
  EnvVarGuard database{"DATABASE_PATH", std::nullopt};
  EnvVarGuard retries{"FINAGENT_MAX_RETRIES", std::nullopt};
  EnvVarGuard log{"FINAGENT_LOG", std::nullopt};
};

}  // namespace

TEST(ConfigTest, DefaultsWhenEnvironmentIsEmpty) {
  CleanEnvironment clean;
  TempDir dir;
  EnvVarGuard data("DATA_DIRECTORY", (dir.path() / "data").string());

  auto settings = finagent::load_settings();

  EXPECT_EQ(settings.environment, "staging");
  EXPECT_FALSE(settings.api_key.has_value());
  EXPECT_FALSE(settings.assistant_id.has_value());
  EXPECT_EQ(settings.base_url, finagent::kDefaultBaseUrl);
  EXPECT_EQ(settings.database_path, dir.path() / "data" / "metadata.db");
  EXPECT_EQ(settings.max_connectivity_retries, 0u);
  EXPECT_EQ(settings.log_level, finagent::LogLevel::Off);
  EXPECT_TRUE(std::filesystem::is_directory(dir.path() / "data"));
}

TEST(ConfigTest, ReadsOverridesFromEnvironment) {
  CleanEnvironment clean;
  TempDir dir;
  EnvVarGuard data("DATA_DIRECTORY", dir.path().string());
  EnvVarGuard environment("ENVIRONMENT", std::string("production"));
  EnvVarGuard api_key("OPENAI_API_KEY", std::string(" sk-test "));
  EnvVarGuard base_url("OPENAI_BASE_URL", std::string("http://localhost:8080/v1"));
  EnvVarGuard assistant("OPENAI_ASSISTANT_ID", std::string("asst_123"));
  EnvVarGuard database("DATABASE_PATH", (dir.path() / "db" / "meta.db").string());
  EnvVarGuard retries("FINAGENT_MAX_RETRIES", std::string("2"));
  EnvVarGuard log("FINAGENT_LOG", std::string("debug"));

  auto settings = finagent::load_settings();

  EXPECT_EQ(settings.environment, "production");
  EXPECT_EQ(settings.api_key, std::optional<std::string>("sk-test"));
  EXPECT_EQ(settings.base_url, "http://localhost:8080/v1");
  EXPECT_EQ(settings.assistant_id, std::optional<std::string>("asst_123"));
  EXPECT_EQ(settings.database_path, dir.path() / "db" / "meta.db");
  EXPECT_TRUE(std::filesystem::is_directory(dir.path() / "db"));
  EXPECT_EQ(settings.max_connectivity_retries, 2u);
  EXPECT_EQ(settings.log_level, finagent::LogLevel::Debug);
}

TEST(ConfigTest, BlankCredentialsCountAsMissing) {
  CleanEnvironment clean;
  TempDir dir;
  EnvVarGuard data("DATA_DIRECTORY", dir.path().string());
  EnvVarGuard api_key("OPENAI_API_KEY", std::string("   "));

  EXPECT_FALSE(finagent::load_settings().api_key.has_value());
}

TEST(ConfigTest, RejectsMalformedRetryCount) {
  CleanEnvironment clean;
  TempDir dir;
  EnvVarGuard data("DATA_DIRECTORY", dir.path().string());
  EnvVarGuard retries("FINAGENT_MAX_RETRIES", std::string("-1"));

  EXPECT_THROW(finagent::load_settings(), finagent::ConfigurationError);

  EnvVarGuard garbage("FINAGENT_MAX_RETRIES", std::string("two"));
  EXPECT_THROW(finagent::load_settings(), finagent::ConfigurationError);
}

TEST(ConfigTest, ExpandsHomeInDataDirectory) {
  CleanEnvironment clean;
  TempDir dir;
  EnvVarGuard home("HOME", dir.path().string());
  EnvVarGuard data("DATA_DIRECTORY", std::string("~/finagent-data"));

  auto settings = finagent::load_settings();
  EXPECT_EQ(settings.data_directory, std::filesystem::path(dir.path().string() + "/finagent-data"));
}
