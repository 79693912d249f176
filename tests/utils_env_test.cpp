#include <gtest/gtest.h>

#include "finagent/utils/env.hpp"
#include "support/env_guard.hpp"

#include <stdexcept>

using finagent::testing::EnvVarGuard;
using namespace finagent::utils;

TEST(UtilsEnvTest, ReadEnvTrimsValues) {
  EnvVarGuard guard("FINAGENT_TEST_ENV", std::string("  value \n"));
  EXPECT_EQ(read_env("FINAGENT_TEST_ENV"), std::optional<std::string>("value"));
}

TEST(UtilsEnvTest, UnsetAndBlankAreMissing) {
  {
    EnvVarGuard guard("FINAGENT_TEST_ENV", std::nullopt);
    EXPECT_FALSE(read_env("FINAGENT_TEST_ENV").has_value());
    EXPECT_EQ(read_env_or("FINAGENT_TEST_ENV", "fallback"), "fallback");
  }
  EnvVarGuard blank("FINAGENT_TEST_ENV", std::string("   "));
  EXPECT_FALSE(read_env("FINAGENT_TEST_ENV").has_value());
}

TEST(UtilsEnvTest, ReadEnvPathExpandsHome) {
  EnvVarGuard home("HOME", std::string("/home/analyst"));
  EnvVarGuard guard("FINAGENT_TEST_ENV", std::string("~/reports/metadata.db"));
  EXPECT_EQ(read_env_path("FINAGENT_TEST_ENV"), std::filesystem::path("/home/analyst/reports/metadata.db"));
  EXPECT_EQ(expand_home("relative/dir"), std::filesystem::path("relative/dir"));
}

TEST(UtilsEnvTest, ReadEnvCountParsesDigitsOnly) {
  {
    EnvVarGuard guard("FINAGENT_TEST_ENV", std::string(" 3 "));
    EXPECT_EQ(read_env_count("FINAGENT_TEST_ENV"), std::optional<std::size_t>(3));
  }
  {
    EnvVarGuard guard("FINAGENT_TEST_ENV", std::string("-1"));
    EXPECT_THROW(read_env_count("FINAGENT_TEST_ENV"), std::invalid_argument);
  }
  EnvVarGuard guard("FINAGENT_TEST_ENV", std::string("2x"));
  EXPECT_THROW(read_env_count("FINAGENT_TEST_ENV"), std::invalid_argument);
}
