#include <gtest/gtest.h>

#include "finagent/logging.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace finagent;

TEST(LoggingTest, ParsesLevelsCaseInsensitively) {
  EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
  EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
  EXPECT_EQ(parse_log_level("Info"), LogLevel::Info);
  EXPECT_EQ(parse_log_level("verbose", LogLevel::Error), LogLevel::Error);
}

TEST(LoggingTest, FiltersBelowConfiguredLevel) {
  std::vector<std::string> seen;
  Logger logger(LogLevel::Warn, [&](LogLevel level, const std::string& message, const nlohmann::json&) {
    seen.push_back(std::string(to_string(level)) + ":" + message);
  });

  logger.debug("dropped");
  logger.info("dropped");
  logger.warn("kept");
  logger.error("kept too", {{"run_id", "run_1"}});

  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[0], "warn:kept");
  EXPECT_EQ(seen[1], "error:kept too");
}

TEST(LoggingTest, DefaultLoggerDiscardsEverything) {
  Logger logger;
  EXPECT_FALSE(logger.enabled(LogLevel::Error));
  logger.error("nobody listens");
}

TEST(LoggingTest, StderrSinkAcceptsNonUtf8Details) {
  auto sink = make_stderr_logger();
  EXPECT_NO_THROW(sink(LogLevel::Error, "upstream error", {{"body", "caf\xE9"}}));
}

TEST(LoggingTest, FailingSinkDoesNotReachCaller) {
  Logger logger(LogLevel::Info, [](LogLevel, const std::string&, const nlohmann::json&) {
    throw std::runtime_error("sink unavailable");
  });
  EXPECT_NO_THROW(logger.info("request succeeded", {{"status", 200}}));
}
