#include <gtest/gtest.h>

#include "finagent/utils/values.hpp"

#include <nlohmann/json.hpp>

using namespace finagent::utils;

TEST(UtilsValuesTest, SafeJsonParsesObjectsAndRejectsGarbage) {
  auto parsed = safe_json(R"({"id":"file-abc"})");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->at("id"), "file-abc");

  EXPECT_FALSE(safe_json("").has_value());
  EXPECT_FALSE(safe_json("<html>bad gateway</html>").has_value());
}

TEST(UtilsValuesTest, TrimStripsSurroundingWhitespace) {
  EXPECT_EQ(trim("  summarise q1 \n\t"), "summarise q1");
  EXPECT_EQ(trim("   "), "");
  EXPECT_EQ(trim(""), "");
}

TEST(UtilsValuesTest, TruncateCharsCountsCodePoints) {
  EXPECT_EQ(truncate_chars("abcdef", 3), "abc");
  EXPECT_EQ(truncate_chars("abc", 10), "abc");
  // Each "é" is two bytes; the cut must not split one.
  EXPECT_EQ(truncate_chars("\xC3\xA9\xC3\xA9\xC3\xA9", 2), "\xC3\xA9\xC3\xA9");
  EXPECT_EQ(truncate_chars(std::string(1000, 'x'), 500).size(), 500u);
}

TEST(UtilsValuesTest, StringFieldRequiresNonEmptyString) {
  nlohmann::json payload = {{"id", "run_1"}, {"empty", ""}, {"count", 3}};
  EXPECT_EQ(string_field(payload, "id"), std::optional<std::string>("run_1"));
  EXPECT_FALSE(string_field(payload, "empty").has_value());
  EXPECT_FALSE(string_field(payload, "count").has_value());
  EXPECT_FALSE(string_field(payload, "missing").has_value());
  EXPECT_FALSE(string_field(nlohmann::json::array(), "id").has_value());
}
