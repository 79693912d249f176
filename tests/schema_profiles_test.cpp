#include <gtest/gtest.h>

#include "finagent/schema_profiles.hpp"

#include <nlohmann/json.hpp>

using namespace finagent;

TEST(SchemaProfilesTest, IncomeCashflowExpenseWrapsFinancialReportSchema) {
  auto format = response_format_for("income_cashflow_expense");
  ASSERT_TRUE(format.has_value());
  EXPECT_EQ((*format)["type"], "json_schema");
  EXPECT_EQ((*format)["strict"], true);
  EXPECT_EQ((*format)["json_schema"], financial_report_schema());
  EXPECT_EQ((*format)["json_schema"]["name"], "financial_reports");
}

TEST(SchemaProfilesTest, FinancialReportSchemaRequiresThreeSections) {
  const auto& schema = financial_report_schema()["schema"];
  EXPECT_EQ(schema["required"],
            nlohmann::json::parse(R"(["income_statement","cash_flow","expense_breakdown"])"));
  EXPECT_EQ(schema["additionalProperties"], false);

  const auto& periods = schema["properties"]["income_statement"]["properties"]["periods"];
  EXPECT_EQ(periods["type"], "array");
  EXPECT_EQ(periods["minItems"], 1);
  EXPECT_EQ(periods["items"]["properties"]["margins"]["required"],
            nlohmann::json::parse(R"(["gross","operating","net"])"));

  const auto& cash_flow = schema["properties"]["cash_flow"];
  EXPECT_EQ(cash_flow["required"],
            nlohmann::json::parse(R"(["operating","investing","financing","net_change"])"));

  const auto& by_vendor = schema["properties"]["expense_breakdown"]["properties"]["by_vendor"];
  EXPECT_EQ(by_vendor["items"]["required"], nlohmann::json::parse(R"(["label","total"])"));
}

TEST(SchemaProfilesTest, DefaultAndUnknownProfilesHaveNoResponseFormat) {
  EXPECT_FALSE(response_format_for("default").has_value());
  EXPECT_FALSE(response_format_for("balance_sheet").has_value());
  EXPECT_FALSE(response_format_for("").has_value());
}

TEST(SchemaProfilesTest, ParsesKnownNames) {
  EXPECT_EQ(parse_schema_profile("default"), SchemaProfile::Default);
  EXPECT_EQ(parse_schema_profile("income_cashflow_expense"), SchemaProfile::IncomeCashflowExpense);
  EXPECT_FALSE(parse_schema_profile("INCOME_CASHFLOW_EXPENSE").has_value());
  EXPECT_STREQ(to_string(SchemaProfile::IncomeCashflowExpense), kDefaultSchemaProfile);
}
