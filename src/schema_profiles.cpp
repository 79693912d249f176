#include "finagent/schema_profiles.hpp"

#include <map>

namespace finagent {
namespace {

using json = nlohmann::json;

json label_total_list() {
  return json{
      {"type", "array"},
      {"items",
       {{"type", "object"},
        {"additionalProperties", false},
        {"required", {"label", "total"}},
        {"properties", {{"label", {{"type", "string"}}}, {"total", {{"type", "number"}}}}}}},
  };
}

json number() {
  return json{{"type", "number"}};
}

json build_income_statement() {
  json margins = {
      {"type", "object"},
      {"additionalProperties", false},
      {"required", {"gross", "operating", "net"}},
      {"properties", {{"gross", number()}, {"operating", number()}, {"net", number()}}},
  };

  json period = {
      {"type", "object"},
      {"additionalProperties", false},
      {"required",
       {"label", "revenue", "cogs", "gross_profit", "operating_expenses", "operating_income", "other_net", "taxes",
        "net_income", "margins"}},
      {"properties",
       {{"label", {{"type", "string"}}},
        {"revenue", number()},
        {"cogs", number()},
        {"gross_profit", number()},
        {"operating_expenses", number()},
        {"operating_income", number()},
        {"other_net", number()},
        {"taxes", number()},
        {"net_income", number()},
        {"margins", margins}}},
  };

  return json{
      {"type", "object"},
      {"additionalProperties", false},
      {"required", {"periods"}},
      {"properties", {{"periods", {{"type", "array"}, {"minItems", 1}, {"items", period}}}}},
  };
}

json build_cash_flow() {
  return json{
      {"type", "object"},
      {"additionalProperties", false},
      {"required", {"operating", "investing", "financing", "net_change"}},
      {"properties",
       {{"operating", number()}, {"investing", number()}, {"financing", number()}, {"net_change", number()}}},
  };
}

json build_expense_breakdown() {
  return json{
      {"type", "object"},
      {"additionalProperties", false},
      {"required", {"by_category", "by_vendor", "by_month"}},
      {"properties",
       {{"by_category", label_total_list()}, {"by_vendor", label_total_list()}, {"by_month", label_total_list()}}},
  };
}

json build_financial_report_schema() {
  json schema = {
      {"$schema", "http://json-schema.org/draft-07/schema#"},
      {"type", "object"},
      {"additionalProperties", false},
      {"required", {"income_statement", "cash_flow", "expense_breakdown"}},
      {"properties",
       {{"income_statement", build_income_statement()},
        {"cash_flow", build_cash_flow()},
        {"expense_breakdown", build_expense_breakdown()}}},
  };
  return json{{"name", "financial_reports"}, {"schema", std::move(schema)}, {"strict", true}};
}

const std::map<std::string, json>& registry() {
  static const std::map<std::string, json> profiles = {
      {"income_cashflow_expense",
       json{{"type", "json_schema"}, {"json_schema", financial_report_schema()}, {"strict", true}}},
  };
  return profiles;
}

}  // namespace

const char* to_string(SchemaProfile profile) {
  switch (profile) {
    case SchemaProfile::Default:
      return "default";
    case SchemaProfile::IncomeCashflowExpense:
      return "income_cashflow_expense";
  }
  return "default";
}

std::optional<SchemaProfile> parse_schema_profile(std::string_view name) {
  if (name == "default") return SchemaProfile::Default;
  if (name == "income_cashflow_expense") return SchemaProfile::IncomeCashflowExpense;
  return std::nullopt;
}

const nlohmann::json& financial_report_schema() {
  static const json schema = build_financial_report_schema();
  return schema;
}

std::optional<nlohmann::json> response_format_for(const std::string& profile_name) {
  const auto& profiles = registry();
  auto it = profiles.find(profile_name);
  if (it == profiles.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace finagent
