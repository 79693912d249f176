#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace finagent {

enum class SchemaProfile { Default, IncomeCashflowExpense };

constexpr const char* kDefaultSchemaProfile = "income_cashflow_expense";

const char* to_string(SchemaProfile profile);

std::optional<SchemaProfile> parse_schema_profile(std::string_view name);

/**
 * The `financial_reports` json_schema contract: income statement periods,
 * cash flow summary, and expense breakdown by category, vendor and month.
 */
const nlohmann::json& financial_report_schema();

/**
 * Looks up the `response_format` payload registered for a profile name.
 * Unregistered names (including "default") yield std::nullopt, meaning no
 * structured-output constraint is sent.
 */
std::optional<nlohmann::json> response_format_for(const std::string& profile_name);

}  // namespace finagent
