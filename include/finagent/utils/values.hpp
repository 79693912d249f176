#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace finagent::utils {

std::optional<nlohmann::json> safe_json(const std::string& text);

std::string trim(std::string value);

/**
 * Returns at most max_chars UTF-8 code points of text. Never splits a
 * multi-byte sequence.
 */
std::string truncate_chars(const std::string& text, std::size_t max_chars);

/**
 * Returns payload[key] when it is a non-empty string.
 */
std::optional<std::string> string_field(const nlohmann::json& payload, const std::string& key);

}  // namespace finagent::utils
