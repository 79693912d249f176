#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace finagent::utils {

/**
 * Reads an environment variable with surrounding whitespace removed.
 * Unset and blank variables both come back as std::nullopt.
 */
std::optional<std::string> read_env(const std::string& name);

std::string read_env_or(const std::string& name, const std::string& fallback);

/**
 * read_env, then a leading `~` is replaced by $HOME when HOME is set.
 */
std::optional<std::filesystem::path> read_env_path(const std::string& name);

/**
 * Parses a non-negative integer variable. Throws std::invalid_argument
 * naming the variable when the value is not one.
 */
std::optional<std::size_t> read_env_count(const std::string& name);

std::filesystem::path expand_home(const std::string& raw);

}  // namespace finagent::utils
