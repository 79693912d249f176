#include "finagent/utils/env.hpp"

#include "finagent/utils/values.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace finagent::utils {

std::optional<std::string> read_env(const std::string& name) {
  const char* raw = std::getenv(name.c_str());
  if (raw == nullptr) {
    return std::nullopt;
  }
  std::string value = trim(raw);
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::string read_env_or(const std::string& name, const std::string& fallback) {
  return read_env(name).value_or(fallback);
}

std::filesystem::path expand_home(const std::string& raw) {
  if (raw.empty() || raw.front() != '~') {
    return raw;
  }
  auto home = read_env("HOME");
  if (!home) {
    return raw;
  }
  return std::filesystem::path(*home + raw.substr(1));
}

std::optional<std::filesystem::path> read_env_path(const std::string& name) {
  auto value = read_env(name);
  if (!value) {
    return std::nullopt;
  }
  return expand_home(*value);
}

std::optional<std::size_t> read_env_count(const std::string& name) {
  auto value = read_env(name);
  if (!value) {
    return std::nullopt;
  }
  bool digits_only = std::all_of(value->begin(), value->end(), [](unsigned char c) { return std::isdigit(c) != 0; });
  if (!digits_only || value->size() > 9) {
    throw std::invalid_argument(name + " must be a non-negative integer, got '" + *value + "'");
  }
  return static_cast<std::size_t>(std::stoul(*value));
}

}  // namespace finagent::utils
