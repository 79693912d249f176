#include "finagent/utils/values.hpp"

#include <algorithm>
#include <cctype>

namespace finagent::utils {

std::optional<nlohmann::json> safe_json(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  try {
    return nlohmann::json::parse(text);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::string trim(std::string value) {
  auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(value.begin(), value.end(), is_space);
  auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string truncate_chars(const std::string& text, std::size_t max_chars) {
  std::size_t count = 0;
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (count == max_chars) {
      return text.substr(0, pos);
    }
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    std::size_t width = 1;
    if ((lead & 0xE0) == 0xC0) {
      width = 2;
    } else if ((lead & 0xF0) == 0xE0) {
      width = 3;
    } else if ((lead & 0xF8) == 0xF0) {
      width = 4;
    }
    pos = std::min(text.size(), pos + width);
    ++count;
  }
  return text;
}

std::optional<std::string> string_field(const nlohmann::json& payload, const std::string& key) {
  if (!payload.is_object()) {
    return std::nullopt;
  }
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return std::nullopt;
  }
  auto value = it->get<std::string>();
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace finagent::utils
