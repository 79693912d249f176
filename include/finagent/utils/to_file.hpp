#pragma once

#include <istream>
#include <optional>
#include <string>

namespace finagent::utils {

struct UploadSource {
  std::string data;
  std::string filename;
  std::string content_type;
};

std::string read_all(std::istream& stream);

UploadSource to_file(const std::string& path,
                     const std::string& content_type,
                     std::optional<std::string> filename_override = std::nullopt);

std::optional<std::string> spreadsheet_content_type(const std::string& path);

bool is_spreadsheet_content_type(const std::string& content_type);

}  // namespace finagent::utils
