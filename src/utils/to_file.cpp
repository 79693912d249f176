#include "finagent/utils/to_file.hpp"

#include "finagent/error.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace finagent::utils {
namespace {

constexpr const char* kCsv = "text/csv";
constexpr const char* kXls = "application/vnd.ms-excel";
constexpr const char* kXlsx = "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet";

std::string basename(const std::string& path) {
  std::filesystem::path fs_path(path);
  return fs_path.filename().string();
}

}  // namespace

std::string read_all(std::istream& stream) {
  if (!stream.good()) {
    throw FinAgentError("Input stream is not readable");
  }
  std::string buffer;
  std::array<char, 4096> chunk{};
  while (stream.good()) {
    stream.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    std::streamsize count = stream.gcount();
    if (count > 0) {
      buffer.append(chunk.data(), static_cast<std::size_t>(count));
    }
  }
  if (!stream.eof() && stream.fail()) {
    throw FinAgentError("Failed to read data from stream");
  }
  return buffer;
}

UploadSource to_file(const std::string& path,
                     const std::string& content_type,
                     std::optional<std::string> filename_override) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw FinAgentError("Failed to open file: " + path);
  }
  UploadSource source;
  source.data = read_all(file);
  source.filename = filename_override.value_or(basename(path));
  source.content_type = content_type;
  return source;
}

std::optional<std::string> spreadsheet_content_type(const std::string& path) {
  std::string extension = std::filesystem::path(path).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (extension == ".csv") {
    return std::string(kCsv);
  }
  if (extension == ".xls") {
    return std::string(kXls);
  }
  if (extension == ".xlsx") {
    return std::string(kXlsx);
  }
  return std::nullopt;
}

bool is_spreadsheet_content_type(const std::string& content_type) {
  return content_type == kCsv || content_type == kXls || content_type == kXlsx;
}

}  // namespace finagent::utils
