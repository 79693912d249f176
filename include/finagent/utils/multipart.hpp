#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace finagent::utils {

struct MultipartEncoded {
  std::string content_type;
  std::string body;
};

class MultipartFormData {
public:
  MultipartFormData();
  explicit MultipartFormData(std::string boundary);

  void append_text(const std::string& name, const std::string& value);
  void append_file(const std::string& name,
                   const std::string& filename,
                   const std::string& content_type,
                   std::string_view data);

  const std::string& boundary() const { return boundary_; }

  MultipartEncoded build() const;

private:
  struct Part {
    std::string headers;
    std::string data;
  };

  std::string boundary_;
  std::vector<Part> parts_;
};

}  // namespace finagent::utils
