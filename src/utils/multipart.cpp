#include "finagent/utils/multipart.hpp"

#include <cstdio>
#include <random>
#include <utility>

namespace finagent::utils {
namespace {

std::string quoted(const std::string& value) {
  std::string out = "\"";
  for (char ch : value) {
    switch (ch) {
      case '"':
        out += "%22";
        break;
      case '\r':
        out += "%0D";
        break;
      case '\n':
        out += "%0A";
        break;
      default:
        out.push_back(ch);
    }
  }
  out.push_back('"');
  return out;
}

std::string random_boundary() {
  thread_local std::mt19937_64 rng(std::random_device{}());
  char buffer[40];
  std::snprintf(buffer, sizeof(buffer), "%016llx%016llx",
                static_cast<unsigned long long>(rng()), static_cast<unsigned long long>(rng()));
  return std::string("finagent-") + buffer;
}

}  // namespace

MultipartFormData::MultipartFormData() : boundary_(random_boundary()) {}

MultipartFormData::MultipartFormData(std::string boundary) : boundary_(std::move(boundary)) {}

void MultipartFormData::append_text(const std::string& name, const std::string& value) {
  parts_.push_back(Part{"Content-Disposition: form-data; name=" + quoted(name) + "\r\n", value});
}

void MultipartFormData::append_file(const std::string& name,
                                    const std::string& filename,
                                    const std::string& content_type,
                                    std::string_view data) {
  std::string headers = "Content-Disposition: form-data; name=" + quoted(name) + "; filename=" + quoted(filename) +
                        "\r\nContent-Type: " + content_type + "\r\n";
  parts_.push_back(Part{std::move(headers), std::string(data)});
}

MultipartEncoded MultipartFormData::build() const {
  const std::string delimiter = "--" + boundary_;

  std::size_t size = delimiter.size() + 4;
  for (const auto& part : parts_) {
    size += delimiter.size() + part.headers.size() + part.data.size() + 6;
  }

  MultipartEncoded encoded;
  encoded.body.reserve(size);
  for (const auto& part : parts_) {
    encoded.body += delimiter;
    encoded.body += "\r\n";
    encoded.body += part.headers;
    encoded.body += "\r\n";
    encoded.body += part.data;
    encoded.body += "\r\n";
  }
  encoded.body += delimiter;
  encoded.body += "--\r\n";
  encoded.content_type = "multipart/form-data; boundary=" + boundary_;
  return encoded;
}

}  // namespace finagent::utils
