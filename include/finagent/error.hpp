#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace finagent {

class FinAgentError : public std::runtime_error {
public:
  explicit FinAgentError(const std::string& message)
      : std::runtime_error(message) {}
};

class ConfigurationError : public FinAgentError {
public:
  explicit ConfigurationError(const std::string& message)
      : FinAgentError(message) {}
};

class GatewayError : public FinAgentError {
public:
  explicit GatewayError(const std::string& message)
      : FinAgentError(message) {}
};

class UpstreamStatusError : public GatewayError {
public:
  UpstreamStatusError(const std::string& message, long status_code, std::string body)
      : GatewayError(message), status_code_(status_code), body_(std::move(body)) {}

  long status_code() const { return status_code_; }
  const std::string& body() const { return body_; }

private:
  long status_code_;
  std::string body_;
};

class ConnectivityError : public GatewayError {
public:
  explicit ConnectivityError(const std::string& message)
      : GatewayError(message) {}
};

class ConnectivityTimeoutError : public ConnectivityError {
public:
  using ConnectivityError::ConnectivityError;
};

class ProtocolError : public GatewayError {
public:
  explicit ProtocolError(const std::string& message)
      : GatewayError(message) {}
};

class PersistenceError : public FinAgentError {
public:
  explicit PersistenceError(const std::string& message)
      : FinAgentError(message) {}
};

}  // namespace finagent
