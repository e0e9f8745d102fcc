#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace swarm {

// Raised when a gateway operation is requested while no tool server is configured
class ConfigurationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Raised for a malformed operator request against the gateway
class RequestError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Every transport, protocol and convention failure of the tool gateway
class GatewayError : public std::runtime_error {
 public:
  GatewayError(std::string path, std::string cause)
      : std::runtime_error("Tool gateway request failed for " + (path.empty() ? std::string("<none>") : path) + ": " + cause),
        path_(std::move(path)),
        cause_(std::move(cause)) {}

  // Last attempted path, relative to the server base address
  const std::string &path() const {
    return path_;
  }
  const std::string &cause() const {
    return cause_;
  }

 private:
  std::string path_;
  std::string cause_;
};

}  // namespace swarm
