#pragma once

#include <string>

#include "net/http_client.hpp"

namespace swarm::gateway {

// One synchronous HTTP exchange with the tool server.
// Implementations report failures through HttpResponse::error and must be
// safe to call from several threads at once.
class Transport {
 public:
  virtual ~Transport() = default;

  virtual net::HttpResponse send(const std::string &url, const net::HttpOptions &opts) = 0;
};

// Runs each exchange on its own io_context and blocks until it completes
class HttpTransport : public Transport {
 public:
  net::HttpResponse send(const std::string &url, const net::HttpOptions &opts) override;
};

}  // namespace swarm::gateway
