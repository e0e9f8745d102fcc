#include "gateway/transport.hpp"

#include <spdlog/spdlog.h>

namespace swarm::gateway {

net::HttpResponse HttpTransport::send(const std::string &url, const net::HttpOptions &opts) {
  try {
    // Temporary io_context per exchange keeps concurrent callers independent
    asio::io_context io_ctx;
    net::HttpClient http(io_ctx);

    auto response_future = http.request(url, opts);
    io_ctx.run();
    return response_future.get();
  } catch (const std::exception &e) {
    spdlog::debug("[Gateway] Transport exception for {}: {}", url, e.what());
    net::HttpResponse resp;
    resp.error = std::string("Transport failure: ") + e.what();
    return resp;
  }
}

}  // namespace swarm::gateway
