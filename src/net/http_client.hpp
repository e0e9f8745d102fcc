#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace swarm::net {

struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;  // Empty when the URL does not name one
  std::string path;  // Always starts with '/'
  std::string query;  // Includes the leading '?', or empty

  static std::optional<ParsedUrl> parse(const std::string &url);

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const {
    if (!port.empty()) return port;
    return is_https() ? "443" : "80";
  }

  // Request target: path plus query
  std::string target() const {
    return path + query;
  }
};

// Receives body bytes as they arrive. Return false to stop reading and close the connection.
using BodyCallback = std::function<bool(std::string_view chunk)>;

struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{30000};  // Whole exchange, connect to last byte

  // When set, the body of a 2xx response is streamed here instead of being
  // buffered into HttpResponse::body. Non-2xx bodies are always buffered.
  BodyCallback on_data;
};

struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;  // Lower-cased names
  std::string body;
  std::string error;  // Transport-level failure, empty on success

  bool ok() const {
    return error.empty() && status_code >= 200 && status_code < 300;
  }
};

// Incremental decoder for "Transfer-Encoding: chunked" bodies
class ChunkedDecoder {
 public:
  // Append decoded bytes of `data` to `out`. Returns false on malformed framing.
  bool feed(std::string_view data, std::string &out);

  // True once the terminating zero-size chunk and trailers were consumed
  bool done() const {
    return state_ == State::Done;
  }

 private:
  enum class State { Size, Data, DataEnd, Trailer, Done };

  State state_ = State::Size;
  std::string line_;
  std::size_t remaining_ = 0;
};

// Minimal asynchronous HTTP/1.1 client on asio. One connection per request
// ("Connection: close"); https goes through asio::ssl with peer verification.
// The caller drives the io_context; the returned future becomes ready once
// the exchange completes, fails or times out.
class HttpClient {
 public:
  explicit HttpClient(asio::io_context &io_ctx);
  ~HttpClient();

  std::future<HttpResponse> request(const std::string &url, const HttpOptions &opts);

 private:
  class Session;

  asio::io_context &io_ctx_;
  asio::ssl::context ssl_ctx_;
};

}  // namespace swarm::net
