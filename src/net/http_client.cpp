#include "net/http_client.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <memory>

#include "core/version.hpp"

namespace swarm::net {

namespace {

constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string trim(const std::string &s) {
  auto begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t");
  return s.substr(begin, end - begin + 1);
}

bool all_digits(const std::string &s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

// ============================================================
// ParsedUrl
// ============================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string &url) {
  auto scheme_end = url.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    return std::nullopt;
  }

  ParsedUrl out;
  out.scheme = to_lower(url.substr(0, scheme_end));
  if (out.scheme != "http" && out.scheme != "https") {
    return std::nullopt;
  }

  std::string rest = url.substr(scheme_end + 3);
  auto authority_end = rest.find_first_of("/?#");
  std::string authority = rest.substr(0, authority_end);
  std::string remainder = authority_end == std::string::npos ? "" : rest.substr(authority_end);

  if (authority.empty()) return std::nullopt;

  if (authority.front() == '[') {
    // IPv6 literal: [::1]:8080
    auto close = authority.find(']');
    if (close == std::string::npos) return std::nullopt;
    out.host = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') return std::nullopt;
      out.port = authority.substr(close + 2);
    }
  } else {
    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
      out.host = authority.substr(0, colon);
      out.port = authority.substr(colon + 1);
    } else {
      out.host = authority;
    }
  }

  if (out.host.empty()) return std::nullopt;
  if (!out.port.empty() && !all_digits(out.port)) return std::nullopt;

  auto hash = remainder.find('#');
  if (hash != std::string::npos) {
    remainder.resize(hash);
  }

  auto question = remainder.find('?');
  if (question != std::string::npos) {
    out.path = remainder.substr(0, question);
    out.query = remainder.substr(question);
  } else {
    out.path = remainder;
  }
  if (out.path.empty()) {
    out.path = "/";
  }
  return out;
}

// ============================================================
// ChunkedDecoder
// ============================================================

bool ChunkedDecoder::feed(std::string_view data, std::string &out) {
  std::size_t i = 0;
  while (i < data.size() && state_ != State::Done) {
    switch (state_) {
      case State::Size: {
        char c = data[i++];
        if (c != '\n') {
          line_.push_back(c);
          if (line_.size() > 1024) return false;
          break;
        }
        if (!line_.empty() && line_.back() == '\r') line_.pop_back();
        std::string hex = trim(line_.substr(0, line_.find(';')));
        line_.clear();
        if (hex.empty()) return false;

        std::size_t size = 0;
        for (char h : hex) {
          int v = hex_value(h);
          if (v < 0) return false;
          if (size > (std::numeric_limits<std::size_t>::max() >> 4)) return false;
          size = (size << 4) | static_cast<std::size_t>(v);
        }
        remaining_ = size;
        state_ = size == 0 ? State::Trailer : State::Data;
        break;
      }
      case State::Data: {
        std::size_t n = std::min(remaining_, data.size() - i);
        out.append(data.substr(i, n));
        i += n;
        remaining_ -= n;
        if (remaining_ == 0) state_ = State::DataEnd;
        break;
      }
      case State::DataEnd: {
        char c = data[i++];
        if (c == '\r') break;
        if (c != '\n') return false;
        state_ = State::Size;
        break;
      }
      case State::Trailer: {
        char c = data[i++];
        if (c != '\n') {
          line_.push_back(c);
          if (line_.size() > 8192) return false;
          break;
        }
        if (!line_.empty() && line_.back() == '\r') line_.pop_back();
        if (line_.empty()) state_ = State::Done;
        line_.clear();
        break;
      }
      case State::Done:
        break;
    }
  }
  return true;
}

// ============================================================
// HttpClient::Session: one request/response exchange
// ============================================================

class HttpClient::Session : public std::enable_shared_from_this<Session> {
 public:
  Session(asio::io_context &io_ctx, asio::ssl::context *ssl_ctx, ParsedUrl url, HttpOptions opts)
      : resolver_(io_ctx), plain_(io_ctx), timer_(io_ctx), url_(std::move(url)), opts_(std::move(opts)) {
    if (ssl_ctx != nullptr) {
      tls_ = std::make_unique<asio::ssl::stream<asio::ip::tcp::socket>>(io_ctx, *ssl_ctx);
    }
  }

  std::future<HttpResponse> start() {
    auto future = promise_.get_future();
    auto self = shared_from_this();

    timer_.expires_after(opts_.timeout);
    timer_.async_wait([self](const std::error_code &ec) {
      if (!ec) {
        self->fail("Request timed out after " + std::to_string(self->opts_.timeout.count()) + "ms");
      }
    });

    resolver_.async_resolve(url_.host, url_.port_or_default(),
                            [self](const std::error_code &ec, const asio::ip::tcp::resolver::results_type &results) {
                              if (ec) {
                                self->fail("Resolve failed for " + self->url_.host + ": " + ec.message());
                                return;
                              }
                              self->connect(results);
                            });
    return future;
  }

 private:
  enum class BodyMode { Length, Chunked, UntilClose };

  asio::ip::tcp::socket &lowest_layer() {
    return tls_ ? tls_->next_layer() : plain_;
  }

  void connect(const asio::ip::tcp::resolver::results_type &results) {
    if (done_) return;
    auto self = shared_from_this();
    asio::async_connect(lowest_layer(), results, [self](const std::error_code &ec, const asio::ip::tcp::endpoint &) {
      if (ec) {
        self->fail("Connect failed: " + ec.message());
        return;
      }
      if (self->tls_) {
        self->handshake();
      } else {
        self->write_request();
      }
    });
  }

  void handshake() {
    if (done_) return;
    // SNI plus hostname verification
    if (!SSL_set_tlsext_host_name(tls_->native_handle(), url_.host.c_str())) {
      fail("Failed to set TLS server name");
      return;
    }
    tls_->set_verify_mode(asio::ssl::verify_peer);
    tls_->set_verify_callback(asio::ssl::host_name_verification(url_.host));

    auto self = shared_from_this();
    tls_->async_handshake(asio::ssl::stream_base::client, [self](const std::error_code &ec) {
      if (ec) {
        self->fail("TLS handshake failed: " + ec.message());
        return;
      }
      self->write_request();
    });
  }

  std::string build_request() const {
    std::string host = url_.host.find(':') != std::string::npos ? "[" + url_.host + "]" : url_.host;
    if (!url_.port.empty()) {
      host += ":" + url_.port;
    }

    std::string req = opts_.method + " " + url_.target() + " HTTP/1.1\r\n";
    req += "Host: " + host + "\r\n";
    req += "User-Agent: " + std::string(kUserAgent) + "\r\n";
    req += "Connection: close\r\n";
    for (const auto &[name, value] : opts_.headers) {
      req += name + ": " + value + "\r\n";
    }
    if (!opts_.body.empty() || opts_.method == "POST" || opts_.method == "PUT" || opts_.method == "PATCH") {
      req += "Content-Length: " + std::to_string(opts_.body.size()) + "\r\n";
    }
    req += "\r\n";
    req += opts_.body;
    return req;
  }

  void write_request() {
    if (done_) return;
    request_ = build_request();

    auto self = shared_from_this();
    auto on_written = [self](const std::error_code &ec, std::size_t) {
      if (ec) {
        self->fail("Write failed: " + ec.message());
        return;
      }
      self->read_more();
    };

    if (tls_) {
      asio::async_write(*tls_, asio::buffer(request_), on_written);
    } else {
      asio::async_write(plain_, asio::buffer(request_), on_written);
    }
  }

  void read_more() {
    if (done_) return;
    auto self = shared_from_this();
    auto on_read = [self](const std::error_code &ec, std::size_t n) {
      self->on_read(ec, n);
    };

    if (tls_) {
      tls_->async_read_some(asio::buffer(read_buf_), on_read);
    } else {
      plain_.async_read_some(asio::buffer(read_buf_), on_read);
    }
  }

  void on_read(const std::error_code &ec, std::size_t n) {
    if (done_) return;

    if (n > 0 && !consume(std::string_view(read_buf_.data(), n))) {
      return;
    }

    if (ec) {
      if (ec == asio::error::eof || ec == asio::ssl::error::stream_truncated) {
        on_eof();
      } else {
        fail("Read failed: " + ec.message());
      }
      return;
    }
    read_more();
  }

  // Returns false once the exchange has completed
  bool consume(std::string_view data) {
    if (headers_parsed_) {
      return consume_body(data);
    }

    head_buf_.append(data);
    auto end = head_buf_.find("\r\n\r\n");
    if (end == std::string::npos) {
      if (head_buf_.size() > kMaxHeaderBytes) {
        fail("Response headers exceed " + std::to_string(kMaxHeaderBytes) + " bytes");
        return false;
      }
      return true;
    }

    if (!parse_head(head_buf_.substr(0, end))) {
      fail("Malformed response head");
      return false;
    }
    headers_parsed_ = true;

    std::string rest = head_buf_.substr(end + 4);
    head_buf_.clear();

    if (body_mode_ == BodyMode::Length && remaining_ == 0) {
      finish();
      return false;
    }
    if (rest.empty()) return true;
    return consume_body(rest);
  }

  bool parse_head(const std::string &head) {
    auto line_end = head.find("\r\n");
    std::string status_line = head.substr(0, line_end);

    // HTTP/1.1 200 OK
    auto sp = status_line.find(' ');
    if (sp == std::string::npos || status_line.compare(0, 5, "HTTP/") != 0) return false;
    std::string code = status_line.substr(sp + 1, 3);
    if (code.size() != 3 || !all_digits(code)) return false;
    response_.status_code = std::stoi(code);

    std::size_t pos = line_end == std::string::npos ? head.size() : line_end + 2;
    while (pos < head.size()) {
      auto next = head.find("\r\n", pos);
      std::string line = head.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
      pos = next == std::string::npos ? head.size() : next + 2;

      auto colon = line.find(':');
      if (colon == std::string::npos) continue;
      response_.headers[to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    auto te = response_.headers.find("transfer-encoding");
    auto cl = response_.headers.find("content-length");
    if (response_.status_code == 204 || response_.status_code == 304 || opts_.method == "HEAD") {
      body_mode_ = BodyMode::Length;
      remaining_ = 0;
    } else if (te != response_.headers.end() && to_lower(te->second).find("chunked") != std::string::npos) {
      body_mode_ = BodyMode::Chunked;
    } else if (cl != response_.headers.end()) {
      if (!all_digits(cl->second)) return false;
      body_mode_ = BodyMode::Length;
      remaining_ = static_cast<std::size_t>(std::stoull(cl->second));
    } else {
      body_mode_ = BodyMode::UntilClose;
    }
    return true;
  }

  bool consume_body(std::string_view data) {
    switch (body_mode_) {
      case BodyMode::Chunked: {
        std::string decoded;
        if (!chunked_.feed(data, decoded)) {
          fail("Malformed chunked body");
          return false;
        }
        if (!deliver(decoded)) return false;
        if (chunked_.done()) {
          finish();
          return false;
        }
        return true;
      }
      case BodyMode::Length: {
        std::size_t n = std::min(remaining_, data.size());
        remaining_ -= n;
        if (!deliver(data.substr(0, n))) return false;
        if (remaining_ == 0) {
          finish();
          return false;
        }
        return true;
      }
      case BodyMode::UntilClose:
        return deliver(data);
    }
    return true;
  }

  bool deliver(std::string_view data) {
    if (data.empty()) return true;

    bool streaming = opts_.on_data && response_.status_code >= 200 && response_.status_code < 300;
    if (!streaming) {
      response_.body.append(data);
      return true;
    }
    if (!opts_.on_data(data)) {
      // Consumer has what it needs
      finish();
      return false;
    }
    return true;
  }

  void on_eof() {
    if (!headers_parsed_) {
      fail("Connection closed before response headers");
    } else if (body_mode_ == BodyMode::UntilClose) {
      finish();
    } else {
      fail("Connection closed before response body completed");
    }
  }

  void close() {
    std::error_code ignored;
    timer_.cancel();
    resolver_.cancel();
    auto &socket = lowest_layer();
    socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket.close(ignored);
  }

  void finish() {
    if (done_) return;
    done_ = true;
    close();
    promise_.set_value(std::move(response_));
  }

  void fail(const std::string &message) {
    if (done_) return;
    done_ = true;
    spdlog::debug("[Net] {} {}://{}{}: {}", opts_.method, url_.scheme, url_.host, url_.target(), message);
    response_.error = message;
    close();
    promise_.set_value(std::move(response_));
  }

  asio::ip::tcp::resolver resolver_;
  asio::ip::tcp::socket plain_;
  std::unique_ptr<asio::ssl::stream<asio::ip::tcp::socket>> tls_;
  asio::steady_timer timer_;

  ParsedUrl url_;
  HttpOptions opts_;
  std::string request_;
  std::array<char, 8192> read_buf_{};

  std::string head_buf_;
  bool headers_parsed_ = false;
  BodyMode body_mode_ = BodyMode::UntilClose;
  std::size_t remaining_ = 0;
  ChunkedDecoder chunked_;

  HttpResponse response_;
  std::promise<HttpResponse> promise_;
  bool done_ = false;
};

// ============================================================
// HttpClient
// ============================================================

HttpClient::HttpClient(asio::io_context &io_ctx) : io_ctx_(io_ctx), ssl_ctx_(asio::ssl::context::tls_client) {
  std::error_code ec;
  ssl_ctx_.set_default_verify_paths(ec);
  if (ec) {
    spdlog::warn("[Net] Could not load default CA paths: {}", ec.message());
  }
}

HttpClient::~HttpClient() = default;

std::future<HttpResponse> HttpClient::request(const std::string &url, const HttpOptions &opts) {
  auto parsed = ParsedUrl::parse(url);
  if (!parsed) {
    std::promise<HttpResponse> p;
    HttpResponse resp;
    resp.error = "Invalid URL: " + url;
    p.set_value(std::move(resp));
    return p.get_future();
  }

  asio::ssl::context *ssl = parsed->is_https() ? &ssl_ctx_ : nullptr;
  auto session = std::make_shared<Session>(io_ctx_, ssl, std::move(*parsed), opts);
  return session->start();
}

}  // namespace swarm::net
