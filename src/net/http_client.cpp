#include "http_client.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <type_traits>

#include "chunked_decoder.hpp"

namespace bridge::net {

// URL parsing
std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
  // Simple regex-based URL parser
  std::regex url_regex(R"(^(https?):\/\/([^:\/\s]+)(?::(\d+))?(\/[^\?\s]*)?(\?[^\s]*)?)");
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  result.host = match[2].str();
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
  std::string key = name;
  std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) { return std::tolower(c); });
  auto it = headers.find(key);
  if (it == headers.end()) return std::nullopt;
  return it->second;
}

namespace {

using tcp = asio::ip::tcp;
using SslStream = asio::ssl::stream<tcp::socket>;

tcp::socket& lowest(tcp::socket& socket) {
  return socket;
}

tcp::socket& lowest(SslStream& stream) {
  return stream.next_layer();
}

// SSL peers often drop the connection without close_notify
bool is_end_of_stream(const asio::error_code& ec) {
  return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string build_request(const ParsedUrl& url, const HttpOptions& options) {
  std::ostringstream req;
  req << options.method << " " << url.path << url.query << " HTTP/1.1\r\n";
  req << "Host: " << url.host;
  if (!url.port.empty()) {
    req << ":" << url.port;
  }
  req << "\r\n";
  req << "Connection: close\r\n";

  for (const auto& [key, value] : options.headers) {
    req << key << ": " << value << "\r\n";
  }

  if (!options.body.empty() || options.method == "POST") {
    req << "Content-Length: " << options.body.size() << "\r\n";
  }

  req << "\r\n";
  req << options.body;
  return req.str();
}

// One request/response exchange over a plain or TLS socket. After the head arrives it
// doubles as the StreamReader for the body.
template <typename Socket>
class Exchange : public StreamReader, public std::enable_shared_from_this<Exchange<Socket>> {
 public:
  Exchange(asio::any_io_executor executor, std::unique_ptr<Socket> socket)
      : executor_(executor), socket_(std::move(socket)), resolver_(executor), timer_(executor) {}

  ~Exchange() override {
    close_socket();
  }

  void start(const ParsedUrl& url, const HttpOptions& options, OpenHandler on_open) {
    on_open_ = std::move(on_open);
    request_ = build_request(url, options);

    if constexpr (std::is_same_v<Socket, SslStream>) {
      // Set SNI hostname
      SSL_set_tlsext_host_name(socket_->native_handle(), url.host.c_str());
    }

    auto self = this->shared_from_this();
    timer_.expires_after(options.timeout);
    timer_.async_wait([self](const asio::error_code& ec) {
      if (!ec && self->on_open_) {
        self->timed_out_ = true;
        self->close_socket();
      }
    });

    resolver_.async_resolve(url.host, url.port_or_default(), [self](const asio::error_code& ec, tcp::resolver::results_type results) {
      if (ec) {
        self->fail_open("DNS resolution failed: " + ec.message());
        return;
      }
      self->connect(results);
    });
  }

  void read_some(ReadHandler handler) override {
    auto self = this->shared_from_this();
    asio::dispatch(executor_, [self, handler = std::move(handler)]() mutable { self->do_read(std::move(handler)); });
  }

  void close() override {
    auto self = this->shared_from_this();
    asio::dispatch(executor_, [self]() {
      if (self->closed_) return;
      self->closed_ = true;
      self->timer_.cancel();
      self->resolver_.cancel();
      self->close_socket();
    });
  }

 private:
  void connect(const tcp::resolver::results_type& results) {
    auto self = this->shared_from_this();
    asio::async_connect(lowest(*socket_), results, [self](const asio::error_code& ec, const tcp::endpoint&) {
      if (ec) {
        self->fail_open("Connection failed: " + ec.message());
        return;
      }
      if constexpr (std::is_same_v<Socket, SslStream>) {
        self->socket_->async_handshake(asio::ssl::stream_base::client, [self](const asio::error_code& ec) {
          if (ec) {
            self->fail_open("SSL handshake failed: " + ec.message());
            return;
          }
          self->send_request();
        });
      } else {
        self->send_request();
      }
    });
  }

  void send_request() {
    auto self = this->shared_from_this();
    asio::async_write(*socket_, asio::buffer(request_), [self](const asio::error_code& ec, size_t) {
      if (ec) {
        self->fail_open("Write failed: " + ec.message());
        return;
      }
      asio::async_read_until(*self->socket_, self->buffer_, "\r\n\r\n", [self](const asio::error_code& ec, size_t) {
        if (ec) {
          self->fail_open("Read headers failed: " + ec.message());
          return;
        }
        self->parse_head();
      });
    });
  }

  void parse_head() {
    HttpResponse head;
    std::istream stream(&buffer_);

    // Parse status line
    std::string status_line;
    std::getline(stream, status_line);
    std::regex status_regex(R"(HTTP/\d\.\d\s+(\d+))");
    std::smatch match;
    if (!std::regex_search(status_line, match, status_regex)) {
      fail_open("Invalid HTTP response: cannot parse status line");
      return;
    }
    head.status_code = std::stoi(match[1].str());

    // Parse headers
    std::string header_line;
    while (std::getline(stream, header_line) && header_line != "\r") {
      auto colon = header_line.find(':');
      if (colon != std::string::npos) {
        std::string key = lower(header_line.substr(0, colon));
        std::string value = header_line.substr(colon + 1);
        // Trim whitespace
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        head.headers[key] = value;
      }
    }

    timer_.cancel();

    if (auto te = head.header("Transfer-Encoding")) {
      chunked_ = lower(*te).find("chunked") != std::string::npos;
    }
    if (auto length = head.header("Content-Length"); length && !chunked_) {
      try {
        content_length_ = std::stoull(*length);
      } catch (const std::exception&) {
        // Invalid Content-Length, read until EOF
      }
    }

    auto on_open = std::move(on_open_);
    on_open_ = nullptr;

    if (!head.ok()) {
      // Keep whatever part of the error body already arrived, for diagnostics
      head.body = take_buffered();
      closed_ = true;
      close_socket();
      on_open(std::move(head), nullptr);
      return;
    }

    on_open(std::move(head), this->shared_from_this());
  }

  void do_read(ReadHandler handler) {
    if (closed_) {
      complete(std::move(handler), asio::error::operation_aborted, {});
      return;
    }

    if (buffer_.size() > 0) {
      std::string decoded = take_buffered();
      if (!decoded.empty()) {
        complete(std::move(handler), {}, std::move(decoded));
        return;
      }
    }
    if (decoder_.failed()) {
      complete(std::move(handler), asio::error::invalid_argument, {});
      return;
    }
    if (body_done()) {
      complete(std::move(handler), asio::error::eof, {});
      return;
    }

    auto self = this->shared_from_this();
    asio::async_read(*socket_, buffer_, asio::transfer_at_least(1),
                     [self, handler = std::move(handler)](const asio::error_code& ec, size_t) mutable {
                       if (self->closed_) {
                         handler(asio::error::operation_aborted, {});
                         return;
                       }
                       if (ec && !is_end_of_stream(ec)) {
                         handler(ec, {});
                         return;
                       }
                       if (ec) {
                         self->eof_ = true;
                       }
                       std::string decoded = self->take_buffered();
                       if (!decoded.empty()) {
                         handler({}, std::move(decoded));
                         return;
                       }
                       if (self->decoder_.failed()) {
                         handler(asio::error::invalid_argument, {});
                         return;
                       }
                       if (self->body_done()) {
                         self->complete(std::move(handler), asio::error::eof, {});
                         return;
                       }
                       self->do_read(std::move(handler));
                     });
  }

  // Handlers are never run inline, so a consumer that reads again from its handler
  // does not grow the stack.
  void complete(ReadHandler handler, asio::error_code ec, std::string data) {
    if (ec == asio::error::eof && truncated()) {
      ec = asio::error::connection_reset;
    }
    asio::post(executor_, [handler = std::move(handler), ec, data = std::move(data)]() mutable { handler(ec, std::move(data)); });
  }

  std::string take_buffered() {
    std::string raw(asio::buffers_begin(buffer_.data()), asio::buffers_end(buffer_.data()));
    buffer_.consume(buffer_.size());
    if (chunked_) {
      return decoder_.feed(raw);
    }
    if (content_length_) {
      size_t remaining = *content_length_ - received_;
      if (raw.size() > remaining) raw.resize(remaining);
    }
    received_ += raw.size();
    return raw;
  }

  bool body_done() const {
    if (chunked_) return decoder_.done() || eof_;
    if (content_length_) return received_ >= *content_length_ || eof_;
    return eof_;
  }

  // Connection closed before the framing said the body was complete
  bool truncated() const {
    if (chunked_) return !decoder_.done();
    if (content_length_) return received_ < *content_length_;
    return false;
  }

  void fail_open(const std::string& message) {
    timer_.cancel();
    if (!on_open_) return;
    HttpResponse head;
    if (timed_out_) {
      head.error = "Request timed out";
    } else if (closed_) {
      head.error = "Request cancelled";
    } else {
      head.error = message;
    }
    auto on_open = std::move(on_open_);
    on_open_ = nullptr;
    close_socket();
    on_open(std::move(head), nullptr);
  }

  void close_socket() {
    asio::error_code ignored;
    lowest(*socket_).shutdown(tcp::socket::shutdown_both, ignored);
    lowest(*socket_).close(ignored);
  }

  asio::any_io_executor executor_;
  std::unique_ptr<Socket> socket_;
  tcp::resolver resolver_;
  asio::steady_timer timer_;
  asio::streambuf buffer_;
  std::string request_;
  OpenHandler on_open_;

  ChunkedDecoder decoder_;
  bool chunked_ = false;
  std::optional<size_t> content_length_;
  size_t received_ = 0;

  bool eof_ = false;
  bool closed_ = false;
  bool timed_out_ = false;
};

void read_all(std::shared_ptr<StreamReader> reader, std::shared_ptr<HttpResponse> response, std::function<void()> done) {
  reader->read_some([reader, response, done](const asio::error_code& ec, std::string data) {
    if (!ec) {
      response->body += data;
      read_all(reader, response, done);
      return;
    }
    if (ec != asio::error::eof) {
      response->error = "Read failed: " + ec.message();
    }
    done();
  });
}

}  // namespace

HttpClient::HttpClient(asio::any_io_executor executor, std::shared_ptr<asio::ssl::context> ssl_ctx)
    : executor_(std::move(executor)), ssl_ctx_(std::move(ssl_ctx)) {}

std::shared_ptr<asio::ssl::context> HttpClient::make_ssl_context() {
  auto ctx = std::make_shared<asio::ssl::context>(asio::ssl::context::tlsv12_client);
  ctx->set_default_verify_paths();
  ctx->set_verify_mode(asio::ssl::verify_peer);
  return ctx;
}

void HttpClient::open_stream(const std::string& url, const HttpOptions& options, OpenHandler on_open) {
  auto parsed = ParsedUrl::parse(url);
  if (!parsed) {
    HttpResponse head;
    head.error = "Invalid URL";
    asio::post(executor_, [on_open = std::move(on_open), head = std::move(head)]() mutable { on_open(std::move(head), nullptr); });
    return;
  }

  spdlog::debug("HTTP {} {}", options.method, url);

  if (parsed->is_https()) {
    auto socket = std::make_unique<SslStream>(executor_, *ssl_ctx_);
    auto exchange = std::make_shared<Exchange<SslStream>>(executor_, std::move(socket));
    exchange->start(*parsed, options, std::move(on_open));
  } else {
    auto socket = std::make_unique<tcp::socket>(executor_);
    auto exchange = std::make_shared<Exchange<tcp::socket>>(executor_, std::move(socket));
    exchange->start(*parsed, options, std::move(on_open));
  }
}

void HttpClient::request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
  auto timer = std::make_shared<asio::steady_timer>(executor_, options.timeout);
  auto timed_out = std::make_shared<bool>(false);

  open_stream(url, options, [timer, timed_out, callback](HttpResponse head, std::shared_ptr<StreamReader> reader) {
    if (!reader) {
      timer->cancel();
      callback(std::move(head));
      return;
    }

    // Body deadline counts from the start of the request
    timer->async_wait([reader, timed_out](const asio::error_code& ec) {
      if (!ec) {
        *timed_out = true;
        reader->close();
      }
    });

    auto response = std::make_shared<HttpResponse>(std::move(head));
    read_all(reader, response, [timer, timed_out, response, callback]() {
      timer->cancel();
      if (*timed_out) {
        response->error = "Request timed out";
      }
      callback(std::move(*response));
    });
  });
}

}  // namespace bridge::net
