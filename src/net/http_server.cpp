#include "http_server.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <deque>
#include <sstream>

namespace bridge::net {

namespace {

using tcp = asio::ip::tcp;

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

std::string response_head(int status, const std::string& content_type, const ResponseWriter::Headers& headers) {
  std::ostringstream head;
  head << "HTTP/1.1 " << status << " " << status_text(status) << "\r\n";
  head << "Content-Type: " << content_type << "\r\n";
  head << "Connection: close\r\n";
  head << "Cache-Control: no-cache\r\n";
  for (const auto& [key, value] : headers) {
    head << key << ": " << value << "\r\n";
  }
  return head.str();
}

class HttpConnection : public ResponseWriter, public std::enable_shared_from_this<HttpConnection> {
 public:
  HttpConnection(tcp::socket socket, RequestHandler handler, size_t max_body_bytes)
      : socket_(std::move(socket)), handler_(std::move(handler)), max_body_bytes_(max_body_bytes) {}

  void start() {
    auto self = shared_from_this();
    asio::async_read_until(socket_, buffer_, "\r\n\r\n", [self](const asio::error_code& ec, size_t) {
      if (ec) {
        spdlog::debug("Connection closed before request head: {}", ec.message());
        return;
      }
      self->parse_head();
    });
  }

  asio::any_io_executor executor() const override {
    return socket_.get_executor();
  }

  void send(int status, const std::string& content_type, std::string body, Headers headers) override {
    if (responded_) return;
    responded_ = true;
    std::string out = response_head(status, content_type, headers);
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
    out += body;
    enqueue(std::move(out), nullptr);
    finish();
  }

  void begin_stream(int status, const std::string& content_type, Headers headers) override {
    if (responded_) return;
    responded_ = true;
    std::string out = response_head(status, content_type, headers);
    out += "Transfer-Encoding: chunked\r\n\r\n";
    enqueue(std::move(out), nullptr);
  }

  void write_chunk(std::string data, WriteHandler handler) override {
    if (finished_ || failed_) {
      auto ec = failed_ ? write_error_ : asio::error_code(asio::error::not_connected);
      asio::post(executor(), [handler = std::move(handler), ec]() {
        if (handler) handler(ec);
      });
      return;
    }
    if (data.empty()) {
      // A zero-size chunk would terminate the body
      asio::post(executor(), [handler = std::move(handler)]() {
        if (handler) handler({});
      });
      return;
    }
    std::ostringstream framed;
    framed << std::hex << data.size() << "\r\n";
    enqueue(framed.str() + data + "\r\n", std::move(handler));
  }

  void end_stream() override {
    if (finished_) return;
    enqueue("0\r\n\r\n", nullptr);
    finish();
  }

  void on_disconnect(std::function<void()> callback) override {
    on_disconnect_ = std::move(callback);
    if (disconnected_) {
      fire_disconnect();
    }
  }

 private:
  struct PendingWrite {
    std::string data;
    WriteHandler handler;
  };

  void parse_head() {
    std::istream stream(&buffer_);
    std::string request_line;
    std::getline(stream, request_line);
    if (!request_line.empty() && request_line.back() == '\r') {
      request_line.pop_back();
    }

    std::istringstream line(request_line);
    std::string version;
    line >> request_.method >> request_.target >> version;
    if (request_.method.empty() || request_.target.empty() || version.rfind("HTTP/", 0) != 0) {
      send(400, "text/plain", "Malformed request line", {});
      return;
    }
    auto query = request_.target.find('?');
    request_.path = request_.target.substr(0, query);

    std::string header_line;
    while (std::getline(stream, header_line) && header_line != "\r") {
      auto colon = header_line.find(':');
      if (colon != std::string::npos) {
        std::string key = lower(header_line.substr(0, colon));
        std::string value = header_line.substr(colon + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        request_.headers[key] = value;
      }
    }

    size_t content_length = 0;
    if (auto length = request_.header("Content-Length")) {
      try {
        content_length = std::stoull(*length);
      } catch (const std::exception&) {
        send(400, "text/plain", "Invalid Content-Length", {});
        return;
      }
    }
    if (content_length > max_body_bytes_) {
      send(413, "text/plain", "Request body too large", {});
      return;
    }

    read_body(content_length);
  }

  void read_body(size_t content_length) {
    if (buffer_.size() >= content_length) {
      std::string data(asio::buffers_begin(buffer_.data()), asio::buffers_end(buffer_.data()));
      buffer_.consume(buffer_.size());
      request_.body = data.substr(0, content_length);
      dispatch();
      return;
    }

    auto self = shared_from_this();
    asio::async_read(socket_, buffer_, asio::transfer_exactly(content_length - buffer_.size()),
                     [self, content_length](const asio::error_code& ec, size_t) {
                       if (ec) {
                         spdlog::debug("Connection closed before request body: {}", ec.message());
                         return;
                       }
                       self->read_body(content_length);
                     });
  }

  void dispatch() {
    spdlog::debug("{} {}", request_.method, request_.target);
    watch_disconnect();
    handler_(std::move(request_), shared_from_this());
  }

  // The caller sends nothing after its request, so a completed read means it hung up
  void watch_disconnect() {
    auto self = shared_from_this();
    socket_.async_read_some(asio::buffer(probe_), [self](const asio::error_code& ec, size_t) {
      if (self->finished_) return;
      if (!ec) {
        self->watch_disconnect();
        return;
      }
      self->disconnected_ = true;
      self->fire_disconnect();
    });
  }

  void fire_disconnect() {
    if (!on_disconnect_) return;
    auto callback = std::move(on_disconnect_);
    on_disconnect_ = nullptr;
    callback();
  }

  void enqueue(std::string data, WriteHandler handler) {
    queue_.push_back(PendingWrite{std::move(data), std::move(handler)});
    if (!writing_) {
      do_write();
    }
  }

  void do_write() {
    if (queue_.empty()) {
      writing_ = false;
      if (finished_) {
        close();
      }
      return;
    }
    writing_ = true;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(queue_.front().data), [self](const asio::error_code& ec, size_t) {
      auto handler = std::move(self->queue_.front().handler);
      self->queue_.pop_front();
      if (ec) {
        self->fail_writes(ec);
        if (handler) handler(ec);
        return;
      }
      if (handler) handler({});
      self->do_write();
    });
  }

  void fail_writes(const asio::error_code& ec) {
    failed_ = true;
    write_error_ = ec;
    writing_ = false;
    auto pending = std::move(queue_);
    queue_.clear();
    for (auto& write : pending) {
      if (write.handler) {
        asio::post(executor(), [handler = std::move(write.handler), ec]() { handler(ec); });
      }
    }
    disconnected_ = true;
    fire_disconnect();
    close();
  }

  void finish() {
    finished_ = true;
    on_disconnect_ = nullptr;
    if (!writing_ && queue_.empty()) {
      close();
    }
  }

  void close() {
    asio::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_send, ignored);
    socket_.close(ignored);
  }

  tcp::socket socket_;
  RequestHandler handler_;
  size_t max_body_bytes_;
  asio::streambuf buffer_;
  HttpRequest request_;

  std::deque<PendingWrite> queue_;
  std::array<char, 256> probe_{};
  std::function<void()> on_disconnect_;
  asio::error_code write_error_;

  bool responded_ = false;
  bool writing_ = false;
  bool finished_ = false;
  bool failed_ = false;
  bool disconnected_ = false;
};

}  // namespace

std::optional<std::string> HttpRequest::header(const std::string& name) const {
  auto it = headers.find(lower(name));
  if (it == headers.end()) return std::nullopt;
  return it->second;
}

std::string status_text(int status) {
  switch (status) {
    case 200:
      return "OK";
    case 400:
      return "Bad Request";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    case 500:
      return "Internal Server Error";
    case 502:
      return "Bad Gateway";
    case 503:
      return "Service Unavailable";
    default:
      return "Unknown";
  }
}

HttpServer::HttpServer(asio::io_context& io_ctx, RequestHandler handler, size_t max_body_bytes)
    : io_ctx_(io_ctx), acceptor_(io_ctx), handler_(std::move(handler)), max_body_bytes_(max_body_bytes) {}

tcp::endpoint HttpServer::listen(const std::string& host, int port) {
  tcp::endpoint endpoint(asio::ip::make_address(host), static_cast<unsigned short>(port));
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(tcp::acceptor::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen();
  accept();
  return acceptor_.local_endpoint();
}

void HttpServer::stop() {
  asio::error_code ignored;
  acceptor_.close(ignored);
}

void HttpServer::accept() {
  acceptor_.async_accept(asio::make_strand(io_ctx_), [this](const asio::error_code& ec, tcp::socket socket) {
    if (ec) {
      if (ec != asio::error::operation_aborted) {
        spdlog::warn("Accept failed: {}", ec.message());
        accept();
      }
      return;
    }
    std::make_shared<HttpConnection>(std::move(socket), handler_, max_body_bytes_)->start();
    accept();
  });
}

}  // namespace bridge::net
