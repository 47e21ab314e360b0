#pragma once

#include <asio.hpp>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace bridge::net {

// Inbound HTTP request
struct HttpRequest {
  std::string method;
  std::string target;  // as sent, including the query
  std::string path;
  std::map<std::string, std::string> headers;  // keys lower-cased
  std::string body;

  std::optional<std::string> header(const std::string& name) const;
};

// Response side of one inbound exchange. Must be used from executor().
class ResponseWriter {
 public:
  using WriteHandler = std::function<void(const asio::error_code& ec)>;
  using Headers = std::map<std::string, std::string>;

  virtual ~ResponseWriter() = default;

  virtual asio::any_io_executor executor() const = 0;

  // Complete response with Content-Length; the connection closes after it
  virtual void send(int status, const std::string& content_type, std::string body, Headers headers = {}) = 0;

  // Chunked response. Writes are queued and go out in call order.
  virtual void begin_stream(int status, const std::string& content_type, Headers headers = {}) = 0;
  virtual void write_chunk(std::string data, WriteHandler handler) = 0;
  virtual void end_stream() = 0;

  // Invoked at most once if the peer goes away before the response is complete
  virtual void on_disconnect(std::function<void()> callback) = 0;
};

using RequestHandler = std::function<void(HttpRequest request, std::shared_ptr<ResponseWriter> writer)>;

// Minimal HTTP/1.1 server, one request per connection. Each connection runs on its own strand.
class HttpServer {
 public:
  HttpServer(asio::io_context& io_ctx, RequestHandler handler, size_t max_body_bytes = 8 * 1024 * 1024);

  // Bind and start accepting. Throws asio::system_error when the address is unusable.
  asio::ip::tcp::endpoint listen(const std::string& host, int port);

  void stop();

 private:
  void accept();

  asio::io_context& io_ctx_;
  asio::ip::tcp::acceptor acceptor_;
  RequestHandler handler_;
  size_t max_body_bytes_;
};

std::string status_text(int status);

}  // namespace bridge::net
