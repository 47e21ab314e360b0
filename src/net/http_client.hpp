#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace bridge::net {

// HTTP response
struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;  // keys lower-cased
  std::string body;
  std::string error;

  bool ok() const {
    return error.empty() && status_code >= 200 && status_code < 300;
  }

  std::optional<std::string> header(const std::string& name) const;
};

// HTTP request options
struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  // request(): whole exchange. open_stream(): until the response head arrives.
  std::chrono::seconds timeout{30};
};

// Body of a streaming response. Nothing is read from the socket until read_some() asks for it,
// so a slow consumer holds the producer back instead of buffering without bound.
class StreamReader {
 public:
  using ReadHandler = std::function<void(const asio::error_code& ec, std::string data)>;

  virtual ~StreamReader() = default;

  // Next non-empty piece of the (de-chunked) body, or asio::error::eof at the end.
  // The handler is never invoked inline.
  virtual void read_some(ReadHandler handler) = 0;

  // Abort the transfer and close the connection. Safe to call repeatedly.
  virtual void close() = 0;
};

// head.error is set when no response head was received. reader is null unless head.ok().
using OpenHandler = std::function<void(HttpResponse head, std::shared_ptr<StreamReader> reader)>;

// Async HTTP/1.1 client using ASIO. Completion handlers run on the given executor.
class HttpClient {
 public:
  HttpClient(asio::any_io_executor executor, std::shared_ptr<asio::ssl::context> ssl_ctx);

  // Buffered request with callback
  void request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback);

  // Streaming request: on_open receives the response head and a reader for the body
  void open_stream(const std::string& url, const HttpOptions& options, OpenHandler on_open);

  asio::any_io_executor executor() const {
    return executor_;
  }

  // TLS client context with the system trust store
  static std::shared_ptr<asio::ssl::context> make_ssl_context();

 private:
  asio::any_io_executor executor_;
  std::shared_ptr<asio::ssl::context> ssl_ctx_;
};

// URL parsing helper
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const;

  static std::optional<ParsedUrl> parse(const std::string& url);
};

}  // namespace bridge::net
