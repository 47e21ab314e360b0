#include "backend/stream_client.hpp"

#include <spdlog/spdlog.h>

#include <deque>

#include "net/http_client.hpp"
#include "net/sse_parser.hpp"

namespace bridge {

namespace {

std::string join_url(const std::string& base, const std::string& path) {
  if (!base.empty() && base.back() == '/') {
    return base.substr(0, base.size() - 1) + path;
  }
  return base + path;
}

class HttpEventSource : public EventSource, public std::enable_shared_from_this<HttpEventSource> {
 public:
  HttpEventSource(asio::any_io_executor executor, std::shared_ptr<asio::ssl::context> ssl_ctx, std::string url,
                  net::HttpOptions options)
      : executor_(executor), client_(executor, std::move(ssl_ctx)), url_(std::move(url)), options_(std::move(options)) {}

  ~HttpEventSource() override {
    if (reader_) {
      reader_->close();
    }
  }

  void next(NextHandler handler) override {
    auto self = shared_from_this();
    asio::dispatch(executor_, [self, handler = std::move(handler)]() mutable { self->do_next(std::move(handler)); });
  }

  void close() override {
    auto self = shared_from_this();
    asio::dispatch(executor_, [self]() {
      if (self->closed_) return;
      self->closed_ = true;
      self->pending_.clear();
      if (self->reader_) {
        self->reader_->close();
      }
      spdlog::debug("Backend stream closed: {}", self->url_);
    });
  }

  std::optional<AgentId> backend_agent_id() const override {
    return backend_agent_id_;
  }

 private:
  void do_next(NextHandler handler) {
    if (closed_) {
      deliver(std::move(handler), SourceStep::failed(ErrorKind::Cancelled, "stream closed"));
      return;
    }
    if (!pending_.empty()) {
      auto event = std::move(pending_.front());
      pending_.pop_front();
      deliver(std::move(handler), SourceStep::of(std::move(event)));
      return;
    }
    if (ended_) {
      deliver(std::move(handler), SourceStep::end());
      return;
    }
    if (!opened_) {
      opened_ = true;
      connect(std::move(handler));
      return;
    }
    pull(std::move(handler));
  }

  void connect(NextHandler handler) {
    auto self = shared_from_this();
    client_.open_stream(url_, options_,
                        [self, handler = std::move(handler)](net::HttpResponse head, std::shared_ptr<net::StreamReader> reader) mutable {
                          if (self->closed_) {
                            if (reader) reader->close();
                            handler(SourceStep::failed(ErrorKind::Cancelled, "stream closed"));
                            return;
                          }
                          if (!reader) {
                            self->ended_ = true;
                            if (!head.error.empty()) {
                              handler(SourceStep::failed(ErrorKind::Unreachable, head.error));
                            } else {
                              handler(SourceStep::failed(ErrorKind::BackendError,
                                                         "HTTP " + std::to_string(head.status_code) + ": " + head.body));
                            }
                            return;
                          }

                          if (auto agent_id = head.header("X-Agent-ID"); agent_id && !agent_id->empty()) {
                            spdlog::info("Backend agent instance: {}", *agent_id);
                            self->backend_agent_id_ = *agent_id;
                          }
                          self->reader_ = std::move(reader);
                          self->pull(std::move(handler));
                        });
  }

  void pull(NextHandler handler) {
    auto self = shared_from_this();
    reader_->read_some([self, handler = std::move(handler)](const asio::error_code& ec, std::string data) mutable {
      if (self->closed_) {
        handler(SourceStep::failed(ErrorKind::Cancelled, "stream closed"));
        return;
      }

      if (!ec) {
        for (auto& sse : self->parser_.feed(data)) {
          self->pending_.push_back(RawEvent{std::move(sse.event), std::move(sse.data)});
        }
        if (self->pending_.empty()) {
          self->pull(std::move(handler));
          return;
        }
        self->take_front(std::move(handler));
        return;
      }

      self->ended_ = true;
      self->reader_->close();

      if (ec == asio::error::eof) {
        for (auto& sse : self->parser_.finish()) {
          self->pending_.push_back(RawEvent{std::move(sse.event), std::move(sse.data)});
        }
        if (self->pending_.empty()) {
          handler(SourceStep::end());
        } else {
          self->take_front(std::move(handler));
        }
        return;
      }

      auto kind = self->delivered_ > 0 ? ErrorKind::Truncated : ErrorKind::Unreachable;
      handler(SourceStep::failed(kind, "Read failed: " + ec.message()));
    });
  }

  void take_front(NextHandler handler) {
    auto event = std::move(pending_.front());
    pending_.pop_front();
    delivered_++;
    handler(SourceStep::of(std::move(event)));
  }

  void deliver(NextHandler handler, SourceStep step) {
    if (step.kind == SourceStep::Kind::Event) {
      delivered_++;
    }
    asio::post(executor_, [handler = std::move(handler), step = std::move(step)]() mutable { handler(std::move(step)); });
  }

  asio::any_io_executor executor_;
  net::HttpClient client_;
  std::string url_;
  net::HttpOptions options_;

  std::shared_ptr<net::StreamReader> reader_;
  net::SseParser parser_;
  std::deque<RawEvent> pending_;
  std::optional<AgentId> backend_agent_id_;
  size_t delivered_ = 0;

  bool opened_ = false;
  bool ended_ = false;
  bool closed_ = false;
};

}  // namespace

HttpBackendConnector::HttpBackendConnector(std::string backend_url, std::chrono::seconds connect_timeout,
                                           std::shared_ptr<asio::ssl::context> ssl_ctx)
    : backend_url_(std::move(backend_url)), connect_timeout_(connect_timeout), ssl_ctx_(std::move(ssl_ctx)) {}

std::shared_ptr<EventSource> HttpBackendConnector::open(const std::string& model, const ChatTurnRequest& request,
                                                        asio::any_io_executor executor) {
  net::HttpOptions options;
  options.method = "POST";
  options.headers["Content-Type"] = "application/json";
  options.headers["Accept"] = "text/event-stream";
  if (request.session_id) {
    options.headers["X-Session-ID"] = *request.session_id;
  }
  options.body = request.to_backend_body(model).dump();
  options.timeout = connect_timeout_;

  spdlog::debug("Opening backend stream for model {} ({} messages)", model, request.conversation_history.size());

  return std::make_shared<HttpEventSource>(executor, ssl_ctx_, join_url(backend_url_, "/v1/chat/completions"), std::move(options));
}

}  // namespace bridge
