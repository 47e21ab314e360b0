#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "backend/agent_event.hpp"
#include "core/types.hpp"

namespace bridge {

// One step of a backend event sequence
struct SourceStep {
  enum class Kind { Event, End, Failed };

  Kind kind = Kind::End;
  RawEvent event;     // Kind::Event
  StreamError error;  // Kind::Failed

  static SourceStep of(RawEvent event) {
    return SourceStep{Kind::Event, std::move(event), {}};
  }

  static SourceStep end() {
    return SourceStep{Kind::End, {}, {}};
  }

  static SourceStep failed(ErrorKind kind, std::string message) {
    return SourceStep{Kind::Failed, {}, StreamError{kind, std::move(message)}};
  }
};

// Lazy, ordered sequence of raw events from one backend turn.
// Nothing happens on the network until the first next().
class EventSource {
 public:
  using NextHandler = std::function<void(SourceStep step)>;

  virtual ~EventSource() = default;

  // Deliver the next step. At most one next() may be outstanding; the handler never runs inline.
  // Failure before any event is Unreachable, failure after one is Truncated.
  virtual void next(NextHandler handler) = 0;

  // Terminate the connection and release it. Idempotent; a pending next() completes
  // with Failed{Cancelled}.
  virtual void close() = 0;

  // Agent instance the backend assigned to this turn, once known
  virtual std::optional<AgentId> backend_agent_id() const = 0;
};

// Opens backend turns
class BackendConnector {
 public:
  virtual ~BackendConnector() = default;

  // model: the backend agent id (or agent instance id when continuing a session).
  // All handlers of the returned source run on executor.
  virtual std::shared_ptr<EventSource> open(const std::string& model, const ChatTurnRequest& request,
                                            asio::any_io_executor executor) = 0;
};

// Streams POST {backend_url}/v1/chat/completions as Server-Sent Events
class HttpBackendConnector : public BackendConnector {
 public:
  HttpBackendConnector(std::string backend_url, std::chrono::seconds connect_timeout,
                       std::shared_ptr<asio::ssl::context> ssl_ctx);

  std::shared_ptr<EventSource> open(const std::string& model, const ChatTurnRequest& request,
                                    asio::any_io_executor executor) override;

 private:
  std::string backend_url_;
  std::chrono::seconds connect_timeout_;
  std::shared_ptr<asio::ssl::context> ssl_ctx_;
};

}  // namespace bridge
