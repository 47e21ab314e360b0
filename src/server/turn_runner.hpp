#pragma once

#include <asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "backend/event_decoder.hpp"
#include "backend/stream_client.hpp"
#include "backend/tool_call_assembler.hpp"
#include "emit/turn_output.hpp"
#include "session/session_store.hpp"
#include "session/stream_session.hpp"
#include "session/turn_controller.hpp"

namespace bridge {

// Drives one turn: backend events -> tool call assembly -> decoder -> session -> output.
//
// Everything runs on one strand. The next backend event is requested only after the
// output accepted the fragments of the previous one, so a slow caller slows the
// backend read instead of growing a buffer. Cancellation flows one way, from the
// caller or the deadline to the backend connection.
class TurnRunner : public std::enable_shared_from_this<TurnRunner> {
 public:
  struct Dependencies {
    std::shared_ptr<BackendConnector> connector;
    std::shared_ptr<const EventDecoder> decoder;
    std::shared_ptr<SessionStore> store;
  };

  // Invoked once with the summary after the output finished
  using DoneHandler = std::function<void(const TurnSummary& summary)>;

  TurnRunner(asio::any_io_executor strand, Dependencies deps, std::unique_ptr<StreamSession> session, ChatTurnRequest request,
             std::string backend_model, std::shared_ptr<TurnOutput> output);

  void start(DoneHandler on_done = nullptr);

  // Caller went away. Safe from any thread and after the turn ended.
  void cancel(ErrorKind reason = ErrorKind::Cancelled);

  const SessionId& session_id() const {
    return session_id_;
  }

 private:
  void pull();
  void on_step(SourceStep step);
  void process_ready();
  void after_event();
  void write_fragments(std::vector<OutputFragment> fragments, size_t index, bool cancel_path, std::function<void()> then);
  void on_cancel(ErrorKind reason);
  void conclude();
  void drain();

  asio::any_io_executor strand_;
  Dependencies deps_;
  std::unique_ptr<StreamSession> session_;
  SessionId session_id_;
  ChatTurnRequest request_;
  std::string backend_model_;
  std::shared_ptr<TurnOutput> output_;

  std::shared_ptr<TurnController> controller_;
  std::shared_ptr<EventSource> source_;
  ToolCallAssembler assembler_;
  std::deque<RawEvent> ready_;  // assembled payloads not yet decoded
  DoneHandler on_done_;

  bool cancelled_ = false;
  bool concluded_ = false;
  bool draining_ = false;
};

}  // namespace bridge
