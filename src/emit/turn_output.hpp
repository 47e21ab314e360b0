#pragma once

#include <asio.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "session/output_fragment.hpp"
#include "session/stream_session.hpp"

namespace bridge {

// Byte channel to the caller. Writes complete in call order.
class ChunkSink {
 public:
  using WriteHandler = std::function<void(const asio::error_code& ec)>;

  virtual ~ChunkSink() = default;

  // Completes once the data is accepted by the connection. Empty data completes
  // without writing. The handler never runs inline.
  virtual void write(std::string data, WriteHandler handler) = 0;

  // End of the response body
  virtual void close() = 0;
};

// How a turn ended, handed to the output once the session leaves Streaming
struct TurnSummary {
  SessionId session_id;
  SessionPhase phase = SessionPhase::Completed;
  FinishReason finish_reason = FinishReason::Stop;
  std::optional<ErrorKind> error;
  std::string text;
  std::vector<ToolActivity> tool_activity;
};

TurnSummary summarize(const StreamSession& session);

// Destination of a turn's fragments: streamed chunks or one assembled response
class TurnOutput {
 public:
  using WriteHandler = std::function<void(const asio::error_code& ec)>;

  virtual ~TurnOutput() = default;

  virtual void begin(WriteHandler handler) = 0;

  virtual void emit(const OutputFragment& fragment, WriteHandler handler) = 0;

  virtual void finish(const TurnSummary& summary, WriteHandler handler) = 0;
};

}  // namespace bridge
