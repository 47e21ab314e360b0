#pragma once

#include <cstdint>
#include <ctime>
#include <memory>
#include <string>

#include "emit/turn_output.hpp"

namespace bridge {

// Streams a turn as OpenAI "chat.completion.chunk" Server-Sent Events:
// a role chunk, one content chunk per non-empty fragment, a closing chunk carrying
// finish_reason and the x_session extension, then "data: [DONE]".
//
// Each call issues exactly one sink write, so chunks keep the order of the calls.
class DeltaEmitter : public TurnOutput {
 public:
  DeltaEmitter(std::shared_ptr<ChunkSink> sink, std::string completion_id, std::string model,
               std::int64_t created = static_cast<std::int64_t>(std::time(nullptr)));

  void begin(WriteHandler handler) override;

  void emit(const OutputFragment& fragment, WriteHandler handler) override;

  void finish(const TurnSummary& summary, WriteHandler handler) override;

  bool finished() const {
    return finished_;
  }

  // "data: <json>\n\n"
  static std::string sse_data(const json& payload);

 private:
  json chunk(json delta, json finish_reason) const;

  std::shared_ptr<ChunkSink> sink_;
  std::string completion_id_;
  std::string model_;
  std::int64_t created_;
  bool finished_ = false;
};

// x_session extension: {"id", "state"[, "error"]}
json session_extension(const TurnSummary& summary);

}  // namespace bridge
