#pragma once

#include <asio.hpp>
#include <cstdint>
#include <ctime>
#include <functional>
#include <string>

#include "emit/turn_output.hpp"

namespace bridge {

// Collects a turn for a non-streaming caller and delivers one "chat.completion"
// with the assembled text, a tool_activity summary and the x_session extension.
// Tool annotations are left out of the text; tool_activity carries them.
class TurnAccumulator : public TurnOutput {
 public:
  using CompleteHandler = std::function<void(json response)>;

  TurnAccumulator(asio::any_io_executor executor, std::string completion_id, std::string model, CompleteHandler on_complete,
                  std::int64_t created = static_cast<std::int64_t>(std::time(nullptr)));

  void begin(WriteHandler handler) override;

  void emit(const OutputFragment& fragment, WriteHandler handler) override;

  void finish(const TurnSummary& summary, WriteHandler handler) override;

  const std::string& content() const {
    return content_;
  }

 private:
  void complete(WriteHandler handler);

  asio::any_io_executor executor_;
  std::string completion_id_;
  std::string model_;
  CompleteHandler on_complete_;
  std::int64_t created_;
  std::string content_;
};

}  // namespace bridge
