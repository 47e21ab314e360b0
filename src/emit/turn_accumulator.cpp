#include "emit/turn_accumulator.hpp"

#include "emit/delta_emitter.hpp"

namespace bridge {

TurnAccumulator::TurnAccumulator(asio::any_io_executor executor, std::string completion_id, std::string model,
                                 CompleteHandler on_complete, std::int64_t created)
    : executor_(std::move(executor)),
      completion_id_(std::move(completion_id)),
      model_(std::move(model)),
      on_complete_(std::move(on_complete)),
      created_(created) {}

void TurnAccumulator::begin(WriteHandler handler) {
  complete(std::move(handler));
}

void TurnAccumulator::emit(const OutputFragment& fragment, WriteHandler handler) {
  if (fragment.kind != FragmentKind::ToolAnnotation) {
    content_ += fragment.payload;
  }
  complete(std::move(handler));
}

void TurnAccumulator::finish(const TurnSummary& summary, WriteHandler handler) {
  json activity = json::array();
  for (const auto& record : summary.tool_activity) {
    activity.push_back(record.to_json());
  }

  json response = {{"id", completion_id_},
                   {"object", "chat.completion"},
                   {"created", created_},
                   {"model", model_},
                   {"choices", json::array({{{"index", 0},
                                             {"message", {{"role", "assistant"}, {"content", content_}}},
                                             {"finish_reason", to_string(summary.finish_reason)}}})},
                   {"tool_activity", activity}};
  if (!summary.session_id.empty()) {
    response["x_session"] = session_extension(summary);
  }

  if (on_complete_) {
    auto on_complete = std::move(on_complete_);
    on_complete_ = nullptr;
    on_complete(std::move(response));
  }
  complete(std::move(handler));
}

void TurnAccumulator::complete(WriteHandler handler) {
  asio::post(executor_, [handler = std::move(handler)]() {
    if (handler) handler({});
  });
}

}  // namespace bridge
