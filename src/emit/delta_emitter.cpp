#include "emit/delta_emitter.hpp"

#include <spdlog/spdlog.h>

namespace bridge {

json session_extension(const TurnSummary& summary) {
  json ext = {{"id", summary.session_id}, {"state", to_string(summary.phase)}};
  if (summary.error) {
    ext["error"] = to_string(*summary.error);
  }
  return ext;
}

DeltaEmitter::DeltaEmitter(std::shared_ptr<ChunkSink> sink, std::string completion_id, std::string model, std::int64_t created)
    : sink_(std::move(sink)), completion_id_(std::move(completion_id)), model_(std::move(model)), created_(created) {}

std::string DeltaEmitter::sse_data(const json& payload) {
  return "data: " + payload.dump(-1, ' ', false, json::error_handler_t::replace) + "\n\n";
}

json DeltaEmitter::chunk(json delta, json finish_reason) const {
  json choice = {{"index", 0}, {"delta", std::move(delta)}, {"finish_reason", std::move(finish_reason)}};
  return {{"id", completion_id_},
          {"object", "chat.completion.chunk"},
          {"created", created_},
          {"model", model_},
          {"choices", json::array({std::move(choice)})}};
}

void DeltaEmitter::begin(WriteHandler handler) {
  sink_->write(sse_data(chunk({{"role", "assistant"}, {"content", ""}}, nullptr)), std::move(handler));
}

void DeltaEmitter::emit(const OutputFragment& fragment, WriteHandler handler) {
  if (finished_ || fragment.payload.empty()) {
    sink_->write(std::string(), std::move(handler));
    return;
  }
  spdlog::trace("Emitting {} fragment ({} bytes)", to_string(fragment.kind), fragment.payload.size());
  sink_->write(sse_data(chunk({{"content", fragment.payload}}, nullptr)), std::move(handler));
}

void DeltaEmitter::finish(const TurnSummary& summary, WriteHandler handler) {
  if (finished_) {
    sink_->write(std::string(), std::move(handler));
    return;
  }
  finished_ = true;

  json last = chunk(json::object(), to_string(summary.finish_reason));
  if (!summary.session_id.empty()) {
    last["x_session"] = session_extension(summary);
  }

  auto sink = sink_;
  sink_->write(sse_data(last) + "data: [DONE]\n\n", [sink, handler = std::move(handler)](const asio::error_code& ec) {
    sink->close();
    if (handler) handler(ec);
  });
}

}  // namespace bridge
