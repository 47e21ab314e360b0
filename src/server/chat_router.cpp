#include "server/chat_router.hpp"

#include <spdlog/spdlog.h>

#include "core/uuid.hpp"
#include "emit/delta_emitter.hpp"
#include "emit/turn_accumulator.hpp"

namespace bridge {

namespace {

constexpr const char* kNoUserMessage = "No user message found in the request.";

std::string dump(const json& j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Chunked HTTP response body as the emitter's sink
class ResponseChunkSink : public ChunkSink {
 public:
  explicit ResponseChunkSink(std::shared_ptr<net::ResponseWriter> writer) : writer_(std::move(writer)) {}

  void write(std::string data, WriteHandler handler) override {
    writer_->write_chunk(std::move(data), std::move(handler));
  }

  void close() override {
    writer_->end_stream();
  }

 private:
  std::shared_ptr<net::ResponseWriter> writer_;
};

json model_entry(const AgentDescriptor& agent) {
  return {{"id", agent.id}, {"object", "model"}, {"owned_by", agent.owned_by}, {"name", agent.display_name}};
}

}  // namespace

ChatRouter::ChatRouter(BridgeConfig config, std::shared_ptr<AgentRegistry> registry, std::shared_ptr<AgentFetcher> health,
                       TurnRunner::Dependencies deps)
    : config_(std::move(config)), registry_(std::move(registry)), health_(std::move(health)), deps_(std::move(deps)) {}

void ChatRouter::handle(net::HttpRequest request, std::shared_ptr<net::ResponseWriter> writer) {
  const auto& path = request.path;

  if (path == "/v1/models") {
    if (request.method != "GET") {
      send_error(*writer, 405, "Use GET for " + path, "invalid_request_error");
      return;
    }
    list_models(std::move(writer));
    return;
  }

  if (path == "/v1/chat/completions") {
    if (request.method != "POST") {
      send_error(*writer, 405, "Use POST for " + path, "invalid_request_error");
      return;
    }
    chat_completions(request, std::move(writer));
    return;
  }

  if (path == "/health") {
    check_health(std::move(writer));
    return;
  }

  send_error(*writer, 404, "No route for " + request.method + " " + path, "not_found");
}

void ChatRouter::list_models(std::shared_ptr<net::ResponseWriter> writer) {
  auto fallback = config_.fallback_agents;
  registry_->list_agents([writer, fallback](Result<std::vector<AgentDescriptor>> result) {
    asio::post(writer->executor(), [writer, fallback, result = std::move(result)]() {
      json data = json::array();
      if (result.ok()) {
        for (const auto& agent : *result.value) {
          data.push_back(model_entry(agent));
        }
      } else {
        spdlog::warn("Serving fallback model list: {}", *result.error);
        for (const auto& id : fallback) {
          AgentDescriptor agent;
          agent.id = id;
          agent.display_name = display_name_for(id);
          data.push_back(model_entry(agent));
        }
      }
      writer->send(200, "application/json", dump({{"object", "list"}, {"data", data}}));
    });
  });
}

void ChatRouter::check_health(std::shared_ptr<net::ResponseWriter> writer) {
  health_->check_health([writer](bool healthy) {
    asio::post(writer->executor(), [writer, healthy]() {
      json body = {{"status", healthy ? "ok" : "degraded"}, {"backend", healthy ? "up" : "down"}};
      writer->send(healthy ? 200 : 503, "application/json", dump(body));
    });
  });
}

void ChatRouter::chat_completions(const net::HttpRequest& http_request, std::shared_ptr<net::ResponseWriter> writer) {
  auto parsed = parse_chat_request(http_request.body, config_.default_agent);
  if (!parsed.ok()) {
    spdlog::warn("Rejected chat request: {}", *parsed.error);
    send_error(*writer, 400, *parsed.error, "invalid_request_error");
    return;
  }
  auto request = std::move(*parsed.value);

  if (!request.turn.session_id) {
    if (auto header = http_request.header("X-Session-ID"); header && !header->empty()) {
      request.turn.session_id = *header;
    }
  }

  if (request.title_task) {
    spdlog::debug("Answering title generation request");
    respond_text(std::move(writer), request, config_.title_response);
    return;
  }
  if (!request.has_user_message) {
    respond_text(std::move(writer), request, kNoUserMessage);
    return;
  }
  if (request.title_flag) {
    spdlog::debug("Answering title flag request");
    respond_text(std::move(writer), request, config_.title_flag_response);
    return;
  }

  std::unique_ptr<StreamSession> session;
  if (request.turn.session_id) {
    session = deps_.store->take(*request.turn.session_id);
    if (!session) {
      send_error(*writer, 404, "Unknown or expired session: " + *request.turn.session_id, "not_found");
      return;
    }
    spdlog::info("[{}] Resuming session after clarification", session->id());
  } else {
    auto agent = registry_->resolve(request.turn.agent_id);
    if (!agent.advertised) {
      spdlog::debug("Agent {} is not in the advertised model list", agent.id);
    }
    SessionOptions options{config_.emit_tool_calls && agent.capabilities.tool_calls};
    session = std::make_unique<StreamSession>(UUID::generate(), agent.id, options);
  }

  request.turn.timeout = config_.request_timeout();
  std::string backend_model = session->backend_agent_id().value_or(session->agent_id());
  std::string model = request.model.empty() ? session->agent_id() : request.model;
  SessionId session_id = session->id();

  if (request.turn.stream) {
    writer->begin_stream(200, "text/event-stream", {{"X-Session-ID", session_id}});
  }
  auto output = make_output(writer, request.turn.stream, model, session_id);

  auto runner = std::make_shared<TurnRunner>(writer->executor(), deps_, std::move(session), std::move(request.turn), backend_model, output);

  std::weak_ptr<TurnRunner> weak = runner;
  writer->on_disconnect([weak]() {
    if (auto r = weak.lock()) {
      spdlog::info("[{}] Caller disconnected", r->session_id());
      r->cancel(ErrorKind::Cancelled);
    }
  });

  runner->start([](const TurnSummary& summary) {
    spdlog::info("[{}] Turn finished: {} ({} tool calls)", summary.session_id, to_string(summary.phase), summary.tool_activity.size());
  });
}

void ChatRouter::respond_text(std::shared_ptr<net::ResponseWriter> writer, const ChatRequest& request, const std::string& text) {
  if (request.turn.stream) {
    writer->begin_stream(200, "text/event-stream");
  }
  auto output = make_output(writer, request.turn.stream, request.model.empty() ? request.turn.agent_id : request.model, "");

  TurnSummary summary;
  summary.text = text;
  OutputFragment fragment{FragmentKind::Text, text, true};

  output->begin([output, fragment, summary](const asio::error_code& ec) {
    if (ec) return;
    output->emit(fragment, [output, summary](const asio::error_code& ec) {
      if (ec) return;
      output->finish(summary, nullptr);
    });
  });
}

std::shared_ptr<TurnOutput> ChatRouter::make_output(std::shared_ptr<net::ResponseWriter> writer, bool stream, const std::string& model,
                                                    const SessionId& session_id) {
  if (stream) {
    return std::make_shared<DeltaEmitter>(std::make_shared<ResponseChunkSink>(writer), UUID::completion_id(), model);
  }

  return std::make_shared<TurnAccumulator>(writer->executor(), UUID::completion_id(), model, [writer, session_id](json response) {
    net::ResponseWriter::Headers headers;
    if (!session_id.empty()) {
      headers["X-Session-ID"] = session_id;
    }
    writer->send(200, "application/json", dump(response), headers);
  });
}

void ChatRouter::send_error(net::ResponseWriter& writer, int status, const std::string& message, const std::string& type) {
  json body = {{"error", {{"message", message}, {"type", type}}}};
  writer.send(status, "application/json", dump(body));
}

}  // namespace bridge
