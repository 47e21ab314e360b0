#pragma once

#include <memory>
#include <string>

#include "backend/agent_registry.hpp"
#include "core/config.hpp"
#include "net/http_server.hpp"
#include "server/chat_request.hpp"
#include "server/turn_runner.hpp"

namespace bridge {

// OpenAI-compatible caller endpoints:
//   GET  /v1/models
//   POST /v1/chat/completions
//   GET  /health
class ChatRouter {
 public:
  ChatRouter(BridgeConfig config, std::shared_ptr<AgentRegistry> registry, std::shared_ptr<AgentFetcher> health,
             TurnRunner::Dependencies deps);

  void handle(net::HttpRequest request, std::shared_ptr<net::ResponseWriter> writer);

 private:
  void list_models(std::shared_ptr<net::ResponseWriter> writer);
  void check_health(std::shared_ptr<net::ResponseWriter> writer);
  void chat_completions(const net::HttpRequest& request, std::shared_ptr<net::ResponseWriter> writer);

  // Answer without a backend turn (title generation, missing user message)
  void respond_text(std::shared_ptr<net::ResponseWriter> writer, const ChatRequest& request, const std::string& text);

  std::shared_ptr<TurnOutput> make_output(std::shared_ptr<net::ResponseWriter> writer, bool stream, const std::string& model,
                                          const SessionId& session_id);

  static void send_error(net::ResponseWriter& writer, int status, const std::string& message, const std::string& type);

  BridgeConfig config_;
  std::shared_ptr<AgentRegistry> registry_;
  std::shared_ptr<AgentFetcher> health_;
  TurnRunner::Dependencies deps_;
};

}  // namespace bridge
