#pragma once

#include <asio.hpp>
#include <memory>
#include <string>

#include "backend/agent_registry.hpp"
#include "backend/stream_client.hpp"
#include "core/config.hpp"
#include "net/http_server.hpp"
#include "server/chat_router.hpp"
#include "session/session_store.hpp"

namespace bridge {

// Wires the caller-facing server to the research backend
class Bridge {
 public:
  // config must already be validated
  Bridge(asio::io_context& io_ctx, BridgeConfig config);

  // Bind the listener, warm the agent registry and start housekeeping.
  // Throws asio::system_error when the listen address is unusable.
  asio::ip::tcp::endpoint start();

  void stop();

  const BridgeConfig& config() const {
    return config_;
  }

 private:
  void schedule_purge();

  asio::io_context& io_ctx_;
  BridgeConfig config_;

  std::shared_ptr<asio::ssl::context> ssl_ctx_;
  std::shared_ptr<HttpAgentFetcher> fetcher_;
  std::shared_ptr<AgentRegistry> registry_;
  std::shared_ptr<SessionStore> store_;
  std::shared_ptr<ChatRouter> router_;
  std::unique_ptr<net::HttpServer> server_;
  asio::steady_timer purge_timer_;
};

std::string version();

}  // namespace bridge
