// Bridge wiring
#include "bridge/bridge.hpp"

#include <spdlog/spdlog.h>

#include "core/version.hpp"
#include "net/http_client.hpp"

namespace bridge {

namespace {

constexpr std::chrono::seconds kPurgeInterval{60};

}  // namespace

Bridge::Bridge(asio::io_context& io_ctx, BridgeConfig config)
    : io_ctx_(io_ctx), config_(std::move(config)), purge_timer_(io_ctx) {
  ssl_ctx_ = net::HttpClient::make_ssl_context();

  fetcher_ = std::make_shared<HttpAgentFetcher>(io_ctx_.get_executor(), ssl_ctx_, config_.backend_url,
                                                std::chrono::seconds(config_.connect_timeout_seconds));
  registry_ = std::make_shared<AgentRegistry>(fetcher_, std::chrono::seconds(config_.registry_ttl_seconds));
  store_ = std::make_shared<SessionStore>(std::chrono::seconds(config_.clarification_ttl_seconds));

  DecoderOptions decoder_options;
  decoder_options.clarification_tools = config_.clarification_tools;
  decoder_options.final_answer_tools = config_.final_answer_tools;

  TurnRunner::Dependencies deps;
  deps.connector = std::make_shared<HttpBackendConnector>(config_.backend_url, std::chrono::seconds(config_.connect_timeout_seconds), ssl_ctx_);
  deps.decoder = std::make_shared<const EventDecoder>(decoder_options);
  deps.store = store_;

  router_ = std::make_shared<ChatRouter>(config_, registry_, fetcher_, deps);

  auto router = router_;
  server_ = std::make_unique<net::HttpServer>(io_ctx_, [router](net::HttpRequest request, std::shared_ptr<net::ResponseWriter> writer) {
    router->handle(std::move(request), std::move(writer));
  });
}

asio::ip::tcp::endpoint Bridge::start() {
  auto endpoint = server_->listen(config_.listen.host, config_.listen.port);
  spdlog::info("research_bridge {} listening on {}:{}, backend {}", version(), endpoint.address().to_string(), endpoint.port(),
               config_.backend_url);

  registry_->refresh([](bool ok) {
    if (!ok) {
      spdlog::warn("Backend agent list not available yet; advertising fallback agents");
    }
  });
  schedule_purge();
  return endpoint;
}

void Bridge::stop() {
  spdlog::info("Stopping research_bridge");
  server_->stop();
  purge_timer_.cancel();
}

void Bridge::schedule_purge() {
  purge_timer_.expires_after(kPurgeInterval);
  purge_timer_.async_wait([this](const asio::error_code& ec) {
    if (ec) return;
    store_->purge_expired();
    schedule_purge();
  });
}

std::string version() {
  return BRIDGE_VERSION_STRING;
}

}  // namespace bridge
