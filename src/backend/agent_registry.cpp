#include "backend/agent_registry.hpp"

#include <spdlog/spdlog.h>

#include "net/http_client.hpp"

namespace bridge {

namespace {

std::string join_url(const std::string& base, const std::string& path) {
  if (!base.empty() && base.back() == '/') {
    return base.substr(0, base.size() - 1) + path;
  }
  return base + path;
}

}  // namespace

HttpAgentFetcher::HttpAgentFetcher(asio::any_io_executor executor, std::shared_ptr<asio::ssl::context> ssl_ctx,
                                   std::string backend_url, std::chrono::seconds timeout)
    : executor_(std::move(executor)), ssl_ctx_(std::move(ssl_ctx)), backend_url_(std::move(backend_url)), timeout_(timeout) {}

void HttpAgentFetcher::fetch_agents(ListHandler handler) {
  // One strand per exchange: its timer and socket handlers must not run concurrently
  net::HttpClient client(asio::make_strand(executor_), ssl_ctx_);
  net::HttpOptions options;
  options.headers["Accept"] = "application/json";
  options.timeout = timeout_;

  client.request(join_url(backend_url_, "/v1/models"), options, [handler = std::move(handler)](net::HttpResponse response) {
    if (!response.error.empty()) {
      handler(Result<std::vector<AgentDescriptor>>::failure(response.error));
      return;
    }
    if (!response.ok()) {
      handler(Result<std::vector<AgentDescriptor>>::failure("HTTP " + std::to_string(response.status_code)));
      return;
    }
    handler(parse_models(response.body));
  });
}

void HttpAgentFetcher::check_health(HealthHandler handler) {
  // One strand per exchange: its timer and socket handlers must not run concurrently
  net::HttpClient client(asio::make_strand(executor_), ssl_ctx_);
  net::HttpOptions options;
  options.timeout = timeout_;

  client.request(join_url(backend_url_, "/health"), options, [handler = std::move(handler)](net::HttpResponse response) {
    if (!response.ok()) {
      spdlog::debug("Backend health check failed: {}", response.error.empty() ? "HTTP " + std::to_string(response.status_code) : response.error);
    }
    handler(response.ok());
  });
}

Result<std::vector<AgentDescriptor>> HttpAgentFetcher::parse_models(const std::string& body) {
  auto j = json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object() || !j.contains("data") || !j["data"].is_array()) {
    return Result<std::vector<AgentDescriptor>>::failure("malformed model list");
  }

  std::vector<AgentDescriptor> agents;
  for (const auto& item : j["data"]) {
    if (!item.is_object() || !item.contains("id") || !item["id"].is_string()) {
      spdlog::warn("Skipping model entry without id: {}", item.dump());
      continue;
    }
    AgentDescriptor agent;
    agent.id = item["id"].get<std::string>();
    agent.display_name = display_name_for(agent.id);
    if (item.contains("owned_by") && item["owned_by"].is_string()) {
      agent.owned_by = item["owned_by"].get<std::string>();
    }
    if (item.contains("capabilities") && item["capabilities"].is_object()) {
      const auto& capabilities = item["capabilities"];
      if (capabilities.contains("tool_calls") && capabilities["tool_calls"].is_boolean()) {
        agent.capabilities.tool_calls = capabilities["tool_calls"].get<bool>();
      }
    }
    agents.push_back(std::move(agent));
  }
  return Result<std::vector<AgentDescriptor>>::success(std::move(agents));
}

AgentRegistry::AgentRegistry(std::shared_ptr<AgentFetcher> fetcher, std::chrono::seconds ttl,
                             std::function<Clock::time_point()> now)
    : fetcher_(std::move(fetcher)), ttl_(ttl), now_(std::move(now)) {}

void AgentRegistry::list_agents(ListHandler handler) {
  auto snap = snapshot();
  if (snap) {
    bool stale = now_() - snap->fetched_at >= ttl_;
    handler(Result<std::vector<AgentDescriptor>>::success(snap->agents));
    if (stale) {
      refresh();
    }
    return;
  }

  bool start_fetch = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    waiters_.push_back(std::move(handler));
    if (!refreshing_) {
      refreshing_ = true;
      start_fetch = true;
    }
  }
  if (start_fetch) {
    auto self = shared_from_this();
    fetcher_->fetch_agents([self](Result<std::vector<AgentDescriptor>> result) { self->on_fetched(std::move(result)); });
  }
}

void AgentRegistry::refresh(std::function<void(bool)> done) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done) {
      refresh_callbacks_.push_back(std::move(done));
    }
    if (refreshing_) return;
    refreshing_ = true;
  }
  auto self = shared_from_this();
  fetcher_->fetch_agents([self](Result<std::vector<AgentDescriptor>> result) { self->on_fetched(std::move(result)); });
}

void AgentRegistry::on_fetched(Result<std::vector<AgentDescriptor>> result) {
  std::vector<ListHandler> waiters;
  std::vector<std::function<void(bool)>> callbacks;
  std::shared_ptr<const Snapshot> snap;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    refreshing_ = false;
    if (result.ok()) {
      snapshot_ = std::make_shared<const Snapshot>(Snapshot{std::move(*result.value), now_()});
    }
    snap = snapshot_;
    waiters.swap(waiters_);
    callbacks.swap(refresh_callbacks_);
  }

  if (result.ok()) {
    spdlog::info("Loaded {} agent models", snap->agents.size());
  } else if (snap) {
    spdlog::warn("Agent list refresh failed, serving cached list: {}", *result.error);
  } else {
    spdlog::warn("Agent list unavailable: {}", *result.error);
  }

  for (auto& waiter : waiters) {
    if (snap) {
      waiter(Result<std::vector<AgentDescriptor>>::success(snap->agents));
    } else {
      waiter(Result<std::vector<AgentDescriptor>>::failure(to_string(ErrorKind::RegistryUnavailable)));
    }
  }
  for (auto& callback : callbacks) {
    callback(result.ok());
  }
}

AgentDescriptor AgentRegistry::resolve(const AgentId& id) const {
  if (auto snap = snapshot()) {
    for (const auto& agent : snap->agents) {
      if (agent.id == id) return agent;
    }
  }
  AgentDescriptor agent;
  agent.id = id;
  agent.display_name = display_name_for(id);
  agent.advertised = false;
  return agent;
}

bool AgentRegistry::has_snapshot() const {
  return snapshot() != nullptr;
}

std::shared_ptr<const AgentRegistry::Snapshot> AgentRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshot_;
}

}  // namespace bridge
