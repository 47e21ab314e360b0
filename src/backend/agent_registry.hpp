#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace bridge {

// Backend agent discovery and liveness
class AgentFetcher {
 public:
  using ListHandler = std::function<void(Result<std::vector<AgentDescriptor>> agents)>;
  using HealthHandler = std::function<void(bool healthy)>;

  virtual ~AgentFetcher() = default;

  virtual void fetch_agents(ListHandler handler) = 0;

  virtual void check_health(HealthHandler handler) = 0;
};

// GET {backend_url}/v1/models and GET {backend_url}/health
class HttpAgentFetcher : public AgentFetcher {
 public:
  HttpAgentFetcher(asio::any_io_executor executor, std::shared_ptr<asio::ssl::context> ssl_ctx, std::string backend_url,
                   std::chrono::seconds timeout);

  void fetch_agents(ListHandler handler) override;

  void check_health(HealthHandler handler) override;

  // Parse an OpenAI-style model list: {"data": [{"id": ...}, ...]}
  static Result<std::vector<AgentDescriptor>> parse_models(const std::string& body);

 private:
  asio::any_io_executor executor_;
  std::shared_ptr<asio::ssl::context> ssl_ctx_;
  std::string backend_url_;
  std::chrono::seconds timeout_;
};

// Cached view of the backend's agents, exposed to callers as models.
//
// The cache is an immutable snapshot replaced wholesale after each successful fetch.
// Readers copy the snapshot pointer and never wait for a refresh: a stale snapshot is
// served while a background refresh runs. Only when nothing was ever fetched does a
// reader wait for the fetch in flight.
class AgentRegistry : public std::enable_shared_from_this<AgentRegistry> {
 public:
  using Clock = std::chrono::steady_clock;
  using ListHandler = std::function<void(Result<std::vector<AgentDescriptor>> agents)>;

  AgentRegistry(std::shared_ptr<AgentFetcher> fetcher, std::chrono::seconds ttl,
                std::function<Clock::time_point()> now = [] { return Clock::now(); });

  // Error is to_string(ErrorKind::RegistryUnavailable) when no snapshot exists and the fetch failed
  void list_agents(ListHandler handler);

  // Fetch now, regardless of the TTL. done(true) when the snapshot was replaced.
  void refresh(std::function<void(bool)> done = nullptr);

  // Descriptor for an id from the current snapshot. Unknown ids get a synthesized,
  // unadvertised descriptor with the default capabilities.
  AgentDescriptor resolve(const AgentId& id) const;

  bool has_snapshot() const;

 private:
  struct Snapshot {
    std::vector<AgentDescriptor> agents;
    Clock::time_point fetched_at;
  };

  std::shared_ptr<const Snapshot> snapshot() const;

  void on_fetched(Result<std::vector<AgentDescriptor>> result);

  std::shared_ptr<AgentFetcher> fetcher_;
  std::chrono::seconds ttl_;
  std::function<Clock::time_point()> now_;

  mutable std::mutex mutex_;
  std::shared_ptr<const Snapshot> snapshot_;
  bool refreshing_ = false;
  std::vector<ListHandler> waiters_;
  std::vector<std::function<void(bool)>> refresh_callbacks_;
};

}  // namespace bridge
