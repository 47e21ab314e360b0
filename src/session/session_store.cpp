#include "session/session_store.hpp"

#include <spdlog/spdlog.h>

namespace bridge {

SessionStore::SessionStore(std::chrono::seconds ttl, std::function<Clock::time_point()> now) : ttl_(ttl), now_(std::move(now)) {}

void SessionStore::park(std::unique_ptr<StreamSession> session) {
  if (!session) return;
  auto id = session->id();
  std::lock_guard<std::mutex> lock(mutex_);
  parked_[id] = Parked{std::move(session), now_() + ttl_};
  spdlog::debug("Parked session {} ({} waiting)", id, parked_.size());
}

std::unique_ptr<StreamSession> SessionStore::take(const SessionId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = parked_.find(id);
  if (it == parked_.end()) {
    return nullptr;
  }
  auto parked = std::move(it->second);
  parked_.erase(it);
  if (now_() >= parked.expires_at) {
    spdlog::info("Session {} expired while awaiting clarification", id);
    return nullptr;
  }
  return std::move(parked.session);
}

size_t SessionStore::purge_expired() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = now_();
  size_t dropped = 0;
  for (auto it = parked_.begin(); it != parked_.end();) {
    if (now >= it->second.expires_at) {
      it = parked_.erase(it);
      dropped++;
    } else {
      ++it;
    }
  }
  if (dropped > 0) {
    spdlog::info("Discarded {} expired session(s)", dropped);
  }
  return dropped;
}

size_t SessionStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parked_.size();
}

}  // namespace bridge
