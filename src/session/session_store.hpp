#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

#include "session/stream_session.hpp"

namespace bridge {

// Sessions paused for clarification, waiting for the caller's continuation.
// The store is the only owner of a parked session; take() hands ownership back.
class SessionStore {
 public:
  using Clock = std::chrono::steady_clock;

  explicit SessionStore(std::chrono::seconds ttl, std::function<Clock::time_point()> now = [] { return Clock::now(); });

  void park(std::unique_ptr<StreamSession> session);

  // nullptr when the id is unknown or its session expired
  std::unique_ptr<StreamSession> take(const SessionId& id);

  // Drop expired sessions; returns how many were dropped
  size_t purge_expired();

  size_t size() const;

 private:
  struct Parked {
    std::unique_ptr<StreamSession> session;
    Clock::time_point expires_at;
  };

  std::chrono::seconds ttl_;
  std::function<Clock::time_point()> now_;

  mutable std::mutex mutex_;
  std::map<SessionId, Parked> parked_;
};

}  // namespace bridge
