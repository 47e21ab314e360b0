#pragma once

#include <asio.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "core/types.hpp"

namespace bridge {

// Cancellation token and deadline for one turn.
// Must be used from the executor it was created with.
class TurnController : public std::enable_shared_from_this<TurnController> {
 public:
  using CancelHandler = std::function<void(ErrorKind reason)>;

  TurnController(asio::any_io_executor executor, std::chrono::steady_clock::duration timeout);

  // Arm the deadline. on_cancel runs once, for the first cancel() or the deadline.
  void start(CancelHandler on_cancel);

  // Cancelled or TimedOut. Returns true only for the call that actually cancelled;
  // later calls, and calls after complete(), are no-ops.
  bool cancel(ErrorKind reason);

  // The turn ended on its own; disarms the deadline
  void complete();

  bool cancelled() const {
    return reason_.has_value();
  }

  std::optional<ErrorKind> reason() const {
    return reason_;
  }

  bool completed() const {
    return completed_;
  }

  std::chrono::steady_clock::time_point deadline() const {
    return deadline_;
  }

 private:
  asio::steady_timer timer_;
  std::chrono::steady_clock::duration timeout_;
  std::chrono::steady_clock::time_point deadline_;
  CancelHandler on_cancel_;
  std::optional<ErrorKind> reason_;
  bool completed_ = false;
};

}  // namespace bridge
