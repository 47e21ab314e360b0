#include "session/turn_controller.hpp"

#include <spdlog/spdlog.h>

namespace bridge {

TurnController::TurnController(asio::any_io_executor executor, std::chrono::steady_clock::duration timeout)
    : timer_(executor), timeout_(timeout) {}

void TurnController::start(CancelHandler on_cancel) {
  on_cancel_ = std::move(on_cancel);
  deadline_ = std::chrono::steady_clock::now() + timeout_;
  timer_.expires_at(deadline_);

  std::weak_ptr<TurnController> weak = shared_from_this();
  timer_.async_wait([weak](const asio::error_code& ec) {
    if (ec) return;
    if (auto self = weak.lock()) {
      if (self->cancel(ErrorKind::TimedOut)) {
        spdlog::warn("Turn deadline expired");
      }
    }
  });
}

bool TurnController::cancel(ErrorKind reason) {
  if (reason_ || completed_) {
    return false;
  }
  reason_ = reason;
  timer_.cancel();

  if (on_cancel_) {
    auto on_cancel = std::move(on_cancel_);
    on_cancel_ = nullptr;
    on_cancel(reason);
  }
  return true;
}

void TurnController::complete() {
  if (completed_ || reason_) return;
  completed_ = true;
  timer_.cancel();
  on_cancel_ = nullptr;
}

}  // namespace bridge
