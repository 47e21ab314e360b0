#include "server/turn_runner.hpp"

#include <spdlog/spdlog.h>

namespace bridge {

TurnRunner::TurnRunner(asio::any_io_executor strand, Dependencies deps, std::unique_ptr<StreamSession> session,
                       ChatTurnRequest request, std::string backend_model, std::shared_ptr<TurnOutput> output)
    : strand_(std::move(strand)),
      deps_(std::move(deps)),
      session_(std::move(session)),
      session_id_(session_->id()),
      request_(std::move(request)),
      backend_model_(std::move(backend_model)),
      output_(std::move(output)) {}

void TurnRunner::start(DoneHandler on_done) {
  auto self = shared_from_this();
  asio::dispatch(strand_, [self, on_done = std::move(on_done)]() mutable {
    self->on_done_ = std::move(on_done);

    std::weak_ptr<TurnRunner> weak = self;
    self->controller_ = std::make_shared<TurnController>(self->strand_, self->request_.timeout);
    self->controller_->start([weak](ErrorKind reason) {
      if (auto runner = weak.lock()) {
        runner->on_cancel(reason);
      }
    });

    self->session_->begin_turn();
    spdlog::info("[{}] Turn started: agent {} via backend model {}", self->session_id_, self->session_->agent_id(),
                 self->backend_model_);

    self->source_ = self->deps_.connector->open(self->backend_model_, self->request_, self->strand_);
    self->output_->begin([self](const asio::error_code& ec) {
      if (ec) {
        self->controller_->cancel(ErrorKind::Cancelled);
        return;
      }
      self->pull();
    });
  });
}

void TurnRunner::cancel(ErrorKind reason) {
  auto self = shared_from_this();
  asio::dispatch(strand_, [self, reason]() {
    if (self->controller_) {
      self->controller_->cancel(reason);
    }
  });
}

void TurnRunner::pull() {
  if (cancelled_ || concluded_) return;
  auto self = shared_from_this();
  source_->next([self](SourceStep step) { self->on_step(std::move(step)); });
}

void TurnRunner::on_step(SourceStep step) {
  if (cancelled_ || concluded_) return;

  auto self = shared_from_this();
  switch (step.kind) {
    case SourceStep::Kind::Event: {
      if (!session_->backend_agent_id()) {
        if (auto agent_id = source_->backend_agent_id()) {
          session_->set_backend_agent_id(*agent_id);
        }
      }

      for (auto& raw : assembler_.feed(step.event)) {
        ready_.push_back(std::move(raw));
      }
      process_ready();
      return;
    }

    case SourceStep::Kind::End: {
      std::vector<OutputFragment> fragments;
      if (session_->phase() == SessionPhase::Streaming) {
        fragments = session_->apply(StreamError{ErrorKind::Truncated, "backend stream ended before the turn completed"});
      }
      write_fragments(std::move(fragments), 0, false, [self]() { self->conclude(); });
      return;
    }

    case SourceStep::Kind::Failed:
      write_fragments(session_->apply(step.error), 0, false, [self]() { self->after_event(); });
      return;
  }
}

void TurnRunner::process_ready() {
  if (ready_.empty()) {
    pull();
    return;
  }

  RawEvent raw = std::move(ready_.front());
  ready_.pop_front();

  auto decoded = deps_.decoder->decode(raw);
  if (!decoded.ok()) {
    spdlog::warn("[{}] Skipping undecodable backend event: {}", session_id_, *decoded.error);
    process_ready();
    return;
  }
  auto self = shared_from_this();
  write_fragments(session_->apply(*decoded.value), 0, false, [self]() { self->after_event(); });
}

void TurnRunner::after_event() {
  if (session_->phase() == SessionPhase::Streaming) {
    process_ready();
  } else {
    conclude();
  }
}

void TurnRunner::write_fragments(std::vector<OutputFragment> fragments, size_t index, bool cancel_path, std::function<void()> then) {
  // A cancellation supersedes whatever chain was in flight
  if (cancelled_ && !cancel_path) return;

  if (index == fragments.size()) {
    then();
    return;
  }

  auto self = shared_from_this();
  OutputFragment fragment = fragments[index];
  output_->emit(fragment, [self, fragments = std::move(fragments), index, cancel_path, then = std::move(then)](const asio::error_code& ec) mutable {
    if (ec) {
      if (!cancel_path) {
        spdlog::info("[{}] Caller write failed: {}", self->session_id_, ec.message());
        self->controller_->cancel(ErrorKind::Cancelled);
      } else {
        then();
      }
      return;
    }
    self->write_fragments(std::move(fragments), index + 1, cancel_path, std::move(then));
  });
}

void TurnRunner::on_cancel(ErrorKind reason) {
  if (concluded_) {
    // Deadline or caller disconnect while draining a finished turn
    if (draining_ && source_) {
      source_->close();
    }
    return;
  }

  cancelled_ = true;
  spdlog::info("[{}] Turn {}", session_id_, reason == ErrorKind::TimedOut ? "timed out" : "cancelled by caller");

  if (source_) {
    source_->close();
  }

  auto self = shared_from_this();
  auto fragments = session_->fail(reason, reason == ErrorKind::TimedOut ? "turn deadline expired" : "caller disconnected");
  write_fragments(std::move(fragments), 0, true, [self]() { self->conclude(); });
}

void TurnRunner::conclude() {
  if (concluded_) return;
  concluded_ = true;

  auto summary = summarize(*session_);
  spdlog::debug("[{}] Turn concluded in phase {}", session_id_, to_string(summary.phase));

  if (summary.phase == SessionPhase::AwaitingClarification) {
    deps_.store->park(std::move(session_));
  }

  auto self = shared_from_this();
  output_->finish(summary, [self, summary](const asio::error_code& ec) {
    if (ec) {
      spdlog::debug("[{}] Final chunk not delivered: {}", self->session_id_, ec.message());
    }
    if (self->on_done_) {
      auto on_done = std::move(self->on_done_);
      self->on_done_ = nullptr;
      on_done(summary);
    }
  });

  if (!cancelled_ && summary.phase != SessionPhase::Failed) {
    // Let the backend end the stream itself; only the caller or the deadline cancel it
    drain();
  } else {
    controller_->complete();
    source_->close();
  }
}

void TurnRunner::drain() {
  draining_ = true;
  auto self = shared_from_this();
  source_->next([self](SourceStep step) {
    if (step.kind == SourceStep::Kind::Event) {
      spdlog::trace("[{}] Discarding backend event after the turn ended", self->session_id_);
      self->drain();
      return;
    }
    self->draining_ = false;
    self->controller_->complete();
    self->source_->close();
  });
}

}  // namespace bridge
