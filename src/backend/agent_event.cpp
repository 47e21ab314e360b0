#include "backend/agent_event.hpp"

namespace bridge {

namespace {

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

std::string event_name(const AgentEvent& event) {
  return std::visit(overloaded{
                        [](const TextDelta&) { return std::string("text_delta"); },
                        [](const ToolCallStarted&) { return std::string("tool_call_started"); },
                        [](const ToolCallFinished&) { return std::string("tool_call_finished"); },
                        [](const ClarificationRequested&) { return std::string("clarification_requested"); },
                        [](const TurnCompleted&) { return std::string("turn_completed"); },
                        [](const StreamError&) { return std::string("error"); },
                    },
                    event);
}

}  // namespace bridge
