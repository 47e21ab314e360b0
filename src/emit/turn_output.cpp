#include "emit/turn_output.hpp"

namespace bridge {

TurnSummary summarize(const StreamSession& session) {
  TurnSummary summary;
  summary.session_id = session.id();
  summary.phase = session.phase();
  summary.error = session.error();
  summary.finish_reason = session.error() ? finish_reason_for(*session.error()) : FinishReason::Stop;
  summary.text = session.turn_text();
  summary.tool_activity = session.turn_tool_activity();
  return summary;
}

}  // namespace bridge
