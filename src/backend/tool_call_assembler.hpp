#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "backend/agent_event.hpp"

namespace bridge {

// Reassembles tool calls that an OpenAI-style backend streams in fragments.
//
// The first delta of a call carries id and name with empty or partial arguments; the
// following id-less deltas append to the arguments of the call at the same index. A call
// is released as one complete chunk once its arguments parse as a JSON object, or when the
// backend reports a finish_reason. A complete call that repeats one already released
// (same name and arguments) is dropped, since the backend replays the selected action
// after streaming it. Everything else passes through unchanged.
//
// One instance per turn; not thread-safe.
class ToolCallAssembler {
 public:
  // Zero or more payloads ready for EventDecoder, in order
  std::vector<RawEvent> feed(const RawEvent& raw);

  size_t pending() const {
    return pending_.size();
  }

 private:
  struct PendingCall {
    std::string id;
    std::string name;
    std::string arguments;
  };

  void absorb(const ordered_json& tool_call, const RawEvent& raw, std::vector<RawEvent>& out, bool& orphaned);
  void release(int index, const PendingCall& call, const std::string& event, std::vector<RawEvent>& out);
  void flush(const std::string& event, std::vector<RawEvent>& out);

  std::map<int, PendingCall> pending_;
  std::set<std::string> released_;
};

}  // namespace bridge
