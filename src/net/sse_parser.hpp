#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace bridge::net {

// SSE event
struct SseEvent {
  std::string event;  // Event type (empty for default "message")
  std::string data;   // Event data, multiple data lines joined by '\n'
  std::string id;     // Event ID (optional)
};

// Incremental Server-Sent Events parser. Chunks may split lines and events anywhere.
class SseParser {
 public:
  // Feed a chunk; returns the events completed by it, in order
  std::vector<SseEvent> feed(std::string_view chunk);

  // End of stream: returns a last event that was not followed by a blank line
  std::vector<SseEvent> finish();

  void reset();

 private:
  void process_line(std::string line, std::vector<SseEvent>& out);
  void dispatch(std::vector<SseEvent>& out);

  std::string buffer_;
  SseEvent current_;
  bool has_data_ = false;
};

}  // namespace bridge::net
