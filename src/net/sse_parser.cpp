#include "net/sse_parser.hpp"

namespace bridge::net {

namespace {

// "field: value" and "field:value" are equivalent
std::string field_value(const std::string& line, size_t colon) {
  size_t start = colon + 1;
  if (start < line.size() && line[start] == ' ') {
    start++;
  }
  return line.substr(start);
}

}  // namespace

std::vector<SseEvent> SseParser::feed(std::string_view chunk) {
  std::vector<SseEvent> out;
  buffer_.append(chunk);

  size_t pos = 0;
  while (true) {
    size_t newline = buffer_.find('\n', pos);
    if (newline == std::string::npos) break;

    std::string line = buffer_.substr(pos, newline - pos);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    pos = newline + 1;
    process_line(std::move(line), out);
  }

  // Keep the incomplete tail
  buffer_.erase(0, pos);
  return out;
}

std::vector<SseEvent> SseParser::finish() {
  std::vector<SseEvent> out;
  if (!buffer_.empty()) {
    std::string line = std::move(buffer_);
    buffer_.clear();
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    process_line(std::move(line), out);
  }
  dispatch(out);
  return out;
}

void SseParser::reset() {
  buffer_.clear();
  current_ = SseEvent{};
  has_data_ = false;
}

void SseParser::process_line(std::string line, std::vector<SseEvent>& out) {
  if (line.empty()) {
    // Empty line = dispatch event
    dispatch(out);
    return;
  }

  // Comment (keep-alive)
  if (line[0] == ':') return;

  size_t colon = line.find(':');
  std::string field = colon == std::string::npos ? line : line.substr(0, colon);
  std::string value = colon == std::string::npos ? std::string() : field_value(line, colon);

  if (field == "data") {
    if (has_data_) {
      current_.data += '\n';
    }
    current_.data += value;
    has_data_ = true;
  } else if (field == "event") {
    current_.event = value;
  } else if (field == "id") {
    current_.id = value;
  }
  // Other fields (retry, unknown) are ignored
}

void SseParser::dispatch(std::vector<SseEvent>& out) {
  if (has_data_) {
    out.push_back(std::move(current_));
  }
  current_ = SseEvent{};
  has_data_ = false;
}

}  // namespace bridge::net
