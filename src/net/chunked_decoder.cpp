#include "net/chunked_decoder.hpp"

#include <algorithm>
#include <cstdint>

namespace bridge::net {

std::string ChunkedDecoder::feed(std::string_view data) {
  std::string out;

  size_t pos = 0;
  while (pos < data.size() && state_ != State::Done && state_ != State::Error) {
    switch (state_) {
      case State::Size:
      case State::Trailer:
      case State::DataEnd: {
        size_t newline = data.find('\n', pos);
        if (newline == std::string_view::npos) {
          line_.append(data.substr(pos));
          pos = data.size();
          break;
        }
        line_.append(data.substr(pos, newline - pos));
        pos = newline + 1;
        if (!line_.empty() && line_.back() == '\r') {
          line_.pop_back();
        }

        if (state_ == State::Size) {
          if (!parse_size_line()) {
            state_ = State::Error;
          }
        } else if (state_ == State::DataEnd) {
          state_ = line_.empty() ? State::Size : State::Error;
        } else if (line_.empty()) {
          // Blank line ends the trailer section
          state_ = State::Done;
        }
        line_.clear();
        break;
      }

      case State::Data: {
        size_t take = std::min(remaining_, data.size() - pos);
        out.append(data.substr(pos, take));
        pos += take;
        remaining_ -= take;
        if (remaining_ == 0) {
          state_ = State::DataEnd;
        }
        break;
      }

      case State::Done:
      case State::Error:
        break;
    }
  }

  return out;
}

bool ChunkedDecoder::parse_size_line() {
  // Chunk extensions after ';' are ignored
  auto size_part = line_.substr(0, line_.find(';'));
  size_part.erase(size_part.find_last_not_of(" \t") + 1);
  if (size_part.empty()) return false;

  size_t size = 0;
  for (char c : size_part) {
    int digit;
    if (c >= '0' && c <= '9') {
      digit = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      digit = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      digit = c - 'A' + 10;
    } else {
      return false;
    }
    if (size > (SIZE_MAX >> 4)) return false;
    size = (size << 4) | static_cast<size_t>(digit);
  }

  remaining_ = size;
  state_ = size == 0 ? State::Trailer : State::Data;
  return true;
}

void ChunkedDecoder::reset() {
  state_ = State::Size;
  line_.clear();
  remaining_ = 0;
}

}  // namespace bridge::net
