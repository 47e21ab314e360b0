#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace bridge::net {

// Incremental decoder for HTTP/1.1 "Transfer-Encoding: chunked" bodies
class ChunkedDecoder {
 public:
  // Feed raw body bytes; returns the payload bytes decoded from them
  std::string feed(std::string_view data);

  // Terminating zero-size chunk and trailers seen
  bool done() const {
    return state_ == State::Done;
  }

  bool failed() const {
    return state_ == State::Error;
  }

  void reset();

 private:
  enum class State { Size, Data, DataEnd, Trailer, Done, Error };

  bool parse_size_line();

  State state_ = State::Size;
  std::string line_;
  size_t remaining_ = 0;
};

}  // namespace bridge::net
