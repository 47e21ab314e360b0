#pragma once

#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <string>

namespace bridge {

// Identifier generation for sessions and completion chunks
class UUID {
 public:
  // Random RFC 4122 version 4 identifier
  static std::string generate() {
    std::uint64_t ab;
    std::uint64_t cd;
    {
      std::lock_guard<std::mutex> lock(mutex());
      ab = wide()(engine());
      cd = wide()(engine());
    }

    ab = (ab & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    cd = (cd & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << (ab >> 32) << "-";
    ss << std::setw(4) << ((ab >> 16) & 0xFFFF) << "-";
    ss << std::setw(4) << (ab & 0xFFFF) << "-";
    ss << std::setw(4) << (cd >> 48) << "-";
    ss << std::setw(12) << (cd & 0x0000FFFFFFFFFFFFULL);
    return ss.str();
  }

  static std::string short_id(size_t length = 8) {
    static const char charset[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    std::lock_guard<std::mutex> lock(mutex());
    for (size_t i = 0; i < length; ++i) {
      result += charset[dist(engine())];
    }
    return result;
  }

  // "chatcmpl-..." id shared by every chunk of one response
  static std::string completion_id() {
    return "chatcmpl-" + short_id(24);
  }

 private:
  // Request handlers run on several threads
  static std::mutex& mutex() {
    static std::mutex m;
    return m;
  }

  static std::mt19937_64& engine() {
    static std::mt19937_64 gen(std::random_device{}());
    return gen;
  }

  static std::uniform_int_distribution<std::uint64_t>& wide() {
    static std::uniform_int_distribution<std::uint64_t> dist;
    return dist;
  }
};

}  // namespace bridge
