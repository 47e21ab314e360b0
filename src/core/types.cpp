#include "core/types.hpp"

#include <cctype>

namespace bridge {

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Unreachable:
      return "unreachable";
    case ErrorKind::Truncated:
      return "truncated";
    case ErrorKind::DecodeError:
      return "decode_error";
    case ErrorKind::ProtocolViolation:
      return "protocol_violation";
    case ErrorKind::Cancelled:
      return "cancelled";
    case ErrorKind::TimedOut:
      return "timed_out";
    case ErrorKind::RegistryUnavailable:
      return "registry_unavailable";
    case ErrorKind::BackendError:
      return "backend_error";
  }
  return "backend_error";
}

ErrorKind error_kind_from_string(const std::string& str) {
  if (str == "unreachable") return ErrorKind::Unreachable;
  if (str == "truncated") return ErrorKind::Truncated;
  if (str == "decode_error") return ErrorKind::DecodeError;
  if (str == "protocol_violation") return ErrorKind::ProtocolViolation;
  if (str == "cancelled") return ErrorKind::Cancelled;
  if (str == "timed_out" || str == "timeout") return ErrorKind::TimedOut;
  if (str == "registry_unavailable") return ErrorKind::RegistryUnavailable;
  return ErrorKind::BackendError;
}

std::string user_message(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Unreachable:
      return "The research service is unreachable. Please try again later.";
    case ErrorKind::Truncated:
      return "The connection to the research service was interrupted before the answer was complete.";
    case ErrorKind::Cancelled:
      return "The request was cancelled.";
    case ErrorKind::TimedOut:
      return "The research took longer than the allowed time and was stopped.";
    case ErrorKind::RegistryUnavailable:
      return "The list of research agents is currently unavailable.";
    case ErrorKind::DecodeError:
    case ErrorKind::ProtocolViolation:
    case ErrorKind::BackendError:
      return "The research service reported an error while processing the request.";
  }
  return "The research service reported an error while processing the request.";
}

std::string to_string(FinishReason reason) {
  switch (reason) {
    case FinishReason::Stop:
      return "stop";
    case FinishReason::Error:
      return "error";
    case FinishReason::Cancelled:
      return "cancelled";
  }
  return "stop";
}

FinishReason finish_reason_for(ErrorKind kind) {
  if (kind == ErrorKind::Cancelled || kind == ErrorKind::TimedOut) return FinishReason::Cancelled;
  return FinishReason::Error;
}

std::string to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
    case Role::Tool:
      return "tool";
  }
  return "user";
}

Role role_from_string(const std::string& str) {
  if (str == "system" || str == "developer") return Role::System;
  if (str == "assistant") return Role::Assistant;
  if (str == "tool") return Role::Tool;
  return Role::User;
}

json ChatTurnRequest::to_backend_body(const std::string& model) const {
  json messages = json::array();
  for (const auto& msg : conversation_history) {
    messages.push_back({{"role", to_string(msg.role)}, {"content", msg.content}});
  }
  return {{"model", model}, {"messages", messages}, {"stream", true}};
}

std::string display_name_for(const AgentId& id) {
  std::string out;
  out.reserve(id.size());
  bool word_start = true;
  for (char c : id) {
    if (c == '_') c = ' ';
    auto uc = static_cast<unsigned char>(c);
    if (std::isalpha(uc)) {
      out.push_back(static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc)));
      word_start = false;
    } else {
      out.push_back(c);
      word_start = true;
    }
  }
  return out;
}

namespace {

// Expected length of a UTF-8 sequence from its leading byte, 0 when invalid
size_t sequence_length(unsigned char lead) {
  if (lead <= 0x7F) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 0;
}

bool is_continuation(unsigned char c) {
  return (c & 0xC0) == 0x80;
}

}  // namespace

std::string sanitize_utf8(const std::string& input) {
  static const char kReplacement[] = "\xEF\xBF\xBD";

  std::string output;
  output.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    auto lead = static_cast<unsigned char>(input[i]);
    size_t len = sequence_length(lead);

    if (len == 1) {
      output.push_back(input[i]);
      i++;
      continue;
    }

    bool complete = len != 0 && i + len <= input.size();
    for (size_t k = 1; complete && k < len; ++k) {
      complete = is_continuation(static_cast<unsigned char>(input[i + k]));
    }
    if (!complete) {
      output.append(kReplacement);
      i++;
      continue;
    }

    // Decode to reject overlong forms and surrogates
    uint32_t cp = lead & (0xFF >> (len + 1));
    for (size_t k = 1; k < len; ++k) {
      cp = (cp << 6) | (static_cast<unsigned char>(input[i + k]) & 0x3F);
    }
    static const uint32_t kMinimum[] = {0, 0, 0x80, 0x800, 0x10000};
    bool valid = cp >= kMinimum[len] && cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);

    if (valid) {
      output.append(input, i, len);
    } else {
      output.append(kReplacement);
    }
    i += len;
  }

  return output;
}

}  // namespace bridge
