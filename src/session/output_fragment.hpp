#pragma once

#include <string>

#include "core/types.hpp"

namespace bridge {

enum class FragmentKind { Text, ToolAnnotation, Control };

std::string to_string(FragmentKind kind);

// Unit of visible output produced by the session state machine
struct OutputFragment {
  FragmentKind kind = FragmentKind::Text;
  std::string payload;
  bool is_final = false;                            // last fragment of the turn
  FinishReason finish_reason = FinishReason::Stop;  // meaningful when is_final
};

}  // namespace bridge
