#pragma once

#include "hovel/common/events.hpp"
#include "hovel/shell/shell_engine.hpp"

#include <string>

namespace hovel::tools {

// One JSON object per line; `type` is "command" or "event".
[[nodiscard]] std::string format_shell_command_log_json(const hovel::shell::CommandMetrics& metrics);
[[nodiscard]] std::string format_engine_event_log_json(const hovel::EngineEvent& event);

}  // namespace hovel::tools
