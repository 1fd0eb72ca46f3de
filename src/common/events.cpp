#include "hovel/common/events.hpp"

#include <utility>

namespace hovel {

std::string_view event_severity_to_string(EventSeverity severity) noexcept
{
    switch (severity) {
    case EventSeverity::Debug:
        return "debug";
    case EventSeverity::Info:
        return "info";
    case EventSeverity::Warning:
        return "warning";
    case EventSeverity::Error:
    default:
        return "error";
    }
}

void emit_event(const EventLogger& logger, EventSeverity severity, std::string_view component, std::string message)
{
    if (!logger) {
        return;
    }

    EngineEvent event{};
    event.severity = severity;
    event.component = std::string{component};
    event.message = std::move(message);
    event.timestamp = std::chrono::system_clock::now();
    logger(event);
}

}  // namespace hovel
