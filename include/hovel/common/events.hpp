#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace hovel {

enum class EventSeverity : std::uint8_t {
    Debug = 0,
    Info,
    Warning,
    Error
};

struct EngineEvent final {
    EventSeverity severity = EventSeverity::Info;
    std::string component{};
    std::string message{};
    std::chrono::system_clock::time_point timestamp{};
};

using EventLogger = std::function<void(const EngineEvent&)>;

[[nodiscard]] std::string_view event_severity_to_string(EventSeverity severity) noexcept;

// No-op when no logger is installed.
void emit_event(const EventLogger& logger, EventSeverity severity, std::string_view component, std::string message);

}  // namespace hovel
