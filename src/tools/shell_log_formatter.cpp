#include "hovel/tools/shell_log_formatter.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string_view>
#include <utility>

namespace {

void append_json_string(std::string& out, std::string_view text)
{
    out.push_back('"');
    for (unsigned char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789ABCDEF";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

[[nodiscard]] std::string_view parser_severity_to_string(hovel::parser::ParserSeverity severity) noexcept
{
    switch (severity) {
    case hovel::parser::ParserSeverity::Info:
        return "info";
    case hovel::parser::ParserSeverity::Warning:
        return "warning";
    case hovel::parser::ParserSeverity::Error:
    default:
        return "error";
    }
}

[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
    gmtime_r(&time_value, &buffer);

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

class JsonObjectWriter final {
public:
    JsonObjectWriter()
    {
        json_.reserve(512U);
        json_.push_back('{');
    }

    void field(const char* name)
    {
        if (!first_) {
            json_.push_back(',');
        }
        first_ = false;
        json_.push_back('"');
        json_.append(name);
        json_.append("\":");
    }

    void string_field(const char* name, std::string_view value)
    {
        field(name);
        append_json_string(json_, value);
    }

    template <typename Number>
    void number_field(const char* name, Number value)
    {
        field(name);
        json_.append(std::to_string(value));
    }

    void bool_field(const char* name, bool value)
    {
        field(name);
        json_.append(value ? "true" : "false");
    }

    void timestamp_field(const char* name, std::chrono::system_clock::time_point tp)
    {
        const auto text = format_timestamp_iso(tp);
        field(name);
        if (text.empty()) {
            json_.append("null");
        } else {
            append_json_string(json_, text);
        }
    }

    std::string& raw() noexcept
    {
        return json_;
    }

    std::string finish()
    {
        json_.push_back('}');
        return std::move(json_);
    }

private:
    std::string json_{};
    bool first_ = true;
};

}  // namespace

namespace hovel::tools {

std::string format_shell_command_log_json(const hovel::shell::CommandMetrics& metrics)
{
    JsonObjectWriter writer;
    writer.string_field("type", "command");
    writer.string_field("correlation_id", metrics.correlation_id);
    writer.string_field("category", metrics.command_category);
    writer.string_field("command", metrics.command_text);
    writer.string_field("summary", metrics.summary);
    writer.bool_field("success", metrics.success);
    writer.number_field("status", metrics.status_code);
    writer.number_field("duration_ms", metrics.duration_ms);
    writer.number_field("rows_touched", metrics.rows_touched);
    writer.timestamp_field("started_at", metrics.started_at);
    writer.timestamp_field("finished_at", metrics.finished_at);

    auto& json = writer.raw();
    writer.field("detail_lines");
    json.push_back('[');
    for (std::size_t i = 0; i < metrics.detail_lines.size(); ++i) {
        if (i > 0U) {
            json.push_back(',');
        }
        append_json_string(json, metrics.detail_lines[i]);
    }
    json.push_back(']');

    writer.field("diagnostics");
    json.push_back('[');
    for (std::size_t i = 0; i < metrics.diagnostics.size(); ++i) {
        if (i > 0U) {
            json.push_back(',');
        }
        const auto& diagnostic = metrics.diagnostics[i];
        JsonObjectWriter entry;
        entry.string_field("severity", parser_severity_to_string(diagnostic.severity));
        entry.string_field("message", diagnostic.message);
        entry.number_field("line", diagnostic.line);
        entry.number_field("column", diagnostic.column);
        entry.string_field("statement", diagnostic.statement);
        entry.field("remediation_hints");
        auto& hints = entry.raw();
        hints.push_back('[');
        for (std::size_t hint_index = 0; hint_index < diagnostic.remediation_hints.size(); ++hint_index) {
            if (hint_index > 0U) {
                hints.push_back(',');
            }
            append_json_string(hints, diagnostic.remediation_hints[hint_index]);
        }
        hints.push_back(']');
        json.append(entry.finish());
    }
    json.push_back(']');

    return writer.finish();
}

std::string format_engine_event_log_json(const hovel::EngineEvent& event)
{
    JsonObjectWriter writer;
    writer.string_field("type", "event");
    writer.string_field("severity", hovel::event_severity_to_string(event.severity));
    writer.string_field("component", event.component);
    writer.string_field("message", event.message);
    writer.timestamp_field("timestamp", event.timestamp);
    return writer.finish();
}

}  // namespace hovel::tools
