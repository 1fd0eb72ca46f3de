#include "hovel/types/typed_value.hpp"

#include "hovel/common/errors.hpp"
#include "hovel/types/value_codec.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <optional>
#include <regex>
#include <system_error>

namespace hovel::types {

namespace {

[[nodiscard]] std::string_view strip_plus_sign(std::string_view text) noexcept
{
    if (text.size() > 1U && text.front() == '+' && text[1] != '-' && text[1] != '+') {
        return text.substr(1U);
    }
    return text;
}

[[nodiscard]] std::optional<std::int64_t> parse_int(std::string_view text) noexcept
{
    text = strip_plus_sign(text);
    if (text.empty()) {
        return std::nullopt;
    }
    std::int64_t value = 0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<double> parse_float(std::string_view text) noexcept
{
    text = strip_plus_sign(text);
    if (text.empty()) {
        return std::nullopt;
    }
    double value = 0.0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::string format_float(double value)
{
    std::array<char, 64> buffer{};
    const auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{}) {
        return std::to_string(value);
    }
    return std::string{buffer.data(), ptr};
}

[[noreturn]] void throw_invalid_value(const TypedValue& value, DataType target)
{
    throw_error(EngineErrc::InvalidValue,
                "Invalid value " + describe(value) + " for datatype " + std::string{data_type_to_string(target)});
}

// Char payloads are Latin-1 code points; widen bytes >= 0x80 to two-byte UTF-8.
[[nodiscard]] std::string latin1_to_utf8(char value)
{
    const auto code = static_cast<unsigned char>(value);
    if (code < 0x80U) {
        return std::string(1U, value);
    }
    std::string out;
    out.push_back(static_cast<char>(0xC0U | (code >> 6U)));
    out.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
    return out;
}

}  // namespace

std::string to_string(const TypedValue& value)
{
    switch (value.type()) {
    case DataType::Int:
        return std::to_string(value.as_int());
    case DataType::Float:
        return format_float(value.as_float());
    case DataType::Char:
        return std::string(1U, value.as_char());
    case DataType::String:
        return value.as_string();
    case DataType::Serial:
        return std::to_string(value.as_serial());
    case DataType::Email:
        return value.as_email();
    default:
        return {};
    }
}

std::string describe(const TypedValue& value)
{
    switch (value.type()) {
    case DataType::Int:
        return "Int(" + to_string(value) + ")";
    case DataType::Float:
        return "Float(" + to_string(value) + ")";
    case DataType::Char:
        return "Char('" + to_string(value) + "')";
    case DataType::String:
        return "String(\"" + value.as_string() + "\")";
    case DataType::Serial:
        return "Serial(" + to_string(value) + ")";
    case DataType::Email:
        return "Email(\"" + value.as_email() + "\")";
    default:
        return "Unknown";
    }
}

TypedValue coerce(const TypedValue& value, DataType target)
{
    const auto source = value.type();
    if (source == target) {
        return value;
    }

    switch (source) {
    case DataType::Int:
        if (target == DataType::Float) {
            return TypedValue::floating(static_cast<double>(value.as_int()));
        }
        if (target == DataType::Serial) {
            return TypedValue::serial(static_cast<std::uint32_t>(value.as_int()));
        }
        break;
    case DataType::String: {
        const auto& text = value.as_string();
        if (target == DataType::Char && text.size() == 1U) {
            return TypedValue::character(text.front());
        }
        if (target == DataType::Email) {
            return TypedValue::email(text);
        }
        if (target == DataType::Int) {
            if (const auto parsed = parse_int(text)) {
                return TypedValue::integer(*parsed);
            }
        }
        if (target == DataType::Float) {
            if (const auto parsed = parse_float(text)) {
                return TypedValue::floating(*parsed);
            }
        }
        break;
    }
    case DataType::Char: {
        if (target == DataType::String) {
            return TypedValue::string(latin1_to_utf8(value.as_char()));
        }
        const std::string text(1U, value.as_char());
        if (target == DataType::Int) {
            if (const auto parsed = parse_int(text)) {
                return TypedValue::integer(*parsed);
            }
        }
        if (target == DataType::Float) {
            if (const auto parsed = parse_float(text)) {
                return TypedValue::floating(*parsed);
            }
        }
        break;
    }
    case DataType::Email:
        if (target == DataType::String) {
            return TypedValue::string(value.as_email());
        }
        break;
    case DataType::Serial:
        if (target == DataType::Int) {
            return TypedValue::integer(static_cast<std::int64_t>(value.as_serial()));
        }
        break;
    case DataType::Float:
    default:
        break;
    }

    throw_invalid_value(value, target);
}

bool is_valid_email(std::string_view text)
{
    static const std::regex kEmailPattern{R"(^[\w\-\.]+@([\w-]+\.)+[\w\-]{2,4}$)"};
    return std::regex_match(text.begin(), text.end(), kEmailPattern);
}

void validate(const TypedValue& value)
{
    const auto type = value.type();
    if ((type == DataType::String && !is_valid_utf8(value.as_string())) ||
        (type == DataType::Email && !is_valid_utf8(value.as_email()))) {
        throw_error(EngineErrc::InvalidValue,
                    "Invalid value for datatype " + std::string{data_type_to_string(type)} + ": not valid UTF-8");
    }
    if (type == DataType::Email && !is_valid_email(value.as_email())) {
        throw_error(EngineErrc::InvalidEmail, "Invalid email format");
    }
}

std::partial_ordering compare_values(const TypedValue& lhs, const TypedValue& rhs) noexcept
{
    if (lhs.type() != rhs.type()) {
        return std::partial_ordering::unordered;
    }

    switch (lhs.type()) {
    case DataType::Int:
        return lhs.as_int() <=> rhs.as_int();
    case DataType::Float:
        return lhs.as_float() <=> rhs.as_float();
    case DataType::Char:
        return lhs.as_char() <=> rhs.as_char();
    case DataType::String:
        return lhs.as_string() <=> rhs.as_string();
    case DataType::Serial:
        return lhs.as_serial() <=> rhs.as_serial();
    case DataType::Email:
        return lhs.as_email() <=> rhs.as_email();
    default:
        return std::partial_ordering::unordered;
    }
}

}  // namespace hovel::types
