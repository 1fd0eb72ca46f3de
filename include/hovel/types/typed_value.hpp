#pragma once

#include "hovel/types/data_type.hpp"

#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>

namespace hovel::types {

struct EmailAddress final {
    std::string address{};

    bool operator==(const EmailAddress& other) const = default;
};

class TypedValue final {
public:
    // Alternative order follows DataType ordinals.
    using Storage = std::variant<std::int64_t, double, char, std::string, std::uint32_t, EmailAddress>;

    TypedValue() = default;

    [[nodiscard]] static TypedValue integer(std::int64_t value) { return TypedValue{Storage{std::in_place_index<0>, value}}; }
    [[nodiscard]] static TypedValue floating(double value) { return TypedValue{Storage{std::in_place_index<1>, value}}; }
    [[nodiscard]] static TypedValue character(char value) { return TypedValue{Storage{std::in_place_index<2>, value}}; }
    [[nodiscard]] static TypedValue string(std::string value)
    {
        return TypedValue{Storage{std::in_place_index<3>, std::move(value)}};
    }
    [[nodiscard]] static TypedValue serial(std::uint32_t value) { return TypedValue{Storage{std::in_place_index<4>, value}}; }
    [[nodiscard]] static TypedValue email(std::string value)
    {
        return TypedValue{Storage{std::in_place_index<5>, EmailAddress{std::move(value)}}};
    }

    [[nodiscard]] DataType type() const noexcept { return static_cast<DataType>(storage_.index()); }
    [[nodiscard]] const Storage& storage() const noexcept { return storage_; }

    [[nodiscard]] std::int64_t as_int() const { return std::get<0>(storage_); }
    [[nodiscard]] double as_float() const { return std::get<1>(storage_); }
    [[nodiscard]] char as_char() const { return std::get<2>(storage_); }
    [[nodiscard]] const std::string& as_string() const { return std::get<3>(storage_); }
    [[nodiscard]] std::uint32_t as_serial() const { return std::get<4>(storage_); }
    [[nodiscard]] const std::string& as_email() const { return std::get<5>(storage_).address; }

    bool operator==(const TypedValue& other) const = default;

private:
    explicit TypedValue(Storage storage)
        : storage_{std::move(storage)}
    {
    }

    Storage storage_{};
};

using ColumnSet = std::unordered_map<std::string, TypedValue>;

// Payload rendered as plain text (`42`, `1.5`, `a@b.io`).
[[nodiscard]] std::string to_string(const TypedValue& value);

// Tagged rendering used in error messages (`Int(42)`, `String("ab")`).
[[nodiscard]] std::string describe(const TypedValue& value);

// Throws Error{InvalidValue} when the pair is not convertible.
[[nodiscard]] TypedValue coerce(const TypedValue& value, DataType target);

// Throws Error{InvalidEmail}; every other type is accepted as is.
void validate(const TypedValue& value);

[[nodiscard]] bool is_valid_email(std::string_view text);

// Unordered across different types and for NaN payloads.
[[nodiscard]] std::partial_ordering compare_values(const TypedValue& lhs, const TypedValue& rhs) noexcept;

}  // namespace hovel::types
