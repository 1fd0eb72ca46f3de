#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace hovel::types {

// Ordinals are stable: they match the TypedValue variant index and the
// integer encoding used by external collaborators.
enum class DataType : std::uint8_t {
    Int = 0,
    Float = 1,
    Char = 2,
    String = 3,
    Serial = 4,
    Email = 5
};

inline constexpr std::size_t kDataTypeCount = 6U;

[[nodiscard]] std::string_view data_type_to_string(DataType type) noexcept;
[[nodiscard]] std::optional<DataType> data_type_from_string(std::string_view text) noexcept;

// Throws Error{InvalidDataType} for an unknown keyword.
[[nodiscard]] DataType parse_data_type(std::string_view text);

}  // namespace hovel::types
