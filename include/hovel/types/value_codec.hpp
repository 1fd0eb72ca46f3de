#pragma once

#include "hovel/types/typed_value.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>
#include <system_error>
#include <vector>

namespace hovel::types {

// Fixed little-endian widths: Int/Float 8, Char 1, Serial 4,
// String/Email 8-byte length prefix followed by UTF-8 bytes.
inline constexpr std::size_t kStringLengthPrefixSize = 8U;

[[nodiscard]] std::size_t encoded_size(const TypedValue& value) noexcept;

void encode_value(const TypedValue& value, std::vector<std::byte>& out);
[[nodiscard]] std::vector<std::byte> encode_value(const TypedValue& value);

// Both decoders report io_error for a short read and illegal_byte_sequence
// for a string payload that is not valid UTF-8.
[[nodiscard]] std::error_code decode_value(DataType type, std::istream& in, TypedValue& out);
[[nodiscard]] std::error_code decode_value(DataType type,
                                           std::span<const std::byte> buffer,
                                           std::size_t& offset,
                                           TypedValue& out);

void write_u32_le(std::uint32_t value, std::byte* out) noexcept;
[[nodiscard]] std::uint32_t read_u32_le(const std::byte* in) noexcept;

[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;

}  // namespace hovel::types
