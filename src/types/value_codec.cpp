#include "hovel/types/value_codec.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cstring>
#include <string>

namespace hovel::types {

namespace {

constexpr std::size_t kStringReadChunk = 64U * 1024U;

template <std::size_t Width>
void append_le(std::uint64_t value, std::vector<std::byte>& out)
{
    for (std::size_t index = 0U; index < Width; ++index) {
        out.push_back(static_cast<std::byte>((value >> (8U * index)) & 0xFFU));
    }
}

template <std::size_t Width>
[[nodiscard]] std::uint64_t load_le(const std::array<std::byte, Width>& bytes) noexcept
{
    std::uint64_t value = 0U;
    for (std::size_t index = 0U; index < Width; ++index) {
        value |= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(bytes[index])) << (8U * index);
    }
    return value;
}

void append_string(const std::string& text, std::vector<std::byte>& out)
{
    append_le<kStringLengthPrefixSize>(static_cast<std::uint64_t>(text.size()), out);
    const auto* data = reinterpret_cast<const std::byte*>(text.data());
    out.insert(out.end(), data, data + text.size());
}

class StreamReader final {
public:
    explicit StreamReader(std::istream& in) noexcept
        : in_{in}
    {
    }

    [[nodiscard]] bool read(std::byte* out, std::size_t size)
    {
        if (size == 0U) {
            return true;
        }
        in_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(size));
        return in_.gcount() == static_cast<std::streamsize>(size);
    }

private:
    std::istream& in_;
};

class SpanReader final {
public:
    SpanReader(std::span<const std::byte> buffer, std::size_t& offset) noexcept
        : buffer_{buffer}
        , offset_{offset}
    {
    }

    [[nodiscard]] bool read(std::byte* out, std::size_t size)
    {
        if (offset_ > buffer_.size() || buffer_.size() - offset_ < size) {
            return false;
        }
        if (size != 0U) {
            std::memcpy(out, buffer_.data() + offset_, size);
        }
        offset_ += size;
        return true;
    }

private:
    std::span<const std::byte> buffer_;
    std::size_t& offset_;
};

template <std::size_t Width, typename Reader>
[[nodiscard]] bool read_le(Reader& reader, std::uint64_t& value)
{
    std::array<std::byte, Width> bytes{};
    if (!reader.read(bytes.data(), Width)) {
        return false;
    }
    value = load_le<Width>(bytes);
    return true;
}

template <typename Reader>
[[nodiscard]] std::error_code read_string(Reader& reader, std::string& out)
{
    std::uint64_t length = 0U;
    if (!read_le<kStringLengthPrefixSize>(reader, length)) {
        return std::make_error_code(std::errc::io_error);
    }

    // Grow in bounded chunks so a corrupt length cannot force a huge allocation.
    out.clear();
    std::uint64_t remaining = length;
    while (remaining > 0U) {
        const auto chunk = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, kStringReadChunk));
        const auto previous = out.size();
        out.resize(previous + chunk);
        if (!reader.read(reinterpret_cast<std::byte*>(out.data() + previous), chunk)) {
            return std::make_error_code(std::errc::io_error);
        }
        remaining -= chunk;
    }

    if (!is_valid_utf8(out)) {
        return std::make_error_code(std::errc::illegal_byte_sequence);
    }
    return {};
}

template <typename Reader>
[[nodiscard]] std::error_code decode_with(DataType type, Reader& reader, TypedValue& out)
{
    std::uint64_t raw = 0U;
    switch (type) {
    case DataType::Int:
        if (!read_le<8U>(reader, raw)) {
            return std::make_error_code(std::errc::io_error);
        }
        out = TypedValue::integer(static_cast<std::int64_t>(raw));
        return {};
    case DataType::Float:
        if (!read_le<8U>(reader, raw)) {
            return std::make_error_code(std::errc::io_error);
        }
        out = TypedValue::floating(std::bit_cast<double>(raw));
        return {};
    case DataType::Char:
        if (!read_le<1U>(reader, raw)) {
            return std::make_error_code(std::errc::io_error);
        }
        out = TypedValue::character(static_cast<char>(static_cast<unsigned char>(raw)));
        return {};
    case DataType::Serial:
        if (!read_le<4U>(reader, raw)) {
            return std::make_error_code(std::errc::io_error);
        }
        out = TypedValue::serial(static_cast<std::uint32_t>(raw));
        return {};
    case DataType::String:
    case DataType::Email: {
        std::string text;
        if (auto ec = read_string(reader, text); ec) {
            return ec;
        }
        out = type == DataType::String ? TypedValue::string(std::move(text)) : TypedValue::email(std::move(text));
        return {};
    }
    default:
        return std::make_error_code(std::errc::invalid_argument);
    }
}

}  // namespace

std::size_t encoded_size(const TypedValue& value) noexcept
{
    switch (value.type()) {
    case DataType::Int:
    case DataType::Float:
        return 8U;
    case DataType::Char:
        return 1U;
    case DataType::Serial:
        return 4U;
    case DataType::String:
        return kStringLengthPrefixSize + value.as_string().size();
    case DataType::Email:
        return kStringLengthPrefixSize + value.as_email().size();
    default:
        return 0U;
    }
}

void encode_value(const TypedValue& value, std::vector<std::byte>& out)
{
    switch (value.type()) {
    case DataType::Int:
        append_le<8U>(static_cast<std::uint64_t>(value.as_int()), out);
        break;
    case DataType::Float:
        append_le<8U>(std::bit_cast<std::uint64_t>(value.as_float()), out);
        break;
    case DataType::Char:
        out.push_back(static_cast<std::byte>(value.as_char()));
        break;
    case DataType::String:
        append_string(value.as_string(), out);
        break;
    case DataType::Serial:
        append_le<4U>(value.as_serial(), out);
        break;
    case DataType::Email:
        append_string(value.as_email(), out);
        break;
    default:
        break;
    }
}

std::vector<std::byte> encode_value(const TypedValue& value)
{
    std::vector<std::byte> out;
    out.reserve(encoded_size(value));
    encode_value(value, out);
    return out;
}

std::error_code decode_value(DataType type, std::istream& in, TypedValue& out)
{
    StreamReader reader{in};
    return decode_with(type, reader, out);
}

std::error_code decode_value(DataType type,
                             std::span<const std::byte> buffer,
                             std::size_t& offset,
                             TypedValue& out)
{
    SpanReader reader{buffer, offset};
    return decode_with(type, reader, out);
}

void write_u32_le(std::uint32_t value, std::byte* out) noexcept
{
    for (std::size_t index = 0U; index < 4U; ++index) {
        out[index] = static_cast<std::byte>((value >> (8U * index)) & 0xFFU);
    }
}

std::uint32_t read_u32_le(const std::byte* in) noexcept
{
    std::uint32_t value = 0U;
    for (std::size_t index = 0U; index < 4U; ++index) {
        value |= static_cast<std::uint32_t>(std::to_integer<std::uint8_t>(in[index])) << (8U * index);
    }
    return value;
}

bool is_valid_utf8(std::string_view text) noexcept
{
    std::size_t index = 0U;
    while (index < text.size()) {
        const auto lead = static_cast<unsigned char>(text[index]);
        std::size_t continuation = 0U;
        std::uint32_t code_point = 0U;
        if (lead < 0x80U) {
            ++index;
            continue;
        }
        if ((lead & 0xE0U) == 0xC0U) {
            continuation = 1U;
            code_point = lead & 0x1FU;
        } else if ((lead & 0xF0U) == 0xE0U) {
            continuation = 2U;
            code_point = lead & 0x0FU;
        } else if ((lead & 0xF8U) == 0xF0U) {
            continuation = 3U;
            code_point = lead & 0x07U;
        } else {
            return false;
        }

        if (text.size() - index <= continuation) {
            return false;
        }
        for (std::size_t offset = 1U; offset <= continuation; ++offset) {
            const auto next = static_cast<unsigned char>(text[index + offset]);
            if ((next & 0xC0U) != 0x80U) {
                return false;
            }
            code_point = (code_point << 6U) | (next & 0x3FU);
        }

        // Overlong forms, surrogates and values past U+10FFFF.
        constexpr std::array<std::uint32_t, 4> kMinimum{0U, 0x80U, 0x800U, 0x10000U};
        if (code_point < kMinimum[continuation] || code_point > 0x10FFFFU ||
            (code_point >= 0xD800U && code_point <= 0xDFFFU)) {
            return false;
        }
        index += continuation + 1U;
    }
    return true;
}

}  // namespace hovel::types
