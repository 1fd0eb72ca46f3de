#include "hovel/types/data_type.hpp"

#include "hovel/common/errors.hpp"

#include <array>
#include <string>
#include <utility>

namespace hovel::types {

namespace {

constexpr std::array<std::pair<std::string_view, DataType>, kDataTypeCount> kKeywords{{
    {"int", DataType::Int},
    {"float", DataType::Float},
    {"char", DataType::Char},
    {"string", DataType::String},
    {"serial", DataType::Serial},
    {"email", DataType::Email},
}};

}  // namespace

std::string_view data_type_to_string(DataType type) noexcept
{
    switch (type) {
    case DataType::Int:
        return "int";
    case DataType::Float:
        return "float";
    case DataType::Char:
        return "char";
    case DataType::String:
        return "string";
    case DataType::Serial:
        return "serial";
    case DataType::Email:
        return "email";
    default:
        return "unknown";
    }
}

std::optional<DataType> data_type_from_string(std::string_view text) noexcept
{
    for (const auto& [keyword, type] : kKeywords) {
        if (keyword == text) {
            return type;
        }
    }
    return std::nullopt;
}

DataType parse_data_type(std::string_view text)
{
    const auto type = data_type_from_string(text);
    if (!type) {
        throw_error(EngineErrc::InvalidDataType, "Invalid datatype: " + std::string{text});
    }
    return *type;
}

}  // namespace hovel::types
