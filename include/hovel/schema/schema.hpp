#pragma once

#include "hovel/types/data_type.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hovel::schema {

struct Column final {
    std::string name{};
    types::DataType type = types::DataType::Int;

    bool operator==(const Column& other) const = default;
};

using Columns = std::vector<Column>;

// Old column name -> new column name.
using RenameMap = std::map<std::string, std::string>;

enum class SchemaKind : std::uint8_t {
    Native = 0,
    Sqlite
};

inline constexpr std::string_view kSchemaFileName = ".schema";

[[nodiscard]] std::string_view schema_kind_to_string(SchemaKind kind) noexcept;
[[nodiscard]] std::optional<SchemaKind> schema_kind_from_string(std::string_view text) noexcept;

class Schema final {
public:
    explicit Schema(std::string database_name, SchemaKind kind = SchemaKind::Native);

    // Throws SchemaCorruptedError when the file is missing or malformed.
    [[nodiscard]] static Schema load(const std::filesystem::path& database_path);

    // Writes `<database_path>/.schema`; throws Error{IoError} on failure.
    void dump(const std::filesystem::path& database_path) const;

    [[nodiscard]] static Schema parse(std::string_view text);
    [[nodiscard]] std::string serialize() const;

    void create_table(const std::string& table_name, Columns columns);
    void drop_table(const std::string& table_name);
    void alter_table(const std::string& table_name, const RenameMap& rename);

    [[nodiscard]] bool has_table(std::string_view table_name) const;
    [[nodiscard]] const Columns& columns(const std::string& table_name) const;
    [[nodiscard]] std::vector<std::string> table_names() const;
    [[nodiscard]] std::size_t table_count() const noexcept { return tables_.size(); }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] SchemaKind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_native() const noexcept { return kind_ == SchemaKind::Native; }
    [[nodiscard]] bool is_sqlite() const noexcept { return kind_ == SchemaKind::Sqlite; }

private:
    std::string name_{};
    SchemaKind kind_ = SchemaKind::Native;
    std::map<std::string, Columns, std::less<>> tables_{};
};

}  // namespace hovel::schema
