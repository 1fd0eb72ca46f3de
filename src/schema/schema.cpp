#include "hovel/schema/schema.hpp"

#include "hovel/common/errors.hpp"
#include "hovel/common/identifier.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace hovel::schema {

namespace {

[[nodiscard]] std::vector<std::string_view> split(std::string_view text, char separator)
{
    std::vector<std::string_view> parts;
    std::size_t start = 0U;
    while (true) {
        const auto position = text.find(separator, start);
        if (position == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, position - start));
        start = position + 1U;
    }
    return parts;
}

[[noreturn]] void corrupted(const std::string& detail)
{
    throw SchemaCorruptedError{"Schema file corrupted: " + detail};
}

}  // namespace

std::string_view schema_kind_to_string(SchemaKind kind) noexcept
{
    switch (kind) {
    case SchemaKind::Sqlite:
        return "sqlite";
    case SchemaKind::Native:
    default:
        return "poorly";
    }
}

std::optional<SchemaKind> schema_kind_from_string(std::string_view text) noexcept
{
    if (text == "poorly") {
        return SchemaKind::Native;
    }
    if (text == "sqlite") {
        return SchemaKind::Sqlite;
    }
    return std::nullopt;
}

Schema::Schema(std::string database_name, SchemaKind kind)
    : name_{std::move(database_name)}
    , kind_{kind}
{
}

Schema Schema::load(const std::filesystem::path& database_path)
{
    const auto path = database_path / kSchemaFileName;
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        throw SchemaCorruptedError{"Schema file not found at " + path.string()};
    }

    std::string text{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
    if (stream.bad()) {
        throw SchemaCorruptedError{"Failed to read schema file " + path.string()};
    }
    return parse(text);
}

Schema Schema::parse(std::string_view text)
{
    auto lines = split(text, '\n');
    if (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    if (lines.empty()) {
        corrupted("schema file is empty");
    }

    const auto header = lines.front();
    const auto colon = header.find(':');
    if (colon == std::string_view::npos) {
        corrupted("missing header separator");
    }
    const auto kind = schema_kind_from_string(header.substr(colon + 1U));
    if (!kind) {
        corrupted("unknown schema kind '" + std::string{header.substr(colon + 1U)} + "'");
    }

    Schema schema{std::string{header.substr(0U, colon)}, *kind};
    for (std::size_t index = 1U; index < lines.size(); ++index) {
        const auto line = lines[index];
        const auto hash = line.find('#');
        if (hash == std::string_view::npos) {
            corrupted("table line " + std::to_string(index + 1U) + " has no '#'");
        }

        std::string table_name{line.substr(0U, hash)};
        if (schema.tables_.contains(table_name)) {
            corrupted("table " + table_name + " declared twice");
        }

        Columns columns;
        for (const auto entry : split(line.substr(hash + 1U), ',')) {
            const auto separator = entry.find(':');
            if (separator == std::string_view::npos) {
                corrupted("column entry '" + std::string{entry} + "' has no ':'");
            }
            const auto type = types::data_type_from_string(entry.substr(separator + 1U));
            if (!type) {
                corrupted("unknown datatype '" + std::string{entry.substr(separator + 1U)} + "'");
            }
            columns.push_back(Column{std::string{entry.substr(0U, separator)}, *type});
        }
        schema.tables_.emplace(std::move(table_name), std::move(columns));
    }
    return schema;
}

std::string Schema::serialize() const
{
    std::ostringstream stream;
    stream << name_ << ':' << schema_kind_to_string(kind_) << '\n';
    for (const auto& [table_name, columns] : tables_) {
        stream << table_name << '#';
        for (std::size_t index = 0U; index < columns.size(); ++index) {
            if (index > 0U) {
                stream << ',';
            }
            stream << columns[index].name << ':' << types::data_type_to_string(columns[index].type);
        }
        stream << '\n';
    }
    return stream.str();
}

void Schema::dump(const std::filesystem::path& database_path) const
{
    const auto target = database_path / kSchemaFileName;
    auto staging = target;
    staging += ".tmp";

    {
        std::ofstream stream(staging, std::ios::binary | std::ios::trunc);
        if (!stream) {
            throw_io_error(std::make_error_code(std::errc::io_error), "cannot open " + staging.string());
        }
        const auto text = serialize();
        stream.write(text.data(), static_cast<std::streamsize>(text.size()));
        stream.flush();
        if (!stream) {
            throw_io_error(std::make_error_code(std::errc::io_error), "cannot write " + staging.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(staging, target, ec);
    if (ec) {
        throw_io_error(ec, "cannot replace " + target.string());
    }
}

void Schema::create_table(const std::string& table_name, Columns columns)
{
    validate_name(table_name);
    for (const auto& column : columns) {
        validate_name(column.name);
    }
    if (columns.empty()) {
        throw_error(EngineErrc::NoColumns, "Can't create a table without columns");
    }

    std::sort(columns.begin(), columns.end(), [](const Column& lhs, const Column& rhs) {
        return lhs.name < rhs.name;
    });
    for (std::size_t index = 1U; index < columns.size(); ++index) {
        if (columns[index].name == columns[index - 1U].name) {
            throw_error(EngineErrc::ColumnAlreadyExists,
                        "Column " + columns[index].name + " already exists in table " + table_name);
        }
    }

    if (tables_.contains(table_name)) {
        throw_error(EngineErrc::TableAlreadyExists, "Table " + table_name + " already exists");
    }
    tables_.emplace(table_name, std::move(columns));
}

void Schema::drop_table(const std::string& table_name)
{
    const auto it = tables_.find(table_name);
    if (it == tables_.end()) {
        throw_error(EngineErrc::TableNotFound, "Table " + table_name + " not found");
    }
    tables_.erase(it);
}

void Schema::alter_table(const std::string& table_name, const RenameMap& rename)
{
    const auto it = tables_.find(table_name);
    if (it == tables_.end()) {
        throw_error(EngineErrc::TableNotFound, "Table " + table_name + " not found");
    }

    auto pending = rename;
    Columns renamed;
    renamed.reserve(it->second.size());
    for (const auto& column : it->second) {
        auto name = column.name;
        if (const auto match = pending.find(column.name); match != pending.end()) {
            validate_name(match->second);
            name = match->second;
            pending.erase(match);
        }

        const auto collides = std::any_of(renamed.begin(), renamed.end(), [&name](const Column& existing) {
            return existing.name == name;
        });
        if (collides) {
            throw_error(EngineErrc::ColumnAlreadyExists, "Column " + name + " already exists in table " + table_name);
        }
        renamed.push_back(Column{std::move(name), column.type});
    }

    if (!pending.empty()) {
        throw_error(EngineErrc::ColumnNotFound,
                    "Column " + pending.begin()->first + " not found in table " + table_name);
    }
    it->second = std::move(renamed);
}

bool Schema::has_table(std::string_view table_name) const
{
    return tables_.find(table_name) != tables_.end();
}

const Columns& Schema::columns(const std::string& table_name) const
{
    const auto it = tables_.find(table_name);
    if (it == tables_.end()) {
        throw_error(EngineErrc::TableNotFound, "Table " + table_name + " not found");
    }
    return it->second;
}

std::vector<std::string> Schema::table_names() const
{
    std::vector<std::string> names;
    names.reserve(tables_.size());
    for (const auto& entry : tables_) {
        names.push_back(entry.first);
    }
    return names;
}

}  // namespace hovel::schema
