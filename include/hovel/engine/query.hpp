#pragma once

#include "hovel/schema/schema.hpp"
#include "hovel/storage/table.hpp"
#include "hovel/types/typed_value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace hovel::engine {

struct SelectQuery final {
    std::string db{};
    std::string from{};
    std::vector<std::string> columns{};
    types::ColumnSet conditions{};
};

struct InsertQuery final {
    std::string db{};
    std::string into{};
    types::ColumnSet values{};
};

struct UpdateQuery final {
    std::string db{};
    std::string table{};
    types::ColumnSet set{};
    types::ColumnSet conditions{};
};

struct DeleteQuery final {
    std::string db{};
    std::string from{};
    types::ColumnSet conditions{};
};

struct CreateQuery final {
    std::string db{};
    std::string table{};
    schema::Columns columns{};
};

struct CreateDbQuery final {
    std::string name{};
};

struct DropQuery final {
    std::string db{};
    std::string table{};
};

struct DropDbQuery final {
    std::string name{};
};

struct AlterQuery final {
    std::string db{};
    std::string table{};
    schema::RenameMap rename{};
};

struct ShowTablesQuery final {
    std::string db{};
};

struct JoinQuery final {
    std::string db{};
    std::string table1{};
    std::string table2{};
    std::vector<std::string> columns{};
    types::ColumnSet conditions{};
    storage::JoinOn join_on{};
};

using Query = std::variant<SelectQuery,
                           InsertQuery,
                           UpdateQuery,
                           DeleteQuery,
                           CreateQuery,
                           CreateDbQuery,
                           DropQuery,
                           DropDbQuery,
                           AlterQuery,
                           ShowTablesQuery,
                           JoinQuery>;

// Lowercase command keyword of the query kind (`select`, `createdb`, ...).
[[nodiscard]] std::string_view query_kind(const Query& query) noexcept;

// Database the query addresses; CreateDb/DropDb report their own name.
[[nodiscard]] const std::string& query_database(const Query& query) noexcept;

struct QueryResult final {
    storage::Rows rows{};
    std::optional<std::vector<std::string>> tables{};
    std::error_code error{};
    std::string message{};

    [[nodiscard]] bool success() const noexcept { return !error; }
};

}  // namespace hovel::engine
