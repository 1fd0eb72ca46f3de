#include "hovel/engine/query.hpp"

#include <iterator>
#include <type_traits>
#include <variant>

namespace hovel::engine {

std::string_view query_kind(const Query& query) noexcept
{
    constexpr std::string_view kKinds[] = {"select",  "insert", "update", "delete", "create",    "createdb",
                                           "drop",    "dropdb", "alter",  "showtables", "join"};
    static_assert(std::size(kKinds) == std::variant_size_v<Query>);
    return kKinds[query.index()];
}

const std::string& query_database(const Query& query) noexcept
{
    return std::visit(
        [](const auto& value) -> const std::string& {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, CreateDbQuery> || std::is_same_v<T, DropDbQuery>) {
                return value.name;
            } else {
                return value.db;
            }
        },
        query);
}

}  // namespace hovel::engine
