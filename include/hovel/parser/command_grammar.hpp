#pragma once

#include "hovel/engine/query.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hovel::parser {

enum class ParserSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

struct ParserDiagnostic final {
    ParserSeverity severity = ParserSeverity::Error;
    std::string message{};
    std::size_t line = 0U;
    std::size_t column = 0U;
    std::string statement{};
    std::vector<std::string> remediation_hints{};
};

template <typename T>
struct ParseResult final {
    std::optional<T> ast{};
    std::vector<ParserDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return ast.has_value(); }
};

// Database placeholder resolved by the shell to its current database.
inline constexpr std::string_view kCurrentDatabase = ".";

// Parses one whitespace-separated command (`select db users name,email id=4`)
// into a Query. Keywords are case-insensitive; `_` stands for an empty list.
[[nodiscard]] ParseResult<engine::Query> parse_command(std::string_view input);

// Literal typing used for `col=value` pairs: whole integers become Int,
// decimals Float, everything else (and every quoted token) String.
[[nodiscard]] types::TypedValue make_literal(std::string_view text, bool quoted);

}  // namespace hovel::parser
