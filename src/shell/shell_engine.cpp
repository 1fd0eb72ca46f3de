#include "hovel/shell/shell_engine.hpp"

#include "hovel/common/errors.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <type_traits>
#include <utility>
#include <variant>

using hovel::parser::ParserDiagnostic;

namespace hovel::shell {

namespace {

[[nodiscard]] std::string lowercase(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (const unsigned char ch : text) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

[[nodiscard]] std::string_view first_token(std::string_view text)
{
    std::size_t index = 0U;
    while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) == 0) {
        ++index;
    }
    return text.substr(0U, index);
}

[[nodiscard]] std::vector<std::string> split_tokens(std::string_view text)
{
    std::vector<std::string> tokens;
    std::size_t index = 0U;
    while (index < text.size()) {
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
            ++index;
        }
        if (index >= text.size()) {
            break;
        }
        const std::size_t begin = index;
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) == 0) {
            ++index;
        }
        tokens.emplace_back(text.substr(begin, index - begin));
    }
    return tokens;
}

[[nodiscard]] std::string plural(std::size_t count, std::string_view noun)
{
    std::ostringstream stream;
    stream << count << ' ' << noun << (count == 1U ? "" : "s");
    return stream.str();
}

[[nodiscard]] double elapsed_ms(std::chrono::steady_clock::time_point start)
{
    const auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);
    return static_cast<double>(duration_ns.count()) / 1'000'000.0;
}

// Requested projection order first, then any remaining keys by name.
[[nodiscard]] std::vector<std::string> result_headers(const storage::Rows& rows, const std::vector<std::string>& preferred)
{
    std::vector<std::string> headers = preferred;
    std::set<std::string> extra;
    for (const auto& row : rows) {
        for (const auto& entry : row) {
            if (std::find(headers.begin(), headers.end(), entry.first) == headers.end()) {
                extra.insert(entry.first);
            }
        }
    }
    headers.insert(headers.end(), extra.begin(), extra.end());
    return headers;
}

[[nodiscard]] std::vector<std::string> render_rows(const storage::Rows& rows, const std::vector<std::string>& preferred)
{
    const auto headers = result_headers(rows, preferred);
    std::vector<std::vector<std::string>> cells;
    cells.reserve(rows.size());
    for (const auto& row : rows) {
        std::vector<std::string> line;
        line.reserve(headers.size());
        for (const auto& header : headers) {
            const auto it = row.find(header);
            line.push_back(it == row.end() ? std::string{} : types::to_string(it->second));
        }
        cells.push_back(std::move(line));
    }
    return format_table(headers, cells);
}

[[nodiscard]] std::vector<std::string> projection_of(const engine::Query& query)
{
    if (const auto* select = std::get_if<engine::SelectQuery>(&query)) {
        return select->columns;
    }
    if (const auto* join = std::get_if<engine::JoinQuery>(&query)) {
        return join->columns;
    }
    return {};
}

[[nodiscard]] std::string summarise(const engine::Query& query, const engine::QueryResult& result)
{
    const auto count = result.rows.size();
    return std::visit(
        [&](const auto& value) -> std::string {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, engine::SelectQuery>) {
                return "Selected " + plural(count, "row") + " from " + value.db + "." + value.from;
            } else if constexpr (std::is_same_v<T, engine::InsertQuery>) {
                return "Inserted " + plural(count, "row") + " into " + value.db + "." + value.into;
            } else if constexpr (std::is_same_v<T, engine::UpdateQuery>) {
                return "Updated " + plural(count, "row") + " in " + value.db + "." + value.table;
            } else if constexpr (std::is_same_v<T, engine::DeleteQuery>) {
                return "Deleted " + plural(count, "row") + " from " + value.db + "." + value.from;
            } else if constexpr (std::is_same_v<T, engine::CreateQuery>) {
                return "Created table " + value.db + "." + value.table;
            } else if constexpr (std::is_same_v<T, engine::CreateDbQuery>) {
                return "Created database " + value.name;
            } else if constexpr (std::is_same_v<T, engine::DropQuery>) {
                return "Dropped table " + value.db + "." + value.table;
            } else if constexpr (std::is_same_v<T, engine::DropDbQuery>) {
                return "Dropped database " + value.name;
            } else if constexpr (std::is_same_v<T, engine::AlterQuery>) {
                return "Altered table " + value.db + "." + value.table;
            } else if constexpr (std::is_same_v<T, engine::ShowTablesQuery>) {
                return "Listed " + plural(result.tables ? result.tables->size() : 0U, "table") + " in " + value.db;
            } else {
                return "Joined " + plural(count, "row") + " from " + value.table1 + " and " + value.table2;
            }
        },
        query);
}

[[nodiscard]] bool returns_rows(const engine::Query& query) noexcept
{
    return std::holds_alternative<engine::SelectQuery>(query) || std::holds_alternative<engine::InsertQuery>(query) ||
           std::holds_alternative<engine::UpdateQuery>(query) || std::holds_alternative<engine::DeleteQuery>(query) ||
           std::holds_alternative<engine::JoinQuery>(query);
}

[[nodiscard]] ParserDiagnostic make_error_diagnostic(const std::string& statement,
                                                     std::string message,
                                                     std::string hint)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = parser::ParserSeverity::Error;
    diagnostic.statement = statement;
    diagnostic.message = std::move(message);
    diagnostic.remediation_hints = {std::move(hint)};
    return diagnostic;
}

[[nodiscard]] std::string hint_for(std::error_code code)
{
    if (code == EngineErrc::TableNotFound || code == EngineErrc::DatabaseNotFound) {
        return "Check the name with showtables <db>.";
    }
    if (code == EngineErrc::InvalidValue || code == EngineErrc::InvalidEmail) {
        return "Quote values that must stay strings, e.g. name='42'.";
    }
    if (code == EngineErrc::IncompleteData) {
        return "Provide a value for every non-serial column.";
    }
    return "Type \\help for the command forms.";
}

const std::vector<std::string> kHelpLines{
    "select <db> <table> <cols|*|_> [col=val,...|_]",
    "insert <db> <table> col=val,...",
    "update <db> <table> col=val,... [col=val,...|_]",
    "delete <db> <table> [col=val,...|_]",
    "create <db> <table> col:type,...",
    "createdb <name> | dropdb <name>",
    "drop <db> <table>",
    "alter <db> <table> old=new,...",
    "showtables <db>",
    "join <db> <t1> <t2> <cols|*|_> <col=val,...|_> <left=right,...>",
    "\\use <db>             Use <db> wherever a command names '.'",
    "\\stats <db> <table>   Row and tombstone counts",
    "\\help                 Show this message",
    "\\quit                 Exit the shell",
};

}  // namespace

const std::vector<std::string>& command_keywords()
{
    static const std::vector<std::string> keywords{"select",     "insert", "update", "delete", "create",
                                                   "createdb",   "drop",   "dropdb", "alter",  "showtables",
                                                   "join",       "\\help", "\\quit", "\\use",  "\\stats"};
    return keywords;
}

std::vector<std::string> format_table(const std::vector<std::string>& headers,
                                      const std::vector<std::vector<std::string>>& rows)
{
    const std::size_t column_count = headers.size();
    std::vector<std::size_t> widths(column_count, 0U);
    for (std::size_t i = 0U; i < column_count; ++i) {
        widths[i] = headers[i].size();
    }
    for (const auto& row : rows) {
        for (std::size_t i = 0U; i < column_count && i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto make_line = [&](const std::vector<std::string>& fields) {
        std::string line;
        for (std::size_t i = 0U; i < column_count; ++i) {
            if (i > 0U) {
                line.append(" | ");
            }
            const std::string& field = (i < fields.size()) ? fields[i] : std::string{};
            line.append(field);
            if (field.size() < widths[i]) {
                line.append(widths[i] - field.size(), ' ');
            }
        }
        return line;
    };

    std::vector<std::string> lines;
    lines.reserve(rows.size() + 3U);
    lines.push_back(make_line(headers));

    std::string separator;
    for (std::size_t i = 0U; i < column_count; ++i) {
        if (i > 0U) {
            separator.append("-+-");
        }
        separator.append(widths[i], '-');
    }
    lines.push_back(std::move(separator));

    if (rows.empty()) {
        lines.push_back("(no rows)");
        return lines;
    }

    for (const auto& row : rows) {
        lines.push_back(make_line(row));
    }
    return lines;
}

ShellEngine::ShellEngine() = default;

ShellEngine::ShellEngine(Config config)
    : config_{std::move(config)}
{}

CommandMetrics ShellEngine::execute_command(const std::string& text)
{
    const auto started_at = std::chrono::system_clock::now();
    const auto trimmed = trim(text);

    CommandMetrics metrics{};
    switch (classify(trimmed)) {
    case CommandKind::Empty:
        metrics.success = true;
        metrics.summary = "Empty command.";
        return metrics;
    case CommandKind::Query:
        metrics = execute_query(trimmed);
        break;
    case CommandKind::Meta:
        metrics = execute_meta(trimmed);
        break;
    case CommandKind::Unknown:
    default:
        metrics = unsupported_command(trimmed);
        break;
    }

    metrics.command_text = trimmed;
    metrics.correlation_id = "cmd-" + std::to_string(correlation_counter_.fetch_add(1U));
    metrics.started_at = started_at;
    metrics.finished_at = std::chrono::system_clock::now();
    if (config_.command_logger) {
        config_.command_logger(metrics);
    }
    return metrics;
}

std::string ShellEngine::trim(std::string_view text)
{
    std::size_t start = 0U;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
        ++start;
    }

    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }
    return std::string{text.substr(start, end - start)};
}

ShellEngine::CommandKind ShellEngine::classify(std::string_view text)
{
    if (text.empty()) {
        return CommandKind::Empty;
    }

    const auto token = lowercase(first_token(text));
    if (token.front() == '\\') {
        return CommandKind::Meta;
    }

    const auto& keywords = command_keywords();
    if (std::find(keywords.begin(), keywords.end(), token) != keywords.end()) {
        return CommandKind::Query;
    }
    return CommandKind::Unknown;
}

CommandMetrics ShellEngine::execute_query(const std::string& text)
{
    const auto start = std::chrono::steady_clock::now();
    CommandMetrics metrics{};
    metrics.command_category = lowercase(first_token(text));

    auto parsed = parser::parse_command(text);
    if (!parsed.success()) {
        metrics.success = false;
        metrics.status_code = 400;
        metrics.summary = "Could not parse command.";
        metrics.diagnostics = std::move(parsed.diagnostics);
        metrics.duration_ms = elapsed_ms(start);
        return metrics;
    }

    if (config_.engine == nullptr) {
        metrics.success = false;
        metrics.status_code = 500;
        metrics.summary = "No engine is attached to the shell.";
        metrics.diagnostics.push_back(
            make_error_diagnostic(text, "Engine is not configured.", "Construct the shell with an engine."));
        metrics.duration_ms = elapsed_ms(start);
        return metrics;
    }

    auto query = std::move(*parsed.ast);
    resolve_database(query);
    metrics.command_category = std::string{engine::query_kind(query)};

    const auto result = config_.engine->execute(query);
    metrics.duration_ms = elapsed_ms(start);
    metrics.status_code = status_class(result.error);

    if (!result.success()) {
        metrics.success = false;
        metrics.summary = result.message;
        metrics.diagnostics.push_back(make_error_diagnostic(text, result.message, hint_for(result.error)));
        return metrics;
    }

    metrics.success = true;
    metrics.summary = summarise(query, result);
    if (result.tables) {
        std::vector<std::vector<std::string>> rows;
        rows.reserve(result.tables->size());
        for (const auto& table : *result.tables) {
            rows.push_back({table});
        }
        metrics.detail_lines = format_table({"table"}, rows);
    } else if (returns_rows(query)) {
        metrics.rows_touched = result.rows.size();
        metrics.detail_lines = render_rows(result.rows, projection_of(query));
    }
    return metrics;
}

CommandMetrics ShellEngine::execute_meta(const std::string& command)
{
    CommandMetrics metrics{};
    metrics.command_category = "meta";
    const auto start = std::chrono::steady_clock::now();
    const auto tokens = split_tokens(command);
    const auto verb = lowercase(tokens.front());

    auto finalize = [&](bool success, std::string summary) {
        metrics.success = success;
        metrics.summary = std::move(summary);
        metrics.duration_ms = elapsed_ms(start);
        return metrics;
    };

    auto usage_error = [&](std::string_view usage) {
        metrics.status_code = 400;
        metrics.diagnostics.push_back(
            make_error_diagnostic(command, "Usage: " + std::string{usage}, "Type \\help for the command forms."));
        return finalize(false, "Invalid arguments for " + verb + ".");
    };

    if (verb == "\\help" || verb == "\\h" || verb == "\\?") {
        metrics.detail_lines = kHelpLines;
        return finalize(true, "Commands:");
    }

    if (verb == "\\quit" || verb == "\\q") {
        quit_requested_ = true;
        return finalize(true, "Bye.");
    }

    if (verb == "\\use") {
        if (tokens.size() != 2U) {
            return usage_error("\\use <db>");
        }
        if (config_.engine == nullptr) {
            config_.current_database = tokens[1];
            return finalize(true, "Using database " + tokens[1]);
        }
        const auto result = config_.engine->execute(engine::ShowTablesQuery{tokens[1]});
        if (!result.success()) {
            metrics.status_code = status_class(result.error);
            metrics.diagnostics.push_back(make_error_diagnostic(command, result.message, hint_for(result.error)));
            return finalize(false, result.message);
        }
        config_.current_database = tokens[1];
        return finalize(true, "Using database " + tokens[1]);
    }

    if (verb == "\\stats") {
        if (tokens.size() != 3U) {
            return usage_error("\\stats <db> <table>");
        }
        if (config_.engine == nullptr) {
            metrics.status_code = 500;
            return finalize(false, "No engine is attached to the shell.");
        }

        const auto db = tokens[1] == parser::kCurrentDatabase ? config_.current_database : tokens[1];
        try {
            const auto stats = config_.engine->table_stats(db, tokens[2]);
            metrics.detail_lines = format_table({"live_rows", "tombstones", "file_bytes", "next_serial"},
                                                {{std::to_string(stats.live_rows),
                                                  std::to_string(stats.tombstoned_rows),
                                                  std::to_string(stats.file_bytes),
                                                  std::to_string(stats.next_serial)}});
            return finalize(true, "Statistics for " + db + "." + tokens[2]);
        } catch (const Error& ex) {
            metrics.status_code = status_class(ex.code());
            metrics.diagnostics.push_back(make_error_diagnostic(command, ex.detail(), hint_for(ex.code())));
            return finalize(false, ex.detail());
        }
    }

    metrics.status_code = 400;
    metrics.diagnostics.push_back(
        make_error_diagnostic(command, "Shell command is not recognised.", "Use \\help to list supported commands."));
    return finalize(false, "Unsupported meta command.");
}

CommandMetrics ShellEngine::unsupported_command(const std::string& text)
{
    CommandMetrics metrics{};
    metrics.success = false;
    metrics.status_code = 400;
    metrics.command_category = "unknown";

    const auto token = first_token(text);
    std::ostringstream summary;
    summary << "Unsupported command";
    if (!token.empty()) {
        summary << ": '" << token << "'";
    }
    metrics.summary = summary.str();
    metrics.diagnostics.push_back(make_error_diagnostic(
        text, "Command type is not supported by the shell.", "Commands start with select, insert, update, delete, "
                                                              "create, createdb, drop, dropdb, alter, showtables or join."));
    return metrics;
}

void ShellEngine::resolve_database(engine::Query& query) const
{
    std::visit(
        [this](auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (!std::is_same_v<T, engine::CreateDbQuery> && !std::is_same_v<T, engine::DropDbQuery>) {
                if (value.db == parser::kCurrentDatabase) {
                    value.db = config_.current_database;
                }
            }
        },
        query);
}

}  // namespace hovel::shell
