#include "hovel/parser/command_grammar.hpp"

#include <tao/pegtl.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

namespace hovel::parser {

namespace pegtl = tao::pegtl;

namespace {

template <char... Cs>
struct keyword : pegtl::seq<pegtl::istring<Cs...>, pegtl::not_at<pegtl::identifier_other>> {
};

struct kw_select : keyword<'s', 'e', 'l', 'e', 'c', 't'> {
};

struct kw_insert : keyword<'i', 'n', 's', 'e', 'r', 't'> {
};

struct kw_update : keyword<'u', 'p', 'd', 'a', 't', 'e'> {
};

struct kw_delete : keyword<'d', 'e', 'l', 'e', 't', 'e'> {
};

struct kw_create : keyword<'c', 'r', 'e', 'a', 't', 'e'> {
};

struct kw_createdb : keyword<'c', 'r', 'e', 'a', 't', 'e', 'd', 'b'> {
};

struct kw_drop : keyword<'d', 'r', 'o', 'p'> {
};

struct kw_dropdb : keyword<'d', 'r', 'o', 'p', 'd', 'b'> {
};

struct kw_alter : keyword<'a', 'l', 't', 'e', 'r'> {
};

struct kw_showtables : keyword<'s', 'h', 'o', 'w', 't', 'a', 'b', 'l', 'e', 's'> {
};

struct kw_join : keyword<'j', 'o', 'i', 'n'> {
};

struct required_space : pegtl::plus<pegtl::blank> {
};

struct optional_space : pegtl::star<pegtl::space> {
};

struct comma : pegtl::one<','> {
};

struct name_chars : pegtl::plus<pegtl::sor<pegtl::alnum, pegtl::one<'_'>>> {
};

struct database_name : pegtl::sor<name_chars, pegtl::one<'.'>> {
};

struct new_database_name : name_chars {
};

struct table_name : name_chars {
};

// `column` or `table.column` (join results carry prefixed fields).
struct field_name : pegtl::seq<name_chars, pegtl::opt<pegtl::one<'.'>, name_chars>> {
};

struct token_end : pegtl::not_at<pegtl::not_one<' ', '\t', '\r', '\n'>> {
};

struct empty_marker : pegtl::seq<pegtl::one<'_'>, token_end> {
};

struct projection_all : pegtl::seq<pegtl::one<'*'>, token_end> {
};

struct projection_column : field_name {
};

struct projection : pegtl::sor<projection_all, empty_marker, pegtl::list<projection_column, comma>> {
};

struct quoted_body : pegtl::star<pegtl::sor<pegtl::two<'\''>, pegtl::not_one<'\''>>> {
};

struct quoted_value : pegtl::seq<pegtl::one<'\''>, quoted_body, pegtl::one<'\''>> {
};

struct bare_value : pegtl::plus<pegtl::not_one<' ', '\t', '\r', '\n', ',', '\''>> {
};

struct assignment_key : field_name {
};

struct assignment : pegtl::seq<assignment_key, pegtl::one<'='>, pegtl::sor<quoted_value, bare_value>> {
};

struct assignment_list : pegtl::sor<empty_marker, pegtl::list<assignment, comma>> {
};

struct definition_name : name_chars {
};

struct definition_type : pegtl::plus<pegtl::alpha> {
};

struct column_definition : pegtl::seq<definition_name, pegtl::one<':'>, definition_type> {
};

struct column_definitions : pegtl::list<column_definition, comma> {
};

struct table_target : pegtl::seq<required_space, database_name, required_space, table_name> {
};

struct optional_conditions : pegtl::opt<required_space, assignment_list> {
};

struct select_command
    : pegtl::seq<kw_select,
                 pegtl::must<required_space, database_name, required_space, table_name, required_space, projection>,
                 optional_conditions> {
};

struct insert_command
    : pegtl::seq<kw_insert,
                 pegtl::must<required_space, database_name, required_space, table_name, required_space,
                             assignment_list>> {
};

struct update_command
    : pegtl::seq<kw_update,
                 pegtl::must<required_space, database_name, required_space, table_name, required_space,
                             assignment_list>,
                 optional_conditions> {
};

struct delete_command
    : pegtl::seq<kw_delete, pegtl::must<required_space, database_name, required_space, table_name>,
                 optional_conditions> {
};

struct create_command
    : pegtl::seq<kw_create,
                 pegtl::must<required_space, database_name, required_space, table_name, required_space,
                             column_definitions>> {
};

struct createdb_command : pegtl::seq<kw_createdb, pegtl::must<required_space, new_database_name>> {
};

struct drop_command
    : pegtl::seq<kw_drop, pegtl::must<required_space, database_name, required_space, table_name>> {
};

struct dropdb_command : pegtl::seq<kw_dropdb, pegtl::must<required_space, new_database_name>> {
};

struct alter_command
    : pegtl::seq<kw_alter,
                 pegtl::must<required_space, database_name, required_space, table_name, required_space,
                             assignment_list>> {
};

struct showtables_command : pegtl::seq<kw_showtables, pegtl::must<required_space, database_name>> {
};

struct join_command
    : pegtl::seq<kw_join,
                 pegtl::must<required_space, database_name, required_space, table_name, required_space, table_name,
                             required_space, projection, required_space, assignment_list, required_space,
                             assignment_list>> {
};

struct command_grammar
    : pegtl::seq<optional_space,
                 pegtl::sor<select_command,
                            insert_command,
                            update_command,
                            delete_command,
                            createdb_command,
                            create_command,
                            dropdb_command,
                            drop_command,
                            alter_command,
                            showtables_command,
                            join_command>,
                 optional_space,
                 pegtl::must<pegtl::eof>> {
};

template <typename>
inline constexpr const char* error_message = nullptr;

template <>
inline constexpr auto error_message<required_space> = "expected whitespace";
template <>
inline constexpr auto error_message<database_name> = "expected a database name";
template <>
inline constexpr auto error_message<new_database_name> = "expected a database name";
template <>
inline constexpr auto error_message<table_name> = "expected a table name";
template <>
inline constexpr auto error_message<projection> = "expected a column list, '*' or '_'";
template <>
inline constexpr auto error_message<assignment_list> = "expected col=value pairs or '_'";
template <>
inline constexpr auto error_message<column_definitions> = "expected col:type definitions";
template <>
inline constexpr auto error_message<pegtl::eof> = "expected end of command";

struct command_errors {
    template <typename Rule>
    static constexpr auto message = error_message<Rule>;
};

template <typename Rule>
using command_control = pegtl::must_if<command_errors, pegtl::normal, false>::control<Rule>;

enum class CommandKind : std::uint8_t {
    Unknown = 0,
    Select,
    Insert,
    Update,
    Delete,
    Create,
    CreateDb,
    Drop,
    DropDb,
    Alter,
    ShowTables,
    Join
};

struct Assignment final {
    std::string key{};
    types::TypedValue value{};
};

struct CommandState final {
    CommandKind kind = CommandKind::Unknown;
    std::vector<std::string> names{};
    std::vector<std::string> columns{};
    std::vector<std::vector<Assignment>> lists{};
    std::vector<Assignment> pending{};
    std::string pending_key{};
    std::vector<std::pair<std::string, std::string>> definitions{};
    std::string pending_definition{};
};

template <typename Rule>
struct command_action {
    template <typename Input>
    static void apply(const Input&, CommandState&)
    {
    }
};

template <>
struct command_action<database_name> {
    template <typename Input>
    static void apply(const Input& in, CommandState& state)
    {
        state.names.push_back(in.string());
    }
};

template <>
struct command_action<new_database_name> {
    template <typename Input>
    static void apply(const Input& in, CommandState& state)
    {
        state.names.push_back(in.string());
    }
};

template <>
struct command_action<table_name> {
    template <typename Input>
    static void apply(const Input& in, CommandState& state)
    {
        state.names.push_back(in.string());
    }
};

template <>
struct command_action<projection_column> {
    template <typename Input>
    static void apply(const Input& in, CommandState& state)
    {
        state.columns.push_back(in.string());
    }
};

template <>
struct command_action<assignment_key> {
    template <typename Input>
    static void apply(const Input& in, CommandState& state)
    {
        state.pending_key = in.string();
    }
};

template <>
struct command_action<quoted_body> {
    template <typename Input>
    static void apply(const Input& in, CommandState& state)
    {
        std::string text;
        const auto raw = in.string();
        for (std::size_t index = 0U; index < raw.size(); ++index) {
            text.push_back(raw[index]);
            if (raw[index] == '\'') {
                ++index;
            }
        }
        state.pending.push_back(Assignment{state.pending_key, make_literal(text, true)});
    }
};

template <>
struct command_action<bare_value> {
    template <typename Input>
    static void apply(const Input& in, CommandState& state)
    {
        state.pending.push_back(Assignment{state.pending_key, make_literal(in.string(), false)});
    }
};

template <>
struct command_action<assignment_list> {
    template <typename Input>
    static void apply(const Input&, CommandState& state)
    {
        state.lists.push_back(std::move(state.pending));
        state.pending.clear();
    }
};

template <>
struct command_action<definition_name> {
    template <typename Input>
    static void apply(const Input& in, CommandState& state)
    {
        state.pending_definition = in.string();
    }
};

template <>
struct command_action<definition_type> {
    template <typename Input>
    static void apply(const Input& in, CommandState& state)
    {
        state.definitions.emplace_back(state.pending_definition, in.string());
    }
};

template <CommandKind Kind>
struct mark_kind {
    template <typename Input>
    static void apply(const Input&, CommandState& state)
    {
        state.kind = Kind;
    }
};

template <>
struct command_action<select_command> : mark_kind<CommandKind::Select> {
};
template <>
struct command_action<insert_command> : mark_kind<CommandKind::Insert> {
};
template <>
struct command_action<update_command> : mark_kind<CommandKind::Update> {
};
template <>
struct command_action<delete_command> : mark_kind<CommandKind::Delete> {
};
template <>
struct command_action<create_command> : mark_kind<CommandKind::Create> {
};
template <>
struct command_action<createdb_command> : mark_kind<CommandKind::CreateDb> {
};
template <>
struct command_action<drop_command> : mark_kind<CommandKind::Drop> {
};
template <>
struct command_action<dropdb_command> : mark_kind<CommandKind::DropDb> {
};
template <>
struct command_action<alter_command> : mark_kind<CommandKind::Alter> {
};
template <>
struct command_action<showtables_command> : mark_kind<CommandKind::ShowTables> {
};
template <>
struct command_action<join_command> : mark_kind<CommandKind::Join> {
};

std::string trim_copy(std::string_view text)
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(first, last - first + 1U)};
}

std::string format_parse_message(std::string_view message)
{
    constexpr std::string_view expected_prefix = "expected ";
    if (message.rfind(expected_prefix, 0) == 0U && message.size() > expected_prefix.size()) {
        return "Missing " + std::string{message.substr(expected_prefix.size())};
    }
    return std::string{message};
}

std::string_view extract_token(std::string_view input, std::size_t offset)
{
    if (input.empty()) {
        return {};
    }
    offset = std::min(offset, input.size() - 1U);

    auto is_separator = [](char ch) {
        return std::isspace(static_cast<unsigned char>(ch)) != 0 || ch == ',';
    };

    std::size_t begin = offset;
    while (begin > 0U && !is_separator(input[begin - 1U])) {
        --begin;
    }
    std::size_t end = offset;
    while (end < input.size() && !is_separator(input[end])) {
        ++end;
    }
    return input.substr(begin, end - begin);
}

ParserDiagnostic make_parse_error(const pegtl::parse_error& error, std::string_view source)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Error;
    diagnostic.message = format_parse_message(error.message());
    diagnostic.statement = trim_copy(source);
    diagnostic.remediation_hints = {"Type \\help for the command forms."};

    if (!error.positions().empty()) {
        const auto& position = error.positions().front();
        diagnostic.line = static_cast<std::size_t>(position.line);
        diagnostic.column = static_cast<std::size_t>(position.column);

        const auto byte_index = static_cast<std::size_t>(position.byte);
        if (byte_index < source.size()) {
            const auto token = trim_copy(extract_token(source, byte_index));
            if (!token.empty()) {
                diagnostic.message += " near '" + token + "'";
            }
        } else {
            diagnostic.message += " at end of input";
        }
    }
    return diagnostic;
}

ParserDiagnostic make_diagnostic(std::string message, std::string_view source, std::string hint)
{
    ParserDiagnostic diagnostic{};
    diagnostic.severity = ParserSeverity::Error;
    diagnostic.message = std::move(message);
    diagnostic.line = 1U;
    diagnostic.column = 1U;
    diagnostic.statement = trim_copy(source);
    diagnostic.remediation_hints = {std::move(hint)};
    return diagnostic;
}

[[nodiscard]] types::ColumnSet to_column_set(std::vector<Assignment> assignments)
{
    types::ColumnSet values;
    for (auto& entry : assignments) {
        values.insert_or_assign(std::move(entry.key), std::move(entry.value));
    }
    return values;
}

[[nodiscard]] types::ColumnSet list_at(CommandState& state, std::size_t index)
{
    if (index >= state.lists.size()) {
        return {};
    }
    return to_column_set(std::move(state.lists[index]));
}

[[nodiscard]] std::optional<engine::Query> build_query(CommandState& state,
                                                       std::string_view input,
                                                       std::vector<ParserDiagnostic>& diagnostics)
{
    auto& names = state.names;
    switch (state.kind) {
    case CommandKind::Select:
        return engine::SelectQuery{names[0], names[1], std::move(state.columns), list_at(state, 0U)};
    case CommandKind::Insert:
        return engine::InsertQuery{names[0], names[1], list_at(state, 0U)};
    case CommandKind::Update:
        return engine::UpdateQuery{names[0], names[1], list_at(state, 0U), list_at(state, 1U)};
    case CommandKind::Delete:
        return engine::DeleteQuery{names[0], names[1], list_at(state, 0U)};
    case CommandKind::Create: {
        schema::Columns columns;
        for (const auto& [column, type_text] : state.definitions) {
            const auto type = types::data_type_from_string(type_text);
            if (!type) {
                diagnostics.push_back(make_diagnostic("Invalid datatype: " + type_text, input,
                                                      "Use int, float, char, string, serial or email."));
                return std::nullopt;
            }
            columns.push_back(schema::Column{column, *type});
        }
        return engine::CreateQuery{names[0], names[1], std::move(columns)};
    }
    case CommandKind::CreateDb:
        return engine::CreateDbQuery{names[0]};
    case CommandKind::Drop:
        return engine::DropQuery{names[0], names[1]};
    case CommandKind::DropDb:
        return engine::DropDbQuery{names[0]};
    case CommandKind::Alter: {
        schema::RenameMap rename;
        for (const auto& entry : state.lists.empty() ? std::vector<Assignment>{} : state.lists[0]) {
            rename.insert_or_assign(entry.key, types::to_string(entry.value));
        }
        return engine::AlterQuery{names[0], names[1], std::move(rename)};
    }
    case CommandKind::ShowTables:
        return engine::ShowTablesQuery{names[0]};
    case CommandKind::Join: {
        storage::JoinOn join_on;
        if (state.lists.size() > 1U) {
            for (const auto& entry : state.lists[1]) {
                join_on.emplace_back(entry.key, types::to_string(entry.value));
            }
        }
        return engine::JoinQuery{names[0], names[1], names[2], std::move(state.columns), list_at(state, 0U),
                                 std::move(join_on)};
    }
    case CommandKind::Unknown:
    default:
        diagnostics.push_back(make_diagnostic("Unknown command", input, "Type \\help for the command forms."));
        return std::nullopt;
    }
}

}  // namespace

types::TypedValue make_literal(std::string_view text, bool quoted)
{
    if (quoted || text.empty()) {
        return types::TypedValue::string(std::string{text});
    }

    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto* digits = begin;
    if (*digits == '-' || *digits == '+') {
        ++digits;
    }
    const bool numeric_shape = digits != end && (std::isdigit(static_cast<unsigned char>(*digits)) != 0 ||
                                                 (*digits == '.' && digits + 1 != end &&
                                                  std::isdigit(static_cast<unsigned char>(digits[1])) != 0));
    if (!numeric_shape) {
        return types::TypedValue::string(std::string{text});
    }

    const auto* number_begin = *begin == '+' ? begin + 1 : begin;
    std::int64_t integer = 0;
    if (const auto [ptr, ec] = std::from_chars(number_begin, end, integer); ec == std::errc{} && ptr == end) {
        return types::TypedValue::integer(integer);
    }
    double floating = 0.0;
    if (const auto [ptr, ec] = std::from_chars(number_begin, end, floating); ec == std::errc{} && ptr == end) {
        return types::TypedValue::floating(floating);
    }
    return types::TypedValue::string(std::string{text});
}

ParseResult<engine::Query> parse_command(std::string_view input)
{
    ParseResult<engine::Query> result{};
    pegtl::memory_input in(input.data(), input.size(), "command");
    CommandState state{};

    try {
        const auto parsed = pegtl::parse<command_grammar, command_action, command_control>(in, state);
        if (parsed) {
            result.ast = build_query(state, input, result.diagnostics);
        } else {
            result.diagnostics.push_back(make_diagnostic("Unknown command", input,
                                                         "Type \\help for the command forms."));
        }
    } catch (const pegtl::parse_error& error) {
        result.diagnostics.push_back(make_parse_error(error, input));
    }

    return result;
}

}  // namespace hovel::parser
