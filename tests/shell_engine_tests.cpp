#include "hovel/engine/engine.hpp"
#include "hovel/shell/shell_engine.hpp"
#include "hovel/tools/shell_log_formatter.hpp"

#include "temp_directory.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

using hovel::shell::CommandMetrics;
using hovel::shell::ShellEngine;
using Catch::Matchers::ContainsSubstring;

namespace {

bool any_line_contains(const std::vector<std::string>& lines, const std::string& needle)
{
    return std::any_of(lines.begin(), lines.end(), [&needle](const std::string& line) {
        return line.find(needle) != std::string::npos;
    });
}

struct ShellFixture {
    ShellFixture()
        : scratch{"hovel_shell_test_"}
        , engine{config_for(scratch.path())}
    {
        engine.init();
    }

    ~ShellFixture()
    {
        engine.close();
    }

    ShellEngine make_shell(std::vector<CommandMetrics>* log = nullptr)
    {
        ShellEngine::Config config{};
        config.engine = &engine;
        if (log != nullptr) {
            config.command_logger = [log](const CommandMetrics& metrics) { log->push_back(metrics); };
        }
        return ShellEngine{config};
    }

    static hovel::engine::Engine::Config config_for(const std::filesystem::path& path)
    {
        hovel::engine::Engine::Config config{};
        config.root = path;
        return config;
    }

    hovel::test::TempDirectory scratch;
    hovel::engine::Engine engine;
};

}  // namespace

TEST_CASE("ShellEngine runs commands against the current database", "[shell]")
{
    ShellFixture fixture;
    auto shell = fixture.make_shell();

    const auto created = shell.execute_command("create . users id:serial,name:string");
    REQUIRE(created.success);
    CHECK(created.summary == "Created table hovel.users");
    CHECK(created.command_category == "create");

    const auto inserted = shell.execute_command("insert . users name=ann");
    REQUIRE(inserted.success);
    CHECK(inserted.summary == "Inserted 1 row into hovel.users");
    CHECK(inserted.rows_touched == 1U);

    const auto selected = shell.execute_command("select . users name");
    REQUIRE(selected.success);
    CHECK(selected.summary == "Selected 1 row from hovel.users");
    REQUIRE_FALSE(selected.detail_lines.empty());
    CHECK_THAT(selected.detail_lines.front(), ContainsSubstring("name"));
    CHECK(any_line_contains(selected.detail_lines, "ann"));
}

TEST_CASE("ShellEngine reports engine errors with status classes", "[shell]")
{
    ShellFixture fixture;
    auto shell = fixture.make_shell();

    const auto missing = shell.execute_command("select . ghosts *");
    CHECK_FALSE(missing.success);
    CHECK(missing.status_code == 404);
    CHECK(missing.summary == "Table ghosts not found");
    REQUIRE(missing.diagnostics.size() == 1U);
    CHECK_FALSE(missing.diagnostics[0].remediation_hints.empty());

    const auto forbidden = shell.execute_command("dropdb hovel");
    CHECK_FALSE(forbidden.success);
    CHECK(forbidden.status_code == 403);
}

TEST_CASE("ShellEngine reports parse failures", "[shell]")
{
    ShellFixture fixture;
    auto shell = fixture.make_shell();

    const auto result = shell.execute_command("insert . users");
    CHECK_FALSE(result.success);
    CHECK(result.status_code == 400);
    CHECK(result.summary == "Could not parse command.");
    CHECK_FALSE(result.diagnostics.empty());
}

TEST_CASE("ShellEngine rejects unknown commands", "[shell]")
{
    ShellEngine shell;
    const auto result = shell.execute_command("banana split");
    CHECK_FALSE(result.success);
    CHECK(result.status_code == 400);
    CHECK(result.command_category == "unknown");
    CHECK_THAT(result.summary, ContainsSubstring("banana"));
}

TEST_CASE("ShellEngine without an engine refuses queries", "[shell]")
{
    ShellEngine shell;
    const auto result = shell.execute_command("showtables hovel");
    CHECK_FALSE(result.success);
    CHECK(result.status_code == 500);
}

TEST_CASE("ShellEngine switches databases with \\use", "[shell][meta]")
{
    ShellFixture fixture;
    auto shell = fixture.make_shell();

    REQUIRE(shell.execute_command("createdb shop").success);
    CHECK(shell.current_database() == "hovel");

    const auto missing = shell.execute_command("\\use nowhere");
    CHECK_FALSE(missing.success);
    CHECK(missing.status_code == 404);
    CHECK(shell.current_database() == "hovel");

    const auto used = shell.execute_command("\\use shop");
    REQUIRE(used.success);
    CHECK(shell.current_database() == "shop");

    REQUIRE(shell.execute_command("create . items sku:string").success);
    const auto listing = shell.execute_command("showtables shop");
    REQUIRE(listing.success);
    CHECK(listing.summary == "Listed 1 table in shop");
    CHECK(any_line_contains(listing.detail_lines, "items"));

    CHECK_FALSE(shell.execute_command("\\use").success);
}

TEST_CASE("ShellEngine prints table statistics", "[shell][meta]")
{
    ShellFixture fixture;
    auto shell = fixture.make_shell();
    REQUIRE(shell.execute_command("create . users id:serial,name:string").success);
    REQUIRE(shell.execute_command("insert . users name=ann").success);
    REQUIRE(shell.execute_command("insert . users name=bob").success);
    REQUIRE(shell.execute_command("delete . users name=ann").success);

    const auto stats = shell.execute_command("\\stats . users");
    REQUIRE(stats.success);
    REQUIRE(stats.detail_lines.size() == 3U);
    CHECK_THAT(stats.detail_lines[0], ContainsSubstring("tombstones"));
    CHECK_THAT(stats.detail_lines[2], ContainsSubstring("1 "));

    const auto missing = shell.execute_command("\\stats . ghosts");
    CHECK_FALSE(missing.success);
    CHECK(missing.status_code == 404);
}

TEST_CASE("ShellEngine handles help and quit", "[shell][meta]")
{
    ShellEngine shell;

    const auto help = shell.execute_command("\\help");
    REQUIRE(help.success);
    CHECK(any_line_contains(help.detail_lines, "join <db>"));

    CHECK_FALSE(shell.quit_requested());
    REQUIRE(shell.execute_command("\\quit").success);
    CHECK(shell.quit_requested());

    CHECK_FALSE(shell.execute_command("\\dance").success);
}

TEST_CASE("ShellEngine assigns correlation ids and logs each command", "[shell][logging]")
{
    ShellFixture fixture;
    std::vector<CommandMetrics> log;
    auto shell = fixture.make_shell(&log);

    (void)shell.execute_command("showtables hovel");
    (void)shell.execute_command("\\help");
    (void)shell.execute_command("   ");

    REQUIRE(log.size() == 2U);
    CHECK(log[0].correlation_id == "cmd-1");
    CHECK(log[1].correlation_id == "cmd-2");
    CHECK(log[0].command_category == "showtables");
    CHECK(log[1].command_category == "meta");
    CHECK(log[0].finished_at >= log[0].started_at);
}

TEST_CASE("format_table aligns columns", "[shell]")
{
    const auto lines = hovel::shell::format_table({"id", "name"}, {{"1", "ann"}, {"22", "b"}});
    REQUIRE(lines.size() == 4U);
    CHECK(lines[0] == "id | name");
    CHECK(lines[1] == "---+-----");
    CHECK(lines[2] == "1  | ann ");
    CHECK(lines[3] == "22 | b   ");

    const auto empty = hovel::shell::format_table({"id"}, {});
    CHECK(empty.back() == "(no rows)");
}

TEST_CASE("Command logs are emitted as one JSON object", "[shell][logging]")
{
    CommandMetrics metrics{};
    metrics.success = false;
    metrics.summary = "Table \"x\" not found";
    metrics.status_code = 404;
    metrics.correlation_id = "cmd-7";
    metrics.command_category = "select";
    metrics.command_text = "select . x *";
    metrics.detail_lines = {"line\tone"};

    hovel::parser::ParserDiagnostic diagnostic{};
    diagnostic.message = "Table \"x\" not found";
    diagnostic.remediation_hints = {"check"};
    metrics.diagnostics.push_back(diagnostic);

    const auto json = hovel::tools::format_shell_command_log_json(metrics);
    CHECK(json.front() == '{');
    CHECK(json.back() == '}');
    CHECK(json.find('\n') == std::string::npos);
    CHECK_THAT(json, ContainsSubstring("\"type\":\"command\""));
    CHECK_THAT(json, ContainsSubstring("\"correlation_id\":\"cmd-7\""));
    CHECK_THAT(json, ContainsSubstring("\"status\":404"));
    CHECK_THAT(json, ContainsSubstring("\"success\":false"));
    CHECK_THAT(json, ContainsSubstring("\"summary\":\"Table \\\"x\\\" not found\""));
    CHECK_THAT(json, ContainsSubstring("\"detail_lines\":[\"line\\tone\"]"));
    CHECK_THAT(json, ContainsSubstring("\"remediation_hints\":[\"check\"]"));
    CHECK_THAT(json, ContainsSubstring("\"started_at\":null"));
}

TEST_CASE("Engine events are emitted as JSON with timestamps", "[shell][logging]")
{
    hovel::EngineEvent event{};
    event.severity = hovel::EventSeverity::Warning;
    event.component = "table";
    event.message = "join anomaly";
    event.timestamp = std::chrono::system_clock::time_point{std::chrono::seconds{86400}};

    const auto json = hovel::tools::format_engine_event_log_json(event);
    CHECK_THAT(json, ContainsSubstring("\"type\":\"event\""));
    CHECK_THAT(json, ContainsSubstring("\"severity\":\"warning\""));
    CHECK_THAT(json, ContainsSubstring("\"component\":\"table\""));
    CHECK_THAT(json, ContainsSubstring("\"timestamp\":\"1970-01-02T00:00:00.000000Z\""));
}

TEST_CASE("Engine events reach the configured logger", "[shell][logging]")
{
    const hovel::test::TempDirectory scratch{"hovel_events_test_"};
    const auto& root = scratch.path();
    std::vector<hovel::EngineEvent> events;
    {
        hovel::engine::Engine::Config config{};
        config.root = root;
        config.event_logger = [&events](const hovel::EngineEvent& event) { events.push_back(event); };
        hovel::engine::Engine engine{config};
        engine.init();
    }

    CHECK(std::any_of(events.begin(), events.end(), [](const hovel::EngineEvent& event) {
        return event.component == "database" && event.message == "Created database hovel";
    }));

    hovel::emit_event({}, hovel::EventSeverity::Error, "engine", "dropped on the floor");
}
