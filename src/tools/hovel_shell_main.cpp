#include "hovel/common/errors.hpp"
#include "hovel/engine/engine.hpp"
#include "hovel/engine/query.hpp"
#include "hovel/shell/shell_engine.hpp"
#include "hovel/tools/shell_log_formatter.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cctype>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

std::string trim(std::string_view text)
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

std::filesystem::path history_path()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return {};
    }

    std::filesystem::path path{home};
    path /= ".hovel_shell_history";
    return path;
}

void render_result(const hovel::shell::CommandMetrics& metrics)
{
    const auto status = metrics.success ? "OK" : "ERROR";
    std::cout << status << ": " << metrics.summary;
    if (!metrics.correlation_id.empty()) {
        std::cout << " [" << metrics.correlation_id << ']';
    }
    std::cout << " [" << std::fixed << std::setprecision(2) << metrics.duration_ms << " ms]";
    if (!metrics.success) {
        std::cout << " status=" << metrics.status_code;
    }
    std::cout << '\n';

    for (const auto& line : metrics.detail_lines) {
        std::cout << "    " << line << '\n';
    }

    for (const auto& diagnostic : metrics.diagnostics) {
        std::cout << "  - " << diagnostic.message;
        if (!diagnostic.statement.empty()) {
            std::cout << " (command: " << diagnostic.statement << ')';
        }
        std::cout << '\n';
        for (const auto& hint : diagnostic.remediation_hints) {
            std::cout << "      hint: " << hint << '\n';
        }
    }
}

bool is_comment_only(std::string_view text)
{
    return text.empty() || text.rfind("--", 0U) == 0U || text.rfind("#", 0U) == 0U;
}

// One command per line; blank lines and `--`/`#` comment lines are skipped.
bool load_script_commands(std::istream& input, std::vector<std::string>& commands, std::string& error_message)
{
    error_message.clear();

    std::string line;
    while (std::getline(input, line)) {
        const auto statement = trim(line);
        if (!is_comment_only(statement)) {
            commands.push_back(statement);
        }
    }

    if (input.bad()) {
        error_message = "I/O error while reading script";
        return false;
    }
    return true;
}

replxx::Replxx::completions_t complete_keyword(const std::string& context, int& context_length)
{
    std::size_t begin = context.size();
    while (begin > 0U && std::isspace(static_cast<unsigned char>(context[begin - 1U])) == 0) {
        --begin;
    }
    const auto prefix = context.substr(begin);
    context_length = static_cast<int>(prefix.size());

    replxx::Replxx::completions_t completions;
    if (begin != 0U && !trim(context.substr(0U, begin)).empty()) {
        return completions;
    }
    for (const auto& keyword : hovel::shell::command_keywords()) {
        if (keyword.rfind(prefix, 0U) == 0U) {
            completions.emplace_back(keyword);
        }
    }
    return completions;
}

int run_repl(bool quiet, hovel::shell::ShellEngine& shell)
{
    replxx::Replxx repl;
    repl.set_completion_callback(complete_keyword);

    const auto history = history_path();
    if (!history.empty()) {
        repl.history_load(history.string());
    }

    if (!quiet) {
        std::cout << "hovel shell, one command per line. Type \\help for the command forms.\n";
    }

    while (!shell.quit_requested()) {
        const std::string prompt = "hovel:" + shell.current_database() + "> ";
        const char* line = repl.input(prompt);
        if (line == nullptr) {
            std::cout << '\n';
            break;
        }

        const auto command = trim(line);
        if (command.empty()) {
            continue;
        }
        repl.history_add(command);

        const auto result = shell.execute_command(command);
        render_result(result);
        if (!history.empty()) {
            repl.history_save(history.string());
        }
    }
    return 0;
}

int run_batch(const std::vector<std::string>& commands, hovel::shell::ShellEngine& shell)
{
    int exit_code = 0;
    for (const auto& command : commands) {
        const auto result = shell.execute_command(command);
        render_result(result);
        if (!result.success) {
            exit_code = 1;
        }
        if (shell.quit_requested()) {
            break;
        }
    }
    return exit_code;
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Interactive shell for the hovel embedded database engine."};

    bool quiet = false;
    std::vector<std::string> execute_commands;
    std::vector<std::string> script_files;
    std::string log_json_path;
    std::string data_directory{"hovel_data"};
    std::string default_database{hovel::engine::kDefaultDatabase};
    std::string create_database;

    app.add_flag("-q,--quiet", quiet, "Suppress startup banner");
    app.add_option("-c,--command", execute_commands, "Execute the provided command and exit")
        ->type_name("COMMAND")
        ->expected(1);
    app.add_option("-f,--file", script_files, "Execute commands from the specified script file (use '-' for stdin)")
        ->type_name("PATH")
        ->expected(1);
    app.add_option("--log-json", log_json_path, "Write command and engine logs as JSON Lines (use '-' for stdout)");
    app.add_option("--data-dir", data_directory, "Root directory holding one sub-directory per database")
        ->type_name("PATH")
        ->capture_default_str();
    app.add_option("--default-db", default_database, "Reserved database created on startup and used for '.'")
        ->type_name("NAME")
        ->capture_default_str();
    app.add_option("-n,--new", create_database, "Create the database <NAME> before running commands")
        ->type_name("NAME");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    }

    std::unique_ptr<std::ofstream> log_file;
    std::ostream* log_stream = nullptr;
    std::mutex log_mutex;

    if (!log_json_path.empty()) {
        if (log_json_path == "-") {
            log_stream = &std::cout;
        } else {
            auto file = std::make_unique<std::ofstream>(log_json_path, std::ios::out | std::ios::app);
            if (!file->is_open()) {
                std::cerr << "error: failed to open log file '" << log_json_path << "'" << '\n';
                return 1;
            }
            log_stream = file.get();
            log_file = std::move(file);
        }
    }

    hovel::engine::Engine::Config engine_config{};
    engine_config.root = std::filesystem::path{data_directory};
    engine_config.default_database = default_database;
    engine_config.event_logger = [log_stream, &log_mutex](const hovel::EngineEvent& event) {
        if (log_stream != nullptr) {
            const auto line = hovel::tools::format_engine_event_log_json(event);
            std::lock_guard<std::mutex> guard{log_mutex};
            (*log_stream) << line << '\n';
            log_stream->flush();
            return;
        }
        if (event.severity == hovel::EventSeverity::Warning || event.severity == hovel::EventSeverity::Error) {
            std::lock_guard<std::mutex> guard{log_mutex};
            std::cerr << '[' << hovel::event_severity_to_string(event.severity) << "] " << event.component << ": "
                      << event.message << '\n';
        }
    };

    try {
        hovel::engine::Engine engine{engine_config};
        engine.init();

        if (!create_database.empty()) {
            const auto created = engine.execute(hovel::engine::CreateDbQuery{create_database});
            if (!created.success()) {
                std::cerr << "error: " << created.message << '\n';
                return 1;
            }
        }

        hovel::shell::ShellEngine::Config shell_config{};
        shell_config.engine = &engine;
        shell_config.current_database = default_database;
        if (log_stream != nullptr) {
            shell_config.command_logger = [log_stream, &log_mutex](const hovel::shell::CommandMetrics& metrics) {
                const auto line = hovel::tools::format_shell_command_log_json(metrics);
                std::lock_guard<std::mutex> guard{log_mutex};
                (*log_stream) << line << '\n';
                log_stream->flush();
            };
        }
        hovel::shell::ShellEngine shell{shell_config};

        std::vector<std::string> commands_to_run;
        bool stdin_consumed = false;
        for (const auto& script_path : script_files) {
            std::istream* input = nullptr;
            std::ifstream script_stream;
            if (script_path == "-") {
                if (stdin_consumed) {
                    std::cerr << "error: stdin script '-' specified more than once" << '\n';
                    return 1;
                }
                stdin_consumed = true;
                input = &std::cin;
            } else {
                script_stream.open(script_path);
                if (!script_stream.is_open()) {
                    std::cerr << "error: failed to open script file '" << script_path << "'" << '\n';
                    return 1;
                }
                input = &script_stream;
            }

            std::string error;
            if (!load_script_commands(*input, commands_to_run, error)) {
                std::cerr << "error: " << error << " ('" << (script_path == "-" ? "<stdin>" : script_path) << "')\n";
                return 1;
            }
        }
        commands_to_run.insert(commands_to_run.end(), execute_commands.begin(), execute_commands.end());

        int code = 0;
        if (!commands_to_run.empty()) {
            code = run_batch(commands_to_run, shell);
        } else if (script_files.empty()) {
            code = run_repl(quiet, shell);
        }

        engine.close();
        return code;
    } catch (const hovel::SchemaCorruptedError& error) {
        std::cerr << "fatal: " << error.what() << '\n';
        return 2;
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return 1;
    }
}
