#pragma once

#include "hovel/engine/engine.hpp"
#include "hovel/parser/command_grammar.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace hovel::shell {

struct CommandMetrics final {
    bool success = false;
    std::string summary{};
    double duration_ms = 0.0;
    std::uint64_t rows_touched = 0U;
    int status_code = 200;
    std::vector<parser::ParserDiagnostic> diagnostics{};
    std::vector<std::string> detail_lines{};
    std::string command_text{};
    std::string correlation_id{};
    std::string command_category{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

// Keywords offered by interactive completion.
[[nodiscard]] const std::vector<std::string>& command_keywords();

// Renders rows as an aligned text table; `(no rows)` when empty.
[[nodiscard]] std::vector<std::string> format_table(const std::vector<std::string>& headers,
                                                    const std::vector<std::vector<std::string>>& rows);

class ShellEngine final {
public:
    struct Config final {
        engine::Engine* engine = nullptr;
        std::string current_database{engine::kDefaultDatabase};
        std::function<void(const CommandMetrics&)> command_logger{};
    };

    ShellEngine();
    explicit ShellEngine(Config config);

    CommandMetrics execute_command(const std::string& text);

    [[nodiscard]] const std::string& current_database() const noexcept { return config_.current_database; }
    [[nodiscard]] bool quit_requested() const noexcept { return quit_requested_; }

private:
    enum class CommandKind : std::uint8_t {
        Empty = 0,
        Query,
        Meta,
        Unknown
    };

    static std::string trim(std::string_view text);
    static CommandKind classify(std::string_view text);

    CommandMetrics execute_query(const std::string& text);
    CommandMetrics execute_meta(const std::string& command);
    CommandMetrics unsupported_command(const std::string& text);
    void resolve_database(engine::Query& query) const;

    Config config_{};
    std::atomic<std::uint64_t> correlation_counter_{1U};
    bool quit_requested_ = false;
};

}  // namespace hovel::shell
