#pragma once

#include "hovel/common/events.hpp"
#include "hovel/engine/database.hpp"
#include "hovel/engine/query.hpp"
#include "hovel/storage/table.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace hovel::engine {

// Entry point of the embedded engine. `execute` is safe to call from several
// threads; errors come back inside QueryResult, except SchemaCorruptedError.
class Engine final {
public:
    struct Config final {
        std::filesystem::path root{"."};
        std::string default_database{kDefaultDatabase};
        EventLogger event_logger{};
    };

    // Creates the root directory when missing; throws std::system_error when
    // the root exists and is not a directory.
    explicit Engine(Config config);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Ensures the default database exists. Idempotent.
    void init();

    [[nodiscard]] QueryResult execute(const Query& query);

    [[nodiscard]] storage::Table::Stats table_stats(const std::string& db, const std::string& table);

    void flush();
    void close();

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::shared_ptr<Database> get_database(const std::string& name);
    [[nodiscard]] Database::Config database_config() const;
    // Caller holds mutex_.
    void ensure_open() const;

    [[nodiscard]] QueryResult run(const SelectQuery& query);
    [[nodiscard]] QueryResult run(const InsertQuery& query);
    [[nodiscard]] QueryResult run(const UpdateQuery& query);
    [[nodiscard]] QueryResult run(const DeleteQuery& query);
    [[nodiscard]] QueryResult run(const CreateQuery& query);
    [[nodiscard]] QueryResult run(const CreateDbQuery& query);
    [[nodiscard]] QueryResult run(const DropQuery& query);
    [[nodiscard]] QueryResult run(const DropDbQuery& query);
    [[nodiscard]] QueryResult run(const AlterQuery& query);
    [[nodiscard]] QueryResult run(const ShowTablesQuery& query);
    [[nodiscard]] QueryResult run(const JoinQuery& query);

    Config config_{};
    std::mutex mutex_{};
    std::map<std::string, std::shared_ptr<Database>> databases_{};
    bool closed_ = false;
};

}  // namespace hovel::engine
