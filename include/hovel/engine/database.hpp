#pragma once

#include "hovel/common/events.hpp"
#include "hovel/schema/schema.hpp"
#include "hovel/storage/table.hpp"
#include "hovel/storage/table_latch.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hovel::engine {

// Name of the database `Engine::init` bootstraps unless configured otherwise.
inline constexpr std::string_view kDefaultDatabase = "hovel";

// A cached table plus the latch every caller takes before touching it.
struct TableHandle final {
    TableHandle(std::string name, schema::Columns columns, storage::Table::Config config)
        : table{std::move(name), std::move(columns), std::move(config)}
    {
    }

    storage::TableLatch latch{};
    storage::Table table;
};

// One database directory: its schema plus lazily opened tables.
class Database final {
    // Restricts construction to open().
    struct OpenKey final {
        explicit OpenKey() = default;
    };

public:
    struct Config final {
        std::filesystem::path root{};
        std::string default_database{kDefaultDatabase};
        EventLogger event_logger{};
    };

    // DatabaseNotFound when `<root>/<name>` is not a directory;
    // SchemaCorruptedError when its schema cannot be loaded.
    [[nodiscard]] static std::shared_ptr<Database> open(const std::string& name, const Config& config);

    // Creates the directory with an empty schema.
    static void create(const std::string& name, const Config& config);

    Database(OpenKey key, std::string name, std::filesystem::path path, schema::Schema schema, Config config);
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] bool dropped() const;

    [[nodiscard]] std::shared_ptr<TableHandle> get_table(const std::string& table_name);
    void create_table(const std::string& table_name, schema::Columns columns);
    void drop_table(const std::string& table_name);
    void alter_table(const std::string& table_name, const schema::RenameMap& rename);
    [[nodiscard]] std::vector<std::string> get_tables() const;

    void drop_db();

    // Persists the schema.
    void flush();
    void close();

private:
    void ensure_usable() const;
    void persist_schema();

    std::string name_{};
    std::filesystem::path path_{};
    Config config_{};

    mutable std::mutex mutex_{};
    schema::Schema schema_;
    std::map<std::string, std::shared_ptr<TableHandle>> tables_{};
    bool dropped_ = false;
    bool closed_ = false;
};

}  // namespace hovel::engine
