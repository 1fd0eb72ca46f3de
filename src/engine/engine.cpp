#include "hovel/engine/engine.hpp"

#include "hovel/common/errors.hpp"

#include <exception>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace hovel::engine {

namespace {

constexpr std::string_view kComponent = "engine";

[[nodiscard]] QueryResult failure(std::error_code code, std::string message)
{
    QueryResult result{};
    result.error = code;
    result.message = std::move(message);
    return result;
}

[[nodiscard]] QueryResult with_rows(storage::Rows rows)
{
    QueryResult result{};
    result.rows = std::move(rows);
    return result;
}

}  // namespace

Engine::Engine(Config config)
    : config_{std::move(config)}
{
    std::error_code ec;
    if (std::filesystem::exists(config_.root, ec)) {
        if (!std::filesystem::is_directory(config_.root, ec)) {
            throw std::system_error{std::make_error_code(std::errc::not_a_directory),
                                    "Engine root " + config_.root.string() + " is not a directory"};
        }
    } else {
        std::filesystem::create_directories(config_.root, ec);
        if (ec) {
            throw std::system_error{ec, "Cannot create engine root " + config_.root.string()};
        }
    }
}

Engine::~Engine()
{
    try {
        close();
    } catch (const std::exception& ex) {
        emit_event(config_.event_logger, EventSeverity::Error, kComponent,
                   std::string{"Failed to close engine: "} + ex.what());
    }
}

void Engine::init()
{
    std::scoped_lock lock(mutex_);
    ensure_open();
    std::error_code ec;
    if (std::filesystem::is_directory(config_.root / config_.default_database, ec)) {
        return;
    }
    Database::create(config_.default_database, database_config());
}

QueryResult Engine::execute(const Query& query)
{
    try {
        emit_event(config_.event_logger, EventSeverity::Debug, kComponent,
                   "Executing " + std::string{query_kind(query)} + " on " + query_database(query));
        return std::visit([this](const auto& value) { return run(value); }, query);
    } catch (const Error& ex) {
        return failure(ex.code(), ex.detail());
    } catch (const std::filesystem::filesystem_error& ex) {
        return failure(make_error_code(EngineErrc::IoError), std::string{"IO Error: "} + ex.what());
    }
}

storage::Table::Stats Engine::table_stats(const std::string& db, const std::string& table)
{
    auto handle = get_database(db)->get_table(table);
    storage::TableLatchGuard guard{handle->latch, storage::TableLatchMode::Shared};
    return handle->table.stats();
}

void Engine::flush()
{
    std::scoped_lock lock(mutex_);
    for (auto& [name, database] : databases_) {
        database->flush();
    }
}

void Engine::close()
{
    std::scoped_lock lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;

    std::vector<std::string> failures;
    for (auto& [name, database] : databases_) {
        try {
            database->close();
        } catch (const Error& ex) {
            failures.push_back(name + ": " + ex.detail());
        }
    }
    databases_.clear();

    if (!failures.empty()) {
        std::string message = "Failed to close databases";
        for (const auto& entry : failures) {
            message += "; " + entry;
        }
        throw_error(EngineErrc::IoError, message);
    }
}

std::shared_ptr<Database> Engine::get_database(const std::string& name)
{
    std::scoped_lock lock(mutex_);
    ensure_open();
    if (const auto it = databases_.find(name); it != databases_.end()) {
        return it->second;
    }
    auto database = Database::open(name, database_config());
    databases_.emplace(name, database);
    return database;
}

void Engine::ensure_open() const
{
    if (closed_) {
        throw_error(EngineErrc::InvalidOperation, "Engine is closed");
    }
}

Database::Config Engine::database_config() const
{
    Database::Config config{};
    config.root = config_.root;
    config.default_database = config_.default_database;
    config.event_logger = config_.event_logger;
    return config;
}

QueryResult Engine::run(const SelectQuery& query)
{
    auto handle = get_database(query.db)->get_table(query.from);
    storage::TableLatchGuard guard{handle->latch, storage::TableLatchMode::Shared};
    return with_rows(handle->table.select(query.columns, query.conditions));
}

QueryResult Engine::run(const InsertQuery& query)
{
    auto handle = get_database(query.db)->get_table(query.into);
    storage::TableLatchGuard guard{handle->latch, storage::TableLatchMode::Exclusive};
    return with_rows({handle->table.insert(query.values)});
}

QueryResult Engine::run(const UpdateQuery& query)
{
    auto handle = get_database(query.db)->get_table(query.table);
    storage::TableLatchGuard guard{handle->latch, storage::TableLatchMode::Exclusive};
    return with_rows(handle->table.update(query.set, query.conditions));
}

QueryResult Engine::run(const DeleteQuery& query)
{
    auto handle = get_database(query.db)->get_table(query.from);
    storage::TableLatchGuard guard{handle->latch, storage::TableLatchMode::Exclusive};
    return with_rows(handle->table.delete_rows(query.conditions));
}

QueryResult Engine::run(const CreateQuery& query)
{
    get_database(query.db)->create_table(query.table, query.columns);
    return {};
}

QueryResult Engine::run(const CreateDbQuery& query)
{
    std::scoped_lock lock(mutex_);
    ensure_open();
    Database::create(query.name, database_config());
    return {};
}

QueryResult Engine::run(const DropQuery& query)
{
    get_database(query.db)->drop_table(query.table);
    return {};
}

QueryResult Engine::run(const DropDbQuery& query)
{
    auto database = get_database(query.name);
    std::scoped_lock lock(mutex_);
    database->drop_db();
    databases_.erase(query.name);
    return {};
}

QueryResult Engine::run(const AlterQuery& query)
{
    get_database(query.db)->alter_table(query.table, query.rename);
    return {};
}

QueryResult Engine::run(const ShowTablesQuery& query)
{
    auto tables = get_database(query.db)->get_tables();

    types::ColumnSet listing;
    for (const auto& table : tables) {
        listing.insert_or_assign(table, types::TypedValue::string("table"));
    }

    QueryResult result{};
    result.rows.push_back(std::move(listing));
    result.tables = std::move(tables);
    return result;
}

QueryResult Engine::run(const JoinQuery& query)
{
    auto database = get_database(query.db);
    auto left = database->get_table(query.table1);
    auto right = database->get_table(query.table2);

    auto guards = storage::acquire_in_order({
        storage::OrderedLatch{query.table1, &left->latch, storage::TableLatchMode::Shared},
        storage::OrderedLatch{query.table2, &right->latch, storage::TableLatchMode::Shared},
    });
    return with_rows(left->table.join(right->table, query.columns, query.conditions, query.join_on));
}

}  // namespace hovel::engine
