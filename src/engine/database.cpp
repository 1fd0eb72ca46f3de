#include "hovel/engine/database.hpp"

#include "hovel/common/errors.hpp"
#include "hovel/common/identifier.hpp"

#include <system_error>

namespace hovel::engine {

namespace {

constexpr std::string_view kComponent = "database";

void truncate_table_file(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return;
    }
    std::filesystem::resize_file(path, 0U, ec);
    if (ec) {
        throw_io_error(ec, "cannot truncate table file " + path.string());
    }
}

}  // namespace

std::shared_ptr<Database> Database::open(const std::string& name, const Config& config)
{
    const auto path = config.root / name;
    std::error_code ec;
    if (!is_valid_name(name) || !std::filesystem::is_directory(path, ec)) {
        throw_error(EngineErrc::DatabaseNotFound, "Database " + name + " not found");
    }

    emit_event(config.event_logger, EventSeverity::Info, kComponent, "Loading schema of database " + name);
    auto schema = schema::Schema::load(path);
    emit_event(config.event_logger, EventSeverity::Info, kComponent,
               "Opened database " + name + " with " + std::to_string(schema.table_count()) + " tables");
    return std::make_shared<Database>(OpenKey{}, name, path, std::move(schema), config);
}

void Database::create(const std::string& name, const Config& config)
{
    validate_name(name);
    const auto path = config.root / name;

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        throw_error(EngineErrc::DatabaseAlreadyExists, "Database " + name + " already exists");
    }
    std::filesystem::create_directories(path, ec);
    if (ec) {
        throw_io_error(ec, "cannot create database directory " + path.string());
    }

    schema::Schema{name}.dump(path);
    emit_event(config.event_logger, EventSeverity::Info, kComponent, "Created database " + name);
}

Database::Database(OpenKey /*key*/, std::string name, std::filesystem::path path, schema::Schema schema,
                   Config config)
    : name_{std::move(name)}
    , path_{std::move(path)}
    , config_{std::move(config)}
    , schema_{std::move(schema)}
{
}

bool Database::dropped() const
{
    std::scoped_lock lock(mutex_);
    return dropped_;
}

std::shared_ptr<TableHandle> Database::get_table(const std::string& table_name)
{
    std::scoped_lock lock(mutex_);
    ensure_usable();

    if (const auto it = tables_.find(table_name); it != tables_.end()) {
        return it->second;
    }

    const auto& columns = schema_.columns(table_name);
    storage::Table::Config table_config{};
    table_config.directory = path_;
    table_config.event_logger = config_.event_logger;

    auto handle = std::make_shared<TableHandle>(table_name, columns, std::move(table_config));
    handle->table.open();
    tables_.emplace(table_name, handle);
    return handle;
}

void Database::create_table(const std::string& table_name, schema::Columns columns)
{
    std::scoped_lock lock(mutex_);
    ensure_usable();
    schema_.create_table(table_name, std::move(columns));
    persist_schema();
}

void Database::drop_table(const std::string& table_name)
{
    std::scoped_lock lock(mutex_);
    ensure_usable();
    schema_.drop_table(table_name);
    persist_schema();

    if (const auto it = tables_.find(table_name); it != tables_.end()) {
        auto handle = it->second;
        tables_.erase(it);
        storage::TableLatchGuard guard{handle->latch, storage::TableLatchMode::Exclusive};
        handle->table.drop();
        return;
    }
    truncate_table_file(path_ / table_name);
}

void Database::alter_table(const std::string& table_name, const schema::RenameMap& rename)
{
    std::scoped_lock lock(mutex_);
    ensure_usable();
    schema_.alter_table(table_name, rename);
    persist_schema();

    if (const auto it = tables_.find(table_name); it != tables_.end()) {
        storage::TableLatchGuard guard{it->second->latch, storage::TableLatchMode::Exclusive};
        it->second->table.set_columns(schema_.columns(table_name));
    }
}

std::vector<std::string> Database::get_tables() const
{
    std::scoped_lock lock(mutex_);
    ensure_usable();
    return schema_.table_names();
}

void Database::drop_db()
{
    std::scoped_lock lock(mutex_);
    ensure_usable();
    if (name_ == config_.default_database) {
        throw_error(EngineErrc::CannotDropDefaultDb, "Cannot drop the default database " + name_);
    }

    for (auto& [table_name, handle] : tables_) {
        storage::TableLatchGuard guard{handle->latch, storage::TableLatchMode::Exclusive};
        handle->table.drop();
    }
    tables_.clear();

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        throw_io_error(ec, "cannot remove database directory " + path_.string());
    }
    dropped_ = true;
    emit_event(config_.event_logger, EventSeverity::Info, kComponent, "Dropped database " + name_);
}

void Database::flush()
{
    std::scoped_lock lock(mutex_);
    if (dropped_ || closed_) {
        return;
    }
    persist_schema();
}

void Database::close()
{
    std::scoped_lock lock(mutex_);
    if (dropped_ || closed_) {
        return;
    }
    persist_schema();
    tables_.clear();
    closed_ = true;
}

void Database::ensure_usable() const
{
    if (dropped_) {
        throw_error(EngineErrc::DatabaseNotFound, "Database " + name_ + " not found");
    }
    if (closed_) {
        throw_error(EngineErrc::InvalidOperation, "Database " + name_ + " is closed");
    }
}

void Database::persist_schema()
{
    schema_.dump(path_);
    emit_event(config_.event_logger, EventSeverity::Debug, kComponent, "Dumped schema of database " + name_);
}

}  // namespace hovel::engine
