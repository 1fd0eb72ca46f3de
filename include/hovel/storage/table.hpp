#pragma once

#include "hovel/common/events.hpp"
#include "hovel/schema/schema.hpp"
#include "hovel/storage/table_file.hpp"
#include "hovel/types/typed_value.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace hovel::storage {

// Ordered (left column, right column) equality pairs for a join.
using JoinOn = std::vector<std::pair<std::string, std::string>>;

using Rows = std::vector<types::ColumnSet>;

// Which restrictions apply when a ColumnSet is checked against the columns.
enum class TableMethod : std::uint8_t {
    Insert = 0,
    Update,
    Unrestricted
};

// File layout: [u32 next serial, little-endian] followed by rows of
// [u8 tombstone][value]..., values in Columns order. Rows are never rewritten
// in place except for their tombstone byte.
class Table final {
public:
    struct Config final {
        std::filesystem::path directory{};
        EventLogger event_logger{};
    };

    struct Stats final {
        std::uint64_t live_rows = 0U;
        std::uint64_t tombstoned_rows = 0U;
        std::uint64_t file_bytes = 0U;
        std::uint32_t next_serial = 0U;
    };

    Table(std::string name, schema::Columns columns, Config config);

    Table(const Table&) = delete;
    Table& operator=(const Table&) = delete;

    // Creates the backing file when missing and loads the serial counter.
    void open();

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const schema::Columns& columns() const noexcept { return columns_; }
    [[nodiscard]] std::filesystem::path path() const { return config_.directory / name_; }
    [[nodiscard]] std::uint32_t next_serial() const noexcept { return next_serial_; }
    [[nodiscard]] bool dropped() const noexcept { return dropped_; }

    // Picks up renamed columns after an alter; positions and types are unchanged.
    void set_columns(schema::Columns columns);

    types::ColumnSet insert(const types::ColumnSet& values);
    [[nodiscard]] Rows select(const std::vector<std::string>& columns, const types::ColumnSet& conditions) const;
    Rows update(const types::ColumnSet& set, const types::ColumnSet& conditions);
    Rows delete_rows(const types::ColumnSet& conditions);
    [[nodiscard]] Rows join(const Table& other,
                            const std::vector<std::string>& columns,
                            const types::ColumnSet& conditions,
                            const JoinOn& join_on) const;

    // Truncates the file; the handle rejects every later call with TableNotFound.
    void drop();

    [[nodiscard]] std::uint64_t live_row_count() const;
    [[nodiscard]] std::uint64_t tombstone_count() const;
    [[nodiscard]] Stats stats() const;

    // Coerces and validates `values` against the declared column types.
    [[nodiscard]] types::ColumnSet check_and_coerce(const types::ColumnSet& values, TableMethod method) const;

private:
    struct StoredRow final {
        std::uint64_t offset = 0U;
        bool live = true;
        types::ColumnSet values{};
    };

    template <typename Visitor>
    void scan(std::uint64_t end_offset, Visitor&& visitor) const;

    void ensure_usable() const;
    void check_projection(const std::vector<std::string>& columns) const;
    void write_serial(std::uint32_t value);
    void append_row(const types::ColumnSet& row);
    void tombstone(std::uint64_t offset);
    [[nodiscard]] std::uint64_t file_size();
    void flush();
    [[nodiscard]] Rows prefixed_rows() const;
    [[nodiscard]] bool matches(const types::ColumnSet& row, const types::ColumnSet& conditions) const;

    std::string name_{};
    schema::Columns columns_{};
    std::vector<bool> serial_flags_{};
    Config config_{};
    TableFile file_{};
    std::uint32_t next_serial_ = 0U;
    bool dropped_ = false;
};

}  // namespace hovel::storage
