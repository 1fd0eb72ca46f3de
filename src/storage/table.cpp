#include "hovel/storage/table.hpp"

#include "hovel/common/errors.hpp"
#include "hovel/types/value_codec.hpp"

#include <algorithm>
#include <array>
#include <compare>
#include <fstream>
#include <limits>
#include <set>
#include <utility>

namespace hovel::storage {

namespace {

constexpr std::uint64_t kSerialHeaderSize = 4U;
constexpr std::byte kLiveFlag{0};
constexpr std::byte kTombstoneFlag{1};
constexpr std::string_view kComponent = "table";

[[nodiscard]] std::string prefixed(const std::string& table, const std::string& column)
{
    return table + "." + column;
}

// Smallest key first so the reported column does not depend on hash order.
[[nodiscard]] std::string first_key(const types::ColumnSet& values)
{
    std::string result;
    for (const auto& entry : values) {
        if (result.empty() || entry.first < result) {
            result = entry.first;
        }
    }
    return result;
}

[[nodiscard]] types::ColumnSet project(const types::ColumnSet& row, const std::vector<std::string>& columns)
{
    if (columns.empty()) {
        return row;
    }
    types::ColumnSet projected;
    for (const auto& column : columns) {
        if (const auto it = row.find(column); it != row.end()) {
            projected.insert_or_assign(column, it->second);
        }
    }
    return projected;
}

}  // namespace

template <typename Visitor>
void Table::scan(std::uint64_t end_offset, Visitor&& visitor) const
{
    std::ifstream stream(path(), std::ios::binary);
    if (!stream) {
        throw_io_error(std::make_error_code(std::errc::io_error), "cannot read table file " + path().string());
    }
    stream.seekg(static_cast<std::streamoff>(kSerialHeaderSize));

    std::uint64_t offset = kSerialHeaderSize;
    while (offset < end_offset) {
        char flag = 0;
        if (!stream.get(flag)) {
            if (stream.eof()) {
                break;
            }
            throw_io_error(std::make_error_code(std::errc::io_error), "cannot read row of table " + name_);
        }

        StoredRow row{};
        row.offset = offset;
        row.live = static_cast<std::byte>(flag) == kLiveFlag;
        std::uint64_t length = 1U;
        for (const auto& column : columns_) {
            types::TypedValue value;
            if (auto ec = types::decode_value(column.type, stream, value); ec) {
                throw_io_error(ec, "corrupt row at offset " + std::to_string(offset) + " of table " + name_);
            }
            length += types::encoded_size(value);
            row.values.insert_or_assign(column.name, std::move(value));
        }

        offset += length;
        visitor(row);
    }
}

Table::Table(std::string name, schema::Columns columns, Config config)
    : name_{std::move(name)}
    , config_{std::move(config)}
{
    set_columns(std::move(columns));
}

void Table::open()
{
    if (auto ec = file_.open(path()); ec) {
        throw_io_error(ec, "cannot open table file " + path().string());
    }

    const auto size = file_size();
    if (size == 0U) {
        write_serial(0U);
        flush();
        next_serial_ = 0U;
    } else {
        std::array<std::byte, kSerialHeaderSize> header{};
        if (auto ec = file_.read_at(0U, header); ec) {
            throw_io_error(ec, "cannot read serial counter of table " + name_);
        }
        next_serial_ = types::read_u32_le(header.data());
    }

    emit_event(config_.event_logger, EventSeverity::Info, kComponent,
               "Opened table " + name_ + " (next serial " + std::to_string(next_serial_) + ")");
}

void Table::set_columns(schema::Columns columns)
{
    columns_ = std::move(columns);
    serial_flags_.clear();
    serial_flags_.reserve(columns_.size());
    for (const auto& column : columns_) {
        serial_flags_.push_back(column.type == types::DataType::Serial);
    }
}

types::ColumnSet Table::check_and_coerce(const types::ColumnSet& values, TableMethod method) const
{
    auto pending = values;
    types::ColumnSet coerced;
    for (std::size_t index = 0U; index < columns_.size(); ++index) {
        const auto& column = columns_[index];
        const auto it = pending.find(column.name);
        if (it == pending.end()) {
            continue;
        }
        if (serial_flags_[index] && method != TableMethod::Unrestricted) {
            throw_error(EngineErrc::InvalidOperation,
                        "Column " + column.name + " of table " + name_ + " is a serial and cannot be written");
        }

        auto value = types::coerce(it->second, column.type);
        types::validate(value);
        coerced.insert_or_assign(column.name, std::move(value));
        pending.erase(it);
    }

    if (!pending.empty()) {
        throw_error(EngineErrc::ColumnNotFound, "Column " + first_key(pending) + " not found in table " + name_);
    }
    return coerced;
}

types::ColumnSet Table::insert(const types::ColumnSet& values)
{
    ensure_usable();
    auto row = check_and_coerce(values, TableMethod::Insert);

    for (std::size_t index = 0U; index < columns_.size(); ++index) {
        const auto& column = columns_[index];
        if (serial_flags_[index]) {
            row.insert_or_assign(column.name, types::TypedValue::serial(next_serial_));
        } else if (!row.contains(column.name)) {
            throw_error(EngineErrc::IncompleteData,
                        "Incomplete data: column " + column.name + " of table " + name_ + " has no value");
        }
    }

    // The counter reaches disk before the row so a crash can only skip a serial.
    write_serial(next_serial_ + 1U);
    ++next_serial_;
    append_row(row);
    flush();
    return row;
}

Rows Table::select(const std::vector<std::string>& columns, const types::ColumnSet& conditions) const
{
    ensure_usable();
    const auto coerced = check_and_coerce(conditions, TableMethod::Unrestricted);
    check_projection(columns);

    Rows rows;
    scan(std::numeric_limits<std::uint64_t>::max(), [&](StoredRow& row) {
        if (row.live && matches(row.values, coerced)) {
            rows.push_back(project(row.values, columns));
        }
    });
    return rows;
}

Rows Table::update(const types::ColumnSet& set, const types::ColumnSet& conditions)
{
    ensure_usable();
    const auto changes = check_and_coerce(set, TableMethod::Update);
    const auto coerced = check_and_coerce(conditions, TableMethod::Unrestricted);

    // Rows appended by this call start at `end` and are never revisited.
    const auto end = file_size();
    Rows updated;
    scan(end, [&](StoredRow& row) {
        if (!row.live || !matches(row.values, coerced)) {
            return;
        }

        auto image = row.values;
        bool changed = false;
        for (const auto& [column, value] : changes) {
            auto& slot = image[column];
            if (!(slot == value)) {
                slot = value;
                changed = true;
            }
        }
        if (!changed) {
            return;
        }

        append_row(image);
        tombstone(row.offset);
        updated.push_back(std::move(image));
    });
    flush();
    return updated;
}

Rows Table::delete_rows(const types::ColumnSet& conditions)
{
    ensure_usable();
    const auto coerced = check_and_coerce(conditions, TableMethod::Unrestricted);

    Rows deleted;
    scan(file_size(), [&](StoredRow& row) {
        if (row.live && matches(row.values, coerced)) {
            tombstone(row.offset);
            deleted.push_back(std::move(row.values));
        }
    });
    flush();
    return deleted;
}

Rows Table::join(const Table& other,
                 const std::vector<std::string>& columns,
                 const types::ColumnSet& conditions,
                 const JoinOn& join_on) const
{
    ensure_usable();
    other.ensure_usable();

    std::set<std::string> known;
    for (const auto& column : columns_) {
        known.insert(prefixed(name_, column.name));
    }
    for (const auto& column : other.columns_) {
        known.insert(prefixed(other.name_, column.name));
    }
    for (const auto& column : columns) {
        if (!known.contains(column)) {
            throw_error(EngineErrc::ColumnNotFound, "Column " + column + " not found in join of " + name_ +
                                                        " and " + other.name_);
        }
    }

    const auto left_rows = prefixed_rows();
    const auto right_rows = other.prefixed_rows();

    std::size_t anomalies = 0U;
    const auto equal_on_keys = [&](const types::ColumnSet& left, const types::ColumnSet& right) {
        for (const auto& [left_key, right_key] : join_on) {
            const auto lhs = left.find(left_key);
            const auto rhs = right.find(right_key);
            if (lhs == left.end() || rhs == right.end()) {
                ++anomalies;
                return false;
            }
            const auto order = types::compare_values(lhs->second, rhs->second);
            if (order == std::partial_ordering::unordered) {
                ++anomalies;
                return false;
            }
            if (order != std::partial_ordering::equivalent) {
                return false;
            }
        }
        return true;
    };

    Rows joined;
    for (const auto& left : left_rows) {
        auto merged = left;
        bool matched = false;
        for (const auto& right : right_rows) {
            if (!equal_on_keys(left, right)) {
                continue;
            }
            matched = true;
            for (const auto& [key, value] : right) {
                merged.insert_or_assign(key, value);
            }
        }
        if (!matched) {
            continue;
        }

        bool keep = true;
        for (const auto& [field, expected] : conditions) {
            const auto it = merged.find(field);
            if (it == merged.end()) {
                throw_error(EngineErrc::ColumnNotFound, "Column " + field + " not found in join of " + name_ +
                                                            " and " + other.name_);
            }
            if (!(it->second == types::coerce(expected, it->second.type()))) {
                keep = false;
                break;
            }
        }
        if (keep) {
            joined.push_back(project(merged, columns));
        }
    }

    if (anomalies > 0U) {
        emit_event(config_.event_logger, EventSeverity::Warning, kComponent,
                   "Join of " + name_ + " and " + other.name_ + ": " + std::to_string(anomalies) +
                       " key comparisons had a missing or incomparable operand and were treated as less");
    }
    return joined;
}

void Table::drop()
{
    if (dropped_) {
        return;
    }
    dropped_ = true;
    if (auto ec = file_.truncate(); ec) {
        throw_io_error(ec, "cannot truncate table file " + path().string());
    }
    emit_event(config_.event_logger, EventSeverity::Info, kComponent, "Dropped table " + name_);
}

std::uint64_t Table::live_row_count() const
{
    return stats().live_rows;
}

std::uint64_t Table::tombstone_count() const
{
    return stats().tombstoned_rows;
}

Table::Stats Table::stats() const
{
    ensure_usable();
    Stats stats{};
    stats.next_serial = next_serial_;
    scan(std::numeric_limits<std::uint64_t>::max(), [&](StoredRow& row) {
        if (row.live) {
            ++stats.live_rows;
        } else {
            ++stats.tombstoned_rows;
        }
    });

    std::error_code ec;
    const auto bytes = std::filesystem::file_size(path(), ec);
    if (ec) {
        throw_io_error(ec, "cannot stat table file " + path().string());
    }
    stats.file_bytes = bytes;
    return stats;
}

void Table::ensure_usable() const
{
    if (dropped_) {
        throw_error(EngineErrc::TableNotFound, "Table " + name_ + " not found");
    }
    if (!file_.is_open()) {
        throw_error(EngineErrc::InvalidOperation, "Table " + name_ + " is not open");
    }
}

void Table::check_projection(const std::vector<std::string>& columns) const
{
    for (const auto& requested : columns) {
        const auto found = std::any_of(columns_.begin(), columns_.end(), [&requested](const schema::Column& column) {
            return column.name == requested;
        });
        if (!found) {
            throw_error(EngineErrc::ColumnNotFound, "Column " + requested + " not found in table " + name_);
        }
    }
}

void Table::write_serial(std::uint32_t value)
{
    std::array<std::byte, kSerialHeaderSize> header{};
    types::write_u32_le(value, header.data());
    if (auto ec = file_.write_at(0U, header); ec) {
        throw_io_error(ec, "cannot write serial counter of table " + name_);
    }
}

void Table::append_row(const types::ColumnSet& row)
{
    std::vector<std::byte> bytes{kLiveFlag};
    for (const auto& column : columns_) {
        const auto it = row.find(column.name);
        if (it == row.end()) {
            throw_error(EngineErrc::IncompleteData,
                        "Incomplete data: column " + column.name + " of table " + name_ + " has no value");
        }
        types::encode_value(it->second, bytes);
    }

    std::uint64_t offset = 0U;
    if (auto ec = file_.append(bytes, offset); ec) {
        throw_io_error(ec, "cannot append row to table " + name_);
    }
}

void Table::tombstone(std::uint64_t offset)
{
    const std::array<std::byte, 1> flag{kTombstoneFlag};
    if (auto ec = file_.write_at(offset, flag); ec) {
        throw_io_error(ec, "cannot tombstone row at offset " + std::to_string(offset) + " of table " + name_);
    }
}

std::uint64_t Table::file_size()
{
    std::uint64_t size = 0U;
    if (auto ec = file_.size(size); ec) {
        throw_io_error(ec, "cannot size table file " + path().string());
    }
    return size;
}

void Table::flush()
{
    if (auto ec = file_.flush(); ec) {
        throw_io_error(ec, "cannot flush table file " + path().string());
    }
}

Rows Table::prefixed_rows() const
{
    Rows rows;
    scan(std::numeric_limits<std::uint64_t>::max(), [&](StoredRow& row) {
        if (!row.live) {
            return;
        }
        types::ColumnSet renamed;
        for (auto& [column, value] : row.values) {
            renamed.insert_or_assign(prefixed(name_, column), std::move(value));
        }
        rows.push_back(std::move(renamed));
    });
    return rows;
}

bool Table::matches(const types::ColumnSet& row, const types::ColumnSet& conditions) const
{
    for (const auto& [column, expected] : conditions) {
        const auto it = row.find(column);
        if (it == row.end()) {
            throw_error(EngineErrc::ColumnNotFound, "Column " + column + " not found in table " + name_);
        }
        if (!(it->second == expected)) {
            return false;
        }
    }
    return true;
}

}  // namespace hovel::storage
