#include "hovel/common/errors.hpp"
#include "hovel/common/events.hpp"
#include "hovel/storage/table.hpp"
#include "hovel/storage/table_file.hpp"
#include "hovel/storage/table_latch.hpp"

#include "temp_directory.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <algorithm>
#include <array>
#include <filesystem>
#include <set>
#include <string>
#include <system_error>
#include <vector>

using hovel::EngineErrc;
using hovel::schema::Column;
using hovel::storage::Table;
using hovel::types::ColumnSet;
using hovel::types::DataType;
using hovel::types::TypedValue;
using Catch::Matchers::ContainsSubstring;

namespace {

template <typename Fn>
std::error_code error_of(Fn&& fn)
{
    try {
        fn();
    } catch (const hovel::Error& error) {
        return error.code();
    }
    return {};
}

hovel::schema::Columns user_columns()
{
    return {Column{"age", DataType::Int},
            Column{"email", DataType::Email},
            Column{"id", DataType::Serial},
            Column{"name", DataType::String}};
}

ColumnSet user(const std::string& name, std::int64_t age)
{
    return {{"name", TypedValue::string(name)},
            {"email", TypedValue::string(name + "@example.com")},
            {"age", TypedValue::integer(age)}};
}

Table::Config table_config(const std::filesystem::path& dir, std::vector<hovel::EngineEvent>* events = nullptr)
{
    Table::Config config{};
    config.directory = dir;
    if (events != nullptr) {
        config.event_logger = [events](const hovel::EngineEvent& event) { events->push_back(event); };
    }
    return config;
}

}  // namespace

TEST_CASE("TableFile creates, appends and truncates", "[storage][file]")
{
    const hovel::test::TempDirectory scratch{"hovel_table_file_test_"};
    const auto& dir = scratch.path();
    hovel::storage::TableFile file;
    REQUIRE_FALSE(file.open(dir / "data"));
    CHECK(std::filesystem::exists(dir / "data"));

    const std::array<std::byte, 3> first{std::byte{1}, std::byte{2}, std::byte{3}};
    const std::array<std::byte, 2> second{std::byte{4}, std::byte{5}};
    std::uint64_t offset = 99U;
    REQUIRE_FALSE(file.append(first, offset));
    CHECK(offset == 0U);
    REQUIRE_FALSE(file.append(second, offset));
    CHECK(offset == 3U);

    const std::array<std::byte, 1> patch{std::byte{9}};
    REQUIRE_FALSE(file.write_at(1U, patch));
    REQUIRE_FALSE(file.flush());

    std::array<std::byte, 5> read_back{};
    REQUIRE_FALSE(file.read_at(0U, read_back));
    CHECK(read_back[1] == std::byte{9});
    CHECK(read_back[4] == std::byte{5});

    std::array<std::byte, 8> too_long{};
    CHECK(file.read_at(0U, too_long) == std::errc::io_error);

    REQUIRE_FALSE(file.truncate());
    CHECK_FALSE(file.is_open());
    CHECK(std::filesystem::file_size(dir / "data") == 0U);
}

TEST_CASE("acquire_in_order latches each key once in key order", "[storage][latch]")
{
    hovel::storage::TableLatch alpha;
    hovel::storage::TableLatch beta;

    {
        auto guards = hovel::storage::acquire_in_order({
            {"beta", &beta, hovel::storage::TableLatchMode::Exclusive},
            {"alpha", &alpha, hovel::storage::TableLatchMode::Shared},
        });
        REQUIRE(guards.size() == 2U);
        CHECK(guards[0].mode() == hovel::storage::TableLatchMode::Shared);
        CHECK(guards[1].mode() == hovel::storage::TableLatchMode::Exclusive);
    }

    {
        auto guards = hovel::storage::acquire_in_order({
            {"alpha", &alpha, hovel::storage::TableLatchMode::Shared},
            {"alpha", &alpha, hovel::storage::TableLatchMode::Exclusive},
        });
        REQUIRE(guards.size() == 1U);
        CHECK(guards[0].mode() == hovel::storage::TableLatchMode::Exclusive);
    }

    // Both latches were released by the guards above.
    hovel::storage::TableLatchGuard again{alpha, hovel::storage::TableLatchMode::Exclusive};
    hovel::storage::TableLatchGuard other{beta, hovel::storage::TableLatchMode::Exclusive};
    CHECK(again.mode() == hovel::storage::TableLatchMode::Exclusive);
}

TEST_CASE("Table open writes a zero serial counter to a new file", "[storage][table]")
{
    const hovel::test::TempDirectory scratch{"hovel_table_open_test_"};
    const auto& dir = scratch.path();
    Table table{"users", user_columns(), table_config(dir)};
    table.open();

    CHECK(table.next_serial() == 0U);
    CHECK(std::filesystem::file_size(dir / "users") == 4U);
    CHECK(table.live_row_count() == 0U);
}

TEST_CASE("Table insert assigns serials and coerces values", "[storage][table]")
{
    const hovel::test::TempDirectory scratch{"hovel_table_insert_test_"};
    const auto& dir = scratch.path();
    Table table{"users", user_columns(), table_config(dir)};
    table.open();

    const auto first = table.insert(user("ann", 30));
    const auto second = table.insert(user("bob", 41));

    CHECK(first.at("id") == TypedValue::serial(0U));
    CHECK(second.at("id") == TypedValue::serial(1U));
    CHECK(first.at("email") == TypedValue::email("ann@example.com"));
    CHECK(table.next_serial() == 2U);

    const auto rows = table.select({}, {});
    REQUIRE(rows.size() == 2U);
    CHECK(rows[0].at("name") == TypedValue::string("ann"));
    CHECK(rows[1].at("age") == TypedValue::integer(41));
}

TEST_CASE("Table insert rejects bad rows without touching the file", "[storage][table]")
{
    const hovel::test::TempDirectory scratch{"hovel_table_insert_errors_test_"};
    const auto& dir = scratch.path();
    Table table{"users", user_columns(), table_config(dir)};
    table.open();

    auto with_serial = user("ann", 30);
    with_serial.insert_or_assign("id", TypedValue::integer(5));
    CHECK(error_of([&] { (void)table.insert(with_serial); }) == EngineErrc::InvalidOperation);

    auto missing = user("ann", 30);
    missing.erase("age");
    CHECK(error_of([&] { (void)table.insert(missing); }) == EngineErrc::IncompleteData);

    auto unknown = user("ann", 30);
    unknown.insert_or_assign("nickname", TypedValue::string("a"));
    CHECK(error_of([&] { (void)table.insert(unknown); }) == EngineErrc::ColumnNotFound);

    auto bad_email = user("ann", 30);
    bad_email.insert_or_assign("email", TypedValue::string("nope"));
    CHECK(error_of([&] { (void)table.insert(bad_email); }) == EngineErrc::InvalidEmail);

    auto bad_age = user("ann", 30);
    bad_age.insert_or_assign("age", TypedValue::string("old"));
    CHECK(error_of([&] { (void)table.insert(bad_age); }) == EngineErrc::InvalidValue);

    CHECK(table.next_serial() == 0U);
    CHECK(table.live_row_count() == 0U);
}

TEST_CASE("Table insert refuses text that would not decode", "[storage][table][utf8]")
{
    const hovel::test::TempDirectory scratch{"hovel_table_utf8_test_"};
    Table table{"notes", {Column{"body", DataType::String}}, table_config(scratch.path())};
    table.open();
    (void)table.insert({{"body", TypedValue::string("ok")}});

    CHECK(error_of([&] { (void)table.insert({{"body", TypedValue::string("caf\xE9")}}); }) ==
          EngineErrc::InvalidValue);
    const auto widened = table.insert({{"body", TypedValue::character('\xE9')}});
    CHECK(widened.at("body") == TypedValue::string("\xC3\xA9"));

    const auto rows = table.select({}, {});
    REQUIRE(rows.size() == 2U);
    CHECK(rows[0].at("body") == TypedValue::string("ok"));
    CHECK(rows[1].at("body") == TypedValue::string("\xC3\xA9"));
    CHECK(table.delete_rows({}).size() == 2U);
}

TEST_CASE("Table select filters and projects", "[storage][table]")
{
    const hovel::test::TempDirectory scratch{"hovel_table_select_test_"};
    const auto& dir = scratch.path();
    Table table{"users", user_columns(), table_config(dir)};
    table.open();
    (void)table.insert(user("ann", 30));
    (void)table.insert(user("bob", 41));

    const auto rows = table.select({"name"}, {{"age", TypedValue::string("41")}});
    REQUIRE(rows.size() == 1U);
    CHECK(rows[0].size() == 1U);
    CHECK(rows[0].at("name") == TypedValue::string("bob"));

    const auto by_serial = table.select({"name"}, {{"id", TypedValue::integer(0)}});
    REQUIRE(by_serial.size() == 1U);
    CHECK(by_serial[0].at("name") == TypedValue::string("ann"));

    CHECK(table.select({}, {{"name", TypedValue::string("zed")}}).empty());
    CHECK(error_of([&] { (void)table.select({"nickname"}, {}); }) == EngineErrc::ColumnNotFound);
    CHECK(error_of([&] { (void)table.select({}, {{"nickname", TypedValue::string("x")}}); }) ==
          EngineErrc::ColumnNotFound);
}

TEST_CASE("Table update appends a new image and keeps the serial", "[storage][table]")
{
    const hovel::test::TempDirectory scratch{"hovel_table_update_test_"};
    const auto& dir = scratch.path();
    Table table{"users", user_columns(), table_config(dir)};
    table.open();
    (void)table.insert(user("ann", 30));
    (void)table.insert(user("bob", 41));

    const auto updated = table.update({{"age", TypedValue::integer(31)}}, {{"name", TypedValue::string("ann")}});
    REQUIRE(updated.size() == 1U);
    CHECK(updated[0].at("id") == TypedValue::serial(0U));
    CHECK(updated[0].at("age") == TypedValue::integer(31));

    const auto rows = table.select({"age", "id"}, {{"name", TypedValue::string("ann")}});
    REQUIRE(rows.size() == 1U);
    CHECK(rows[0].at("age") == TypedValue::integer(31));
    CHECK(rows[0].at("id") == TypedValue::serial(0U));

    CHECK(table.next_serial() == 2U);
    CHECK(table.live_row_count() == 2U);
    CHECK(table.tombstone_count() == 1U);

    SECTION("an update that changes nothing writes nothing")
    {
        const auto unchanged = table.update({{"age", TypedValue::integer(41)}}, {{"name", TypedValue::string("bob")}});
        CHECK(unchanged.empty());
        CHECK(table.tombstone_count() == 1U);
    }

    SECTION("serial columns cannot be set")
    {
        CHECK(error_of([&] { (void)table.update({{"id", TypedValue::integer(9)}}, {}); }) ==
              EngineErrc::InvalidOperation);
    }

    SECTION("updating every row visits each original row once")
    {
        const auto all = table.update({{"age", TypedValue::integer(50)}}, {});
        CHECK(all.size() == 2U);
        CHECK(table.live_row_count() == 2U);
        CHECK(table.tombstone_count() == 3U);
    }
}

TEST_CASE("Table delete tombstones matching rows", "[storage][table]")
{
    const hovel::test::TempDirectory scratch{"hovel_table_delete_test_"};
    const auto& dir = scratch.path();
    Table table{"users", user_columns(), table_config(dir)};
    table.open();
    (void)table.insert(user("ann", 30));
    (void)table.insert(user("bob", 41));
    (void)table.insert(user("cat", 30));

    const auto deleted = table.delete_rows({{"age", TypedValue::integer(30)}});
    CHECK(deleted.size() == 2U);

    const auto rows = table.select({"name"}, {});
    REQUIRE(rows.size() == 1U);
    CHECK(rows[0].at("name") == TypedValue::string("bob"));

    const auto stats = table.stats();
    CHECK(stats.live_rows == 1U);
    CHECK(stats.tombstoned_rows == 2U);
    CHECK(stats.next_serial == 3U);
    CHECK(stats.file_bytes == std::filesystem::file_size(dir / "users"));

    CHECK(table.delete_rows({}).size() == 1U);
    CHECK(table.live_row_count() == 0U);
}

TEST_CASE("Table update of a float column replaces the visible row", "[storage][table]")
{
    const hovel::test::TempDirectory scratch{"hovel_table_price_test_"};
    Table table{"products",
                {Column{"id", DataType::Int}, Column{"price", DataType::Float}},
                table_config(scratch.path())};
    table.open();
    (void)table.insert({{"id", TypedValue::integer(1)}, {"price", TypedValue::floating(1.23)}});

    const auto updated = table.update({{"price", TypedValue::floating(123.45)}}, {});
    REQUIRE(updated.size() == 1U);
    CHECK(updated[0].at("price") == TypedValue::floating(123.45));

    const auto rows = table.select({}, {});
    REQUIRE(rows.size() == 1U);
    CHECK(rows[0].at("price") == TypedValue::floating(123.45));

    (void)table.insert({{"id", TypedValue::integer(2)}, {"price", TypedValue::floating(18.18)}});
    const auto second = table.select({}, {{"id", TypedValue::integer(2)}});
    REQUIRE(second.size() == 1U);
    CHECK(second[0].at("price") == TypedValue::floating(18.18));
}

TEST_CASE("Table delete without matches changes nothing", "[storage][table]")
{
    const hovel::test::TempDirectory scratch{"hovel_table_noop_delete_test_"};
    Table table{"users", user_columns(), table_config(scratch.path())};
    table.open();
    (void)table.insert(user("ann", 30));
    (void)table.insert(user("bob", 41));

    const auto before = table.select({}, {});
    const auto bytes_before = table.stats().file_bytes;

    CHECK(table.delete_rows({{"name", TypedValue::string("zed")}}).empty());
    CHECK(table.stats().file_bytes == bytes_before);
    CHECK(table.tombstone_count() == 0U);
    CHECK(table.select({}, {}) == before);
}

TEST_CASE("Table contents and serial counter persist across handles", "[storage][table]")
{
    const hovel::test::TempDirectory scratch{"hovel_table_persist_test_"};
    const auto& dir = scratch.path();
    {
        Table table{"users", user_columns(), table_config(dir)};
        table.open();
        (void)table.insert(user("ann", 30));
        (void)table.insert(user("bob", 41));
        (void)table.delete_rows({{"name", TypedValue::string("bob")}});
    }

    Table reopened{"users", user_columns(), table_config(dir)};
    reopened.open();
    CHECK(reopened.next_serial() == 2U);
    CHECK(reopened.live_row_count() == 1U);

    const auto row = reopened.insert(user("cat", 22));
    CHECK(row.at("id") == TypedValue::serial(2U));
}

TEST_CASE("Table columns can be renamed without rewriting rows", "[storage][table]")
{
    const hovel::test::TempDirectory scratch{"hovel_table_rename_test_"};
    const auto& dir = scratch.path();
    Table table{"users", user_columns(), table_config(dir)};
    table.open();
    (void)table.insert(user("ann", 30));

    table.set_columns({Column{"years", DataType::Int},
                       Column{"email", DataType::Email},
                       Column{"id", DataType::Serial},
                       Column{"name", DataType::String}});

    const auto rows = table.select({"years"}, {});
    REQUIRE(rows.size() == 1U);
    CHECK(rows[0].at("years") == TypedValue::integer(30));
    CHECK(error_of([&] { (void)table.select({"age"}, {}); }) == EngineErrc::ColumnNotFound);
}

TEST_CASE("Table drop truncates the file and retires the handle", "[storage][table]")
{
    const hovel::test::TempDirectory scratch{"hovel_table_drop_test_"};
    const auto& dir = scratch.path();
    Table table{"users", user_columns(), table_config(dir)};
    table.open();
    (void)table.insert(user("ann", 30));

    table.drop();
    CHECK(table.dropped());
    CHECK(std::filesystem::file_size(dir / "users") == 0U);
    CHECK(error_of([&] { (void)table.select({}, {}); }) == EngineErrc::TableNotFound);
    CHECK(error_of([&] { (void)table.insert(user("bob", 1)); }) == EngineErrc::TableNotFound);
}

TEST_CASE("Table join merges matching rows under prefixed names", "[storage][table][join]")
{
    const hovel::test::TempDirectory scratch{"hovel_table_join_test_"};
    const auto& dir = scratch.path();
    Table users{"users", {Column{"id", DataType::Int}, Column{"name", DataType::String}}, table_config(dir)};
    Table orders{"orders",
                 {Column{"id", DataType::Int}, Column{"item", DataType::String}, Column{"user_id", DataType::Int}},
                 table_config(dir)};
    users.open();
    orders.open();

    (void)users.insert({{"id", TypedValue::integer(1)}, {"name", TypedValue::string("ann")}});
    (void)users.insert({{"id", TypedValue::integer(2)}, {"name", TypedValue::string("bob")}});
    (void)orders.insert({{"id", TypedValue::integer(10)},
                         {"item", TypedValue::string("book")},
                         {"user_id", TypedValue::integer(1)}});
    (void)orders.insert({{"id", TypedValue::integer(11)},
                         {"item", TypedValue::string("pen")},
                         {"user_id", TypedValue::integer(3)}});

    const hovel::storage::JoinOn on{{"users.id", "orders.user_id"}};

    const auto joined = users.join(orders, {}, {}, on);
    REQUIRE(joined.size() == 1U);
    CHECK(joined[0].at("users.name") == TypedValue::string("ann"));
    CHECK(joined[0].at("orders.item") == TypedValue::string("book"));
    CHECK(joined[0].at("orders.id") == TypedValue::integer(10));

    const auto projected = users.join(orders, {"users.name", "orders.item"}, {}, on);
    REQUIRE(projected.size() == 1U);
    CHECK(projected[0].size() == 2U);

    CHECK(users.join(orders, {}, {{"users.name", TypedValue::string("bob")}}, on).empty());
    CHECK(users.join(orders, {}, {{"orders.item", TypedValue::string("book")}}, on).size() == 1U);

    CHECK(error_of([&] { (void)users.join(orders, {"orders.colour"}, {}, on); }) == EngineErrc::ColumnNotFound);
    CHECK(error_of([&] { (void)users.join(orders, {}, {{"orders.colour", TypedValue::string("red")}}, on); }) ==
          EngineErrc::ColumnNotFound);
}

TEST_CASE("Table join treats incomparable keys as non-matches and warns once", "[storage][table][join]")
{
    const hovel::test::TempDirectory scratch{"hovel_table_join_warn_test_"};
    const auto& dir = scratch.path();
    std::vector<hovel::EngineEvent> events;
    Table users{"users", {Column{"id", DataType::Int}, Column{"name", DataType::String}}, table_config(dir, &events)};
    Table tags{"tags", {Column{"label", DataType::String}}, table_config(dir, &events)};
    users.open();
    tags.open();

    (void)users.insert({{"id", TypedValue::integer(1)}, {"name", TypedValue::string("ann")}});
    (void)tags.insert({{"label", TypedValue::string("1")}});
    (void)tags.insert({{"label", TypedValue::string("2")}});
    events.clear();

    const auto joined = users.join(tags, {}, {}, {{"users.id", "tags.label"}});
    CHECK(joined.empty());

    const auto warnings = std::count_if(events.begin(), events.end(), [](const hovel::EngineEvent& event) {
        return event.severity == hovel::EventSeverity::Warning;
    });
    REQUIRE(warnings == 1);
    CHECK_THAT(events.back().message, ContainsSubstring("2 key comparisons"));
}

TEST_CASE("Table self-join pairs each row with its own image", "[storage][table][join]")
{
    const hovel::test::TempDirectory scratch{"hovel_table_self_join_test_"};
    const auto& dir = scratch.path();
    Table nodes{"nodes", {Column{"id", DataType::Int}}, table_config(dir)};
    nodes.open();
    (void)nodes.insert({{"id", TypedValue::integer(1)}});
    (void)nodes.insert({{"id", TypedValue::integer(2)}});

    const auto joined = nodes.join(nodes, {}, {}, {{"nodes.id", "nodes.id"}});
    CHECK(joined.size() == 2U);
}
