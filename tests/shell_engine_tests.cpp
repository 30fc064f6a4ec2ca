#include "flatdb/engine/database.hpp"
#include "flatdb/shell/shell_engine.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

using flatdb::engine::Database;
using flatdb::shell::CommandMetrics;
using flatdb::shell::ShellEngine;
using Catch::Matchers::ContainsSubstring;

namespace {

std::filesystem::path make_unique_shell_path()
{
    const auto base = std::filesystem::temp_directory_path();
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    return base / ("flatdb_shell_engine_" + std::to_string(stamp));
}

struct ShellHarness final {
    ShellHarness()
        : path{make_unique_shell_path()}
    {
        std::filesystem::create_directories(path);
        std::ofstream stream{path / "school.dbd", std::ios::binary | std::ios::trunc};
        REQUIRE(stream.is_open());
        stream << "TAB elementary\nKEY id\nCOL name\nCOL date\n**\nTAB staff\nKEY staff_id\nCOL surname\n";
        stream.close();

        database.emplace(path, "school");
        engine.emplace(ShellEngine::Config{&*database});
    }

    ~ShellHarness()
    {
        engine.reset();
        database.reset();
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    CommandMetrics run(const std::string& command)
    {
        return engine->execute(command);
    }

    std::filesystem::path path;
    std::optional<Database> database{};
    std::optional<ShellEngine> engine{};
};

bool has_line_containing(const std::vector<std::string>& lines, const std::string& needle)
{
    return std::any_of(lines.begin(), lines.end(), [&](const std::string& line) {
        return line.find(needle) != std::string::npos;
    });
}

}  // namespace

TEST_CASE("ShellEngine requires a database")
{
    CHECK_THROWS_AS(ShellEngine{ShellEngine::Config{}}, std::invalid_argument);
}

TEST_CASE("ShellEngine runs statements against the database")
{
    ShellHarness harness;

    auto insert = harness.run("INSERT INTO elementary VALUES (12, 'sherlock', '1925-09-09');");
    REQUIRE(insert.success);
    CHECK(insert.rows_touched == 1U);
    CHECK(insert.summary == "Inserted 1 row into elementary with key 12");

    auto autokey = harness.run("INSERT INTO elementary (name, date) VALUES ('watson', '1931-10-31');");
    REQUIRE(autokey.success);
    CHECK_THAT(autokey.summary, ContainsSubstring("with key 13"));

    auto select = harness.run("SELECT id, name FROM elementary WHERE name=/s/ ORDER BY id DESC");
    REQUIRE(select.success);
    CHECK(select.rows_touched == 2U);
    CHECK(select.summary == "Selected 2 rows from elementary");
    REQUIRE(select.detail_lines.size() == 4U);
    CHECK_THAT(select.detail_lines[0], ContainsSubstring("id"));
    CHECK_THAT(select.detail_lines[2], ContainsSubstring("watson"));
    CHECK_THAT(select.detail_lines[3], ContainsSubstring("sherlock"));

    auto update = harness.run("UPDATE elementary SET date = '2000-01-01' WHERE 13");
    REQUIRE(update.success);
    CHECK(update.summary == "Updated 1 row in elementary");

    auto remove = harness.run("DELETE FROM elementary WHERE name='sherlock';");
    REQUIRE(remove.success);
    CHECK(remove.rows_touched == 1U);

    const auto rows = harness.database->select("elementary");
    REQUIRE(rows.size() == 1U);
    CHECK(rows[0].values() == std::vector<std::string>{"13", "watson", "2000-01-01"});
}

TEST_CASE("ShellEngine renders empty selections with headers")
{
    ShellHarness harness;

    auto select = harness.run("SELECT * FROM staff");
    REQUIRE(select.success);
    CHECK(select.summary == "Selected 0 rows from staff");
    REQUIRE(select.detail_lines.size() == 3U);
    CHECK_THAT(select.detail_lines[0], ContainsSubstring("staff_id"));
    CHECK(select.detail_lines[2] == "(no rows)");
}

TEST_CASE("ShellEngine reports engine errors with remediation hints")
{
    ShellHarness harness;
    REQUIRE(harness.run("INSERT INTO elementary VALUES (12, 'sherlock', '')").success);

    auto duplicate = harness.run("INSERT INTO elementary VALUES (12, 'mycroft', '')");
    REQUIRE_FALSE(duplicate.success);
    REQUIRE(duplicate.diagnostics.size() == 1U);
    CHECK_THAT(duplicate.diagnostics.front().message, ContainsSubstring("not unique"));
    CHECK_FALSE(duplicate.diagnostics.front().remediation_hints.empty());

    auto missing = harness.run("SELECT * FROM library");
    REQUIRE_FALSE(missing.success);
    REQUIRE(missing.diagnostics.size() == 1U);
    CHECK(has_line_containing(missing.diagnostics.front().remediation_hints, "\\tables"));

    auto column = harness.run("SELECT nickname FROM elementary");
    REQUIRE_FALSE(column.success);
    CHECK_THAT(column.summary, ContainsSubstring("nickname"));
}

TEST_CASE("ShellEngine reports parse failures and unknown commands")
{
    ShellHarness harness;

    auto malformed = harness.run("SELECT FROM elementary");
    REQUIRE_FALSE(malformed.success);
    CHECK(malformed.summary == "Could not parse statement.");
    CHECK_FALSE(malformed.diagnostics.empty());
    CHECK(malformed.command_category == "statement");

    auto unknown = harness.run("DROP TABLE elementary");
    REQUIRE_FALSE(unknown.success);
    CHECK_THAT(unknown.summary, ContainsSubstring("'DROP'"));
    CHECK(unknown.command_category == "unknown");

    auto empty = harness.run("   ");
    CHECK(empty.success);
    CHECK(empty.command_category == "empty");
}

TEST_CASE("ShellEngine meta commands describe the schema")
{
    ShellHarness harness;

    auto tables = harness.run("\\tables");
    REQUIRE(tables.success);
    CHECK(tables.summary == "Listed 2 tables");
    CHECK(has_line_containing(tables.detail_lines, "elementary"));
    CHECK(has_line_containing(tables.detail_lines, "staff_id"));

    auto schema = harness.run("\\schema elementary");
    REQUIRE(schema.success);
    CHECK(schema.summary == "Listed 3 columns of elementary");
    CHECK(has_line_containing(schema.detail_lines, "date"));

    auto key = harness.run("\\key staff");
    REQUIRE(key.success);
    CHECK(key.summary == "Primary key of staff is staff_id");

    auto bare = harness.run("\\schema");
    REQUIRE_FALSE(bare.success);
    CHECK(bare.summary == "Missing table name.");

    auto unknown_table = harness.run("\\key library");
    REQUIRE_FALSE(unknown_table.success);

    auto help = harness.run("\\help");
    REQUIRE(help.success);
    CHECK(has_line_containing(help.detail_lines, "SELECT"));

    auto unsupported = harness.run("\\vacuum");
    REQUIRE_FALSE(unsupported.success);
    CHECK(unsupported.command_category == "meta");
}

TEST_CASE("ShellEngine stamps each command with metadata")
{
    ShellHarness harness;

    auto first = harness.run("  \\tables  ");
    auto second = harness.run("SELECT * FROM elementary");

    CHECK(first.command_text == "\\tables");
    CHECK(first.correlation_id == "cmd-1");
    CHECK(second.correlation_id == "cmd-2");
    CHECK(second.command_category == "statement");
    CHECK(first.duration_ms >= 0.0);
    CHECK(first.finished_at >= first.started_at);
}
