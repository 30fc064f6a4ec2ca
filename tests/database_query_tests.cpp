#include "flatdb/engine/database.hpp"
#include "flatdb/engine/engine_errors.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

using flatdb::engine::Database;
using flatdb::engine::DatabaseOptions;
using flatdb::engine::EngineErrc;
using flatdb::engine::EngineError;
using flatdb::executor::ColumnList;
using flatdb::executor::ResultRow;

namespace {

struct TempDirectory final {
    TempDirectory()
        : path{std::filesystem::temp_directory_path()
               / ("flatdb_database_query_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()))}
    {
        std::filesystem::create_directories(path);
    }

    ~TempDirectory()
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path path;
};

void write_file(const std::filesystem::path& path, const std::string& contents)
{
    std::ofstream stream{path, std::ios::binary | std::ios::trunc};
    REQUIRE(stream.is_open());
    stream << contents;
}

std::string read_file(const std::filesystem::path& path)
{
    std::ifstream stream{path, std::ios::binary};
    REQUIRE(stream.is_open());
    return std::string{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
}

// Schema with one populated table: (12, sherlock, 1925-09-09) and (47, watson, 1931-10-31).
struct SchoolFixture final {
    explicit SchoolFixture(DatabaseOptions options = {})
    {
        write_file(temp.path / "school.dbd",
                   "TAB elementary\nKEY id\nCOL name\nCOL date\n**\n"
                   "TAB staff\nKEY staff_id\nCOL surname\n**\n");
        database.emplace(temp.path, "school", options);
        database->insert("elementary", {"12", "sherlock", "1925-09-09"});
        database->insert("elementary", {"47", "watson", "1931-10-31"});
    }

    [[nodiscard]] std::filesystem::path elementary_path() const
    {
        return database->table_file_path("elementary");
    }

    TempDirectory temp{};
    std::optional<Database> database{};
};

std::vector<std::string> column_values(const std::vector<ResultRow>& rows, const std::string& column)
{
    std::vector<std::string> values;
    values.reserve(rows.size());
    for (const auto& row : rows) {
        values.push_back(row.at(column));
    }
    return values;
}

}  // namespace

TEST_CASE("Select returns every column in file order by default")
{
    SchoolFixture fixture;

    const auto rows = fixture.database->select("elementary");

    REQUIRE(rows.size() == 2U);
    CHECK(rows[0].columns() == std::vector<std::string>{"id", "name", "date"});
    CHECK(rows[0].values() == std::vector<std::string>{"12", "sherlock", "1925-09-09"});
    CHECK(rows[1].values() == std::vector<std::string>{"47", "watson", "1931-10-31"});
}

TEST_CASE("Select filters with a regular expression and projects columns")
{
    SchoolFixture fixture;

    const auto rows = fixture.database->select("elementary", "id,name", "name=/s/");

    REQUIRE(rows.size() == 2U);
    CHECK(rows[0].columns() == std::vector<std::string>{"id", "name"});
    CHECK(rows[0].values() == std::vector<std::string>{"12", "sherlock"});
    CHECK(rows[1].values() == std::vector<std::string>{"47", "watson"});

    const auto anchored = fixture.database->select("elementary", "name", "name=/^wat/");
    REQUIRE(anchored.size() == 1U);
    CHECK(anchored[0].values() == std::vector<std::string>{"watson"});
}

TEST_CASE("Select matches a bare criteria value against the primary key")
{
    SchoolFixture fixture;

    const auto rows = fixture.database->select("elementary", "*", "47");
    REQUIRE(rows.size() == 1U);
    CHECK(rows[0].at("name") == "watson");

    CHECK(fixture.database->select("elementary", "*", "id=12.0").size() == 1U);
    CHECK(fixture.database->select("elementary", "*", "99").empty());
}

TEST_CASE("Select orders rows by a column")
{
    SchoolFixture fixture;

    const auto descending = fixture.database->select("elementary", {}, {}, "date desc");
    CHECK(column_values(descending, "name") == std::vector<std::string>{"watson", "sherlock"});

    const auto ascending = fixture.database->select("elementary", {}, {}, "name");
    CHECK(column_values(ascending, "name") == std::vector<std::string>{"sherlock", "watson"});
}

TEST_CASE("Select on an unknown criteria column returns no rows but an unknown projection throws")
{
    SchoolFixture fixture;

    CHECK(fixture.database->select("elementary", "*", "nickname=holmes").empty());

    try {
        (void)fixture.database->select("elementary", "id,nickname");
        FAIL("expected ColumnNotFound");
    } catch (const EngineError& error) {
        CHECK(error.errc() == EngineErrc::ColumnNotFound);
        CHECK(error.subjects() == std::vector<std::string>{"nickname"});
    }
}

TEST_CASE("Select leaves the table file untouched")
{
    SchoolFixture fixture;
    const auto before = read_file(fixture.elementary_path());

    const auto first = fixture.database->select("elementary", "*", "name=/o/", "date desc");
    const auto second = fixture.database->select("elementary", "*", "name=/o/", "date desc");

    CHECK(read_file(fixture.elementary_path()) == before);
    REQUIRE(first.size() == second.size());
    for (std::size_t index = 0U; index < first.size(); ++index) {
        CHECK(first[index].values() == second[index].values());
    }
}

TEST_CASE("Select on a table without a data file returns nothing")
{
    SchoolFixture fixture;

    CHECK(fixture.database->select("staff").empty());
    CHECK_FALSE(std::filesystem::exists(fixture.database->table_file_path("staff")));
}

TEST_CASE("Insert assigns the next key after the highest existing key")
{
    SchoolFixture fixture;

    const auto key = fixture.database->insert("elementary", "name,date", {"hudson", "1881-01-01"});
    CHECK(key == "48");

    const auto rows = fixture.database->select("elementary", "*", "48");
    REQUIRE(rows.size() == 1U);
    CHECK(rows[0].values() == std::vector<std::string>{"48", "hudson", "1881-01-01"});
}

TEST_CASE("Insert into an empty table starts keys at one")
{
    SchoolFixture fixture;

    CHECK(fixture.database->insert("staff", "surname", {"moriarty"}) == "1");
    CHECK(fixture.database->insert("staff", "surname", {"lestrade"}) == "2");
    CHECK(column_values(fixture.database->select("staff"), "staff_id") == std::vector<std::string>{"1", "2"});
}

TEST_CASE("Insert writes columns in schema order regardless of the column list order")
{
    SchoolFixture fixture;

    const auto key = fixture.database->insert("elementary", "date,id,name", {"1950-05-05", "60", "mycroft"});
    CHECK(key == "60");

    const auto rows = fixture.database->select("elementary", "*", "60");
    REQUIRE(rows.size() == 1U);
    CHECK(rows[0].values() == std::vector<std::string>{"60", "mycroft", "1950-05-05"});
}

TEST_CASE("Insert rejects duplicate keys")
{
    SchoolFixture fixture;
    const auto before = read_file(fixture.elementary_path());

    try {
        (void)fixture.database->insert("elementary", {"47", "lestrade", "1900-01-01"});
        FAIL("expected DuplicateKey");
    } catch (const EngineError& error) {
        CHECK(error.errc() == EngineErrc::DuplicateKey);
        CHECK(error.subjects() == std::vector<std::string>{"47"});
    }

    CHECK_THROWS_AS(fixture.database->insert("elementary", {"47.0", "lestrade", "1900-01-01"}), EngineError);
    CHECK(read_file(fixture.elementary_path()) == before);
}

TEST_CASE("Insert rejects value counts that differ from the column list")
{
    SchoolFixture fixture;

    try {
        (void)fixture.database->insert("elementary", "name,date", {"lestrade"});
        FAIL("expected ColumnListMismatch");
    } catch (const EngineError& error) {
        CHECK(error.errc() == EngineErrc::ColumnListMismatch);
    }

    CHECK_THROWS_AS(fixture.database->insert("elementary", {"1", "2"}), EngineError);
    CHECK(fixture.database->select("elementary").size() == 2U);
}

TEST_CASE("Insert names unknown columns in its column list")
{
    SchoolFixture fixture;
    const auto before = read_file(fixture.elementary_path());

    try {
        (void)fixture.database->insert("elementary", "nickname", {"x"});
        FAIL("expected ColumnNotFound");
    } catch (const EngineError& error) {
        CHECK(error.errc() == EngineErrc::ColumnNotFound);
        CHECK(error.subjects() == std::vector<std::string>{"nickname"});
    }
    CHECK(read_file(fixture.elementary_path()) == before);
}

TEST_CASE("Insert refuses to assign a key past the int64 maximum")
{
    SchoolFixture fixture;
    (void)fixture.database->insert("elementary", {"9223372036854775807", "last", ""});

    try {
        (void)fixture.database->insert("elementary", "name", {"overflow"});
        FAIL("expected AutoKeyOverflow");
    } catch (const EngineError& error) {
        CHECK(error.errc() == EngineErrc::AutoKeyOverflow);
    }
    CHECK(fixture.database->select("elementary").size() == 3U);
}

TEST_CASE("Insert into an unknown table fails with TableNotFound")
{
    SchoolFixture fixture;

    try {
        (void)fixture.database->insert("library", {"1"});
        FAIL("expected TableNotFound");
    } catch (const EngineError& error) {
        CHECK(error.errc() == EngineErrc::TableNotFound);
    }
    CHECK_FALSE(std::filesystem::exists(fixture.temp.path / "library.dtf"));
}

TEST_CASE("Update changes every row matched by a regular expression")
{
    SchoolFixture fixture;

    const auto updated = fixture.database->update("elementary", "date", {"2000-01-01"}, "name=/o/");
    CHECK(updated == 2U);
    CHECK(column_values(fixture.database->select("elementary"), "date")
          == std::vector<std::string>{"2000-01-01", "2000-01-01"});
}

TEST_CASE("Update by key changes one row")
{
    SchoolFixture fixture;

    CHECK(fixture.database->update("elementary", "name,date", {"john watson", "1932-01-01"}, "47") == 1U);

    const auto rows = fixture.database->select("elementary");
    CHECK(rows[0].values() == std::vector<std::string>{"12", "sherlock", "1925-09-09"});
    CHECK(rows[1].values() == std::vector<std::string>{"47", "john watson", "1932-01-01"});
}

TEST_CASE("Update without criteria targets every row")
{
    SchoolFixture fixture;

    CHECK(fixture.database->update("elementary", "name", {"anon"}) == 2U);
    CHECK(column_values(fixture.database->select("elementary"), "name") == std::vector<std::string>{"anon", "anon"});
}

TEST_CASE("Update with no matching rows leaves the file unchanged")
{
    SchoolFixture fixture;
    const auto before = read_file(fixture.elementary_path());
    const auto written = std::filesystem::last_write_time(fixture.elementary_path());

    CHECK(fixture.database->update("elementary", "name", {"nobody"}, "name=moriarty") == 0U);

    CHECK(read_file(fixture.elementary_path()) == before);
    CHECK(std::filesystem::last_write_time(fixture.elementary_path()) == written);
}

TEST_CASE("Update validates the column list")
{
    SchoolFixture fixture;

    CHECK_THROWS_AS(fixture.database->update("elementary", "name,date", {"x"}, "12"), EngineError);

    try {
        (void)fixture.database->update("elementary", "nickname", {"x"}, "12");
        FAIL("expected ColumnNotFound");
    } catch (const EngineError& error) {
        CHECK(error.errc() == EngineErrc::ColumnNotFound);
    }
}

TEST_CASE("Delete removes matched rows and keeps the rest in order")
{
    SchoolFixture fixture;
    (void)fixture.database->insert("elementary", "name,date", {"hudson", "1881-01-01"});

    CHECK(fixture.database->remove("elementary", "name=/^[sh]/") == 2U);

    const auto rows = fixture.database->select("elementary");
    REQUIRE(rows.size() == 1U);
    CHECK(rows[0].at("name") == "watson");
}

TEST_CASE("Delete without criteria empties the table")
{
    SchoolFixture fixture;

    CHECK(fixture.database->remove("elementary") == 2U);
    CHECK(fixture.database->select("elementary").empty());
    CHECK(read_file(fixture.elementary_path()).empty());

    CHECK(fixture.database->insert("elementary", "name", {"fresh"}) == "1");
}

TEST_CASE("Delete with no matches does not rewrite the file")
{
    SchoolFixture fixture;
    const auto before = read_file(fixture.elementary_path());

    CHECK(fixture.database->remove("elementary", "99") == 0U);
    CHECK(fixture.database->remove("staff") == 0U);

    CHECK(read_file(fixture.elementary_path()) == before);
    CHECK_FALSE(std::filesystem::exists(fixture.database->table_file_path("staff")));
}

TEST_CASE("Values with separators and multi-byte text survive a write and read")
{
    SchoolFixture fixture;

    const auto key = fixture.database->insert("elementary", "name,date", {"holmes, mycroft\nsenior", "\xE6\x97\xA5"});
    const auto rows = fixture.database->select("elementary", "name,date", key);

    REQUIRE(rows.size() == 1U);
    CHECK(rows[0].values() == std::vector<std::string>{"holmes, mycroft\nsenior", "\xE6\x97\xA5"});
}

TEST_CASE("Table file names can carry the database name")
{
    DatabaseOptions options{};
    options.prepend_database_name_to_table_filename = true;
    SchoolFixture fixture{options};

    CHECK(fixture.elementary_path() == fixture.temp.path / "school.elementary.dtf");
    CHECK(std::filesystem::exists(fixture.temp.path / "school.elementary.dtf"));
    CHECK_FALSE(std::filesystem::exists(fixture.temp.path / "elementary.dtf"));
    CHECK(fixture.database->select("elementary").size() == 2U);
}

TEST_CASE("Legacy delimiters are used for reading and writing")
{
    DatabaseOptions options{};
    options.legacy_delimiters = true;
    SchoolFixture fixture{options};

    const auto contents = read_file(fixture.elementary_path());
    CHECK(contents.find(static_cast<char>(200)) != std::string::npos);
    CHECK(contents.find('\x1F') == std::string::npos);
    CHECK(column_values(fixture.database->select("elementary"), "id") == std::vector<std::string>{"12", "47"});
}

TEST_CASE("Rows written by hand with short records read back padded")
{
    SchoolFixture fixture;
    write_file(fixture.elementary_path(), "5\x1E\n6\x1F" "moran\x1E\n");

    const auto rows = fixture.database->select("elementary");
    REQUIRE(rows.size() == 2U);
    CHECK(rows[0].values() == std::vector<std::string>{"5", "", ""});
    CHECK(rows[1].values() == std::vector<std::string>{"6", "moran", ""});

    CHECK(fixture.database->update("elementary", "date", {"1900-01-01"}, "5") == 1U);
    CHECK(fixture.database->select("elementary", "date", "5")[0].at("date") == "1900-01-01");
}
