#include "flatdb/storage/record_codec.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

using flatdb::storage::Delimiters;
using flatdb::storage::RecordCodec;
using flatdb::storage::RecordSet;
using flatdb::storage::decode_records;
using flatdb::storage::encode_records;

namespace {

struct TempDirectory final {
    TempDirectory()
        : path{std::filesystem::temp_directory_path()
               / ("flatdb_record_codec_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()))}
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

std::string read_file(const std::filesystem::path& path)
{
    std::ifstream stream{path, std::ios::binary};
    REQUIRE(stream.is_open());
    return std::string{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
}

void write_file(const std::filesystem::path& path, const std::string& contents)
{
    std::ofstream stream{path, std::ios::binary | std::ios::trunc};
    REQUIRE(stream.is_open());
    stream << contents;
}

RecordCodec make_codec(const std::filesystem::path& directory, bool prepend = false)
{
    RecordCodec::Config config{};
    config.data_directory = directory;
    config.database_name = "school";
    config.prepend_database_name = prepend;
    return RecordCodec{config};
}

}  // namespace

TEST_CASE("Record encoding uses unit and record separators")
{
    const RecordSet records{{"12", "sherlock", "1925-09-09"}, {"47", "watson", "1931-10-31"}};

    const auto encoded = encode_records(records, Delimiters::standard());
    CHECK(encoded == "12\x1Fsherlock\x1F" "1925-09-09\x1E\n47\x1Fwatson\x1F" "1931-10-31\x1E\n");
}

TEST_CASE("Record decoding discards the segment after the last row terminator")
{
    const auto records = decode_records("1\x1F" "a\x1E\n2\x1F" "b\x1E\ntrailing garbage", Delimiters::standard());

    REQUIRE(records.size() == 2U);
    CHECK(records[0] == flatdb::storage::Record{"1", "a"});
    CHECK(records[1] == flatdb::storage::Record{"2", "b"});
}

TEST_CASE("Record decoding strips leading whitespace from each row")
{
    const auto records = decode_records("  1\x1F a \x1E\n\n\t2\x1F" "b\x1E\n", Delimiters::standard());

    REQUIRE(records.size() == 2U);
    CHECK(records[0] == flatdb::storage::Record{"1", " a "});
    CHECK(records[1] == flatdb::storage::Record{"2", "b"});
}

TEST_CASE("Record decoding keeps ragged rows as stored")
{
    const auto records = decode_records("1\x1E\n2\x1F" "b\x1F" "c\x1F" "d\x1E\n", Delimiters::standard());

    REQUIRE(records.size() == 2U);
    CHECK(records[0].size() == 1U);
    CHECK(records[1].size() == 4U);
}

TEST_CASE("Record encoding round-trips embedded commas, line feeds and multi-byte text")
{
    const RecordSet records{{"1", "a, b", "line\nbreak"}, {"2", "\xC3\xA9t\xC3\xA9", "\xE6\x97\xA5\xE6\x9C\xAC"}, {"3", "", ""}};

    const auto encoded = encode_records(records, Delimiters::standard());
    CHECK(decode_records(encoded, Delimiters::standard()) == records);
}

TEST_CASE("Record encoding drops escapes in front of delimiter bytes")
{
    const RecordSet records{{"1", "a\\\x1F" "b", "c\\d"}};

    const auto encoded = encode_records(records, Delimiters::standard());
    CHECK(encoded == "1\x1F" "a\x1F" "b\x1F" "c\\d\x1E\n");
}

TEST_CASE("Legacy delimiters use the 200 and 201 byte pair")
{
    const RecordSet records{{"1", "x"}};

    const auto encoded = encode_records(records, Delimiters::legacy());
    CHECK(encoded == std::string{"1"} + static_cast<char>(200) + "x" + static_cast<char>(201) + "\n");
    CHECK(decode_records(encoded, Delimiters::legacy()) == records);
    CHECK(decode_records(encoded, Delimiters::standard()).empty());
}

TEST_CASE("RecordCodec resolves table file names")
{
    TempDirectory temp;

    CHECK(make_codec(temp.path).table_path("elementary") == temp.path / "elementary.dtf");
    CHECK(make_codec(temp.path, true).table_path("elementary") == temp.path / "school.elementary.dtf");
}

TEST_CASE("RecordCodec treats absent and blank files as empty tables")
{
    TempDirectory temp;
    const auto codec = make_codec(temp.path);

    CHECK(codec.table_empty("elementary"));
    CHECK(codec.decode("elementary").empty());

    write_file(temp.path / "elementary.dtf", " \n\t");
    CHECK(codec.table_empty("elementary"));

    write_file(temp.path / "elementary.dtf", "1\x1E\n");
    CHECK_FALSE(codec.table_empty("elementary"));
}

TEST_CASE("RecordCodec rewrites the whole table file")
{
    TempDirectory temp;
    const auto codec = make_codec(temp.path);

    codec.encode("elementary", RecordSet{{"1", "a"}, {"2", "b"}, {"3", "c"}});
    codec.encode("elementary", RecordSet{{"2", "b"}});

    CHECK(read_file(temp.path / "elementary.dtf") == "2\x1F" "b\x1E\n");
    CHECK(codec.decode("elementary") == RecordSet{{"2", "b"}});

    codec.encode("elementary", RecordSet{});
    CHECK(read_file(temp.path / "elementary.dtf").empty());
}

TEST_CASE("RecordCodec reports write failures as system errors")
{
    TempDirectory temp;
    const auto codec = make_codec(temp.path / "missing_directory");

    try {
        codec.encode("elementary", RecordSet{{"1"}});
        FAIL("expected std::system_error");
    } catch (const std::system_error& error) {
        CHECK(error.code().category() == std::generic_category());
    }
}
