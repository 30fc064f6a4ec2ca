#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace flatdb::storage {

inline constexpr char kUnitSeparator = static_cast<char>(31);
inline constexpr char kRecordSeparator = static_cast<char>(30);
inline constexpr char kLegacyUnitSeparator = static_cast<char>(200);
inline constexpr char kLegacyRecordSeparator = static_cast<char>(201);

struct Delimiters final {
    char column = kUnitSeparator;
    char row = kRecordSeparator;

    [[nodiscard]] static constexpr Delimiters standard() noexcept { return {kUnitSeparator, kRecordSeparator}; }
    [[nodiscard]] static constexpr Delimiters legacy() noexcept { return {kLegacyUnitSeparator, kLegacyRecordSeparator}; }
};

using Record = std::vector<std::string>;
using RecordSet = std::vector<Record>;

// Rows are column values joined by the column delimiter and terminated by the
// row delimiter plus '\n'. Values are stored verbatim; they must not contain
// either delimiter byte.
[[nodiscard]] RecordSet decode_records(std::string_view contents, const Delimiters& delimiters);
[[nodiscard]] std::string encode_records(const RecordSet& records, const Delimiters& delimiters);

class RecordCodec final {
public:
    struct Config final {
        std::filesystem::path data_directory{};
        std::string database_name{};
        std::string data_extension = ".dtf";
        bool prepend_database_name = false;
        Delimiters delimiters = Delimiters::standard();
    };

    explicit RecordCodec(Config config);

    [[nodiscard]] std::filesystem::path table_path(std::string_view table) const;

    // True when the table file is absent or holds only whitespace.
    [[nodiscard]] bool table_empty(std::string_view table) const;

    [[nodiscard]] RecordSet decode(std::string_view table) const;

    // Truncates and rewrites the whole table file.
    void encode(std::string_view table, const RecordSet& records) const;

    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::string read_contents(const std::filesystem::path& path) const;

    Config config_{};
};

}  // namespace flatdb::storage
