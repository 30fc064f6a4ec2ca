#include "flatdb/storage/record_codec.hpp"

#include <cctype>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace flatdb::storage {
namespace {

constexpr char kLegacyEscape = '\\';

[[nodiscard]] bool is_space(char ch) noexcept
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

[[nodiscard]] std::string_view trim_leading(std::string_view text) noexcept
{
    std::size_t start = 0U;
    while (start < text.size() && is_space(text[start])) {
        ++start;
    }
    return text.substr(start);
}

[[nodiscard]] std::error_code last_io_error() noexcept
{
    const int error = errno;
    if (error != 0) {
        return {error, std::generic_category()};
    }
    return std::make_error_code(std::errc::io_error);
}

// Drops an escape character left in front of a delimiter byte by older writers.
void append_value(std::string& out, std::string_view value, const Delimiters& delimiters)
{
    for (std::size_t index = 0U; index < value.size(); ++index) {
        const char ch = value[index];
        if (ch == kLegacyEscape && index + 1U < value.size()) {
            const char next = value[index + 1U];
            if (next == delimiters.column || next == delimiters.row) {
                continue;
            }
        }
        out.push_back(ch);
    }
}

}  // namespace

RecordSet decode_records(std::string_view contents, const Delimiters& delimiters)
{
    RecordSet records;
    if (contents.empty()) {
        return records;
    }

    std::size_t row_start = 0U;
    while (true) {
        const auto row_end = contents.find(delimiters.row, row_start);
        if (row_end == std::string_view::npos) {
            // Whatever follows the last row terminator is discarded.
            break;
        }

        const auto row = trim_leading(contents.substr(row_start, row_end - row_start));
        Record record;
        std::size_t field_start = 0U;
        while (true) {
            const auto field_end = row.find(delimiters.column, field_start);
            if (field_end == std::string_view::npos) {
                record.emplace_back(row.substr(field_start));
                break;
            }
            record.emplace_back(row.substr(field_start, field_end - field_start));
            field_start = field_end + 1U;
        }
        records.push_back(std::move(record));
        row_start = row_end + 1U;
    }

    return records;
}

std::string encode_records(const RecordSet& records, const Delimiters& delimiters)
{
    std::string out;
    for (const auto& record : records) {
        for (std::size_t index = 0U; index < record.size(); ++index) {
            if (index > 0U) {
                out.push_back(delimiters.column);
            }
            append_value(out, record[index], delimiters);
        }
        out.push_back(delimiters.row);
        out.push_back('\n');
    }
    return out;
}

RecordCodec::RecordCodec(Config config)
    : config_{std::move(config)}
{}

std::filesystem::path RecordCodec::table_path(std::string_view table) const
{
    std::string filename;
    if (config_.prepend_database_name) {
        filename.append(config_.database_name);
        filename.push_back('.');
    }
    filename.append(table);
    filename.append(config_.data_extension);
    return config_.data_directory / filename;
}

bool RecordCodec::table_empty(std::string_view table) const
{
    const auto contents = read_contents(table_path(table));
    return trim_leading(contents).empty();
}

RecordSet RecordCodec::decode(std::string_view table) const
{
    const auto contents = read_contents(table_path(table));
    return decode_records(contents, config_.delimiters);
}

void RecordCodec::encode(std::string_view table, const RecordSet& records) const
{
    const auto path = table_path(table);
    const auto payload = encode_records(records, config_.delimiters);

    errno = 0;
    std::ofstream stream{path, std::ios::out | std::ios::binary | std::ios::trunc};
    if (!stream.is_open()) {
        throw std::system_error(last_io_error(), "failed to open table file '" + path.string() + "' for writing");
    }

    stream.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    stream.flush();
    if (!stream) {
        throw std::system_error(last_io_error(), "failed to write table file '" + path.string() + "'");
    }

    stream.close();
    if (stream.fail()) {
        throw std::system_error(last_io_error(), "failed to close table file '" + path.string() + "'");
    }
}

std::string RecordCodec::read_contents(const std::filesystem::path& path) const
{
    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        throw std::system_error(ec, "failed to stat table file '" + path.string() + "'");
    }
    if (!exists) {
        return {};
    }

    errno = 0;
    std::ifstream stream{path, std::ios::in | std::ios::binary};
    if (!stream.is_open()) {
        throw std::system_error(last_io_error(), "failed to open table file '" + path.string() + "'");
    }

    std::string contents{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
    if (stream.bad()) {
        throw std::system_error(last_io_error(), "failed to read table file '" + path.string() + "'");
    }
    return contents;
}

}  // namespace flatdb::storage
