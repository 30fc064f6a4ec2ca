#include "flatdb/catalog/schema_cache.hpp"

#include "flatdb/storage/record_codec.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace flatdb::catalog {
namespace {

constexpr std::string_view kCacheMagic = "flatdb-schema-cache";
constexpr std::string_view kCacheVersion = "1";

[[nodiscard]] storage::RecordSet schema_to_records(const Schema& schema)
{
    storage::RecordSet records;
    records.reserve(schema.tables.size() + 1U);
    records.push_back({std::string{kCacheMagic}, std::string{kCacheVersion}});
    for (const auto& table : schema.tables) {
        storage::Record record;
        record.reserve(table.columns.size() + 2U);
        record.push_back(table.name);
        record.push_back(table.primary_key);
        record.insert(record.end(), table.columns.begin(), table.columns.end());
        records.push_back(std::move(record));
    }
    return records;
}

[[nodiscard]] std::optional<Schema> records_to_schema(const storage::RecordSet& records)
{
    if (records.empty()) {
        return std::nullopt;
    }

    const auto& header = records.front();
    if (header.size() != 2U || header[0] != kCacheMagic || header[1] != kCacheVersion) {
        return std::nullopt;
    }

    Schema schema;
    for (std::size_t index = 1U; index < records.size(); ++index) {
        const auto& record = records[index];
        if (record.size() < 3U) {
            return std::nullopt;
        }

        TableDefinition table;
        table.name = record[0];
        table.primary_key = record[1];
        table.columns.assign(record.begin() + 2, record.end());
        if (table.degenerate() || !table.has_column(table.primary_key)) {
            return std::nullopt;
        }
        schema.tables.push_back(std::move(table));
    }
    return schema;
}

[[nodiscard]] bool is_stale(const std::filesystem::path& cache_file, const std::filesystem::path& schema_file)
{
    std::error_code ec;
    const auto cache_time = std::filesystem::last_write_time(cache_file, ec);
    if (ec) {
        return true;
    }
    const auto schema_time = std::filesystem::last_write_time(schema_file, ec);
    if (ec) {
        // Without a schema file there is nothing to compare against.
        return false;
    }
    return schema_time > cache_time;
}

}  // namespace

std::optional<Schema> MemorySchemaCache::get(const std::string& key)
{
    std::lock_guard guard(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_.fetch_add(1U, std::memory_order_relaxed);
        return std::nullopt;
    }
    hits_.fetch_add(1U, std::memory_order_relaxed);
    return it->second;
}

void MemorySchemaCache::put(const std::string& key, const Schema& schema)
{
    std::lock_guard guard(mutex_);
    entries_.insert_or_assign(key, schema);
    stores_.fetch_add(1U, std::memory_order_relaxed);
}

void MemorySchemaCache::invalidate(const std::string& key) noexcept
{
    std::lock_guard guard(mutex_);
    entries_.erase(key);
}

void MemorySchemaCache::clear() noexcept
{
    std::lock_guard guard(mutex_);
    entries_.clear();
    hits_.store(0U, std::memory_order_relaxed);
    misses_.store(0U, std::memory_order_relaxed);
    stores_.store(0U, std::memory_order_relaxed);
}

MemorySchemaCache::TelemetrySnapshot MemorySchemaCache::telemetry() const noexcept
{
    TelemetrySnapshot snapshot{};
    snapshot.hits = hits_.load(std::memory_order_relaxed);
    snapshot.misses = misses_.load(std::memory_order_relaxed);
    snapshot.stores = stores_.load(std::memory_order_relaxed);
    {
        std::lock_guard guard(mutex_);
        snapshot.entries = entries_.size();
    }
    return snapshot;
}

std::filesystem::path FileSchemaCache::cache_path(const std::filesystem::path& schema_path)
{
    auto filename = std::string{"."} + schema_path.filename().string() + ".cache";
    return schema_path.parent_path() / filename;
}

std::optional<Schema> FileSchemaCache::get(const std::string& key)
{
    const std::filesystem::path schema_path{key};
    const auto path = cache_path(schema_path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || is_stale(path, schema_path)) {
        return std::nullopt;
    }

    std::ifstream stream{path, std::ios::in | std::ios::binary};
    if (!stream.is_open()) {
        return std::nullopt;
    }
    const std::string contents{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
    if (stream.bad()) {
        return std::nullopt;
    }

    return records_to_schema(storage::decode_records(contents, storage::Delimiters::standard()));
}

void FileSchemaCache::put(const std::string& key, const Schema& schema)
{
    const auto path = cache_path(std::filesystem::path{key});
    const auto payload = storage::encode_records(schema_to_records(schema), storage::Delimiters::standard());

    errno = 0;
    std::ofstream stream{path, std::ios::out | std::ios::binary | std::ios::trunc};
    if (stream.is_open()) {
        stream.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        stream.flush();
    }
    if (!stream.is_open() || !stream) {
        const int error = errno;
        const auto ec = error != 0 ? std::error_code{error, std::generic_category()}
                                   : std::make_error_code(std::errc::io_error);
        throw std::system_error(ec, "failed to write schema cache '" + path.string() + "'");
    }
}

}  // namespace flatdb::catalog
