#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

namespace flatdb::engine {

enum class OperationKind : std::uint8_t {
    Open = 0,
    Select,
    Insert,
    Update,
    Delete
};

[[nodiscard]] const char* operation_kind_name(OperationKind kind) noexcept;

// One completed engine call, handed to Database::Config::operation_logger.
struct OperationRecord final {
    OperationKind kind = OperationKind::Select;
    std::string database{};
    std::string table{};
    std::uint64_t rows_read = 0U;
    std::uint64_t rows_affected = 0U;
    bool success = false;
    std::error_code error{};
    std::string error_message{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
    double duration_ms = 0.0;
};

struct EngineTelemetrySnapshot final {
    std::uint64_t selects = 0U;
    std::uint64_t inserts = 0U;
    std::uint64_t updates = 0U;
    std::uint64_t deletes = 0U;
    std::uint64_t failures = 0U;
    std::uint64_t rows_read = 0U;
    std::uint64_t rows_written = 0U;
    std::uint64_t table_rewrites = 0U;
    std::uint64_t schema_cache_hits = 0U;
    std::uint64_t schema_cache_misses = 0U;
    std::uint64_t schema_parses = 0U;
    std::uint64_t schema_cache_store_failures = 0U;
    std::uint64_t total_duration_ns = 0U;
};

class EngineTelemetry final {
public:
    void record_operation(const OperationRecord& record) noexcept;
    void record_rewrite(std::size_t rows_written) noexcept;
    void record_schema_cache_hit() noexcept;
    void record_schema_cache_miss() noexcept;
    void record_schema_parse() noexcept;
    void record_schema_cache_store_failure() noexcept;

    [[nodiscard]] EngineTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    static void add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept;

    std::atomic<std::uint64_t> selects_{0U};
    std::atomic<std::uint64_t> inserts_{0U};
    std::atomic<std::uint64_t> updates_{0U};
    std::atomic<std::uint64_t> deletes_{0U};
    std::atomic<std::uint64_t> failures_{0U};
    std::atomic<std::uint64_t> rows_read_{0U};
    std::atomic<std::uint64_t> rows_written_{0U};
    std::atomic<std::uint64_t> table_rewrites_{0U};
    std::atomic<std::uint64_t> schema_cache_hits_{0U};
    std::atomic<std::uint64_t> schema_cache_misses_{0U};
    std::atomic<std::uint64_t> schema_parses_{0U};
    std::atomic<std::uint64_t> schema_cache_store_failures_{0U};
    std::atomic<std::uint64_t> total_duration_ns_{0U};
};

}  // namespace flatdb::engine
