#include "flatdb/engine/engine_telemetry.hpp"

namespace flatdb::engine {

const char* operation_kind_name(OperationKind kind) noexcept
{
    switch (kind) {
    case OperationKind::Open:
        return "open";
    case OperationKind::Select:
        return "select";
    case OperationKind::Insert:
        return "insert";
    case OperationKind::Update:
        return "update";
    case OperationKind::Delete:
        return "delete";
    default:
        return "unknown";
    }
}

void EngineTelemetry::add_relaxed(std::atomic<std::uint64_t>& target, std::uint64_t value) noexcept
{
    target.fetch_add(value, std::memory_order_relaxed);
}

void EngineTelemetry::record_operation(const OperationRecord& record) noexcept
{
    switch (record.kind) {
    case OperationKind::Select:
        add_relaxed(selects_, 1U);
        break;
    case OperationKind::Insert:
        add_relaxed(inserts_, 1U);
        break;
    case OperationKind::Update:
        add_relaxed(updates_, 1U);
        break;
    case OperationKind::Delete:
        add_relaxed(deletes_, 1U);
        break;
    case OperationKind::Open:
    default:
        break;
    }

    if (!record.success) {
        add_relaxed(failures_, 1U);
    }
    add_relaxed(rows_read_, record.rows_read);

    const auto nanoseconds = std::chrono::duration_cast<std::chrono::nanoseconds>(record.finished_at - record.started_at);
    if (nanoseconds.count() > 0) {
        add_relaxed(total_duration_ns_, static_cast<std::uint64_t>(nanoseconds.count()));
    }
}

void EngineTelemetry::record_rewrite(std::size_t rows_written) noexcept
{
    add_relaxed(table_rewrites_, 1U);
    add_relaxed(rows_written_, static_cast<std::uint64_t>(rows_written));
}

void EngineTelemetry::record_schema_cache_hit() noexcept
{
    add_relaxed(schema_cache_hits_, 1U);
}

void EngineTelemetry::record_schema_cache_miss() noexcept
{
    add_relaxed(schema_cache_misses_, 1U);
}

void EngineTelemetry::record_schema_parse() noexcept
{
    add_relaxed(schema_parses_, 1U);
}

void EngineTelemetry::record_schema_cache_store_failure() noexcept
{
    add_relaxed(schema_cache_store_failures_, 1U);
}

EngineTelemetrySnapshot EngineTelemetry::snapshot() const noexcept
{
    EngineTelemetrySnapshot snapshot{};
    snapshot.selects = selects_.load(std::memory_order_relaxed);
    snapshot.inserts = inserts_.load(std::memory_order_relaxed);
    snapshot.updates = updates_.load(std::memory_order_relaxed);
    snapshot.deletes = deletes_.load(std::memory_order_relaxed);
    snapshot.failures = failures_.load(std::memory_order_relaxed);
    snapshot.rows_read = rows_read_.load(std::memory_order_relaxed);
    snapshot.rows_written = rows_written_.load(std::memory_order_relaxed);
    snapshot.table_rewrites = table_rewrites_.load(std::memory_order_relaxed);
    snapshot.schema_cache_hits = schema_cache_hits_.load(std::memory_order_relaxed);
    snapshot.schema_cache_misses = schema_cache_misses_.load(std::memory_order_relaxed);
    snapshot.schema_parses = schema_parses_.load(std::memory_order_relaxed);
    snapshot.schema_cache_store_failures = schema_cache_store_failures_.load(std::memory_order_relaxed);
    snapshot.total_duration_ns = total_duration_ns_.load(std::memory_order_relaxed);
    return snapshot;
}

void EngineTelemetry::reset() noexcept
{
    selects_.store(0U, std::memory_order_relaxed);
    inserts_.store(0U, std::memory_order_relaxed);
    updates_.store(0U, std::memory_order_relaxed);
    deletes_.store(0U, std::memory_order_relaxed);
    failures_.store(0U, std::memory_order_relaxed);
    rows_read_.store(0U, std::memory_order_relaxed);
    rows_written_.store(0U, std::memory_order_relaxed);
    table_rewrites_.store(0U, std::memory_order_relaxed);
    schema_cache_hits_.store(0U, std::memory_order_relaxed);
    schema_cache_misses_.store(0U, std::memory_order_relaxed);
    schema_parses_.store(0U, std::memory_order_relaxed);
    schema_cache_store_failures_.store(0U, std::memory_order_relaxed);
    total_duration_ns_.store(0U, std::memory_order_relaxed);
}

}  // namespace flatdb::engine
