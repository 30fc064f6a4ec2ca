#pragma once

#include "flatdb/catalog/schema.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace flatdb::catalog {

// Key-value store for parsed schemas. The engine reads it at open time (when
// enabled) and always writes it after parsing the schema file.
class SchemaCache {
public:
    virtual ~SchemaCache() = default;

    [[nodiscard]] virtual std::optional<Schema> get(const std::string& key) = 0;
    virtual void put(const std::string& key, const Schema& schema) = 0;
};

class MemorySchemaCache final : public SchemaCache {
public:
    struct TelemetrySnapshot final {
        std::uint64_t hits = 0U;
        std::uint64_t misses = 0U;
        std::uint64_t stores = 0U;
        std::size_t entries = 0U;
    };

    [[nodiscard]] std::optional<Schema> get(const std::string& key) override;
    void put(const std::string& key, const Schema& schema) override;

    void invalidate(const std::string& key) noexcept;
    void clear() noexcept;

    [[nodiscard]] TelemetrySnapshot telemetry() const noexcept;

private:
    mutable std::mutex mutex_{};
    std::unordered_map<std::string, Schema> entries_{};
    std::atomic<std::uint64_t> hits_{0U};
    std::atomic<std::uint64_t> misses_{0U};
    std::atomic<std::uint64_t> stores_{0U};
};

// Persists each schema beside its definition file as ".<file>.cache". The key
// is the path of the schema definition file.
class FileSchemaCache final : public SchemaCache {
public:
    [[nodiscard]] std::optional<Schema> get(const std::string& key) override;
    void put(const std::string& key, const Schema& schema) override;

    [[nodiscard]] static std::filesystem::path cache_path(const std::filesystem::path& schema_path);
};

}  // namespace flatdb::catalog
