#pragma once

#include "flatdb/catalog/schema.hpp"
#include "flatdb/catalog/schema_cache.hpp"
#include "flatdb/engine/database_options.hpp"
#include "flatdb/engine/engine_errors.hpp"
#include "flatdb/engine/engine_telemetry.hpp"
#include "flatdb/executor/projection.hpp"
#include "flatdb/parser/parser_diagnostics.hpp"
#include "flatdb/storage/record_codec.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace flatdb::engine {

struct DatabaseConfig final {
    std::shared_ptr<catalog::SchemaCache> schema_cache{};
    EngineTelemetry* telemetry = nullptr;
    std::function<void(const OperationRecord&)> operation_logger{};
};

// File-backed record store. Each call is an independent read, optionally
// followed by a full rewrite of the table file. Not safe for concurrent
// writers, in this process or any other.
class Database final {
public:
    using Config = DatabaseConfig;

    // Loads the schema for <data_directory>/<database_name><schema_extension>,
    // from the cache when allowed. Throws EngineError(DatabaseNotFound) when the
    // schema file is missing or empty.
    Database(std::filesystem::path data_directory,
             std::string database_name,
             DatabaseOptions options = {},
             Config config = {});

    [[nodiscard]] static Database open(std::filesystem::path data_directory,
                                       std::string database_name,
                                       DatabaseOptions options = {},
                                       Config config = {});

    [[nodiscard]] std::vector<std::string> list_tables() const;
    [[nodiscard]] std::vector<std::string> table_schema(std::string_view table) const;
    [[nodiscard]] std::string primary_key(std::string_view table) const;

    [[nodiscard]] std::vector<executor::ResultRow> select(std::string_view table,
                                                          const executor::ColumnList& columns = {},
                                                          std::string_view criteria = {},
                                                          std::string_view order = {});

    // Returns the key of the new record, either supplied or auto-assigned.
    std::string insert(std::string_view table, const executor::ColumnList& columns, const std::vector<std::string>& values);
    std::string insert(std::string_view table, const std::vector<std::string>& values);

    // Returns the number of targeted rows.
    std::size_t update(std::string_view table,
                       const executor::ColumnList& columns,
                       const std::vector<std::string>& values,
                       std::string_view criteria = {});

    // Returns the number of removed rows.
    std::size_t remove(std::string_view table, std::string_view criteria = {});

    [[nodiscard]] const DatabaseOptions& options() const noexcept { return options_; }
    [[nodiscard]] const catalog::Schema& schema() const noexcept { return schema_; }
    [[nodiscard]] const std::string& database_name() const noexcept { return database_name_; }
    [[nodiscard]] const std::filesystem::path& data_directory() const noexcept { return data_directory_; }
    [[nodiscard]] std::filesystem::path schema_file_path() const;
    [[nodiscard]] std::filesystem::path table_file_path(std::string_view table) const;
    [[nodiscard]] const std::vector<parser::ParserDiagnostic>& schema_diagnostics() const noexcept { return diagnostics_; }
    [[nodiscard]] bool schema_from_cache() const noexcept { return schema_from_cache_; }

private:
    template <typename Operation>
    auto run_operation(OperationKind kind, std::string_view table, Operation&& operation);

    void finish_operation(OperationRecord& record, std::chrono::steady_clock::time_point started) const;
    std::size_t load_schema();
    [[nodiscard]] const catalog::TableDefinition& resolve_table(std::string_view table) const;
    void write_back(const catalog::TableDefinition& table, const storage::RecordSet& records);

    std::filesystem::path data_directory_{};
    std::string database_name_{};
    DatabaseOptions options_{};
    Config config_{};
    storage::RecordCodec codec_;
    catalog::Schema schema_{};
    std::vector<parser::ParserDiagnostic> diagnostics_{};
    bool schema_from_cache_ = false;
};

}  // namespace flatdb::engine
