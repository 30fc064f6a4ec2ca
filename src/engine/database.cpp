#include "flatdb/engine/database.hpp"

#include "flatdb/executor/criteria.hpp"
#include "flatdb/executor/value_compare.hpp"
#include "flatdb/parser/schema_grammar.hpp"
#include "flatdb/parser/text_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <limits>
#include <optional>
#include <system_error>
#include <type_traits>
#include <utility>

namespace flatdb::engine {
namespace {

[[nodiscard]] storage::RecordCodec::Config make_codec_config(const std::filesystem::path& data_directory,
                                                             const std::string& database_name,
                                                             const DatabaseOptions& options)
{
    storage::RecordCodec::Config config{};
    config.data_directory = data_directory;
    config.database_name = database_name;
    config.data_extension = options.data_extension;
    config.prepend_database_name = options.prepend_database_name_to_table_filename;
    config.delimiters = options.legacy_delimiters ? storage::Delimiters::legacy() : storage::Delimiters::standard();
    return config;
}

[[nodiscard]] bool blank(std::string_view text) noexcept
{
    return parser::trim_view(text).empty();
}

[[nodiscard]] std::string mismatch_detail(std::size_t values, std::size_t columns)
{
    return "got " + std::to_string(values) + " but expected " + std::to_string(columns);
}

}  // namespace

template <typename Operation>
auto Database::run_operation(OperationKind kind, std::string_view table, Operation&& operation)
{
    OperationRecord record{};
    record.kind = kind;
    record.database = database_name_;
    record.table = std::string{table};
    record.started_at = std::chrono::system_clock::now();
    const auto started = std::chrono::steady_clock::now();

    std::optional<std::invoke_result_t<Operation&, OperationRecord&>> result{};
    try {
        result.emplace(operation(record));
    } catch (const std::system_error& error) {
        record.error = error.code();
        record.error_message = error.what();
        finish_operation(record, started);
        throw;
    } catch (const std::exception& error) {
        record.error_message = error.what();
        finish_operation(record, started);
        throw;
    }

    record.success = true;
    finish_operation(record, started);
    return std::move(*result);
}

Database::Database(std::filesystem::path data_directory,
                   std::string database_name,
                   DatabaseOptions options,
                   Config config)
    : data_directory_{std::move(data_directory)}
    , database_name_{std::move(database_name)}
    , options_{std::move(options)}
    , config_{std::move(config)}
    , codec_{make_codec_config(data_directory_, database_name_, options_)}
{
    (void)run_operation(OperationKind::Open, {}, [this](OperationRecord& record) {
        const auto tables = load_schema();
        record.rows_read = tables;
        return tables;
    });
}

Database Database::open(std::filesystem::path data_directory,
                        std::string database_name,
                        DatabaseOptions options,
                        Config config)
{
    return Database{std::move(data_directory), std::move(database_name), std::move(options), std::move(config)};
}

void Database::finish_operation(OperationRecord& record, std::chrono::steady_clock::time_point started) const
{
    record.finished_at = std::chrono::system_clock::now();
    const auto elapsed = std::chrono::steady_clock::now() - started;
    record.duration_ms = std::chrono::duration<double, std::milli>(elapsed).count();

    if (config_.telemetry != nullptr) {
        config_.telemetry->record_operation(record);
    }
    if (config_.operation_logger) {
        config_.operation_logger(record);
    }
}

std::size_t Database::load_schema()
{
    const auto schema_path = schema_file_path();
    const auto cache_key = schema_path.string();

    if (options_.use_cache && config_.schema_cache) {
        if (auto cached = config_.schema_cache->get(cache_key); cached.has_value()) {
            schema_ = std::move(*cached);
            schema_from_cache_ = true;
            if (config_.telemetry != nullptr) {
                config_.telemetry->record_schema_cache_hit();
            }
            return schema_.tables.size();
        }
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_schema_cache_miss();
        }
    }

    parser::SchemaParseResult parsed{};
    try {
        parsed = parser::load_schema_file(schema_path);
    } catch (const EngineError& error) {
        if (error.errc() == EngineErrc::SchemaFileMissing || error.errc() == EngineErrc::SchemaFileEmpty) {
            throw EngineError(EngineErrc::DatabaseNotFound,
                              "no usable schema for database '" + database_name_ + "' at " + cache_key + " ("
                                  + error.code().message() + ")",
                              {database_name_});
        }
        throw;
    }

    if (config_.telemetry != nullptr) {
        config_.telemetry->record_schema_parse();
    }
    schema_ = std::move(parsed.schema);
    diagnostics_ = std::move(parsed.diagnostics);
    schema_from_cache_ = false;

    if (config_.schema_cache) {
        try {
            config_.schema_cache->put(cache_key, schema_);
        } catch (const std::system_error& error) {
            if (config_.telemetry != nullptr) {
                config_.telemetry->record_schema_cache_store_failure();
            }
            parser::ParserDiagnostic diagnostic{};
            diagnostic.severity = parser::ParserSeverity::Warning;
            diagnostic.message = std::string{"schema cache not updated: "} + error.what();
            diagnostic.statement = cache_key;
            diagnostic.remediation_hints = {"Check that the data directory is writable."};
            diagnostics_.push_back(std::move(diagnostic));
        }
    }

    return schema_.tables.size();
}

std::filesystem::path Database::schema_file_path() const
{
    return data_directory_ / (database_name_ + options_.schema_extension);
}

std::filesystem::path Database::table_file_path(std::string_view table) const
{
    return codec_.table_path(resolve_table(table).name);
}

const catalog::TableDefinition& Database::resolve_table(std::string_view table) const
{
    if (blank(table)) {
        throw EngineError(EngineErrc::MissingTableParam, "no table parameter");
    }

    const auto* definition = schema_.find_table(table);
    if (definition == nullptr || definition->degenerate()) {
        throw EngineError(EngineErrc::TableNotFound, "table not found: " + std::string{table}, {std::string{table}});
    }
    return *definition;
}

void Database::write_back(const catalog::TableDefinition& table, const storage::RecordSet& records)
{
    codec_.encode(table.name, records);
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_rewrite(records.size());
    }
}

std::vector<std::string> Database::list_tables() const
{
    return schema_.table_names();
}

std::vector<std::string> Database::table_schema(std::string_view table) const
{
    return resolve_table(table).columns;
}

std::string Database::primary_key(std::string_view table) const
{
    return resolve_table(table).primary_key;
}

std::vector<executor::ResultRow> Database::select(std::string_view table,
                                                  const executor::ColumnList& columns,
                                                  std::string_view criteria,
                                                  std::string_view order)
{
    return run_operation(OperationKind::Select, table, [&](OperationRecord& record) {
        const auto& definition = resolve_table(table);
        auto records = codec_.decode(definition.name);
        record.rows_read = records.size();

        if (!blank(criteria)) {
            const auto parsed = executor::parse_criteria(criteria, definition.primary_key);
            records = executor::matching_records(parsed, definition, records);
        }

        if (const auto spec = executor::parse_order_spec(order); spec.has_value()) {
            executor::apply_ordering(records, *spec, definition);
        }

        const auto projection = executor::resolve_columns(columns, definition);
        std::vector<executor::ResultRow> rows;
        rows.reserve(records.size());
        for (const auto& stored : records) {
            rows.push_back(executor::project_row(executor::make_result_row(stored, definition), projection));
        }
        record.rows_affected = rows.size();
        return rows;
    });
}

std::string Database::insert(std::string_view table, const std::vector<std::string>& values)
{
    return insert(table, executor::ColumnList{}, values);
}

std::string Database::insert(std::string_view table,
                             const executor::ColumnList& columns,
                             const std::vector<std::string>& values)
{
    return run_operation(OperationKind::Insert, table, [&](OperationRecord& record) {
        const auto& definition = resolve_table(table);
        const bool new_table = codec_.table_empty(definition.name);
        auto records = codec_.decode(definition.name);
        record.rows_read = records.size();

        const auto resolved = executor::resolve_columns(columns, definition);
        if (resolved.names.size() != values.size()) {
            throw EngineError(EngineErrc::ColumnListMismatch, mismatch_detail(values.size(), resolved.names.size()));
        }

        const auto key_index = definition.primary_key_index();
        const auto supplied = std::find(resolved.names.begin(), resolved.names.end(), definition.primary_key);
        const bool autokey = supplied == resolved.names.end();

        std::string key;
        if (autokey) {
            std::int64_t next = 1;
            if (!new_table && !records.empty()) {
                std::int64_t highest = std::numeric_limits<std::int64_t>::min();
                for (const auto& existing : records) {
                    const auto value = key_index < existing.size() ? executor::leading_integer(existing[key_index]) : 0;
                    highest = std::max(highest, value);
                }
                if (highest == std::numeric_limits<std::int64_t>::max()) {
                    throw EngineError(EngineErrc::AutoKeyOverflow,
                                      "cannot assign next key after " + std::to_string(highest) + " on table "
                                          + definition.name,
                                      {definition.name});
                }
                next = highest + 1;
            }
            key = std::to_string(next);
        } else {
            key = values[static_cast<std::size_t>(supplied - resolved.names.begin())];
            if (!new_table) {
                for (const auto& existing : records) {
                    if (key_index < existing.size() && executor::values_equal(existing[key_index], key)) {
                        throw EngineError(EngineErrc::DuplicateKey, "invalid key (not unique): " + key, {key});
                    }
                }
            }
        }

        storage::Record fresh(definition.columns.size());
        if (autokey) {
            fresh[key_index] = key;
        }
        for (std::size_t index = 0U; index < values.size(); ++index) {
            fresh[resolved.indices[index]] = values[index];
        }

        records.push_back(std::move(fresh));
        write_back(definition, records);
        record.rows_affected = 1U;
        return key;
    });
}

std::size_t Database::update(std::string_view table,
                             const executor::ColumnList& columns,
                             const std::vector<std::string>& values,
                             std::string_view criteria)
{
    return run_operation(OperationKind::Update, table, [&](OperationRecord& record) {
        const auto& definition = resolve_table(table);
        auto records = codec_.decode(definition.name);
        record.rows_read = records.size();

        std::vector<std::size_t> targets;
        if (blank(criteria)) {
            targets.resize(records.size());
            for (std::size_t index = 0U; index < records.size(); ++index) {
                targets[index] = index;
            }
        } else {
            const auto parsed = executor::parse_criteria(criteria, definition.primary_key);
            targets = executor::matching_row_indices(parsed, definition, records);
        }

        const auto resolved = executor::resolve_columns(columns, definition);
        if (resolved.names.size() != values.size()) {
            throw EngineError(EngineErrc::ColumnListMismatch, mismatch_detail(values.size(), resolved.names.size()));
        }

        if (targets.empty()) {
            return std::size_t{0U};
        }

        for (const auto row : targets) {
            auto& target = records[row];
            for (std::size_t index = 0U; index < values.size(); ++index) {
                const auto column = resolved.indices[index];
                if (column >= target.size()) {
                    target.resize(column + 1U);
                }
                target[column] = values[index];
            }
        }

        write_back(definition, records);
        record.rows_affected = targets.size();
        return targets.size();
    });
}

std::size_t Database::remove(std::string_view table, std::string_view criteria)
{
    return run_operation(OperationKind::Delete, table, [&](OperationRecord& record) {
        const auto& definition = resolve_table(table);
        auto records = codec_.decode(definition.name);
        record.rows_read = records.size();

        std::size_t removed = 0U;
        if (blank(criteria)) {
            removed = records.size();
            records.clear();
        } else {
            const auto parsed = executor::parse_criteria(criteria, definition.primary_key);
            const auto doomed = executor::matching_row_indices(parsed, definition, records);
            removed = doomed.size();

            storage::RecordSet remaining;
            remaining.reserve(records.size() - removed);
            auto next = doomed.begin();
            for (std::size_t index = 0U; index < records.size(); ++index) {
                if (next != doomed.end() && *next == index) {
                    ++next;
                    continue;
                }
                remaining.push_back(std::move(records[index]));
            }
            records = std::move(remaining);
        }

        if (removed > 0U) {
            write_back(definition, records);
        }
        record.rows_affected = removed;
        return removed;
    });
}

}  // namespace flatdb::engine
