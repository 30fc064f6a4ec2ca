#pragma once

#include "flatdb/catalog/schema.hpp"
#include "flatdb/storage/record_codec.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flatdb::executor {

// Requested columns, either as "a, b, `c`" text or as a list of names (each
// entry may itself be comma-separated).
// "*" and blank text mean every column in schema order.
class ColumnList final {
public:
    ColumnList() = default;
    ColumnList(const char* text);
    ColumnList(std::string_view text);
    ColumnList(const std::string& text);
    ColumnList(std::vector<std::string> names);
    ColumnList(std::initializer_list<std::string> names);

    [[nodiscard]] bool all() const noexcept { return all_; }
    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }

private:
    void normalize();

    std::vector<std::string> names_{};
    bool all_ = true;
};

struct ResolvedColumns final {
    std::vector<std::string> names{};
    std::vector<std::size_t> indices{};
};

// Throws engine::EngineError(ColumnNotFound) naming every unknown column.
[[nodiscard]] ResolvedColumns resolve_columns(const ColumnList& columns, const catalog::TableDefinition& table);

class ResultRow final {
public:
    void append(std::string column, std::string value);

    [[nodiscard]] const std::string& at(std::string_view column) const;
    [[nodiscard]] const std::string* find(std::string_view column) const noexcept;

    [[nodiscard]] const std::vector<std::string>& columns() const noexcept { return columns_; }
    [[nodiscard]] const std::vector<std::string>& values() const noexcept { return values_; }
    [[nodiscard]] std::size_t size() const noexcept { return columns_.size(); }

    bool operator==(const ResultRow& other) const = default;

private:
    std::vector<std::string> columns_{};
    std::vector<std::string> values_{};
};

// Keys the record by the full column list; missing trailing fields become
// empty text and surplus fields are dropped.
[[nodiscard]] ResultRow make_result_row(const storage::Record& record, const catalog::TableDefinition& table);
[[nodiscard]] ResultRow project_row(const ResultRow& row, const ResolvedColumns& columns);

enum class SortDirection : std::uint8_t {
    Ascending = 0,
    Descending
};

struct OrderSpec final {
    std::string column{};
    SortDirection direction = SortDirection::Ascending;
};

// "<column> [ASC|DESC]"; blank text yields no ordering.
[[nodiscard]] std::optional<OrderSpec> parse_order_spec(std::string_view text);

// Stable natural-order sort on the order column; descending reverses the
// ascending result. Unknown columns leave the records untouched.
void apply_ordering(storage::RecordSet& records, const OrderSpec& order, const catalog::TableDefinition& table);

}  // namespace flatdb::executor
