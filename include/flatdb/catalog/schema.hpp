#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flatdb::catalog {

inline constexpr std::size_t kColumnNotFound = static_cast<std::size_t>(-1);

struct TableDefinition final {
    std::string name{};
    std::vector<std::string> columns{};
    std::string primary_key{};

    [[nodiscard]] std::size_t column_index(std::string_view column) const noexcept;
    [[nodiscard]] std::size_t primary_key_index() const noexcept;
    [[nodiscard]] bool has_column(std::string_view column) const noexcept;
    [[nodiscard]] bool degenerate() const noexcept;
};

// Tables in declaration order. Lookup returns the first table with a matching name.
struct Schema final {
    std::vector<TableDefinition> tables{};

    [[nodiscard]] const TableDefinition* find_table(std::string_view name) const noexcept;
    [[nodiscard]] std::vector<std::string> table_names() const;
    [[nodiscard]] bool empty() const noexcept { return tables.empty(); }
};

bool operator==(const TableDefinition& lhs, const TableDefinition& rhs) noexcept;
bool operator==(const Schema& lhs, const Schema& rhs) noexcept;

}  // namespace flatdb::catalog
