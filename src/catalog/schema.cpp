#include "flatdb/catalog/schema.hpp"

#include <algorithm>

namespace flatdb::catalog {

std::size_t TableDefinition::column_index(std::string_view column) const noexcept
{
    for (std::size_t index = 0U; index < columns.size(); ++index) {
        if (columns[index] == column) {
            return index;
        }
    }
    return kColumnNotFound;
}

std::size_t TableDefinition::primary_key_index() const noexcept
{
    return column_index(primary_key);
}

bool TableDefinition::has_column(std::string_view column) const noexcept
{
    return column_index(column) != kColumnNotFound;
}

bool TableDefinition::degenerate() const noexcept
{
    return name.empty() || columns.empty();
}

const TableDefinition* Schema::find_table(std::string_view name) const noexcept
{
    const auto it = std::find_if(tables.begin(), tables.end(), [name](const TableDefinition& table) {
        return table.name == name;
    });
    return it != tables.end() ? &*it : nullptr;
}

std::vector<std::string> Schema::table_names() const
{
    std::vector<std::string> names;
    names.reserve(tables.size());
    for (const auto& table : tables) {
        if (!table.degenerate()) {
            names.push_back(table.name);
        }
    }
    return names;
}

bool operator==(const TableDefinition& lhs, const TableDefinition& rhs) noexcept
{
    return lhs.name == rhs.name && lhs.columns == rhs.columns && lhs.primary_key == rhs.primary_key;
}

bool operator==(const Schema& lhs, const Schema& rhs) noexcept
{
    return lhs.tables == rhs.tables;
}

}  // namespace flatdb::catalog
