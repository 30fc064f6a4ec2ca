#include "flatdb/executor/projection.hpp"

#include "flatdb/engine/engine_errors.hpp"
#include "flatdb/executor/value_compare.hpp"
#include "flatdb/parser/text_utils.hpp"

#include <tao/pegtl.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace flatdb::executor {

namespace pegtl = tao::pegtl;

namespace {

struct order_column : pegtl::plus<pegtl::not_one<' ', '\t', '\r', '\n', '\v', '\f'>> {
};

struct order_modifier : pegtl::star<pegtl::any> {
};

struct order_grammar
    : pegtl::seq<pegtl::star<pegtl::space>, order_column, pegtl::star<pegtl::space>, order_modifier, pegtl::eof> {
};

template <typename Rule>
struct order_action : pegtl::nothing<Rule> {
};

template <>
struct order_action<order_column> {
    template <typename Input>
    static void apply(const Input& in, OrderSpec& spec)
    {
        spec.column = in.string();
    }
};

template <>
struct order_action<order_modifier> {
    template <typename Input>
    static void apply(const Input& in, OrderSpec& spec)
    {
        const auto modifier = parser::trim_copy(in.string());
        spec.direction = parser::iequals(modifier, "desc") ? SortDirection::Descending : SortDirection::Ascending;
    }
};

[[nodiscard]] std::string strip_backticks(std::string_view name)
{
    std::string result;
    result.reserve(name.size());
    for (const auto ch : name) {
        if (ch != '`') {
            result.push_back(ch);
        }
    }
    return parser::trim_copy(result);
}

}  // namespace

ColumnList::ColumnList(const char* text)
    : ColumnList(std::string_view{text != nullptr ? text : ""})
{}

ColumnList::ColumnList(const std::string& text)
    : ColumnList(std::string_view{text})
{}

ColumnList::ColumnList(std::string_view text)
    : names_{std::string{text}}
    , all_{false}
{
    normalize();
}

ColumnList::ColumnList(std::vector<std::string> names)
    : names_{std::move(names)}
    , all_{false}
{
    normalize();
}

ColumnList::ColumnList(std::initializer_list<std::string> names)
    : ColumnList(std::vector<std::string>(names))
{}

void ColumnList::normalize()
{
    std::vector<std::string> names;
    names.reserve(names_.size());
    for (const auto& entry : names_) {
        for (const auto& part : parser::split_copy(entry, ',')) {
            names.push_back(strip_backticks(part));
        }
    }
    names_ = std::move(names);
    if (names_.empty() || (names_.size() == 1U && (names_.front().empty() || names_.front() == "*"))) {
        names_.clear();
        all_ = true;
    }
}

ResolvedColumns resolve_columns(const ColumnList& columns, const catalog::TableDefinition& table)
{
    ResolvedColumns resolved{};
    if (columns.all()) {
        resolved.names = table.columns;
        resolved.indices.reserve(table.columns.size());
        for (std::size_t index = 0U; index < table.columns.size(); ++index) {
            resolved.indices.push_back(index);
        }
        return resolved;
    }

    std::vector<std::string> invalid;
    for (const auto& name : columns.names()) {
        const auto index = table.column_index(name);
        if (index == catalog::kColumnNotFound) {
            invalid.push_back(name);
            continue;
        }
        resolved.names.push_back(name);
        resolved.indices.push_back(index);
    }

    if (!invalid.empty()) {
        std::string detail = "on table " + table.name + ": ";
        for (std::size_t index = 0U; index < invalid.size(); ++index) {
            if (index > 0U) {
                detail.push_back(',');
            }
            detail.append(invalid[index]);
        }
        throw engine::EngineError(engine::EngineErrc::ColumnNotFound, detail, std::move(invalid));
    }
    return resolved;
}

void ResultRow::append(std::string column, std::string value)
{
    columns_.push_back(std::move(column));
    values_.push_back(std::move(value));
}

const std::string& ResultRow::at(std::string_view column) const
{
    const auto* value = find(column);
    if (value == nullptr) {
        throw std::out_of_range{"column '" + std::string{column} + "' not present in row"};
    }
    return *value;
}

const std::string* ResultRow::find(std::string_view column) const noexcept
{
    for (std::size_t index = 0U; index < columns_.size(); ++index) {
        if (columns_[index] == column) {
            return &values_[index];
        }
    }
    return nullptr;
}

ResultRow make_result_row(const storage::Record& record, const catalog::TableDefinition& table)
{
    ResultRow row;
    for (std::size_t index = 0U; index < table.columns.size(); ++index) {
        row.append(table.columns[index], index < record.size() ? record[index] : std::string{});
    }
    return row;
}

ResultRow project_row(const ResultRow& row, const ResolvedColumns& columns)
{
    ResultRow projected;
    for (const auto& name : columns.names) {
        const auto* value = row.find(name);
        projected.append(name, value != nullptr ? *value : std::string{});
    }
    return projected;
}

std::optional<OrderSpec> parse_order_spec(std::string_view text)
{
    if (parser::trim_view(text).empty()) {
        return std::nullopt;
    }

    OrderSpec spec{};
    pegtl::memory_input in(text.data(), text.size(), "order");
    if (!pegtl::parse<order_grammar, order_action>(in, spec)) {
        return std::nullopt;
    }
    return spec;
}

void apply_ordering(storage::RecordSet& records, const OrderSpec& order, const catalog::TableDefinition& table)
{
    const auto column = table.column_index(order.column);
    if (column == catalog::kColumnNotFound) {
        return;
    }

    static const std::string kMissing{};
    const auto key = [column](const storage::Record& record) -> const std::string& {
        return column < record.size() ? record[column] : kMissing;
    };

    std::stable_sort(records.begin(), records.end(), [&key](const storage::Record& lhs, const storage::Record& rhs) {
        return natural_compare(key(lhs), key(rhs)) < 0;
    });

    if (order.direction == SortDirection::Descending) {
        std::reverse(records.begin(), records.end());
    }
}

}  // namespace flatdb::executor
