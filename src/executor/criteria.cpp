#include "flatdb/executor/criteria.hpp"

#include "flatdb/executor/value_compare.hpp"
#include "flatdb/parser/text_utils.hpp"

#include <utility>

namespace flatdb::executor {

std::string_view Criteria::pattern() const noexcept
{
    if (!is_regex || value.size() < 2U) {
        return {};
    }
    return std::string_view{value}.substr(1U, value.size() - 2U);
}

Criteria parse_criteria(std::string_view raw, std::string_view primary_key)
{
    Criteria criteria{};
    const auto separator = raw.find('=');
    if (separator != std::string_view::npos) {
        criteria.column = parser::trim_copy(raw.substr(0U, separator));
        criteria.value = parser::trim_copy(raw.substr(separator + 1U));
    } else {
        criteria.column = std::string{primary_key};
        criteria.value = parser::trim_copy(raw);
    }

    if (criteria.value == "true") {
        criteria.value = "1";
    } else if (criteria.value == "false") {
        criteria.value.clear();
    }

    criteria.is_regex = !criteria.value.empty() && criteria.value.front() == '/' && criteria.value.back() == '/';
    return criteria;
}

CriteriaMatcher::CriteriaMatcher(const Criteria& criteria, const catalog::TableDefinition& table)
    : criteria_{criteria}
    , column_index_{table.column_index(criteria.column)}
{
    if (!criteria_.is_regex || criteria_.value.size() < 2U) {
        return;
    }

    try {
        regex_.emplace(std::string{criteria_.pattern()}, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error&) {
        // An unusable pattern matches no rows.
        regex_.reset();
    }
}

bool CriteriaMatcher::matches(const storage::Record& record) const
{
    if (!column_known() || !pattern_valid()) {
        return false;
    }

    static const std::string kMissing{};
    const auto& field = column_index_ < record.size() ? record[column_index_] : kMissing;
    if (criteria_.is_regex) {
        return std::regex_search(field, *regex_);
    }
    return values_equal(field, criteria_.value);
}

std::vector<std::size_t> matching_row_indices(const Criteria& criteria,
                                              const catalog::TableDefinition& table,
                                              const storage::RecordSet& records)
{
    std::vector<std::size_t> indices;
    const CriteriaMatcher matcher{criteria, table};
    if (!matcher.column_known()) {
        return indices;
    }

    for (std::size_t index = 0U; index < records.size(); ++index) {
        if (matcher.matches(records[index])) {
            indices.push_back(index);
        }
    }
    return indices;
}

storage::RecordSet matching_records(const Criteria& criteria,
                                    const catalog::TableDefinition& table,
                                    const storage::RecordSet& records)
{
    storage::RecordSet matched;
    for (const auto index : matching_row_indices(criteria, table, records)) {
        matched.push_back(records[index]);
    }
    return matched;
}

}  // namespace flatdb::executor
