#pragma once

#include "flatdb/catalog/schema.hpp"
#include "flatdb/storage/record_codec.hpp"

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace flatdb::executor {

// "COLUMN=VALUE" or a bare "VALUE" aimed at the primary key. A value wrapped
// in slashes ("/^sh/") is a case-insensitive regular expression.
struct Criteria final {
    std::string column{};
    std::string value{};
    bool is_regex = false;

    // Text between the enclosing slashes; empty for plain values.
    [[nodiscard]] std::string_view pattern() const noexcept;
};

[[nodiscard]] Criteria parse_criteria(std::string_view raw, std::string_view primary_key);

class CriteriaMatcher final {
public:
    CriteriaMatcher(const Criteria& criteria, const catalog::TableDefinition& table);

    // False when the criteria column is not part of the table; nothing matches then.
    [[nodiscard]] bool column_known() const noexcept { return column_index_ != catalog::kColumnNotFound; }
    [[nodiscard]] bool pattern_valid() const noexcept { return !criteria_.is_regex || regex_.has_value(); }

    [[nodiscard]] bool matches(const storage::Record& record) const;

private:
    Criteria criteria_{};
    std::size_t column_index_ = catalog::kColumnNotFound;
    std::optional<std::regex> regex_{};
};

[[nodiscard]] std::vector<std::size_t> matching_row_indices(const Criteria& criteria,
                                                            const catalog::TableDefinition& table,
                                                            const storage::RecordSet& records);

[[nodiscard]] storage::RecordSet matching_records(const Criteria& criteria,
                                                  const catalog::TableDefinition& table,
                                                  const storage::RecordSet& records);

}  // namespace flatdb::executor
