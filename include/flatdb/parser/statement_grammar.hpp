#pragma once

#include "flatdb/parser/parser_diagnostics.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flatdb::parser {

enum class StatementKind : std::uint8_t {
    Select = 0,
    Insert,
    Update,
    Delete
};

[[nodiscard]] const char* statement_kind_name(StatementKind kind) noexcept;

struct Assignment final {
    std::string column{};
    std::string value{};
};

// One shell statement lowered to engine call arguments. Criteria and order are
// kept in the textual form the engine accepts ("name=Bob", "age DESC").
struct Statement final {
    StatementKind kind = StatementKind::Select;
    std::string table{};
    std::vector<std::string> columns{};
    std::vector<std::string> values{};
    std::vector<Assignment> assignments{};
    std::string criteria{};
    std::string order{};
};

struct StatementParseResult final {
    std::optional<Statement> statement{};
    std::vector<ParserDiagnostic> diagnostics{};

    [[nodiscard]] bool success() const noexcept { return statement.has_value(); }
};

// Accepts, case-insensitively and with an optional trailing ';':
//   SELECT <cols|*> FROM <table> [WHERE <criteria>] [ORDER BY <col> [ASC|DESC]]
//   INSERT INTO <table> [(<cols>)] VALUES (<v>, ...)
//   UPDATE <table> SET <col> = <v>[, ...] [WHERE <criteria>]
//   DELETE FROM <table> [WHERE <criteria>]
// Values are single-quoted ('' escapes a quote) or bare tokens. Names may be
// wrapped in backticks.
[[nodiscard]] StatementParseResult parse_statement(std::string_view text);

}  // namespace flatdb::parser
