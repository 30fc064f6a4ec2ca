#include "flatdb/parser/statement_grammar.hpp"

#include "flatdb/parser/text_utils.hpp"

#include <tao/pegtl.hpp>

#include <utility>

namespace flatdb::parser {

namespace pegtl = tao::pegtl;

namespace {

struct optional_space : pegtl::star<pegtl::space> {
};

struct required_space : pegtl::plus<pegtl::space> {
};

template <char... Cs>
struct keyword : pegtl::seq<pegtl::istring<Cs...>, pegtl::not_at<pegtl::identifier_other>> {
};

struct kw_select : keyword<'S', 'E', 'L', 'E', 'C', 'T'> {
};

struct kw_from : keyword<'F', 'R', 'O', 'M'> {
};

struct kw_where : keyword<'W', 'H', 'E', 'R', 'E'> {
};

struct kw_order : keyword<'O', 'R', 'D', 'E', 'R'> {
};

struct kw_by : keyword<'B', 'Y'> {
};

struct kw_asc : keyword<'A', 'S', 'C'> {
};

struct kw_desc : keyword<'D', 'E', 'S', 'C'> {
};

struct kw_insert : keyword<'I', 'N', 'S', 'E', 'R', 'T'> {
};

struct kw_into : keyword<'I', 'N', 'T', 'O'> {
};

struct kw_values : keyword<'V', 'A', 'L', 'U', 'E', 'S'> {
};

struct kw_update : keyword<'U', 'P', 'D', 'A', 'T', 'E'> {
};

struct kw_set : keyword<'S', 'E', 'T'> {
};

struct kw_delete : keyword<'D', 'E', 'L', 'E', 'T', 'E'> {
};

struct comma : pegtl::seq<optional_space, pegtl::one<','>, optional_space> {
};

struct quoted_char : pegtl::sor<pegtl::seq<pegtl::one<'\''>, pegtl::one<'\''>>, pegtl::not_one<'\''>> {
};

struct quoted_value : pegtl::seq<pegtl::one<'\''>, pegtl::star<quoted_char>, pegtl::one<'\''>> {
};

struct bare_value : pegtl::plus<pegtl::not_one<' ', '\t', '\n', '\r', '\v', '\f', ',', ';', '(', ')', '\''>> {
};

struct value : pegtl::sor<quoted_value, bare_value> {
};

struct backtick_name : pegtl::seq<pegtl::one<'`'>, pegtl::plus<pegtl::not_one<'`'>>, pegtl::one<'`'>> {
};

struct bare_name
    : pegtl::plus<pegtl::not_one<' ', '\t', '\n', '\r', '\v', '\f', ',', ';', '(', ')', '=', '`', '\''>> {
};

struct name : pegtl::sor<backtick_name, bare_name> {
};

struct table_name : name {
};

struct where_column : name {
};

struct criteria_pair : pegtl::seq<where_column, optional_space, pegtl::one<'='>, optional_space, value> {
};

struct criteria_value : value {
};

struct where_clause : pegtl::seq<kw_where, required_space, pegtl::sor<criteria_pair, criteria_value>> {
};

struct order_column : name {
};

struct order_direction : pegtl::sor<kw_asc, kw_desc> {
};

struct order_clause
    : pegtl::seq<kw_order, required_space, kw_by, required_space, order_column, pegtl::opt<required_space, order_direction>> {
};

struct select_all : pegtl::one<'*'> {
};

struct select_column : name {
};

struct select_list : pegtl::sor<select_all, pegtl::list<select_column, comma>> {
};

struct select_statement : pegtl::seq<kw_select,
                                     optional_space,
                                     select_list,
                                     required_space,
                                     kw_from,
                                     required_space,
                                     table_name,
                                     pegtl::opt<required_space, where_clause>,
                                     pegtl::opt<required_space, order_clause>> {
};

struct insert_column : name {
};

struct insert_value : value {
};

struct insert_columns
    : pegtl::seq<pegtl::one<'('>, optional_space, pegtl::list<insert_column, comma>, optional_space, pegtl::one<')'>> {
};

struct insert_values
    : pegtl::seq<pegtl::one<'('>, optional_space, pegtl::list<insert_value, comma>, optional_space, pegtl::one<')'>> {
};

struct insert_statement : pegtl::seq<kw_insert,
                                     required_space,
                                     kw_into,
                                     required_space,
                                     table_name,
                                     pegtl::opt<optional_space, insert_columns>,
                                     optional_space,
                                     kw_values,
                                     optional_space,
                                     insert_values> {
};

struct assignment_column : name {
};

struct assignment_value : value {
};

struct assignment : pegtl::seq<assignment_column, optional_space, pegtl::one<'='>, optional_space, assignment_value> {
};

struct update_statement : pegtl::seq<kw_update,
                                     required_space,
                                     table_name,
                                     required_space,
                                     kw_set,
                                     required_space,
                                     pegtl::list<assignment, comma>,
                                     pegtl::opt<required_space, where_clause>> {
};

struct delete_statement : pegtl::seq<kw_delete,
                                     required_space,
                                     kw_from,
                                     required_space,
                                     table_name,
                                     pegtl::opt<required_space, where_clause>> {
};

struct statement_grammar : pegtl::seq<optional_space,
                                      pegtl::sor<select_statement, insert_statement, update_statement, delete_statement>,
                                      optional_space,
                                      pegtl::opt<pegtl::one<';'>>,
                                      optional_space,
                                      pegtl::eof> {
};

[[nodiscard]] std::string unquote_value(std::string_view text)
{
    if (text.size() < 2U || text.front() != '\'' || text.back() != '\'') {
        return std::string{text};
    }

    std::string result;
    result.reserve(text.size() - 2U);
    const auto inner = text.substr(1U, text.size() - 2U);
    for (std::size_t index = 0U; index < inner.size(); ++index) {
        result.push_back(inner[index]);
        if (inner[index] == '\'' && index + 1U < inner.size() && inner[index + 1U] == '\'') {
            ++index;
        }
    }
    return result;
}

[[nodiscard]] std::string unquote_name(std::string_view text)
{
    if (text.size() >= 2U && text.front() == '`' && text.back() == '`') {
        return std::string{text.substr(1U, text.size() - 2U)};
    }
    return std::string{text};
}

struct StatementBuilder final {
    Statement statement{};
    std::string pending_column{};
};

template <typename Rule>
struct statement_action : pegtl::nothing<Rule> {
};

template <>
struct statement_action<kw_select> {
    template <typename Input>
    static void apply(const Input&, StatementBuilder& builder)
    {
        builder.statement.kind = StatementKind::Select;
    }
};

template <>
struct statement_action<kw_insert> {
    template <typename Input>
    static void apply(const Input&, StatementBuilder& builder)
    {
        builder.statement.kind = StatementKind::Insert;
    }
};

template <>
struct statement_action<kw_update> {
    template <typename Input>
    static void apply(const Input&, StatementBuilder& builder)
    {
        builder.statement.kind = StatementKind::Update;
    }
};

template <>
struct statement_action<kw_delete> {
    template <typename Input>
    static void apply(const Input&, StatementBuilder& builder)
    {
        builder.statement.kind = StatementKind::Delete;
    }
};

template <>
struct statement_action<table_name> {
    template <typename Input>
    static void apply(const Input& in, StatementBuilder& builder)
    {
        builder.statement.table = unquote_name(in.string_view());
    }
};

template <>
struct statement_action<select_column> {
    template <typename Input>
    static void apply(const Input& in, StatementBuilder& builder)
    {
        builder.statement.columns.push_back(unquote_name(in.string_view()));
    }
};

template <>
struct statement_action<insert_column> {
    template <typename Input>
    static void apply(const Input& in, StatementBuilder& builder)
    {
        builder.statement.columns.push_back(unquote_name(in.string_view()));
    }
};

template <>
struct statement_action<insert_value> {
    template <typename Input>
    static void apply(const Input& in, StatementBuilder& builder)
    {
        builder.statement.values.push_back(unquote_value(in.string_view()));
    }
};

template <>
struct statement_action<assignment_column> {
    template <typename Input>
    static void apply(const Input& in, StatementBuilder& builder)
    {
        builder.pending_column = unquote_name(in.string_view());
    }
};

template <>
struct statement_action<assignment_value> {
    template <typename Input>
    static void apply(const Input& in, StatementBuilder& builder)
    {
        builder.statement.assignments.push_back(
            Assignment{std::move(builder.pending_column), unquote_value(in.string_view())});
        builder.pending_column.clear();
    }
};

// where_column also matches the head of a bare criteria value, so the pair is
// taken apart only once the whole rule has matched.
template <>
struct statement_action<criteria_pair> {
    template <typename Input>
    static void apply(const Input& in, StatementBuilder& builder)
    {
        const auto text = in.string_view();
        std::size_t split = 0U;
        if (!text.empty() && text.front() == '`') {
            split = text.find('`', 1U) + 1U;
        }
        split = text.find('=', split);

        const auto column = unquote_name(trim_view(text.substr(0U, split)));
        const auto value = unquote_value(trim_view(text.substr(split + 1U)));
        builder.statement.criteria = column + "=" + value;
    }
};

template <>
struct statement_action<criteria_value> {
    template <typename Input>
    static void apply(const Input& in, StatementBuilder& builder)
    {
        builder.statement.criteria = unquote_value(in.string_view());
    }
};

template <>
struct statement_action<order_column> {
    template <typename Input>
    static void apply(const Input& in, StatementBuilder& builder)
    {
        builder.statement.order = unquote_name(in.string_view());
    }
};

template <>
struct statement_action<order_direction> {
    template <typename Input>
    static void apply(const Input& in, StatementBuilder& builder)
    {
        builder.statement.order += " " + lowercase_copy(in.string_view());
    }
};

}  // namespace

const char* statement_kind_name(StatementKind kind) noexcept
{
    switch (kind) {
    case StatementKind::Select:
        return "select";
    case StatementKind::Insert:
        return "insert";
    case StatementKind::Update:
        return "update";
    case StatementKind::Delete:
        return "delete";
    }
    return "unknown";
}

StatementParseResult parse_statement(std::string_view text)
{
    StatementParseResult result{};
    StatementBuilder builder{};
    pegtl::memory_input in(text.data(), text.size(), "statement");

    try {
        if (pegtl::parse<statement_grammar, statement_action>(in, builder)) {
            result.statement = std::move(builder.statement);
            return result;
        }

        ParserDiagnostic diagnostic{};
        diagnostic.severity = ParserSeverity::Error;
        diagnostic.message = "input did not match statement grammar";
        diagnostic.line = 1U;
        diagnostic.column = 1U;
        diagnostic.statement = trim_copy(text);
        diagnostic.remediation_hints = {"Use SELECT, INSERT, UPDATE or DELETE; see \\help for the accepted forms."};
        result.diagnostics.push_back(std::move(diagnostic));
    } catch (const pegtl::parse_error& error) {
        ParserDiagnostic diagnostic{};
        diagnostic.severity = ParserSeverity::Error;
        diagnostic.message = error.what();
        if (!error.positions().empty()) {
            diagnostic.line = static_cast<std::size_t>(error.positions().front().line);
            diagnostic.column = static_cast<std::size_t>(error.positions().front().column);
        }
        diagnostic.statement = trim_copy(text);
        result.diagnostics.push_back(std::move(diagnostic));
    }

    return result;
}

}  // namespace flatdb::parser
