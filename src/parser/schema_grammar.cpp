#include "flatdb/parser/schema_grammar.hpp"

#include "flatdb/engine/engine_errors.hpp"
#include "flatdb/parser/text_utils.hpp"

#include <tao/pegtl.hpp>

#include <fstream>
#include <iterator>
#include <utility>

namespace flatdb::parser {

namespace pegtl = tao::pegtl;

namespace {

constexpr std::size_t kTagLength = 3U;

struct line_rest : pegtl::star<pegtl::not_one<'\n'>> {
};

struct tag_separator : pegtl::one<' ', '\t', '\v', '\f', '\r'> {
};

struct directive_value : line_rest {
};

template <typename Tag>
struct directive : pegtl::seq<Tag, pegtl::sor<pegtl::at<pegtl::eolf>, pegtl::seq<tag_separator, directive_value>>> {
};

struct table_directive : directive<pegtl::string<'T', 'A', 'B'>> {
};

struct key_directive : directive<pegtl::string<'K', 'E', 'Y'>> {
};

struct column_directive : directive<pegtl::string<'C', 'O', 'L'>> {
};

struct table_separator : pegtl::seq<pegtl::string<'*', '*'>, line_rest> {
};

struct ignored_line : line_rest {
};

struct definition_line
    : pegtl::seq<pegtl::sor<table_separator, table_directive, key_directive, column_directive, ignored_line>,
                 pegtl::eolf> {
};

struct schema_grammar : pegtl::until<pegtl::eof, definition_line> {
};

struct PendingTable final {
    catalog::TableDefinition table{};
    std::size_t first_line = 0U;
};

struct SchemaBuilder final {
    SchemaBuilder()
    {
        tables.emplace_back();
    }

    PendingTable& current()
    {
        return tables.back();
    }

    void touch(std::size_t line)
    {
        if (current().first_line == 0U) {
            current().first_line = line;
        }
    }

    void warn(std::size_t line, std::string message, std::string statement, std::string hint)
    {
        ParserDiagnostic diagnostic{};
        diagnostic.severity = ParserSeverity::Warning;
        diagnostic.message = std::move(message);
        diagnostic.line = line;
        diagnostic.column = 1U;
        diagnostic.statement = std::move(statement);
        diagnostic.remediation_hints = {std::move(hint)};
        diagnostics.push_back(std::move(diagnostic));
    }

    void add_column(std::size_t line, std::string column, const std::string& statement)
    {
        auto& table = current().table;
        if (table.has_column(column)) {
            warn(line,
                 "duplicate column '" + column + "' ignored",
                 statement,
                 "Declare each column once per table.");
            return;
        }
        table.columns.push_back(std::move(column));
    }

    std::vector<PendingTable> tables{};
    std::vector<ParserDiagnostic> diagnostics{};
};

template <typename Input>
std::string directive_argument(const Input& in)
{
    const auto text = in.string();
    return trim_copy(std::string_view{text}.substr(kTagLength));
}

template <typename Rule>
struct schema_action : pegtl::nothing<Rule> {
};

template <>
struct schema_action<table_separator> {
    template <typename Input>
    static void apply(const Input&, SchemaBuilder& builder)
    {
        builder.tables.emplace_back();
    }
};

template <>
struct schema_action<table_directive> {
    template <typename Input>
    static void apply(const Input& in, SchemaBuilder& builder)
    {
        const auto line = static_cast<std::size_t>(in.position().line);
        auto name = directive_argument(in);
        auto& table = builder.current().table;
        if (!table.name.empty()) {
            builder.warn(line,
                         "table '" + table.name + "' renamed to '" + name + "'",
                         trim_copy(in.string()),
                         "Separate table definitions with a '**' line.");
        }
        builder.touch(line);
        table.name = std::move(name);
    }
};

template <>
struct schema_action<key_directive> {
    template <typename Input>
    static void apply(const Input& in, SchemaBuilder& builder)
    {
        const auto line = static_cast<std::size_t>(in.position().line);
        auto column = directive_argument(in);
        const auto statement = trim_copy(in.string());
        builder.touch(line);
        if (column.empty()) {
            builder.warn(line, "KEY directive without a column name ignored", statement, "Use KEY <column>.");
            return;
        }

        auto& table = builder.current().table;
        if (!table.primary_key.empty()) {
            builder.warn(line,
                         "table '" + table.name + "' already has primary key '" + table.primary_key
                             + "'; '" + column + "' added as an ordinary column",
                         statement,
                         "Declare exactly one KEY per table.");
            builder.add_column(line, std::move(column), statement);
            return;
        }

        if (!table.columns.empty()) {
            builder.warn(line,
                         "primary key '" + column + "' is not the first declared column",
                         statement,
                         "Declare KEY before any COL lines.");
        }
        table.primary_key = column;
        builder.add_column(line, std::move(column), statement);
    }
};

template <>
struct schema_action<column_directive> {
    template <typename Input>
    static void apply(const Input& in, SchemaBuilder& builder)
    {
        const auto line = static_cast<std::size_t>(in.position().line);
        auto column = directive_argument(in);
        const auto statement = trim_copy(in.string());
        builder.touch(line);
        if (column.empty()) {
            builder.warn(line, "COL directive without a column name ignored", statement, "Use COL <column>.");
            return;
        }
        builder.add_column(line, std::move(column), statement);
    }
};

void finalize(SchemaBuilder& builder, SchemaParseResult& result)
{
    for (auto& pending : builder.tables) {
        auto& table = pending.table;
        if (table.name.empty() && table.columns.empty()) {
            continue;
        }

        if (table.degenerate()) {
            builder.warn(pending.first_line,
                         table.name.empty() ? "table definition without a TAB name dropped"
                                            : "table '" + table.name + "' has no columns and was dropped",
                         table.name,
                         "Every table needs a TAB line and at least a KEY column.");
            continue;
        }

        if (table.primary_key.empty()) {
            table.primary_key = table.columns.front();
            builder.warn(pending.first_line,
                         "table '" + table.name + "' has no KEY; using '" + table.primary_key + "'",
                         table.name,
                         "Declare the primary key with KEY <column>.");
        }

        result.schema.tables.push_back(std::move(table));
    }
    result.diagnostics = std::move(builder.diagnostics);
}

}  // namespace

SchemaParseResult parse_schema_definition(std::string_view source, std::string_view source_name)
{
    SchemaParseResult result{};
    SchemaBuilder builder{};
    pegtl::memory_input in(source.data(), source.size(), std::string{source_name});

    try {
        if (!pegtl::parse<schema_grammar, schema_action>(in, builder)) {
            ParserDiagnostic diagnostic{};
            diagnostic.severity = ParserSeverity::Error;
            diagnostic.message = "input did not match schema definition grammar";
            diagnostic.line = 1U;
            diagnostic.column = 1U;
            diagnostic.statement = std::string{source_name};
            diagnostic.remediation_hints = {"Use TAB, KEY, COL and '**' lines."};
            builder.diagnostics.push_back(std::move(diagnostic));
        }
    } catch (const pegtl::parse_error& error) {
        ParserDiagnostic diagnostic{};
        diagnostic.severity = ParserSeverity::Error;
        diagnostic.message = error.what();
        if (!error.positions().empty()) {
            diagnostic.line = static_cast<std::size_t>(error.positions().front().line);
            diagnostic.column = static_cast<std::size_t>(error.positions().front().column);
        }
        diagnostic.statement = std::string{source_name};
        builder.diagnostics.push_back(std::move(diagnostic));
    }

    finalize(builder, result);
    return result;
}

SchemaParseResult load_schema_file(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw engine::EngineError(engine::EngineErrc::SchemaFileMissing,
                                  "schema file missing or not readable: " + path.string(),
                                  {path.string()});
    }

    std::ifstream stream{path, std::ios::in | std::ios::binary};
    if (!stream.is_open()) {
        throw engine::EngineError(engine::EngineErrc::SchemaFileMissing,
                                  "schema file missing or not readable: " + path.string(),
                                  {path.string()});
    }

    const std::string contents{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
    if (stream.bad()) {
        throw engine::EngineError(engine::EngineErrc::SchemaFileMissing,
                                  "schema file could not be read: " + path.string(),
                                  {path.string()});
    }
    if (contents.empty()) {
        throw engine::EngineError(engine::EngineErrc::SchemaFileEmpty,
                                  "schema file empty: " + path.string(),
                                  {path.string()});
    }

    return parse_schema_definition(contents, path.string());
}

}  // namespace flatdb::parser
