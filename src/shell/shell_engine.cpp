#include "flatdb/shell/shell_engine.hpp"

#include "flatdb/engine/engine_errors.hpp"
#include "flatdb/parser/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

using flatdb::parser::ParserDiagnostic;

namespace flatdb::shell {

namespace {

[[nodiscard]] std::vector<std::string> split_tokens(std::string_view text)
{
    std::vector<std::string> tokens;
    std::size_t index = 0U;
    while (index < text.size()) {
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) != 0) {
            ++index;
        }
        if (index >= text.size()) {
            break;
        }
        const std::size_t begin = index;
        while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) == 0) {
            ++index;
        }
        tokens.emplace_back(text.substr(begin, index - begin));
    }
    return tokens;
}

[[nodiscard]] std::string_view first_token(std::string_view text)
{
    std::size_t index = 0U;
    while (index < text.size() && std::isspace(static_cast<unsigned char>(text[index])) == 0) {
        ++index;
    }
    return text.substr(0U, index);
}

[[nodiscard]] std::string plural(std::size_t count, std::string_view noun)
{
    std::ostringstream stream;
    stream << count << ' ' << noun << (count == 1U ? "" : "s");
    return stream.str();
}

[[nodiscard]] std::vector<std::string> format_table(const std::vector<std::string>& headers,
                                                    const std::vector<std::vector<std::string>>& rows)
{
    const std::size_t column_count = headers.size();
    std::vector<std::size_t> widths(column_count, 0U);
    for (std::size_t i = 0U; i < column_count; ++i) {
        widths[i] = headers[i].size();
    }
    for (const auto& row : rows) {
        for (std::size_t i = 0U; i < column_count && i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto make_line = [&](const std::vector<std::string>& fields) {
        std::string line;
        for (std::size_t i = 0U; i < column_count; ++i) {
            if (i > 0U) {
                line.append(" | ");
            }
            const std::string& field = (i < fields.size()) ? fields[i] : std::string{};
            line.append(field);
            if (field.size() < widths[i]) {
                line.append(widths[i] - field.size(), ' ');
            }
        }
        return line;
    };

    std::vector<std::string> lines;
    lines.reserve(rows.size() + 3U);
    lines.push_back(make_line(headers));

    std::string separator;
    for (std::size_t i = 0U; i < column_count; ++i) {
        if (i > 0U) {
            separator.append("-+-");
        }
        separator.append(widths[i], '-');
    }
    lines.push_back(std::move(separator));

    if (rows.empty()) {
        lines.push_back("(no rows)");
        return lines;
    }

    for (const auto& row : rows) {
        lines.push_back(make_line(row));
    }

    return lines;
}

[[nodiscard]] std::vector<std::string> remediation_for(engine::EngineErrc code)
{
    switch (code) {
    case engine::EngineErrc::DatabaseNotFound:
        return {"Check --data-dir and --database."};
    case engine::EngineErrc::MissingTableParam:
    case engine::EngineErrc::TableNotFound:
        return {"Use \\tables to list the tables of this database."};
    case engine::EngineErrc::ColumnNotFound:
        return {"Use \\schema <table> to list the columns of a table."};
    case engine::EngineErrc::ColumnListMismatch:
        return {"Supply exactly one value per listed column."};
    case engine::EngineErrc::DuplicateKey:
        return {"Omit the key column to have the next key assigned."};
    case engine::EngineErrc::AutoKeyOverflow:
        return {"Supply the key explicitly."};
    default:
        return {};
    }
}

void record_failure(CommandMetrics& metrics, const std::string& statement, const std::system_error& error)
{
    metrics.success = false;
    metrics.summary = error.what();

    ParserDiagnostic diagnostic{};
    diagnostic.severity = parser::ParserSeverity::Error;
    diagnostic.message = error.what();
    diagnostic.statement = statement;
    if (error.code().category() == engine::engine_error_category()) {
        diagnostic.remediation_hints = remediation_for(static_cast<engine::EngineErrc>(error.code().value()));
    }
    metrics.diagnostics.push_back(std::move(diagnostic));
}

const std::vector<std::string>& help_lines()
{
    static const std::vector<std::string> lines{
        "\\tables                     List tables",
        "\\schema <table>             List the columns of a table",
        "\\key <table>                Show the primary key of a table",
        "\\help                       Show this message",
        "SELECT <cols|*> FROM <table> [WHERE <criteria>] [ORDER BY <col> [ASC|DESC]];",
        "INSERT INTO <table> [(<cols>)] VALUES (<value>, ...);",
        "UPDATE <table> SET <col> = <value>[, ...] [WHERE <criteria>];",
        "DELETE FROM <table> [WHERE <criteria>];",
        "Criteria: <col>=<value>, <value> (primary key), or a /regex/ value.",
    };
    return lines;
}

}  // namespace

ShellEngine::ShellEngine(Config config)
    : config_{std::move(config)}
{
    if (config_.database == nullptr) {
        throw std::invalid_argument{"ShellEngine requires a database"};
    }
}

CommandMetrics ShellEngine::execute(const std::string& command)
{
    const auto trimmed = parser::trim_copy(command);
    const auto kind = classify(trimmed);
    const auto started_at = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();

    CommandMetrics metrics{};
    switch (kind) {
    case CommandKind::Empty:
        metrics.success = true;
        metrics.summary = "Empty command.";
        break;
    case CommandKind::Statement:
        metrics = execute_statement(trimmed);
        break;
    case CommandKind::Meta:
        metrics = execute_meta(trimmed);
        break;
    case CommandKind::Unknown:
    default:
        metrics = unsupported_command(trimmed);
        break;
    }

    const auto end = std::chrono::steady_clock::now();
    const auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start);
    metrics.duration_ms = static_cast<double>(duration_ns.count()) / 1'000'000.0;
    metrics.started_at = started_at;
    metrics.finished_at = std::chrono::system_clock::now();
    metrics.command_text = trimmed;
    metrics.command_category = std::string{command_kind_to_string(kind)};
    metrics.correlation_id = "cmd-" + std::to_string(correlation_counter_.fetch_add(1U, std::memory_order_relaxed));
    return metrics;
}

ShellEngine::CommandKind ShellEngine::classify(std::string_view text)
{
    if (text.empty()) {
        return CommandKind::Empty;
    }

    if (text.front() == '\\') {
        return CommandKind::Meta;
    }

    auto token = first_token(text);
    const auto paren = token.find('(');
    if (paren != std::string_view::npos) {
        token = token.substr(0U, paren);
    }
    if (parser::iequals(token, "SELECT") || parser::iequals(token, "INSERT") || parser::iequals(token, "UPDATE")
        || parser::iequals(token, "DELETE")) {
        return CommandKind::Statement;
    }

    return CommandKind::Unknown;
}

std::string_view ShellEngine::command_kind_to_string(CommandKind kind) noexcept
{
    switch (kind) {
    case CommandKind::Empty:
        return "empty";
    case CommandKind::Statement:
        return "statement";
    case CommandKind::Meta:
        return "meta";
    case CommandKind::Unknown:
    default:
        return "unknown";
    }
}

CommandMetrics ShellEngine::execute_statement(const std::string& text)
{
    auto parsed = parser::parse_statement(text);
    if (!parsed.success()) {
        CommandMetrics metrics{};
        metrics.success = false;
        metrics.summary = "Could not parse statement.";
        metrics.diagnostics = std::move(parsed.diagnostics);
        return metrics;
    }

    const auto& statement = *parsed.statement;
    try {
        switch (statement.kind) {
        case parser::StatementKind::Select:
            return run_select(statement);
        case parser::StatementKind::Insert:
            return run_insert(statement);
        case parser::StatementKind::Update:
            return run_update(statement);
        case parser::StatementKind::Delete:
            return run_delete(statement);
        }
    } catch (const std::system_error& error) {
        CommandMetrics metrics{};
        record_failure(metrics, text, error);
        return metrics;
    }

    return unsupported_command(text);
}

CommandMetrics ShellEngine::run_select(const parser::Statement& statement)
{
    const executor::ColumnList columns =
        statement.columns.empty() ? executor::ColumnList{} : executor::ColumnList{statement.columns};
    const auto rows = config_.database->select(statement.table, columns, statement.criteria, statement.order);

    std::vector<std::string> headers;
    if (!rows.empty()) {
        headers = rows.front().columns();
    } else if (statement.columns.empty()) {
        headers = config_.database->table_schema(statement.table);
    } else {
        headers = statement.columns;
    }

    std::vector<std::vector<std::string>> table_rows;
    table_rows.reserve(rows.size());
    for (const auto& row : rows) {
        table_rows.push_back(row.values());
    }

    CommandMetrics metrics{};
    metrics.success = true;
    metrics.rows_touched = rows.size();
    metrics.summary = "Selected " + plural(rows.size(), "row") + " from " + statement.table;
    metrics.detail_lines = format_table(headers, table_rows);
    return metrics;
}

CommandMetrics ShellEngine::run_insert(const parser::Statement& statement)
{
    const auto key = statement.columns.empty()
                         ? config_.database->insert(statement.table, statement.values)
                         : config_.database->insert(statement.table, executor::ColumnList{statement.columns}, statement.values);

    CommandMetrics metrics{};
    metrics.success = true;
    metrics.rows_touched = 1U;
    metrics.summary = "Inserted 1 row into " + statement.table + " with key " + key;
    return metrics;
}

CommandMetrics ShellEngine::run_update(const parser::Statement& statement)
{
    std::vector<std::string> columns;
    std::vector<std::string> values;
    columns.reserve(statement.assignments.size());
    values.reserve(statement.assignments.size());
    for (const auto& assignment : statement.assignments) {
        columns.push_back(assignment.column);
        values.push_back(assignment.value);
    }

    const auto updated =
        config_.database->update(statement.table, executor::ColumnList{std::move(columns)}, values, statement.criteria);

    CommandMetrics metrics{};
    metrics.success = true;
    metrics.rows_touched = updated;
    metrics.summary = "Updated " + plural(updated, "row") + " in " + statement.table;
    return metrics;
}

CommandMetrics ShellEngine::run_delete(const parser::Statement& statement)
{
    const auto removed = config_.database->remove(statement.table, statement.criteria);

    CommandMetrics metrics{};
    metrics.success = true;
    metrics.rows_touched = removed;
    metrics.summary = "Deleted " + plural(removed, "row") + " from " + statement.table;
    return metrics;
}

CommandMetrics ShellEngine::execute_meta(const std::string& command)
{
    CommandMetrics metrics{};
    const auto tokens = split_tokens(command);
    const std::string argument = tokens.size() > 1U ? tokens[1] : std::string{};

    auto require_table = [&](std::string_view usage) {
        metrics.success = false;
        metrics.summary = "Missing table name.";
        ParserDiagnostic diagnostic{};
        diagnostic.severity = parser::ParserSeverity::Error;
        diagnostic.statement = command;
        diagnostic.message = "Command requires a table name.";
        diagnostic.remediation_hints = {"Usage: " + std::string{usage}};
        metrics.diagnostics.push_back(std::move(diagnostic));
        return metrics;
    };

    try {
        if (tokens.front() == "\\tables") {
            const auto tables = config_.database->list_tables();
            std::vector<std::vector<std::string>> rows;
            rows.reserve(tables.size());
            for (const auto& table : tables) {
                rows.push_back({table,
                                config_.database->primary_key(table),
                                std::to_string(config_.database->table_schema(table).size())});
            }
            metrics.detail_lines = format_table({"name", "key", "columns"}, rows);
            metrics.summary = "Listed " + plural(tables.size(), "table");
            metrics.success = true;
            return metrics;
        }

        if (tokens.front() == "\\schema") {
            if (argument.empty()) {
                return require_table("\\schema <table>");
            }
            const auto columns = config_.database->table_schema(argument);
            const auto key = config_.database->primary_key(argument);
            std::vector<std::vector<std::string>> rows;
            rows.reserve(columns.size());
            for (std::size_t index = 0U; index < columns.size(); ++index) {
                rows.push_back({std::to_string(index), columns[index], columns[index] == key ? "yes" : ""});
            }
            metrics.detail_lines = format_table({"position", "column", "key"}, rows);
            metrics.summary = "Listed " + plural(columns.size(), "column") + " of " + argument;
            metrics.success = true;
            return metrics;
        }

        if (tokens.front() == "\\key") {
            if (argument.empty()) {
                return require_table("\\key <table>");
            }
            metrics.summary = "Primary key of " + argument + " is " + config_.database->primary_key(argument);
            metrics.success = true;
            return metrics;
        }
    } catch (const std::system_error& error) {
        record_failure(metrics, command, error);
        return metrics;
    }

    if (tokens.front() == "\\help") {
        metrics.detail_lines = help_lines();
        metrics.summary = "Supported commands";
        metrics.success = true;
        return metrics;
    }

    metrics.success = false;
    metrics.summary = "Unsupported meta command.";
    ParserDiagnostic diagnostic{};
    diagnostic.severity = parser::ParserSeverity::Error;
    diagnostic.statement = command;
    diagnostic.message = "Shell command is not recognised.";
    diagnostic.remediation_hints = {"Use \\help to list supported commands."};
    metrics.diagnostics.push_back(std::move(diagnostic));
    return metrics;
}

CommandMetrics ShellEngine::unsupported_command(const std::string& text)
{
    CommandMetrics metrics{};
    metrics.success = false;

    const auto token = first_token(text);
    std::ostringstream summary;
    summary << "Unsupported command";
    if (!token.empty()) {
        summary << ": '" << token << "'";
    }
    metrics.summary = summary.str();

    ParserDiagnostic diagnostic{};
    diagnostic.severity = parser::ParserSeverity::Error;
    diagnostic.statement = text;
    diagnostic.message = "Command type is not supported by the shell.";
    diagnostic.remediation_hints = {"Use SELECT, INSERT, UPDATE, DELETE or a \\ command."};
    metrics.diagnostics.push_back(std::move(diagnostic));

    return metrics;
}

}  // namespace flatdb::shell
