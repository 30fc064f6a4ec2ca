#include "flatdb/catalog/schema_cache.hpp"
#include "flatdb/engine/database.hpp"
#include "flatdb/engine/database_options.hpp"
#include "flatdb/engine/engine_errors.hpp"
#include "flatdb/engine/engine_telemetry.hpp"
#include "flatdb/parser/text_utils.hpp"
#include "flatdb/shell/shell_engine.hpp"
#include "flatdb/tools/operation_log_formatter.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

using flatdb::parser::trim_copy;

std::filesystem::path history_path()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return {};
    }

    std::filesystem::path path{home};
    path /= ".flatdb_shell_history";
    return path;
}

void render_result(const flatdb::shell::CommandMetrics& metrics)
{
    const auto status = metrics.success ? "OK" : "ERROR";
    std::cout << status << ": " << metrics.summary;
    if (!metrics.correlation_id.empty()) {
        std::cout << " [" << metrics.correlation_id << ']';
    }
    std::cout << " [" << std::fixed << std::setprecision(2) << metrics.duration_ms << " ms]";
    if (metrics.rows_touched != 0U) {
        std::cout << " rows=" << metrics.rows_touched;
    }
    std::cout << '\n';

    for (const auto& line : metrics.detail_lines) {
        std::cout << "    " << line << '\n';
    }

    for (const auto& diagnostic : metrics.diagnostics) {
        std::cout << "  - " << diagnostic.message;
        if (!diagnostic.statement.empty()) {
            std::cout << " (statement: " << diagnostic.statement << ')';
        }
        std::cout << '\n';
        for (const auto& hint : diagnostic.remediation_hints) {
            std::cout << "      hint: " << hint << '\n';
        }
    }
}

bool command_complete(std::string_view text)
{
    bool in_single_quote = false;

    for (std::size_t index = 0U; index < text.size(); ++index) {
        const char ch = text[index];
        const char next = (index + 1U < text.size()) ? text[index + 1U] : '\0';

        if (ch == '\'') {
            if (in_single_quote && next == '\'') {
                ++index;
            } else {
                in_single_quote = !in_single_quote;
            }
            continue;
        }

        if (in_single_quote) {
            continue;
        }

        if (ch == ';') {
            return trim_copy(text.substr(index + 1U)).empty();
        }
    }

    return false;
}

bool load_script_commands(std::istream& input, std::vector<std::string>& commands, std::string& error_message)
{
    error_message.clear();

    std::string buffer;
    std::string line;

    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        const auto trimmed = trim_copy(line);
        if (buffer.empty() && (trimmed.empty() || trimmed.rfind("--", 0U) == 0U)) {
            continue;
        }
        if (buffer.empty() && trimmed.rfind("\\", 0U) == 0U) {
            commands.push_back(trimmed);
            continue;
        }

        buffer.append(line);
        buffer.push_back('\n');

        if (!command_complete(buffer)) {
            continue;
        }

        commands.push_back(trim_copy(buffer));
        buffer.clear();
    }

    if (input.bad()) {
        error_message = "I/O error while reading script";
        return false;
    }

    if (input.fail() && !input.eof()) {
        error_message = "Failed to read script to completion";
        return false;
    }

    const auto trailing = trim_copy(buffer);
    if (!trailing.empty()) {
        commands.push_back(trailing);
    }

    return true;
}

bool run_script_stream(flatdb::shell::ShellEngine& engine, std::istream& stream, const std::string& source)
{
    std::vector<std::string> statements;
    statements.reserve(16U);

    std::string error;
    if (!load_script_commands(stream, statements, error)) {
        std::cerr << "error: " << error;
        if (!source.empty()) {
            std::cerr << " ('" << source << "')";
        }
        std::cerr << '\n';
        return false;
    }

    bool all_success = true;
    for (const auto& statement : statements) {
        const auto result = engine.execute(statement);
        render_result(result);
        if (!result.success) {
            all_success = false;
        }
    }

    return all_success;
}

int run_repl(bool quiet, flatdb::shell::ShellEngine& engine)
{
    replxx::Replxx repl;

    const auto history = history_path();
    if (!history.empty()) {
        (void)repl.history_load(history.string());
    }

    if (!quiet) {
        std::cout << "flatdb shell: statements end with ';', type \\help for commands or \\q to quit.\n";
    }

    std::string buffer;
    while (true) {
        const char* line = repl.input(buffer.empty() ? "flatdb> " : "...> ");
        if (line == nullptr) {
            std::cout << '\n';
            break;
        }

        const auto trimmed = trim_copy(line);
        if (buffer.empty() && trimmed.rfind("\\", 0U) == 0U) {
            if (trimmed == "\\q" || trimmed == "\\quit") {
                break;
            }
            repl.history_add(trimmed);
            render_result(engine.execute(trimmed));
            continue;
        }

        if (buffer.empty() && trimmed.rfind("@", 0U) == 0U) {
            const auto script_spec = trim_copy(std::string_view{trimmed}.substr(1U));
            if (script_spec.empty()) {
                std::cerr << "error: script path is required after '@'" << '\n';
                continue;
            }

            std::ifstream script_file{script_spec};
            if (!script_file.is_open()) {
                std::cerr << "error: failed to open script file '" << script_spec << "'" << '\n';
                continue;
            }

            if (!run_script_stream(engine, script_file, script_spec)) {
                std::cerr << "error: script '" << script_spec << "' completed with errors" << '\n';
            }
            continue;
        }

        if (trimmed.empty()) {
            continue;
        }

        buffer.append(line);
        buffer.push_back('\n');

        if (!command_complete(buffer)) {
            continue;
        }

        const auto statement = trim_copy(buffer);
        repl.history_add(statement);
        render_result(engine.execute(statement));
        if (!history.empty()) {
            (void)repl.history_save(history.string());
        }
        buffer.clear();
    }

    return 0;
}

int run_batch(const std::vector<std::string>& commands, flatdb::shell::ShellEngine& engine)
{
    int exit_code = 0;
    for (const auto& command : commands) {
        const auto result = engine.execute(command);
        render_result(result);
        if (!result.success) {
            exit_code = 1;
        }
    }
    return exit_code;
}

std::optional<std::map<std::string, std::string>> parse_option_pairs(const std::vector<std::string>& pairs)
{
    std::map<std::string, std::string> values;
    for (const auto& pair : pairs) {
        const auto separator = pair.find('=');
        if (separator == std::string::npos) {
            std::cerr << "error: --option expects key=value, got '" << pair << "'" << '\n';
            return std::nullopt;
        }
        values[trim_copy(std::string_view{pair}.substr(0U, separator))] =
            trim_copy(std::string_view{pair}.substr(separator + 1U));
    }
    return values;
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Interactive shell for flatdb delimited-text databases."};

    bool quiet = false;
    bool prepend_database_name = false;
    bool no_cache = false;
    bool legacy_delimiters = false;
    std::vector<std::string> execute_commands;
    std::vector<std::string> script_files;
    std::vector<std::string> option_pairs;
    std::string log_json_path;
    std::string data_directory = ".";
    std::string database_name;

    app.add_flag("-q,--quiet", quiet, "Suppress startup banner and schema warnings");
    app.add_option("-c,--command", execute_commands, "Execute the provided command and exit")
        ->type_name("COMMAND")
        ->expected(1);
    app.add_option("-f,--file", script_files, "Execute commands from the specified script file (use '-' for stdin)")
        ->type_name("PATH")
        ->expected(1);
    app.add_option("--log-json", log_json_path, "Write engine operation logs as JSON Lines (use '-' for stdout)");
    app.add_option("--data-dir", data_directory, "Directory holding the schema and table files")
        ->type_name("PATH");
    app.add_option("--database", database_name, "Database name; the schema file is <data-dir>/<name>.dbd")
        ->required();
    app.add_flag("--prepend-db-name", prepend_database_name, "Table files are named <database>.<table>.dtf");
    app.add_flag("--no-cache", no_cache, "Always parse the schema file instead of reading the schema cache");
    app.add_flag("--legacy-delimiters", legacy_delimiters, "Use the legacy 200/201 delimiter bytes");
    app.add_option("--option", option_pairs, "Database option as key=value (repeatable)")
        ->type_name("KEY=VALUE");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    }

    const auto option_values = parse_option_pairs(option_pairs);
    if (!option_values) {
        return 1;
    }

    flatdb::engine::DatabaseOptions defaults{};
    defaults.prepend_database_name_to_table_filename = prepend_database_name;
    defaults.use_cache = !no_cache;
    defaults.legacy_delimiters = legacy_delimiters;

    flatdb::engine::DatabaseOptions options{};
    try {
        options = flatdb::engine::parse_database_options(*option_values, defaults);
    } catch (const std::invalid_argument& error) {
        std::cerr << "error: " << error.what() << '\n';
        return 1;
    }

    std::unique_ptr<std::ofstream> log_file;
    std::ostream* log_stream = nullptr;
    std::mutex log_mutex;

    if (!log_json_path.empty()) {
        if (log_json_path == "-") {
            log_stream = &std::cout;
        } else {
            auto file = std::make_unique<std::ofstream>(log_json_path, std::ios::out | std::ios::app);
            if (!file->is_open()) {
                std::cerr << "error: failed to open log file '" << log_json_path << "'" << '\n';
                return 1;
            }
            log_stream = file.get();
            log_file = std::move(file);
        }
    }

    flatdb::engine::EngineTelemetry telemetry;
    flatdb::engine::Database::Config config{};
    config.schema_cache = std::make_shared<flatdb::catalog::FileSchemaCache>();
    config.telemetry = &telemetry;
    if (log_stream != nullptr) {
        config.operation_logger = [log_stream, &log_mutex](const flatdb::engine::OperationRecord& record) {
            const auto line = flatdb::tools::format_operation_log_json(record);
            std::lock_guard<std::mutex> guard{log_mutex};
            (*log_stream) << line << '\n';
            log_stream->flush();
        };
    }

    std::optional<flatdb::engine::Database> database;
    try {
        database.emplace(std::filesystem::path{data_directory}, database_name, options, std::move(config));
    } catch (const std::system_error& error) {
        std::cerr << "error: " << error.what() << '\n';
        return 1;
    }

    if (!quiet) {
        for (const auto& diagnostic : database->schema_diagnostics()) {
            std::cerr << "warning: " << database->schema_file_path().string() << ':' << diagnostic.line << ": "
                      << diagnostic.message << '\n';
        }
    }

    flatdb::shell::ShellEngine engine{flatdb::shell::ShellEngine::Config{&*database}};

    std::vector<std::string> commands_to_run;
    commands_to_run.reserve(execute_commands.size());

    bool stdin_consumed = false;
    for (const auto& script_path : script_files) {
        std::istream* input = nullptr;
        std::ifstream script_stream;
        if (script_path == "-") {
            if (stdin_consumed) {
                std::cerr << "error: stdin script '-' specified more than once" << '\n';
                return 1;
            }
            stdin_consumed = true;
            input = &std::cin;
        } else {
            script_stream.open(script_path);
            if (!script_stream.is_open()) {
                std::cerr << "error: failed to open script file '" << script_path << "'" << '\n';
                return 1;
            }
            input = &script_stream;
        }

        std::string error;
        if (!load_script_commands(*input, commands_to_run, error)) {
            std::cerr << "error: " << error << " ('" << (script_path == "-" ? "<stdin>" : script_path) << "')" << '\n';
            return 1;
        }
    }

    commands_to_run.insert(commands_to_run.end(), execute_commands.begin(), execute_commands.end());

    if (!commands_to_run.empty()) {
        return run_batch(commands_to_run, engine);
    }

    if (!script_files.empty()) {
        return 0;
    }

    return run_repl(quiet, engine);
}
