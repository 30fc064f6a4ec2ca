#pragma once

#include "flatdb/engine/database.hpp"
#include "flatdb/parser/parser_diagnostics.hpp"
#include "flatdb/parser/statement_grammar.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace flatdb::shell {

struct CommandMetrics final {
    bool success = false;
    std::string summary{};
    double duration_ms = 0.0;
    std::uint64_t rows_touched = 0U;
    std::vector<parser::ParserDiagnostic> diagnostics{};
    std::vector<std::string> detail_lines{};
    std::string command_text{};
    std::string correlation_id{};
    std::string command_category{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

class ShellEngine final {
public:
    struct Config final {
        engine::Database* database = nullptr;
    };

    // Throws std::invalid_argument when no database is configured.
    explicit ShellEngine(Config config);

    CommandMetrics execute(const std::string& command);

private:
    enum class CommandKind : std::uint8_t {
        Empty = 0,
        Statement,
        Meta,
        Unknown
    };

    static CommandKind classify(std::string_view text);
    static std::string_view command_kind_to_string(CommandKind kind) noexcept;

    CommandMetrics execute_statement(const std::string& text);
    CommandMetrics execute_meta(const std::string& command);
    CommandMetrics run_select(const parser::Statement& statement);
    CommandMetrics run_insert(const parser::Statement& statement);
    CommandMetrics run_update(const parser::Statement& statement);
    CommandMetrics run_delete(const parser::Statement& statement);
    CommandMetrics unsupported_command(const std::string& text);

    Config config_{};
    std::atomic<std::uint64_t> correlation_counter_{1U};
};

}  // namespace flatdb::shell
