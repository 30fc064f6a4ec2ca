#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace flatdb::parser {

enum class ParserSeverity : std::uint8_t {
    Info = 0,
    Warning,
    Error
};

struct ParserDiagnostic final {
    ParserSeverity severity = ParserSeverity::Error;
    std::string message{};
    std::size_t line = 0U;
    std::size_t column = 0U;
    std::string statement{};
    std::vector<std::string> remediation_hints{};
};

[[nodiscard]] const char* parser_severity_name(ParserSeverity severity) noexcept;

}  // namespace flatdb::parser
