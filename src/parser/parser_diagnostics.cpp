#include "flatdb/parser/parser_diagnostics.hpp"

namespace flatdb::parser {

const char* parser_severity_name(ParserSeverity severity) noexcept
{
    switch (severity) {
    case ParserSeverity::Info:
        return "info";
    case ParserSeverity::Warning:
        return "warning";
    case ParserSeverity::Error:
    default:
        return "error";
    }
}

}  // namespace flatdb::parser
