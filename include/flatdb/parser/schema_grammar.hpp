#pragma once

#include "flatdb/catalog/schema.hpp"
#include "flatdb/parser/parser_diagnostics.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace flatdb::parser {

struct SchemaParseResult final {
    catalog::Schema schema{};
    std::vector<ParserDiagnostic> diagnostics{};
};

// Parses schema definition text:
//   TAB <table>   starts naming the current table
//   KEY <column>  primary key column (also appended to the column list)
//   COL <column>  ordinary column
//   **            ends the current table
// Any other line is ignored. Unusable tables are dropped with a diagnostic.
[[nodiscard]] SchemaParseResult parse_schema_definition(std::string_view source,
                                                        std::string_view source_name = "schema");

// Throws engine::EngineError with SchemaFileMissing when the file cannot be
// opened and SchemaFileEmpty when it has no lines.
[[nodiscard]] SchemaParseResult load_schema_file(const std::filesystem::path& path);

}  // namespace flatdb::parser
