#pragma once

#include <map>
#include <string>

namespace flatdb::engine {

struct DatabaseOptions final {
    bool prepend_database_name_to_table_filename = false;
    bool use_cache = true;
    // Swaps the unit/record separators for the legacy 200/201 byte pair.
    bool legacy_delimiters = false;
    std::string schema_extension = ".dbd";
    std::string data_extension = ".dtf";
};

// Builds options from textual key/value pairs. Recognized keys:
//   prepend_database_name_to_table_filename, use_cache, no_cache (negated
//   use_cache), legacy_delimiters (alias compat_legacy_delimiters),
//   schema_extension, data_extension.
// Throws std::invalid_argument on unknown keys or non-boolean values.
[[nodiscard]] DatabaseOptions parse_database_options(const std::map<std::string, std::string>& values,
                                                     DatabaseOptions defaults = {});

[[nodiscard]] bool parse_option_bool(const std::string& key, const std::string& value);

}  // namespace flatdb::engine
