#include "flatdb/engine/database_options.hpp"

#include "flatdb/parser/text_utils.hpp"

#include <stdexcept>
#include <utility>

namespace flatdb::engine {
namespace {

[[nodiscard]] std::string normalize_extension(const std::string& value)
{
    auto extension = parser::trim_copy(value);
    if (!extension.empty() && extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }
    return extension;
}

}  // namespace

bool parse_option_bool(const std::string& key, const std::string& value)
{
    const auto text = parser::lowercase_copy(parser::trim_view(value));
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
        return true;
    }
    if (text == "0" || text == "false" || text == "no" || text == "off" || text.empty()) {
        return false;
    }
    throw std::invalid_argument{"option '" + key + "' expects a boolean value, got '" + value + "'"};
}

DatabaseOptions parse_database_options(const std::map<std::string, std::string>& values, DatabaseOptions defaults)
{
    auto options = std::move(defaults);
    for (const auto& [key, value] : values) {
        if (key == "prepend_database_name_to_table_filename") {
            options.prepend_database_name_to_table_filename = parse_option_bool(key, value);
        } else if (key == "use_cache") {
            options.use_cache = parse_option_bool(key, value);
        } else if (key == "no_cache") {
            options.use_cache = !parse_option_bool(key, value);
        } else if (key == "legacy_delimiters" || key == "compat_legacy_delimiters") {
            options.legacy_delimiters = parse_option_bool(key, value);
        } else if (key == "schema_extension") {
            options.schema_extension = normalize_extension(value);
        } else if (key == "data_extension") {
            options.data_extension = normalize_extension(value);
        } else {
            throw std::invalid_argument{"unknown database option '" + key + "'"};
        }
    }
    return options;
}

}  // namespace flatdb::engine
