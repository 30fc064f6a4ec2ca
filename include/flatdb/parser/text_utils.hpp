#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace flatdb::parser {

[[nodiscard]] std::string trim_copy(std::string_view text);
[[nodiscard]] std::string_view trim_view(std::string_view text) noexcept;
[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs) noexcept;
[[nodiscard]] std::string lowercase_copy(std::string_view text);
[[nodiscard]] std::vector<std::string> split_copy(std::string_view text, char delimiter);

}  // namespace flatdb::parser
