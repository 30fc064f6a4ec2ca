#include "flatdb/parser/text_utils.hpp"

#include <cctype>

namespace flatdb::parser {
namespace {

[[nodiscard]] bool is_space(char ch) noexcept
{
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

}  // namespace

std::string_view trim_view(std::string_view text) noexcept
{
    std::size_t start = 0U;
    while (start < text.size() && is_space(text[start])) {
        ++start;
    }

    std::size_t end = text.size();
    while (end > start && is_space(text[end - 1U])) {
        --end;
    }

    return text.substr(start, end - start);
}

std::string trim_copy(std::string_view text)
{
    return std::string{trim_view(text)};
}

bool iequals(std::string_view lhs, std::string_view rhs) noexcept
{
    if (lhs.size() != rhs.size()) {
        return false;
    }

    for (std::size_t index = 0; index < lhs.size(); ++index) {
        const auto left = static_cast<unsigned char>(lhs[index]);
        const auto right = static_cast<unsigned char>(rhs[index]);
        if (std::tolower(left) != std::tolower(right)) {
            return false;
        }
    }
    return true;
}

std::string lowercase_copy(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (const auto ch : text) {
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return result;
}

std::vector<std::string> split_copy(std::string_view text, char delimiter)
{
    std::vector<std::string> parts;
    std::size_t start = 0U;
    while (true) {
        const auto end = text.find(delimiter, start);
        if (end == std::string_view::npos) {
            parts.emplace_back(text.substr(start));
            break;
        }
        parts.emplace_back(text.substr(start, end - start));
        start = end + 1U;
    }
    return parts;
}

}  // namespace flatdb::parser
