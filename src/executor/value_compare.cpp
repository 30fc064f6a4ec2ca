#include "flatdb/executor/value_compare.hpp"

#include <tao/pegtl.hpp>

#include <cctype>
#include <cstdlib>
#include <limits>
#include <string>

namespace flatdb::executor {

namespace pegtl = tao::pegtl;

namespace {

struct sign : pegtl::opt<pegtl::one<'+', '-'>> {
};

struct mantissa
    : pegtl::sor<pegtl::seq<pegtl::plus<pegtl::digit>, pegtl::opt<pegtl::one<'.'>, pegtl::star<pegtl::digit>>>,
                 pegtl::seq<pegtl::one<'.'>, pegtl::plus<pegtl::digit>>> {
};

struct exponent : pegtl::seq<pegtl::one<'e', 'E'>, sign, pegtl::plus<pegtl::digit>> {
};

struct numeric_text
    : pegtl::seq<pegtl::star<pegtl::space>, sign, mantissa, pegtl::opt<exponent>, pegtl::star<pegtl::space>, pegtl::eof> {
};

[[nodiscard]] bool is_digit(char ch) noexcept
{
    return ch >= '0' && ch <= '9';
}

[[nodiscard]] std::string_view digit_run(std::string_view text, std::size_t& position) noexcept
{
    const auto start = position;
    while (position < text.size() && is_digit(text[position])) {
        ++position;
    }
    return text.substr(start, position - start);
}

[[nodiscard]] int compare_digit_runs(std::string_view lhs, std::string_view rhs) noexcept
{
    const auto strip = [](std::string_view run) {
        const auto first = run.find_first_not_of('0');
        return first == std::string_view::npos ? std::string_view{} : run.substr(first);
    };
    const auto left = strip(lhs);
    const auto right = strip(rhs);
    if (left.size() != right.size()) {
        return left.size() < right.size() ? -1 : 1;
    }
    const auto result = left.compare(right);
    return result < 0 ? -1 : (result > 0 ? 1 : 0);
}

}  // namespace

bool is_numeric_text(std::string_view text)
{
    pegtl::memory_input in(text.data(), text.size(), "numeric");
    return pegtl::parse<numeric_text>(in);
}

bool values_equal(std::string_view lhs, std::string_view rhs)
{
    if (lhs == rhs) {
        return true;
    }
    if (!is_numeric_text(lhs) || !is_numeric_text(rhs)) {
        return false;
    }
    const std::string left{lhs};
    const std::string right{rhs};
    return std::strtod(left.c_str(), nullptr) == std::strtod(right.c_str(), nullptr);
}

std::int64_t leading_integer(std::string_view text) noexcept
{
    std::size_t position = 0U;
    while (position < text.size() && std::isspace(static_cast<unsigned char>(text[position])) != 0) {
        ++position;
    }

    bool negative = false;
    if (position < text.size() && (text[position] == '+' || text[position] == '-')) {
        negative = text[position] == '-';
        ++position;
    }

    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    std::int64_t value = 0;
    for (; position < text.size() && is_digit(text[position]); ++position) {
        const auto digit = static_cast<std::int64_t>(text[position] - '0');
        if (negative) {
            if (value < (kMin + digit) / 10) {
                return kMin;
            }
            value = value * 10 - digit;
        } else {
            if (value > (kMax - digit) / 10) {
                return kMax;
            }
            value = value * 10 + digit;
        }
    }
    return value;
}

int natural_compare(std::string_view lhs, std::string_view rhs) noexcept
{
    std::size_t left_position = 0U;
    std::size_t right_position = 0U;
    while (left_position < lhs.size() && right_position < rhs.size()) {
        if (is_digit(lhs[left_position]) && is_digit(rhs[right_position])) {
            const auto result = compare_digit_runs(digit_run(lhs, left_position), digit_run(rhs, right_position));
            if (result != 0) {
                return result;
            }
            continue;
        }

        // Outside a shared digit run, bytes compare by unsigned value.
        const auto left = static_cast<unsigned char>(lhs[left_position]);
        const auto right = static_cast<unsigned char>(rhs[right_position]);
        if (left != right) {
            return left < right ? -1 : 1;
        }
        ++left_position;
        ++right_position;
    }

    const bool left_done = left_position >= lhs.size();
    const bool right_done = right_position >= rhs.size();
    if (left_done && right_done) {
        return 0;
    }
    return left_done ? -1 : 1;
}

}  // namespace flatdb::executor
