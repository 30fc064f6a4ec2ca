#pragma once

#include <cstdint>
#include <string_view>

namespace flatdb::executor {

// Decimal number text with optional sign, fraction, exponent and surrounding
// whitespace ("12", " -3.5", "1e3").
[[nodiscard]] bool is_numeric_text(std::string_view text);

// Equal text, or two numeric texts with the same value ("12" and "12.0").
[[nodiscard]] bool values_equal(std::string_view lhs, std::string_view rhs);

// Integer value of the leading "[+-]digits" run after leading whitespace,
// saturated to the int64 range. Text without leading digits yields 0.
[[nodiscard]] std::int64_t leading_integer(std::string_view text) noexcept;

// Natural-order comparison: digit runs compare as integers of any length,
// everything else compares by unsigned byte value, run by run.
// Returns <0, 0 or >0.
[[nodiscard]] int natural_compare(std::string_view lhs, std::string_view rhs) noexcept;

}  // namespace flatdb::executor
