#pragma once

#include <optional>
#include <string_view>

namespace invoscan::extract {

/// Parses a decimal number the way OCR amounts are written out:
/// surrounding whitespace and one leading sign allowed, exponent and
/// inf/nan accepted, the rest of the text must be consumed.
[[nodiscard]] std::optional<double> parse_number(std::string_view text);

/// parse_number after removing every ',' (thousands separators).
[[nodiscard]] std::optional<double> parse_amount(std::string_view text);

/// True if text is non-empty and every character is an ASCII digit.
[[nodiscard]] bool is_all_digits(std::string_view text) noexcept;

/// True if text contains at least one ASCII digit.
[[nodiscard]] bool has_digit(std::string_view text) noexcept;

/// Round half away from zero to the given number of decimals.
[[nodiscard]] double round_to(double value, int decimals) noexcept;

}  // namespace invoscan::extract
