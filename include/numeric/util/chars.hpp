#ifndef NUMERIC_CHARS_HPP
#define NUMERIC_CHARS_HPP

#include <cstddef>
#include <string_view>

#include "ulight/impl/ascii_chars.hpp"

namespace numeric {

using ulight::is_ascii_digit;
using ulight::is_ascii_lower_alpha;
using ulight::is_ascii_upper_alpha;
using ulight::to_ascii_upper;

/// @brief The digits of all bases up to 36, in ascending order of their value.
inline constexpr std::u8string_view all_digits_lower = u8"0123456789abcdefghijklmnopqrstuvwxyz";
inline constexpr std::u8string_view all_digits_upper = u8"0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

/// @brief The greatest base whose digits can be expressed
/// with ASCII digits and letters of either case.
inline constexpr int max_digit_base = 36;

/// @brief Returns the value of `c` as a digit,
/// where `a` (or `A`) to `z` (or `Z`) represent the values `10` to `35`,
/// or `-1` if `c` is not a digit in any base up to `max_digit_base`.
[[nodiscard]]
constexpr int digit_value(const char32_t c) noexcept
{
    if (is_ascii_digit(c)) {
        return int(c - U'0');
    }
    if (is_ascii_lower_alpha(c)) {
        return int(c - U'a') + 10;
    }
    if (is_ascii_upper_alpha(c)) {
        return int(c - U'A') + 10;
    }
    return -1;
}

/// @brief Returns `true` if `c` is a digit in the given `base`.
[[nodiscard]]
constexpr bool is_digit_in_base(const char32_t c, const int base) noexcept
{
    const int value = digit_value(c);
    return value >= 0 && value < base;
}

/// @brief Returns the character representing the digit with the given `value`.
/// `value` shall be in `[0, max_digit_base)`.
[[nodiscard]]
constexpr char8_t digit_character(const int value, const bool to_upper = false) noexcept
{
    return (to_upper ? all_digits_upper : all_digits_lower)[std::size_t(value)];
}

} // namespace numeric

#endif
