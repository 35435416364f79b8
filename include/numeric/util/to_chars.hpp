#ifndef NUMERIC_TO_CHARS_HPP
#define NUMERIC_TO_CHARS_HPP

#include <array>
#include <charconv>
#include <cstddef>
#include <limits>
#include <string_view>
#include <system_error>

#include "numeric/util/assert.hpp"
#include "numeric/util/chars.hpp"
#include "numeric/util/meta.hpp"

namespace numeric {

/// @brief A string of at most `capacity` UTF-8 code units, stored in place.
template <std::size_t capacity>
struct Characters8 {
    using array_type = std::array<char8_t, capacity>;

private:
    array_type m_buffer {};
    std::size_t m_length = 0;

public:
    [[nodiscard]]
    constexpr Characters8(const array_type& array, const std::size_t length)
        : m_buffer { array }
        , m_length { length }
    {
        NUMERIC_ASSERT(length <= capacity);
    }

    constexpr Characters8() = default;

    [[nodiscard]]
    constexpr std::size_t size() const noexcept
    {
        return m_length;
    }

    [[nodiscard]]
    constexpr std::size_t length() const noexcept
    {
        return m_length;
    }

    [[nodiscard]]
    constexpr const char8_t* data() const noexcept
    {
        return m_buffer.data();
    }

    [[nodiscard]]
    constexpr std::u8string_view as_string() const noexcept
    {
        return { m_buffer.data(), m_length };
    }

    [[nodiscard]]
    constexpr operator std::u8string_view() const noexcept
    {
        return as_string();
    }
};

/// @brief Converts `x` to a sequence of digits in the given `base`,
/// preceded by `-` if `x` is negative.
/// `base` shall be in [2, 36].
template <signed_or_unsigned T>
    requires(!one_of<T, Int128, Uint128>)
[[nodiscard]]
constexpr Characters8<std::size_t(std::numeric_limits<T>::digits) + 2>
to_characters8(const T x, const int base = 10, const bool to_upper = false)
{
    NUMERIC_ASSERT(base >= 2 && base <= max_digit_base);
    constexpr std::size_t capacity = std::size_t(std::numeric_limits<T>::digits) + 2;

    std::array<char, capacity> chars {};
    const std::to_chars_result result
        = std::to_chars(chars.data(), chars.data() + chars.size(), x, base);
    NUMERIC_ASSERT(result.ec == std::errc {});
    const auto length = std::size_t(result.ptr - chars.data());

    std::array<char8_t, capacity> code_units {};
    for (std::size_t i = 0; i < length; ++i) {
        const auto c = char8_t(chars[i]);
        code_units[i] = to_upper ? char8_t(to_ascii_upper(c)) : c;
    }
    return { code_units, length };
}

} // namespace numeric

#endif
