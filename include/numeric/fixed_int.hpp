#ifndef NUMERIC_FIXED_INT_HPP
#define NUMERIC_FIXED_INT_HPP

#include <algorithm>
#include <array>
#include <bit>
#include <compare>
#include <cstddef>
#include <limits>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include "numeric/util/assert.hpp"
#include "numeric/util/chars.hpp"
#include "numeric/util/function_ref.hpp"
#include "numeric/util/meta.hpp"
#include "numeric/util/result.hpp"

#include "numeric/big_int.hpp"
#include "numeric/bits/element.hpp"
#include "numeric/bits/variants.hpp"
#include "numeric/bits/word_span.hpp"
#include "numeric/settings.hpp"

namespace numeric {

namespace detail {

using Byte = unsigned char;
using Byte_Kernel = bits::Element<Byte>;

inline constexpr int byte_bits = Word_Traits<Byte>::bit_len;

template <signed_or_unsigned T>
[[nodiscard]]
constexpr bool is_negative_int(const T x) noexcept
{
    if constexpr (signed_integer<T>) {
        return x < 0;
    }
    else {
        return false;
    }
}

/// @brief Returns the `N` least significant bytes of `x` in little-endian order,
/// where bytes past the width of `T` are filled with the sign of `x`.
template <std::size_t N, signed_or_unsigned T>
[[nodiscard]]
constexpr std::array<Byte, N> int_to_bytes(const T x) noexcept
{
    const auto u = make_unsigned_t<T>(x);
    const Byte fill = is_negative_int(x) ? Byte(0xff) : Byte(0);
    std::array<Byte, N> result {};
    for (std::size_t i = 0; i < N; ++i) {
        result[i] = i < sizeof(T) ? Byte(u >> (i * byte_bits)) : fill;
    }
    return result;
}

/// @brief Returns the value of the little-endian `bytes` modulo `2^value_bits<T>`,
/// where the bytes are extended with `fill` if `T` is wider.
template <signed_or_unsigned T, std::size_t N>
[[nodiscard]]
constexpr T bytes_to_int(const std::array<Byte, N>& bytes, const Byte fill) noexcept
{
    using Unsigned = make_unsigned_t<T>;
    Unsigned result = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        const Byte b = i < N ? bytes[i] : fill;
        result |= Unsigned(Unsigned(b) << (i * byte_bits));
    }
    return T(result);
}

} // namespace detail

/// @brief An integer of exactly `N` bytes, stored in little-endian order.
/// If `is_signed` is `true`, the bytes hold a two's complement value.
///
/// For unsigned integers, the arithmetic operators `+`, `-`, `*`, and `<<`
/// fail a debug assertion upon overflow and wrap around otherwise.
/// For signed integers, these operators always wrap around.
/// Explicit `wrapping_`, `checked_`, and `saturating_` functions are provided for either.
template <std::size_t N, bool is_signed>
    requires(N != 0)
struct Fixed_Integer {
    using Bytes = std::array<unsigned char, N>;

    static constexpr std::size_t byte_count = N;
    static constexpr std::size_t bit_count = N * std::size_t(detail::byte_bits);

private:
    using Byte = detail::Byte;
    using Kernel = detail::Byte_Kernel;
    using Span = std::span<Byte>;
    using Const_Span = std::span<const Byte>;

    static constexpr Byte sign_mask = Byte(1u << (detail::byte_bits - 1));

    Bytes m_bytes {};

    [[nodiscard]]
    constexpr explicit Fixed_Integer(const Bytes& bytes) noexcept
        : m_bytes { bytes }
    {
    }

public:
    /// @brief Constructs zero.
    [[nodiscard]]
    constexpr Fixed_Integer() noexcept = default;

    // BYTES =======================================================================================

    [[nodiscard]]
    static constexpr Fixed_Integer from_le_bytes(const Bytes& bytes) noexcept
    {
        return Fixed_Integer { bytes };
    }

    [[nodiscard]]
    static constexpr Fixed_Integer from_be_bytes(Bytes bytes) noexcept
    {
        std::ranges::reverse(bytes);
        return Fixed_Integer { bytes };
    }

    [[nodiscard]]
    static constexpr Fixed_Integer from_ne_bytes(const Bytes& bytes) noexcept
    {
        if constexpr (std::endian::native == std::endian::big) {
            return from_be_bytes(bytes);
        }
        else {
            return from_le_bytes(bytes);
        }
    }

    [[nodiscard]]
    constexpr Bytes to_le_bytes() const noexcept
    {
        return m_bytes;
    }

    [[nodiscard]]
    constexpr Bytes to_be_bytes() const noexcept
    {
        Bytes result = m_bytes;
        std::ranges::reverse(result);
        return result;
    }

    [[nodiscard]]
    constexpr Bytes to_ne_bytes() const noexcept
    {
        if constexpr (std::endian::native == std::endian::big) {
            return to_be_bytes();
        }
        else {
            return to_le_bytes();
        }
    }

    // CONSTANTS ===================================================================================

    [[nodiscard]]
    static constexpr Fixed_Integer zero() noexcept
    {
        return {};
    }

    [[nodiscard]]
    static constexpr Fixed_Integer one() noexcept
    {
        Bytes bytes {};
        bytes[0] = 1;
        return Fixed_Integer { bytes };
    }

    [[nodiscard]]
    static constexpr Fixed_Integer min() noexcept
    {
        Bytes bytes {};
        if constexpr (is_signed) {
            bytes[N - 1] = sign_mask;
        }
        return Fixed_Integer { bytes };
    }

    [[nodiscard]]
    static constexpr Fixed_Integer max() noexcept
    {
        Bytes bytes {};
        bytes.fill(Byte(0xff));
        if constexpr (is_signed) {
            bytes[N - 1] = Byte(~sign_mask);
        }
        return Fixed_Integer { bytes };
    }

    /// @brief Returns the least positive value, which is one.
    [[nodiscard]]
    static constexpr Fixed_Integer min_positive() noexcept
        requires is_signed
    {
        return one();
    }

    /// @brief Returns the greatest negative value, which is negative one.
    [[nodiscard]]
    static constexpr Fixed_Integer max_negative() noexcept
        requires is_signed
    {
        Bytes bytes {};
        bytes.fill(Byte(0xff));
        return Fixed_Integer { bytes };
    }

    // CLASSIFICATION ==============================================================================

    [[nodiscard]]
    constexpr bool is_zero() const noexcept
    {
        return bits::is_zero<Byte>(m_bytes);
    }

    [[nodiscard]]
    constexpr bool is_one() const noexcept
    {
        return *this == one();
    }

    [[nodiscard]]
    constexpr bool is_negative() const noexcept
    {
        if constexpr (is_signed) {
            return (m_bytes[N - 1] & sign_mask) != 0;
        }
        else {
            return false;
        }
    }

    /// @brief Returns `true` if this value is greater than zero.
    [[nodiscard]]
    constexpr bool is_positive() const noexcept
    {
        return !is_negative() && !is_zero();
    }

    // INTEGER CONVERSIONS =========================================================================

    /// @brief Converts `x` if it is in the range of this type.
    template <signed_or_unsigned T>
    [[nodiscard]]
    static constexpr Result<Fixed_Integer, Out_Of_Range_Error> from_int(const T x) noexcept
    {
        const Fixed_Integer result = truncate_from(x);
        const bool negative = detail::is_negative_int(x);
        if (result.is_negative() == negative && result.template truncate<T>() == x) {
            return result;
        }
        return negative ? Out_Of_Range_Error::below : Out_Of_Range_Error::above;
    }

    /// @brief Converts `x` modulo `2^bit_count`.
    template <signed_or_unsigned T>
    [[nodiscard]]
    static constexpr Fixed_Integer truncate_from(const T x) noexcept
    {
        return Fixed_Integer { detail::int_to_bytes<N>(x) };
    }

    /// @brief Converts `x`, clamping it to `min()` or `max()` if it is out of range.
    template <signed_or_unsigned T>
    [[nodiscard]]
    static constexpr Fixed_Integer saturate_from(const T x) noexcept
    {
        const Result<Fixed_Integer, Out_Of_Range_Error> result = from_int(x);
        if (result) {
            return *result;
        }
        return result.error() == Out_Of_Range_Error::above ? max() : min();
    }

    /// @brief Converts to `T` if this value is in the range of `T`.
    template <signed_or_unsigned T>
    [[nodiscard]]
    constexpr Result<T, Out_Of_Range_Error> to_int() const noexcept
    {
        const T result = truncate<T>();
        if (detail::is_negative_int(result) == is_negative() && truncate_from(result) == *this) {
            return result;
        }
        return is_negative() ? Out_Of_Range_Error::below : Out_Of_Range_Error::above;
    }

    /// @brief Converts to `T` modulo `2^value_bits<T>`,
    /// where signed values are sign-extended if `T` is wider.
    template <signed_or_unsigned T>
    [[nodiscard]]
    constexpr T truncate() const noexcept
    {
        return detail::bytes_to_int<T>(m_bytes, is_negative() ? Byte(0xff) : Byte(0));
    }

    /// @brief Converts to `T`, clamping values outside the range of `T`
    /// to its minimum or maximum.
    template <signed_or_unsigned T>
    [[nodiscard]]
    constexpr T saturate() const noexcept
    {
        const Result<T, Out_Of_Range_Error> result = to_int<T>();
        if (result) {
            return *result;
        }
        return result.error() == Out_Of_Range_Error::above ? std::numeric_limits<T>::max()
                                                           : std::numeric_limits<T>::min();
    }

    // COMPARISON ==================================================================================

    [[nodiscard]]
    friend constexpr bool operator==(const Fixed_Integer&, const Fixed_Integer&)
        = default;

    [[nodiscard]]
    friend constexpr std::strong_ordering
    operator<=>(const Fixed_Integer& x, const Fixed_Integer& y) noexcept
    {
        if (x.is_negative() != y.is_negative()) {
            return x.is_negative() ? std::strong_ordering::less : std::strong_ordering::greater;
        }
        // Within the same sign, two's complement preserves the unsigned order.
        return Kernel::compare(x.m_bytes, y.m_bytes);
    }

    // UNARY OPERATIONS ============================================================================

    [[nodiscard]]
    constexpr Fixed_Integer operator+() const noexcept
    {
        return *this;
    }

    /// @brief Returns the two's complement negation,
    /// where the negation of `min()` is `min()`.
    [[nodiscard]]
    constexpr Fixed_Integer operator-() const noexcept
        requires is_signed
    {
        Fixed_Integer result = *this;
        bits::negate_in_place<Byte>(result.m_bytes);
        return result;
    }

    [[nodiscard]]
    constexpr Fixed_Integer operator~() const noexcept
    {
        Fixed_Integer result = *this;
        Kernel::bit_not(result.m_bytes);
        return result;
    }

    /// @brief Returns the absolute of `x`,
    /// where the absolute of `min()` is `min()`.
    [[nodiscard]]
    friend constexpr Fixed_Integer abs(const Fixed_Integer& x) noexcept
    {
        if constexpr (is_signed) {
            return x.is_negative() ? -x : x;
        }
        else {
            return x;
        }
    }

    // ARITHMETIC ==================================================================================

    [[nodiscard]]
    friend constexpr Fixed_Integer operator+(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        return arithmetic<bits::Add_Op>(x, y);
    }

    [[nodiscard]]
    friend constexpr Fixed_Integer operator-(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        return arithmetic<bits::Sub_Op>(x, y);
    }

    [[nodiscard]]
    friend constexpr Fixed_Integer operator*(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        if constexpr (is_signed) {
            return wrapping_mul(x, y);
        }
        else {
            return arithmetic<bits::Mul_Op>(x, y);
        }
    }

    /// @brief Returns `x / y`, rounded towards zero.
    /// `y` shall not be zero, and for signed integers,
    /// `x / y` shall not be `min() / -1`.
    [[nodiscard]]
    friend Fixed_Integer operator/(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        if constexpr (is_signed) {
            NUMERIC_ASSERT(x != min() || y != -one());
        }
        return div_rem(x, y).quotient;
    }

    /// @brief Returns the remainder of `x / y`.
    /// Its magnitude is `|x| % |y|`,
    /// and it is negative iff exactly one of `x` and `y` is negative (unless it is zero).
    /// `y` shall not be zero.
    [[nodiscard]]
    friend Fixed_Integer operator%(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        return div_rem(x, y).remainder;
    }

    /// @brief Returns `x / y` and `x % y`.
    /// `y` shall not be zero.
    /// The quotient of `min() / -1` wraps around to `min()`.
    [[nodiscard]]
    friend Div_Result<Fixed_Integer> div_rem(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        NUMERIC_ASSERT(!y.is_zero());
        const bool negative = x.is_negative() != y.is_negative();
        const Fixed_Integer x_magnitude = abs(x);
        const Fixed_Integer y_magnitude = abs(y);
        Div_Result<Fixed_Integer> result;
        // The magnitude of min() is representable when the bytes are viewed as unsigned.
        [[maybe_unused]]
        const bool overflow
            = Kernel::div_rem_overflowing(
                result.quotient.m_bytes, result.remainder.m_bytes, x_magnitude.m_bytes,
                y_magnitude.m_bytes
            );
        NUMERIC_DEBUG_ASSERT(!overflow);
        if constexpr (is_signed) {
            if (negative) {
                result.quotient = -result.quotient;
                result.remainder = -result.remainder;
            }
        }
        return result;
    }

    /// @brief Returns `x << s`, discarding the bits shifted out.
    /// For unsigned integers, no one-bits shall be shifted out.
    [[nodiscard]]
    friend constexpr Fixed_Integer operator<<(const Fixed_Integer& x, const std::size_t s)
    {
        Fixed_Integer result;
        [[maybe_unused]]
        const bool overflow
            = Kernel::shl_overflowing(result.m_bytes, x.m_bytes, s);
        if constexpr (!is_signed) {
            NUMERIC_DEBUG_ASSERT(!overflow);
        }
        return result;
    }

    /// @brief Returns `x >> s`.
    /// For signed integers, the shift is arithmetic,
    /// so negative values are filled with one-bits from the left.
    [[nodiscard]]
    friend constexpr Fixed_Integer operator>>(const Fixed_Integer& x, const std::size_t s)
    {
        if (x.is_negative()) {
            return ~(~x >> s);
        }
        Fixed_Integer result;
        [[maybe_unused]]
        const bool overflow
            = Kernel::shr_overflowing(result.m_bytes, x.m_bytes, s);
        return result;
    }

    [[nodiscard]]
    friend constexpr Fixed_Integer operator&(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        Fixed_Integer result;
        Kernel::bit_and(result.m_bytes, x.m_bytes, y.m_bytes);
        return result;
    }

    [[nodiscard]]
    friend constexpr Fixed_Integer operator|(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        Fixed_Integer result;
        Kernel::bit_or(result.m_bytes, x.m_bytes, y.m_bytes);
        return result;
    }

    [[nodiscard]]
    friend constexpr Fixed_Integer operator^(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        Fixed_Integer result;
        Kernel::bit_xor(result.m_bytes, x.m_bytes, y.m_bytes);
        return result;
    }

    Fixed_Integer& operator+=(const Fixed_Integer& x)
    {
        return *this = *this + x;
    }

    Fixed_Integer& operator-=(const Fixed_Integer& x)
    {
        return *this = *this - x;
    }

    Fixed_Integer& operator*=(const Fixed_Integer& x)
    {
        return *this = *this * x;
    }

    Fixed_Integer& operator/=(const Fixed_Integer& x)
    {
        return *this = *this / x;
    }

    Fixed_Integer& operator%=(const Fixed_Integer& x)
    {
        return *this = *this % x;
    }

    Fixed_Integer& operator<<=(const std::size_t s)
    {
        return *this = *this << s;
    }

    Fixed_Integer& operator>>=(const std::size_t s)
    {
        return *this = *this >> s;
    }

    /// @brief Returns `x` raised to the power of `y` by repeated squaring,
    /// where `pow(x, 0)` is one for any `x`.
    /// Intermediate results overflow only if the final result does.
    [[nodiscard]]
    friend constexpr Fixed_Integer pow(const Fixed_Integer& x, unsigned y)
    {
        Fixed_Integer result = one();
        Fixed_Integer base = x;
        while (y != 0) {
            if (y & 1) {
                result = result * base;
            }
            y >>= 1;
            if (y != 0) {
                base = base * base;
            }
        }
        return result;
    }

    // WRAPPING ====================================================================================

    [[nodiscard]]
    friend constexpr Fixed_Integer wrapping_add(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        Fixed_Integer result;
        bits::wrapping<bits::Add_Op, Kernel>(result.m_bytes, x.m_bytes, y.m_bytes);
        return result;
    }

    [[nodiscard]]
    friend constexpr Fixed_Integer wrapping_sub(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        Fixed_Integer result;
        bits::wrapping<bits::Sub_Op, Kernel>(result.m_bytes, x.m_bytes, y.m_bytes);
        return result;
    }

    /// @brief Returns `x * y` modulo `2^bit_count`,
    /// which is the same for signed and unsigned integers.
    [[nodiscard]]
    friend constexpr Fixed_Integer wrapping_mul(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        Fixed_Integer result;
        bits::wrapping<bits::Mul_Op, Kernel>(result.m_bytes, x.m_bytes, y.m_bytes);
        return result;
    }

    // CHECKED =====================================================================================

    [[nodiscard]]
    friend constexpr std::optional<Fixed_Integer>
    checked_add(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        if constexpr (is_signed) {
            const Fixed_Integer result = wrapping_add(x, y);
            if (x.is_negative() == y.is_negative() && result.is_negative() != x.is_negative()) {
                return std::nullopt;
            }
            return result;
        }
        else {
            return checked_unsigned<bits::Add_Op>(x, y);
        }
    }

    [[nodiscard]]
    friend constexpr std::optional<Fixed_Integer>
    checked_sub(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        if constexpr (is_signed) {
            const Fixed_Integer result = wrapping_sub(x, y);
            if (x.is_negative() != y.is_negative() && result.is_negative() != x.is_negative()) {
                return std::nullopt;
            }
            return result;
        }
        else {
            return checked_unsigned<bits::Sub_Op>(x, y);
        }
    }

    [[nodiscard]]
    friend constexpr std::optional<Fixed_Integer>
    checked_mul(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        if constexpr (is_signed) {
            const bool negative = x.is_negative() != y.is_negative();
            const Fixed_Integer x_magnitude = abs(x);
            const Fixed_Integer y_magnitude = abs(y);
            Fixed_Integer magnitude;
            if (bits::checked<bits::Mul_Op, Kernel>(
                    magnitude.m_bytes, x_magnitude.m_bytes, y_magnitude.m_bytes
                )
                == std::nullopt) {
                return std::nullopt;
            }
            // The magnitude has the sign bit set only if it is at least 2^(bit_count - 1),
            // which is only in range as the magnitude of min().
            if (magnitude.is_negative() && (!negative || magnitude != min())) {
                return std::nullopt;
            }
            return negative ? -magnitude : magnitude;
        }
        else {
            return checked_unsigned<bits::Mul_Op>(x, y);
        }
    }

    /// @brief Like `x / y`, but returns `std::nullopt` if `y` is zero
    /// or if the quotient is out of range.
    [[nodiscard]]
    friend std::optional<Fixed_Integer> checked_div(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        if constexpr (is_signed) {
            if (y.is_zero() || (x == min() && y == -one())) {
                return std::nullopt;
            }
            return x / y;
        }
        else {
            return checked_unsigned<bits::Div_Op>(x, y);
        }
    }

    /// @brief Like `x % y`, but returns `std::nullopt` if `y` is zero.
    [[nodiscard]]
    friend std::optional<Fixed_Integer> checked_rem(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        if constexpr (is_signed) {
            if (y.is_zero()) {
                return std::nullopt;
            }
            return x % y;
        }
        else {
            return checked_unsigned<bits::Rem_Op>(x, y);
        }
    }

    // SATURATING ==================================================================================

    [[nodiscard]]
    friend constexpr Fixed_Integer saturating_add(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        if constexpr (is_signed) {
            return checked_add(x, y).value_or(x.is_negative() ? min() : max());
        }
        else {
            return saturating_unsigned<bits::Add_Op>(x, y);
        }
    }

    [[nodiscard]]
    friend constexpr Fixed_Integer saturating_sub(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        if constexpr (is_signed) {
            return checked_sub(x, y).value_or(x.is_negative() ? min() : max());
        }
        else {
            return saturating_unsigned<bits::Sub_Op>(x, y);
        }
    }

    [[nodiscard]]
    friend constexpr Fixed_Integer saturating_mul(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        if constexpr (is_signed) {
            const bool negative = x.is_negative() != y.is_negative();
            return checked_mul(x, y).value_or(negative ? min() : max());
        }
        else {
            return saturating_unsigned<bits::Mul_Op>(x, y);
        }
    }

    /// @brief Like `x / y`, but division by zero yields `min()` if `x` is negative
    /// and `max()` otherwise, and `min() / -1` yields `max()`.
    [[nodiscard]]
    friend Fixed_Integer saturating_div(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        if constexpr (is_signed) {
            if (y.is_zero()) {
                return x.is_negative() ? min() : max();
            }
            return checked_div(x, y).value_or(max());
        }
        else {
            return saturating_unsigned<bits::Div_Op>(x, y);
        }
    }

    // STRING CONVERSIONS ==========================================================================

    /// @brief Passes the digits representing this integer to `out`,
    /// preceded by `-` if it is negative.
    /// @param base The base of the digits.
    /// Shall be in [2, 36].
    /// @param to_upper If `true`, outputs digits for base 11 or more in uppercase.
    void print_to(
        const String_Sink out, //
        const int base = 10,
        const bool to_upper = false
    ) const
    {
        NUMERIC_ASSERT(base >= 2 && base <= max_digit_base);
        Bytes magnitude = abs(*this).m_bytes;
        // Base 2 needs the most digits, plus one character for the sign.
        std::array<char, bit_count + 1> chars {};
        std::size_t length = 0;
        do {
            const Byte digit = Kernel::div_rem_word(magnitude, Byte(base));
            chars[length++] = char(digit_character(int(digit), to_upper));
        } while (!bits::is_zero<Byte>(magnitude));
        if (is_negative()) {
            chars[length++] = '-';
        }
        std::ranges::reverse(chars.begin(), chars.begin() + std::ptrdiff_t(length));
        out(std::string_view { chars.data(), length });
    }

    friend std::ostream& operator<<(std::ostream& out, const Fixed_Integer& x)
    {
        x.print_to([&](const std::string_view str) { out << str; });
        return out;
    }

private:
    /// @brief Performs `Op` with a debug assertion against overflow for unsigned integers,
    /// and wrapping around for signed integers.
    template <typename Op>
    [[nodiscard]]
    static constexpr Fixed_Integer arithmetic(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        Fixed_Integer result;
        if constexpr (is_signed) {
            bits::wrapping<Op, Kernel>(result.m_bytes, x.m_bytes, y.m_bytes);
        }
        else {
            [[maybe_unused]]
            const bool overflow
                = Op::template overflowing<Kernel>(
                    Span { result.m_bytes }, Const_Span { x.m_bytes }, Const_Span { y.m_bytes }
                );
            NUMERIC_DEBUG_ASSERT(!overflow);
        }
        return result;
    }

    template <typename Op>
    [[nodiscard]]
    static constexpr std::optional<Fixed_Integer>
    checked_unsigned(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        Fixed_Integer result;
        if (bits::checked<Op, Kernel>(result.m_bytes, x.m_bytes, y.m_bytes) == std::nullopt) {
            return std::nullopt;
        }
        return result;
    }

    template <typename Op>
    [[nodiscard]]
    static constexpr Fixed_Integer
    saturating_unsigned(const Fixed_Integer& x, const Fixed_Integer& y)
    {
        Fixed_Integer result;
        bits::saturating<Op, Kernel>(result.m_bytes, x.m_bytes, y.m_bytes);
        return result;
    }
};

/// @brief An unsigned integer of `N` bytes.
/// For example, `Fixed_Uint<16>` has the same range as `Uint128`.
template <std::size_t N>
using Fixed_Uint = Fixed_Integer<N, false>;

/// @brief A signed two's complement integer of `N` bytes.
/// For example, `Fixed_Int<1>` has the same range as `signed char`.
template <std::size_t N>
using Fixed_Int = Fixed_Integer<N, true>;

template <std::size_t N, bool is_signed>
[[nodiscard]]
std::string to_string(
    const Fixed_Integer<N, is_signed>& x, //
    const int base = 10,
    const bool to_upper = false
)
{
    std::string result;
    x.print_to([&](const std::string_view str) { result += str; }, base, to_upper);
    return result;
}

} // namespace numeric

#endif
