#ifndef NUMERIC_WORD_HPP
#define NUMERIC_WORD_HPP

#include <concepts>
#include <cstddef>
#include <type_traits>

#include "numeric/util/meta.hpp"

#include "numeric/fwd.hpp"
#include "numeric/settings.hpp"

namespace numeric {

/// @brief The result of an addition or subtraction which may have wrapped around.
template <typename W>
struct Overflow_Result {
    /// @brief The result, reduced modulo `2^bit_len`.
    W value;
    /// @brief `true` if a carry (for addition) or borrow (for subtraction) occurred.
    bool overflow;

    [[nodiscard]]
    friend constexpr bool operator==(const Overflow_Result&, const Overflow_Result&)
        = default;
};

/// @brief The exact result of a multiplication, split into two words.
template <typename W>
struct Wide_Result {
    W low;
    W high;

    [[nodiscard]]
    friend constexpr bool operator==(const Wide_Result&, const Wide_Result&)
        = default;
};

/// @brief A type satisfies `word` if `Word_Traits` is specialized for it
/// and provides all the operations that the arithmetic kernels need.
///
/// `Word_Traits<W>` shall provide:
/// - `bit_len`, the amount of bits in `W`
/// - `zero()`, `one()`, and `max()`
/// - `overflowing_add(x, y)` and `overflowing_sub(x, y)`, returning `Overflow_Result<W>`
/// - `widening_mul(x, y, carry)`, returning `x * y + carry` as a `Wide_Result<W>`
/// - `shl(x, s)` and `shr(x, s)` for `s` in `[0, bit_len)`
/// - `bit_and`, `bit_or`, `bit_xor`, and `bit_not`
///
/// Furthermore, `W` itself shall be totally ordered by value.
template <typename W>
concept word = std::semiregular<W> && std::totally_ordered<W> && requires(W x, W y, int s) {
    { Word_Traits<W>::bit_len } -> std::convertible_to<int>;
    { Word_Traits<W>::zero() } -> std::same_as<W>;
    { Word_Traits<W>::one() } -> std::same_as<W>;
    { Word_Traits<W>::max() } -> std::same_as<W>;
    { Word_Traits<W>::overflowing_add(x, y) } -> std::same_as<Overflow_Result<W>>;
    { Word_Traits<W>::overflowing_sub(x, y) } -> std::same_as<Overflow_Result<W>>;
    { Word_Traits<W>::widening_mul(x, y, x) } -> std::same_as<Wide_Result<W>>;
    { Word_Traits<W>::shl(x, s) } -> std::same_as<W>;
    { Word_Traits<W>::shr(x, s) } -> std::same_as<W>;
    { Word_Traits<W>::bit_and(x, y) } -> std::same_as<W>;
    { Word_Traits<W>::bit_or(x, y) } -> std::same_as<W>;
    { Word_Traits<W>::bit_xor(x, y) } -> std::same_as<W>;
    { Word_Traits<W>::bit_not(x) } -> std::same_as<W>;
};

namespace detail {

/// @brief Provides a member `type`, which is an unsigned integer type
/// at least twice as wide as `W`, if there is any such builtin type.
template <typename W>
struct Widened { };

template <typename W>
    requires(unsigned_integer<W> && sizeof(W) <= sizeof(unsigned int) / 2)
struct Widened<W> {
    using type = unsigned int;
};

template <typename W>
    requires(
        unsigned_integer<W> && sizeof(W) > sizeof(unsigned int) / 2
        && sizeof(W) <= sizeof(unsigned long long) / 2
    )
struct Widened<W> {
    using type = unsigned long long;
};

template <typename W>
    requires(
        unsigned_integer<W> && sizeof(W) > sizeof(unsigned long long) / 2
        && sizeof(W) <= sizeof(Uint128) / 2
    )
struct Widened<W> {
    using type = Uint128;
};

template <typename W>
concept widenable = requires { typename Widened<W>::type; };

/// @brief Computes `x * y + carry` for 128-bit words,
/// for which there is no wider builtin type.
/// The operands are split into 64-bit halves and the partial products are summed.
[[nodiscard]]
constexpr Wide_Result<Uint128> widening_mul_u128(Uint128 x, Uint128 y, Uint128 carry) noexcept
{
    constexpr Uint128 half_mask = (Uint128 { 1 } << 64) - 1;
    const Uint128 x_lo = x & half_mask;
    const Uint128 x_hi = x >> 64;
    const Uint128 y_lo = y & half_mask;
    const Uint128 y_hi = y >> 64;

    const Uint128 p_lo_lo = x_lo * y_lo;
    const Uint128 p_lo_hi = x_lo * y_hi;
    const Uint128 p_hi_lo = x_hi * y_lo;
    const Uint128 p_hi_hi = x_hi * y_hi;

    // At most 66 bits, so this cannot overflow.
    const Uint128 middle = (p_lo_lo >> 64) + (p_lo_hi & half_mask) + (p_hi_lo & half_mask);
    Uint128 low = (p_lo_lo & half_mask) | (middle << 64);
    Uint128 high = p_hi_hi + (p_lo_hi >> 64) + (p_hi_lo >> 64) + (middle >> 64);

    const Uint128 low_plus_carry = low + carry;
    high += Uint128 { low_plus_carry < low };
    low = low_plus_carry;
    return { low, high };
}

/// @brief The `Word_Traits` of the builtin unsigned integer types.
template <unsigned_integer W>
struct Builtin_Word_Traits {
    static constexpr int bit_len = value_bits<W>;

    [[nodiscard]]
    static constexpr W zero() noexcept
    {
        return W(0);
    }

    [[nodiscard]]
    static constexpr W one() noexcept
    {
        return W(1);
    }

    [[nodiscard]]
    static constexpr W max() noexcept
    {
        return W(~W(0));
    }

    [[nodiscard]]
    static constexpr Overflow_Result<W> overflowing_add(W x, W y) noexcept
    {
        W result;
        const bool overflow = __builtin_add_overflow(x, y, &result);
        return { result, overflow };
    }

    [[nodiscard]]
    static constexpr Overflow_Result<W> overflowing_sub(W x, W y) noexcept
    {
        W result;
        const bool overflow = __builtin_sub_overflow(x, y, &result);
        return { result, overflow };
    }

    [[nodiscard]]
    static constexpr Wide_Result<W> widening_mul(W x, W y, W carry) noexcept
    {
        if constexpr (std::is_same_v<W, Uint128>) {
            return widening_mul_u128(x, y, carry);
        }
        else {
            using Wide = typename Widened<W>::type;
            const Wide product = (Wide(x) * Wide(y)) + Wide(carry);
            return { W(product), W(product >> bit_len) };
        }
    }

    [[nodiscard]]
    static constexpr W shl(W x, int s) noexcept
    {
        return W(x << s);
    }

    [[nodiscard]]
    static constexpr W shr(W x, int s) noexcept
    {
        return W(x >> s);
    }

    [[nodiscard]]
    static constexpr W bit_and(W x, W y) noexcept
    {
        return W(x & y);
    }

    [[nodiscard]]
    static constexpr W bit_or(W x, W y) noexcept
    {
        return W(x | y);
    }

    [[nodiscard]]
    static constexpr W bit_xor(W x, W y) noexcept
    {
        return W(x ^ y);
    }

    [[nodiscard]]
    static constexpr W bit_not(W x) noexcept
    {
        return W(~x);
    }
};

} // namespace detail

template <>
struct Word_Traits<unsigned char> : detail::Builtin_Word_Traits<unsigned char> { };
template <>
struct Word_Traits<unsigned short> : detail::Builtin_Word_Traits<unsigned short> { };
template <>
struct Word_Traits<unsigned int> : detail::Builtin_Word_Traits<unsigned int> { };
template <>
struct Word_Traits<unsigned long> : detail::Builtin_Word_Traits<unsigned long> { };
template <>
struct Word_Traits<unsigned long long> : detail::Builtin_Word_Traits<unsigned long long> { };
template <>
struct Word_Traits<Uint128> : detail::Builtin_Word_Traits<Uint128> { };

static_assert(word<unsigned char>);
static_assert(word<unsigned short>);
static_assert(word<unsigned int>);
static_assert(word<unsigned long>);
static_assert(word<unsigned long long>);
static_assert(word<Uint128>);
static_assert(word<Big_Int_Word>);

} // namespace numeric

#endif
