#ifndef NUMERIC_BITS_KERNEL_BASE_HPP
#define NUMERIC_BITS_KERNEL_BASE_HPP

#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>

#include "numeric/util/assert.hpp"

#include "numeric/bits/word_span.hpp"
#include "numeric/word.hpp"

namespace numeric::bits {

/// @brief The result of a growing subtraction `x - y`.
template <word W>
struct Sub_Result {
    /// @brief The canonical magnitude `|x - y|`.
    std::vector<W> magnitude;
    /// @brief `true` if `x < y`,
    /// i.e. if the magnitude had to be negated after borrowing past the last word.
    bool negated;

    [[nodiscard]]
    friend bool operator==(const Sub_Result&, const Sub_Result&)
        = default;
};

/// @brief The result of a growing division with remainder.
template <word W>
struct Div_Rem_Result {
    std::vector<W> quotient;
    std::vector<W> remainder;

    [[nodiscard]]
    friend bool operator==(const Div_Rem_Result&, const Div_Rem_Result&)
        = default;
};

namespace detail {

/// @brief Implements the growing operations of a kernel family
/// on top of the overflowing operations in `Derived`.
///
/// Growing operations allocate exactly as many words as the result can possibly need,
/// so they cannot overflow.
/// Their results are always in canonical form.
template <typename Derived, word W>
struct Kernel_Base {
    using Word = W;
    using Traits = Word_Traits<W>;
    using Span = std::span<W>;
    using Const_Span = std::span<const W>;

    [[nodiscard]]
    static std::vector<W> add_growing(const Const_Span x, const Const_Span y)
    {
        std::vector<W> result(std::max(x.size(), y.size()) + 1, Traits::zero());
        [[maybe_unused]]
        const bool overflow
            = Derived::add_overflowing(result, x, y);
        NUMERIC_DEBUG_ASSERT(!overflow);
        shrink(result);
        return result;
    }

    /// @brief Computes `|x - y|`.
    /// The kernel only deals in magnitudes,
    /// so it is up to the caller to turn `negated` into a sign.
    [[nodiscard]]
    static Sub_Result<W> sub_growing(const Const_Span x, const Const_Span y)
    {
        Sub_Result<W> result {
            .magnitude = std::vector<W>(
                std::max({ x.size(), y.size(), std::size_t(1) }), Traits::zero()
            ),
            .negated = false,
        };
        result.negated = Derived::sub_overflowing(result.magnitude, x, y);
        if (result.negated) {
            negate_in_place<W>(result.magnitude);
        }
        shrink(result.magnitude);
        return result;
    }

    [[nodiscard]]
    static std::vector<W> mul_growing(const Const_Span x, const Const_Span y)
    {
        std::vector<W> result(std::max(x.size() + y.size(), std::size_t(1)), Traits::zero());
        [[maybe_unused]]
        const bool overflow
            = Derived::mul_overflowing(result, x, y);
        NUMERIC_DEBUG_ASSERT(!overflow);
        shrink(result);
        return result;
    }

    /// @brief Computes the quotient and remainder of `x / y`, rounded towards zero.
    /// `y` shall not be zero.
    [[nodiscard]]
    static Div_Rem_Result<W> div_rem_growing(const Const_Span x, const Const_Span y)
    {
        NUMERIC_ASSERT(!is_zero<W>(y));
        Div_Rem_Result<W> result {
            .quotient = std::vector<W>(std::max(x.size(), std::size_t(1)), Traits::zero()),
            .remainder = std::vector<W>(shrink<W>(y).size(), Traits::zero()),
        };
        [[maybe_unused]]
        const bool overflow
            = Derived::div_rem_overflowing(result.quotient, result.remainder, x, y);
        NUMERIC_DEBUG_ASSERT(!overflow);
        shrink(result.quotient);
        shrink(result.remainder);
        return result;
    }

    /// @brief Like `div_rem_overflowing`, but only the quotient is stored.
    [[nodiscard]]
    static bool div_overflowing(const Span out, const Const_Span x, const Const_Span y)
    {
        std::vector<W> remainder(y.size(), Traits::zero());
        return Derived::div_rem_overflowing(out, remainder, x, y);
    }

    /// @brief Like `div_rem_overflowing`, but only the remainder is stored.
    [[nodiscard]]
    static bool rem_overflowing(const Span out, const Const_Span x, const Const_Span y)
    {
        std::vector<W> quotient(x.size(), Traits::zero());
        return Derived::div_rem_overflowing(quotient, out, x, y);
    }

    [[nodiscard]]
    static std::vector<W> shl_growing(const Const_Span x, const std::size_t s)
    {
        const std::size_t extra_words = (s / Traits::bit_len) + (s % Traits::bit_len != 0);
        std::vector<W> result(std::max(x.size(), std::size_t(1)) + extra_words, Traits::zero());
        [[maybe_unused]]
        const bool overflow
            = Derived::shl_overflowing(result, x, s);
        NUMERIC_DEBUG_ASSERT(!overflow);
        shrink(result);
        return result;
    }

    /// @brief Computes `x >> s`, i.e. `x / 2^s` rounded towards zero.
    [[nodiscard]]
    static std::vector<W> shr_growing(const Const_Span x, const std::size_t s)
    {
        const std::size_t dropped_words = s / Traits::bit_len;
        const std::size_t length = x.size() > dropped_words ? x.size() - dropped_words : 1;
        std::vector<W> result(length, Traits::zero());
        [[maybe_unused]]
        const bool overflow
            = Derived::shr_overflowing(result, x, s);
        NUMERIC_DEBUG_ASSERT(!overflow);
        shrink(result);
        return result;
    }

    [[nodiscard]]
    static std::vector<W> bit_and_growing(const Const_Span x, const Const_Span y)
    {
        std::vector<W> result(std::max({ x.size(), y.size(), std::size_t(1) }), Traits::zero());
        Derived::bit_and(result, x, y);
        shrink(result);
        return result;
    }

    [[nodiscard]]
    static std::vector<W> bit_or_growing(const Const_Span x, const Const_Span y)
    {
        std::vector<W> result(std::max({ x.size(), y.size(), std::size_t(1) }), Traits::zero());
        Derived::bit_or(result, x, y);
        shrink(result);
        return result;
    }

    [[nodiscard]]
    static std::vector<W> bit_xor_growing(const Const_Span x, const Const_Span y)
    {
        std::vector<W> result(std::max({ x.size(), y.size(), std::size_t(1) }), Traits::zero());
        Derived::bit_xor(result, x, y);
        shrink(result);
        return result;
    }
};

} // namespace detail
} // namespace numeric::bits

#endif
