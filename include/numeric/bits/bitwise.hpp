#ifndef NUMERIC_BITS_BITWISE_HPP
#define NUMERIC_BITS_BITWISE_HPP

#include <algorithm>
#include <compare>
#include <cstddef>
#include <span>
#include <vector>

#include "numeric/util/assert.hpp"

#include "numeric/bits/kernel_base.hpp"
#include "numeric/bits/word_span.hpp"
#include "numeric/word.hpp"

namespace numeric::bits {

/// @brief Arithmetic on word spans which operates on one bit at a time.
/// This is much slower than `Element`,
/// but every operation is a direct transcription of the pencil-and-paper algorithm,
/// which makes it useful as a reference to test `Element` against.
///
/// The contracts of all operations are identical to those in `Element`.
template <word W>
struct Bitwise : detail::Kernel_Base<Bitwise<W>, W> {
    using Traits = Word_Traits<W>;
    using Span = std::span<W>;
    using Const_Span = std::span<const W>;

    // ADDITION AND SUBTRACTION ====================================================================

    [[nodiscard]]
    static constexpr bool add_overflowing(const Span out, const Const_Span x, const Const_Span y)
    {
        const std::size_t operand_bits = bit_count(std::max(x.size(), y.size()));
        const std::size_t out_bits = bit_count(out.size());
        bool carry = false;
        bool overflow = false;
        for (std::size_t i = 0; i < std::max(operand_bits + 1, out_bits); ++i) {
            const bool a = get_bit<W>(x, i);
            const bool b = get_bit<W>(y, i);
            const bool sum = (a != b) != carry;
            carry = (a && b) || (carry && (a != b));
            if (i < out_bits) {
                set_bit<W>(out, i, sum);
            }
            else if (sum) {
                overflow = true;
            }
        }
        return overflow;
    }

    [[nodiscard]]
    static constexpr bool sub_overflowing(const Span out, const Const_Span x, const Const_Span y)
    {
        const std::size_t operand_bits = bit_count(std::max(x.size(), y.size()));
        const std::size_t out_bits = bit_count(out.size());
        bool borrow = false;
        bool overflow = false;
        for (std::size_t i = 0; i < std::max(operand_bits, out_bits); ++i) {
            const bool a = get_bit<W>(x, i);
            const bool b = get_bit<W>(y, i);
            const bool difference = (a != b) != borrow;
            borrow = (!a && b) || (borrow && a == b);
            if (i < out_bits) {
                set_bit<W>(out, i, difference);
            }
            else if (difference) {
                overflow = true;
            }
        }
        return overflow || borrow;
    }

    // MULTIPLICATION ==============================================================================

    /// @brief Multiplies by shifting and adding:
    /// for every one-bit `j` of `y`, `x << j` is added to the result.
    [[nodiscard]]
    static constexpr bool mul_overflowing(const Span out, const Const_Span x, const Const_Span y)
    {
        std::ranges::fill(out, Traits::zero());
        const std::size_t x_bits = bit_width<W>(x);
        const std::size_t y_bits = bit_width<W>(y);
        const std::size_t out_bits = bit_count(out.size());
        bool overflow = false;
        for (std::size_t j = 0; j < y_bits; ++j) {
            if (!get_bit<W>(y, j)) {
                continue;
            }
            bool carry = false;
            for (std::size_t k = 0; k < x_bits || carry; ++k) {
                const std::size_t position = j + k;
                const bool a = get_bit<W>(x, k);
                if (position >= out_bits) {
                    overflow |= a || carry;
                    carry = false;
                    continue;
                }
                const bool b = get_bit<W>(out, position);
                set_bit<W>(out, position, (a != b) != carry);
                carry = (a && b) || (carry && (a != b));
            }
        }
        return overflow;
    }

    // DIVISION ====================================================================================

    /// @brief Computes `x / y` and `x % y` by binary long division,
    /// where the running remainder is shifted, compared, and subtracted bit by bit.
    [[nodiscard]]
    static constexpr bool div_rem_overflowing(
        const Span quotient,
        const Span remainder,
        const Const_Span x,
        const Const_Span y
    )
    {
        std::ranges::fill(quotient, Traits::zero());
        std::ranges::fill(remainder, Traits::zero());
        if (is_zero<W>(y)) {
            return true;
        }
        const Const_Span divisor = shrink<W>(y);
        std::vector<W> running(divisor.size() + 1, Traits::zero());
        const std::size_t running_bits = bit_count(running.size());

        bool overflow = false;
        const std::size_t quotient_bits = bit_count(quotient.size());
        for (std::size_t i = bit_width<W>(x); i-- > 0;) {
            for (std::size_t k = running_bits - 1; k > 0; --k) {
                set_bit<W>(running, k, get_bit<W>(running, k - 1));
            }
            set_bit<W>(running, 0, get_bit<W>(x, i));

            if (compare(running, divisor) != std::strong_ordering::less) {
                [[maybe_unused]]
                const bool borrow
                    = sub_overflowing(running, running, divisor);
                NUMERIC_DEBUG_ASSERT(!borrow);
                if (i < quotient_bits) {
                    set_bit<W>(quotient, i, true);
                }
                else {
                    overflow = true;
                }
            }
        }
        const std::size_t remainder_bits = bit_count(remainder.size());
        for (std::size_t i = 0; i < running_bits; ++i) {
            const bool bit = get_bit<W>(running, i);
            if (i < remainder_bits) {
                set_bit<W>(remainder, i, bit);
            }
            else if (bit) {
                overflow = true;
            }
        }
        return overflow;
    }

    // SHIFTS ======================================================================================

    [[nodiscard]]
    static constexpr bool shl_overflowing(const Span out, const Const_Span x, const std::size_t s)
    {
        const std::size_t out_bits = bit_count(out.size());
        const std::size_t x_bits = bit_width<W>(x);
        bool overflow = false;
        for (std::size_t k = 0; k < x_bits; ++k) {
            if (get_bit<W>(x, k) && (k >= out_bits || s >= out_bits - k)) {
                overflow = true;
                break;
            }
        }
        for (std::size_t i = out_bits; i-- > 0;) {
            set_bit<W>(out, i, i >= s && get_bit<W>(x, i - s));
        }
        return overflow;
    }

    [[nodiscard]]
    static constexpr bool shr_overflowing(const Span out, const Const_Span x, const std::size_t s)
    {
        const std::size_t out_bits = bit_count(out.size());
        const std::size_t x_bits = bit_width<W>(x);
        const bool overflow = x_bits > s && x_bits - s > out_bits;
        for (std::size_t i = 0; i < out_bits; ++i) {
            const bool in_range = s < x_bits && i < x_bits - s;
            set_bit<W>(out, i, in_range && get_bit<W>(x, i + s));
        }
        return overflow;
    }

    // COMPARISON ==================================================================================

    [[nodiscard]]
    static constexpr std::strong_ordering compare(const Const_Span x, const Const_Span y) noexcept
    {
        for (std::size_t i = bit_count(std::max(x.size(), y.size())); i-- > 0;) {
            const bool a = get_bit<W>(x, i);
            const bool b = get_bit<W>(y, i);
            if (a != b) {
                return a ? std::strong_ordering::greater : std::strong_ordering::less;
            }
        }
        return std::strong_ordering::equal;
    }

    // BITWISE LOGIC ===============================================================================

    static constexpr void bit_and(const Span out, const Const_Span x, const Const_Span y) noexcept
    {
        for (std::size_t i = 0; i < bit_count(out.size()); ++i) {
            set_bit<W>(out, i, get_bit<W>(x, i) && get_bit<W>(y, i));
        }
    }

    static constexpr void bit_or(const Span out, const Const_Span x, const Const_Span y) noexcept
    {
        for (std::size_t i = 0; i < bit_count(out.size()); ++i) {
            set_bit<W>(out, i, get_bit<W>(x, i) || get_bit<W>(y, i));
        }
    }

    static constexpr void bit_xor(const Span out, const Const_Span x, const Const_Span y) noexcept
    {
        for (std::size_t i = 0; i < bit_count(out.size()); ++i) {
            set_bit<W>(out, i, get_bit<W>(x, i) != get_bit<W>(y, i));
        }
    }

    static constexpr void bit_not(const Span words) noexcept
    {
        for (std::size_t i = 0; i < bit_count(words.size()); ++i) {
            set_bit<W>(words, i, !get_bit<W>(words, i));
        }
    }

private:
    [[nodiscard]]
    static constexpr std::size_t bit_count(const std::size_t word_count) noexcept
    {
        return word_count * std::size_t(Traits::bit_len);
    }
};

} // namespace numeric::bits

#endif
