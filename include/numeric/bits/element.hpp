#ifndef NUMERIC_BITS_ELEMENT_HPP
#define NUMERIC_BITS_ELEMENT_HPP

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

/// @brief Arithmetic on word spans which operates on whole words at a time,
/// using the carry and borrow flags of `Word_Traits`.
/// This is the fast path that `Big_Int` is built on.
///
/// Unless stated otherwise, an output span may be the same span as the left operand,
/// but shall not partially overlap any operand.
template <word W>
struct Element : detail::Kernel_Base<Element<W>, W> {
    using Traits = Word_Traits<W>;
    using Span = std::span<W>;
    using Const_Span = std::span<const W>;

    // ADDITION AND SUBTRACTION ====================================================================

    /// @brief Stores `x + y` modulo `2^(out.size() * bit_len)` in `out`.
    /// @returns `true` iff the sum does not fit into `out`.
    [[nodiscard]]
    static constexpr bool add_overflowing(const Span out, const Const_Span x, const Const_Span y)
    {
        const std::size_t length = std::max(x.size(), y.size());
        bool carry = false;
        bool overflow = false;
        for (std::size_t i = 0; i <= length; ++i) {
            const auto [partial, carry_x_y] = Traits::overflowing_add(word_at(x, i), word_at(y, i));
            const auto [sum, carry_in] = Traits::overflowing_add(partial, carry_word(carry));
            carry = carry_x_y || carry_in;
            if (i < out.size()) {
                out[i] = sum;
            }
            else if (sum != Traits::zero()) {
                overflow = true;
            }
        }
        std::ranges::fill(out.subspan(std::min(out.size(), length + 1)), Traits::zero());
        return overflow;
    }

    /// @brief Stores `x - y` modulo `2^(out.size() * bit_len)` in `out`.
    /// If `x < y`, the difference wraps around,
    /// and `negate_in_place` recovers `y - x` from it.
    /// @returns `true` iff the difference does not fit into `out`,
    /// which is always the case when `x < y`.
    [[nodiscard]]
    static constexpr bool sub_overflowing(const Span out, const Const_Span x, const Const_Span y)
    {
        const std::size_t length = std::max(x.size(), y.size());
        bool borrow = false;
        bool overflow = false;
        for (std::size_t i = 0; i < length; ++i) {
            const auto [partial, borrow_x_y] = Traits::overflowing_sub(word_at(x, i), word_at(y, i));
            const auto [difference, borrow_in] = Traits::overflowing_sub(partial, carry_word(borrow));
            borrow = borrow_x_y || borrow_in;
            if (i < out.size()) {
                out[i] = difference;
            }
            else if (difference != Traits::zero()) {
                overflow = true;
            }
        }
        // A borrow out of the last word sign-extends the wrapped result with ones.
        const W extension = borrow ? Traits::max() : Traits::zero();
        std::ranges::fill(out.subspan(std::min(out.size(), length)), extension);
        return overflow || borrow;
    }

    // MULTIPLICATION ==============================================================================

    /// @brief Stores `x * y` modulo `2^(out.size() * bit_len)` in `out`.
    /// `out` shall not overlap `x` or `y`.
    /// @returns `true` iff the product does not fit into `out`.
    [[nodiscard]]
    static constexpr bool mul_overflowing(const Span out, const Const_Span x, const Const_Span y)
    {
        std::ranges::fill(out, Traits::zero());
        bool overflow = false;
        for (std::size_t i = 0; i < x.size(); ++i) {
            if (x[i] == Traits::zero()) {
                continue;
            }
            for (std::size_t j = 0; j < y.size(); ++j) {
                const auto [low, high] = Traits::widening_mul(x[i], y[j], Traits::zero());
                overflow |= add_word_at(out, i + j, low);
                overflow |= add_word_at(out, i + j + 1, high);
            }
        }
        return overflow;
    }

    /// @brief Replaces `words` with `words * factor + addend`,
    /// appending a word if the result needs one more.
    static void mul_add_word(std::vector<W>& words, const W factor, const W addend)
    {
        W carry = addend;
        for (W& w : words) {
            const auto [low, high] = Traits::widening_mul(w, factor, carry);
            w = low;
            carry = high;
        }
        if (carry != Traits::zero()) {
            words.push_back(carry);
        }
    }

    // DIVISION ====================================================================================

    /// @brief Computes `x / y` and `x % y` by binary long division,
    /// producing one quotient bit per dividend bit.
    /// The remainder is shifted and subtracted one word at a time.
    ///
    /// If `y` is zero, `quotient` and `remainder` are filled with zeros.
    /// `quotient` and `remainder` shall not overlap each other or the operands.
    /// @returns `true` iff `y` is zero,
    /// or if the quotient or remainder does not fit into its output span.
    [[nodiscard]]
    static bool div_rem_overflowing(
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
        // Before subtraction, the running remainder is less than 2 * divisor,
        // so one extra word always suffices.
        std::vector<W> running(divisor.size() + 1, Traits::zero());

        bool overflow = false;
        const std::size_t quotient_bits = quotient.size() * std::size_t(Traits::bit_len);
        for (std::size_t i = bit_width<W>(x); i-- > 0;) {
            shl_one_in_place(running, get_bit<W>(x, i));
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
        for (std::size_t i = 0; i < running.size(); ++i) {
            if (i < remainder.size()) {
                remainder[i] = running[i];
            }
            else if (running[i] != Traits::zero()) {
                overflow = true;
            }
        }
        return overflow;
    }

    /// @brief Replaces `words` with `words / divisor` and returns `words % divisor`.
    /// This is short division, which is much cheaper than `div_rem_overflowing`
    /// when the divisor fits into a single word.
    /// `divisor` shall not be zero.
    [[nodiscard]]
    static constexpr W div_rem_word(const Span words, const W divisor)
    {
        NUMERIC_ASSERT(divisor != Traits::zero());
        W remainder = Traits::zero();
        for (std::size_t i = words.size(); i-- > 0;) {
            if constexpr (numeric::detail::widenable<W>) {
                using Wide = typename numeric::detail::Widened<W>::type;
                const Wide current = (Wide(remainder) << Traits::bit_len) | Wide(words[i]);
                words[i] = W(current / Wide(divisor));
                remainder = W(current % Wide(divisor));
            }
            else {
                W quotient_word = Traits::zero();
                for (int b = Traits::bit_len; b-- > 0;) {
                    const bool top_bit
                        = Traits::shr(remainder, Traits::bit_len - 1) != Traits::zero();
                    const W next_bit = Traits::bit_and(Traits::shr(words[i], b), Traits::one());
                    remainder = Traits::bit_or(Traits::shl(remainder, 1), next_bit);
                    if (top_bit || remainder >= divisor) {
                        remainder = Traits::overflowing_sub(remainder, divisor).value;
                        quotient_word = Traits::bit_or(quotient_word, Traits::shl(Traits::one(), b));
                    }
                }
                words[i] = quotient_word;
            }
        }
        return remainder;
    }

    // SHIFTS ======================================================================================

    /// @brief Stores `x << s` modulo `2^(out.size() * bit_len)` in `out`.
    /// Whole words are relocated by `s / bit_len` positions,
    /// and the remaining `s % bit_len` bits that spill out of each word
    /// are merged into the next more significant word.
    /// @returns `true` iff any one-bit is shifted past the end of `out`.
    [[nodiscard]]
    static constexpr bool shl_overflowing(const Span out, const Const_Span x, const std::size_t s)
    {
        const std::size_t width = bit_width<W>(x);
        const std::size_t capacity = out.size() * std::size_t(Traits::bit_len);
        const bool overflow = width != 0 && (width > capacity || s > capacity - width);

        const std::size_t word_shift = s / Traits::bit_len;
        const int bit_shift = int(s % Traits::bit_len);
        for (std::size_t i = out.size(); i-- > 0;) {
            if (i < word_shift) {
                out[i] = Traits::zero();
                continue;
            }
            const std::size_t source = i - word_shift;
            W result = Traits::shl(word_at(x, source), bit_shift);
            if (bit_shift != 0 && source != 0) {
                const W spill = Traits::shr(word_at(x, source - 1), Traits::bit_len - bit_shift);
                result = Traits::bit_or(result, spill);
            }
            out[i] = result;
        }
        return overflow;
    }

    /// @brief Stores `x >> s` in `out`.
    /// @returns `true` iff the result does not fit into `out`.
    [[nodiscard]]
    static constexpr bool shr_overflowing(const Span out, const Const_Span x, const std::size_t s)
    {
        const std::size_t width = bit_width<W>(x);
        const std::size_t capacity = out.size() * std::size_t(Traits::bit_len);
        const bool overflow = width > s && width - s > capacity;

        const std::size_t word_shift = s / Traits::bit_len;
        const int bit_shift = int(s % Traits::bit_len);
        for (std::size_t i = 0; i < out.size(); ++i) {
            if (word_shift >= x.size() || i >= x.size() - word_shift) {
                out[i] = Traits::zero();
                continue;
            }
            const std::size_t source = i + word_shift;
            W result = Traits::shr(x[source], bit_shift);
            if (bit_shift != 0) {
                const W spill = Traits::shl(word_at(x, source + 1), Traits::bit_len - bit_shift);
                result = Traits::bit_or(result, spill);
            }
            out[i] = result;
        }
        return overflow;
    }

    // COMPARISON ==================================================================================

    /// @brief Compares the magnitudes of `x` and `y`,
    /// treating the shorter span as if it was zero-extended.
    [[nodiscard]]
    static constexpr std::strong_ordering compare(const Const_Span x, const Const_Span y) noexcept
    {
        for (std::size_t i = std::max(x.size(), y.size()); i-- > 0;) {
            const W x_i = word_at(x, i);
            const W y_i = word_at(y, i);
            if (x_i != y_i) {
                return x_i < y_i ? std::strong_ordering::less : std::strong_ordering::greater;
            }
        }
        return std::strong_ordering::equal;
    }

    // BITWISE LOGIC ===============================================================================

    static constexpr void bit_and(const Span out, const Const_Span x, const Const_Span y) noexcept
    {
        for (std::size_t i = 0; i < out.size(); ++i) {
            out[i] = Traits::bit_and(word_at(x, i), word_at(y, i));
        }
    }

    static constexpr void bit_or(const Span out, const Const_Span x, const Const_Span y) noexcept
    {
        for (std::size_t i = 0; i < out.size(); ++i) {
            out[i] = Traits::bit_or(word_at(x, i), word_at(y, i));
        }
    }

    static constexpr void bit_xor(const Span out, const Const_Span x, const Const_Span y) noexcept
    {
        for (std::size_t i = 0; i < out.size(); ++i) {
            out[i] = Traits::bit_xor(word_at(x, i), word_at(y, i));
        }
    }

    static constexpr void bit_not(const Span words) noexcept
    {
        for (W& w : words) {
            w = Traits::bit_not(w);
        }
    }

private:
    [[nodiscard]]
    static constexpr W word_at(const Const_Span words, const std::size_t i) noexcept
    {
        return bits::word_at<W>(words, i);
    }

    [[nodiscard]]
    static constexpr W carry_word(const bool carry) noexcept
    {
        return carry ? Traits::one() : Traits::zero();
    }

    /// @brief Adds `w` to the magnitude in `out`, starting at index `i`,
    /// and ripples the carry forward until it stops propagating.
    /// @returns `true` iff the carry (or `w` itself) propagates past the end of `out`.
    [[nodiscard]]
    static constexpr bool add_word_at(const Span out, std::size_t i, W w) noexcept
    {
        while (w != Traits::zero()) {
            if (i >= out.size()) {
                return true;
            }
            const auto [sum, carry] = Traits::overflowing_add(out[i], w);
            out[i] = sum;
            w = carry_word(carry);
            ++i;
        }
        return false;
    }

    /// @brief Shifts `words` left by one bit, shifting `low_bit` into the least significant bit.
    /// The most significant bit is discarded.
    static constexpr void shl_one_in_place(const Span words, const bool low_bit) noexcept
    {
        W carry = carry_word(low_bit);
        for (W& w : words) {
            const W next_carry = Traits::shr(w, Traits::bit_len - 1);
            w = Traits::bit_or(Traits::shl(w, 1), carry);
            carry = next_carry;
        }
    }
};

} // namespace numeric::bits

#endif
