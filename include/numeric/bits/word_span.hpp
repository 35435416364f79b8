#ifndef NUMERIC_BITS_WORD_SPAN_HPP
#define NUMERIC_BITS_WORD_SPAN_HPP

#include <cstddef>
#include <span>
#include <vector>

#include "numeric/util/assert.hpp"

#include "numeric/word.hpp"

namespace numeric::bits {

// Word spans hold magnitudes with the least significant word first.
// Words past the end of a span are treated as zero throughout.

/// @brief Returns `words[i]`, or zero if `i` is past the end of `words`.
template <word W>
[[nodiscard]]
constexpr W word_at(const std::span<const W> words, const std::size_t i) noexcept
{
    return i < words.size() ? words[i] : Word_Traits<W>::zero();
}

/// @brief Returns the canonical form of `words`,
/// which is `words` without any redundant most significant zero words.
/// If all words are zero, the result is a single zero word.
/// If `words` is empty, the result is empty.
template <word W>
[[nodiscard]]
constexpr std::span<const W> shrink(const std::span<const W> words) noexcept
{
    std::size_t length = words.size();
    while (length > 1 && words[length - 1] == Word_Traits<W>::zero()) {
        --length;
    }
    return words.first(length);
}

/// @brief Like `shrink(std::span<const W>)`, but erases the redundant words from `words`.
template <word W>
constexpr void shrink(std::vector<W>& words)
{
    words.resize(shrink(std::span<const W> { words }).size());
}

/// @brief Returns `true` if the magnitude held by `words` is zero.
/// The empty span is zero.
template <word W>
[[nodiscard]]
constexpr bool is_zero(const std::span<const W> words) noexcept
{
    for (const W w : words) {
        if (w != Word_Traits<W>::zero()) {
            return false;
        }
    }
    return true;
}

/// @brief Returns the bit with index `i`, where index `0` is the least significant bit.
/// Bits past the end are zero.
template <word W>
[[nodiscard]]
constexpr bool get_bit(const std::span<const W> words, const std::size_t i) noexcept
{
    using Traits = Word_Traits<W>;
    const std::size_t word_index = i / Traits::bit_len;
    const int bit_index = int(i % Traits::bit_len);
    const W mask = Traits::shl(Traits::one(), bit_index);
    return Traits::bit_and(word_at(words, word_index), mask) != Traits::zero();
}

/// @brief Sets the bit with index `i` to `value`.
/// `i` shall be less than `words.size() * Word_Traits<W>::bit_len`.
template <word W>
constexpr void set_bit(const std::span<W> words, const std::size_t i, const bool value) noexcept
{
    using Traits = Word_Traits<W>;
    const std::size_t word_index = i / Traits::bit_len;
    const int bit_index = int(i % Traits::bit_len);
    NUMERIC_DEBUG_ASSERT(word_index < words.size());
    const W mask = Traits::shl(Traits::one(), bit_index);
    words[word_index] = value ? Traits::bit_or(words[word_index], mask)
                              : Traits::bit_and(words[word_index], Traits::bit_not(mask));
}

/// @brief Returns the amount of bits needed to represent the magnitude in `words`.
/// That is, the index of the most significant one-bit plus one, or zero for zero.
template <word W>
[[nodiscard]]
constexpr std::size_t bit_width(const std::span<const W> words) noexcept
{
    using Traits = Word_Traits<W>;
    const std::span<const W> canonical = shrink(words);
    if (canonical.empty()) {
        return 0;
    }
    const W top = canonical.back();
    int top_width = 0;
    while (top_width < Traits::bit_len && Traits::shr(top, top_width) != Traits::zero()) {
        ++top_width;
    }
    return ((canonical.size() - 1) * std::size_t(Traits::bit_len)) + std::size_t(top_width);
}

/// @brief Replaces the words with their two's complement, i.e. `2^N - x`,
/// where `N` is the amount of bits in `words`.
/// This operation is what recovers the magnitude of a subtraction `x - y`
/// which borrowed past the most significant word:
/// the wrapped difference is `2^N - (y - x)`,
/// so negating it yields `y - x`.
template <word W>
constexpr void negate_in_place(const std::span<W> words) noexcept
{
    using Traits = Word_Traits<W>;
    bool carry = true;
    for (W& w : words) {
        const W increment = carry ? Traits::one() : Traits::zero();
        const auto [sum, overflow] = Traits::overflowing_add(Traits::bit_not(w), increment);
        w = sum;
        carry = overflow;
    }
}

} // namespace numeric::bits

#endif
