#ifndef NUMERIC_BITS_VARIANTS_HPP
#define NUMERIC_BITS_VARIANTS_HPP

#include <algorithm>
#include <optional>
#include <span>
#include <utility>

#include "numeric/fwd.hpp"

namespace numeric::bits {

/// @brief The value that a saturating operation clamps its output to upon overflow.
enum struct Saturation : Default_Underlying {
    /// @brief The result was too large, so the output is filled with one-bits.
    max,
    /// @brief The result was too small (or undefined), so the output is filled with zeros.
    zero,
};

// Each operation tag forwards to the overflowing implementation in a kernel family,
// which is either `Element<W>` or `Bitwise<W>`.

struct Add_Op {
    static constexpr Saturation saturation = Saturation::max;

    template <typename Algo, typename... Args>
    [[nodiscard]]
    static constexpr bool overflowing(Args&&... args)
    {
        return Algo::add_overflowing(std::forward<Args>(args)...);
    }
};

struct Sub_Op {
    static constexpr Saturation saturation = Saturation::zero;

    template <typename Algo, typename... Args>
    [[nodiscard]]
    static constexpr bool overflowing(Args&&... args)
    {
        return Algo::sub_overflowing(std::forward<Args>(args)...);
    }
};

struct Mul_Op {
    static constexpr Saturation saturation = Saturation::max;

    template <typename Algo, typename... Args>
    [[nodiscard]]
    static constexpr bool overflowing(Args&&... args)
    {
        return Algo::mul_overflowing(std::forward<Args>(args)...);
    }
};

/// @brief Division which only yields the quotient.
/// Division by zero saturates to the maximum, as if the quotient was infinite.
struct Div_Op {
    static constexpr Saturation saturation = Saturation::max;

    template <typename Algo, typename... Args>
    [[nodiscard]]
    static bool overflowing(Args&&... args)
    {
        return Algo::div_overflowing(std::forward<Args>(args)...);
    }
};

/// @brief Division which only yields the remainder.
/// The remainder always fits into the divisor's width,
/// so overflow only happens upon division by zero.
struct Rem_Op {
    static constexpr Saturation saturation = Saturation::zero;

    template <typename Algo, typename... Args>
    [[nodiscard]]
    static bool overflowing(Args&&... args)
    {
        return Algo::rem_overflowing(std::forward<Args>(args)...);
    }
};

struct Shl_Op {
    static constexpr Saturation saturation = Saturation::max;

    template <typename Algo, typename... Args>
    [[nodiscard]]
    static constexpr bool overflowing(Args&&... args)
    {
        return Algo::shl_overflowing(std::forward<Args>(args)...);
    }
};

struct Shr_Op {
    static constexpr Saturation saturation = Saturation::max;

    template <typename Algo, typename... Args>
    [[nodiscard]]
    static constexpr bool overflowing(Args&&... args)
    {
        return Algo::shr_overflowing(std::forward<Args>(args)...);
    }
};

/// @brief Performs `Op` with the kernel family `Algo`,
/// storing the result modulo `2^(out.size() * bit_len)` in `out`.
/// Any overflow is silently discarded.
/// For example, `wrapping<Add_Op, Element<unsigned>>(out, x, y)`.
template <typename Op, typename Algo, typename... Args>
constexpr void wrapping(const std::span<typename Algo::Word> out, Args&&... args)
{
    [[maybe_unused]]
    const bool overflow
        = Op::template overflowing<Algo>(out, std::forward<Args>(args)...);
}

/// @brief Performs `Op` with the kernel family `Algo`, storing the result in `out`.
/// @returns `out`, or `std::nullopt` if the result did not fit into `out`.
/// In the latter case, the contents of `out` are the wrapped result.
template <typename Op, typename Algo, typename... Args>
[[nodiscard]]
constexpr std::optional<std::span<typename Algo::Word>>
checked(const std::span<typename Algo::Word> out, Args&&... args)
{
    const bool overflow = Op::template overflowing<Algo>(out, std::forward<Args>(args)...);
    if (overflow) {
        return std::nullopt;
    }
    return out;
}

/// @brief Performs `Op` with the kernel family `Algo`, storing the result in `out`.
/// If the result did not fit into `out`,
/// `out` is clamped to the value given by `Op::saturation` instead.
/// @returns `true` iff saturation took place.
template <typename Op, typename Algo, typename... Args>
constexpr bool saturating(const std::span<typename Algo::Word> out, Args&&... args)
{
    using Traits = typename Algo::Traits;
    const bool overflow = Op::template overflowing<Algo>(out, std::forward<Args>(args)...);
    if (overflow) {
        const auto fill = Op::saturation == Saturation::max ? Traits::max() : Traits::zero();
        std::ranges::fill(out, fill);
    }
    return overflow;
}

} // namespace numeric::bits

#endif
