#ifndef NUMERIC_META_HPP
#define NUMERIC_META_HPP

#include <concepts>
#include <type_traits>

#include "ulight/const.hpp"

#include "numeric/settings.hpp"

namespace numeric {

using ulight::const_v;

template <typename>
inline constexpr bool dependent_false = false;

template <typename T, typename... Us>
concept one_of = (std::same_as<T, Us> || ...);

template <typename T>
concept signed_integer = one_of<
    T,
    signed char,
    signed short,
    signed int,
    signed long,
    signed long long,
    Int128>;

template <typename T>
concept unsigned_integer = one_of<
    T,
    unsigned char,
    unsigned short,
    unsigned int,
    unsigned long,
    unsigned long long,
    Uint128>;

template <typename T>
concept signed_or_unsigned = signed_integer<T> || unsigned_integer<T>;

namespace detail {

template <typename T>
struct Make_Unsigned : std::make_unsigned<T> { };

template <>
struct Make_Unsigned<Int128> {
    using type = Uint128;
};

template <>
struct Make_Unsigned<Uint128> {
    using type = Uint128;
};

} // namespace detail

/// @brief Like `std::make_unsigned_t`,
/// but also supports 128-bit integers in strict (non-GNU) language modes.
template <signed_or_unsigned T>
using make_unsigned_t = typename detail::Make_Unsigned<T>::type;

/// @brief The amount of value bits in `T`, not counting the sign bit.
template <signed_or_unsigned T>
inline constexpr int value_bits = int(sizeof(T) * 8) - int(signed_integer<T>);

} // namespace numeric

#endif
