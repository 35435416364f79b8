#ifndef NUMERIC_BIG_INT_OPS_HPP
#define NUMERIC_BIG_INT_OPS_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

#include "numeric/util/assert.hpp"

#include "numeric/big_int.hpp"

namespace numeric {

[[nodiscard]]
inline std::string to_string(const Big_Int& x, const int base = 10, const bool to_upper = false)
{
    std::string result;
    x.print_to([&](const std::string_view str) { result += str; }, base, to_upper);
    return result;
}

[[nodiscard]]
inline std::u8string to_u8string(const Big_Int& x, const int base = 10, const bool to_upper = false)
{
    std::u8string result;
    x.print_to([&](const std::u8string_view str) { result += str; }, base, to_upper);
    return result;
}

/// @brief Returns the prefix that introduces digits in the given `base`,
/// such as `0x` for base 16.
/// `base` shall be 2, 8, or 16.
[[nodiscard]]
constexpr std::string_view base_prefix(const int base, const bool to_upper = false)
{
    switch (base) {
    case 2: return to_upper ? "0B" : "0b";
    case 8: return to_upper ? "0O" : "0o";
    case 16: return to_upper ? "0X" : "0x";
    default: break;
    }
    NUMERIC_ASSERT_UNREACHABLE(u8"Base has no prefix.");
}

/// @brief Like `to_string`, but the digits are preceded by `base_prefix(base, to_upper)`,
/// and the sign (if any) precedes the prefix.
/// For example, `to_prefixed_string(Big_Int(-255), 16)` is `"-0xff"`.
[[nodiscard]]
inline std::string
to_prefixed_string(const Big_Int& x, const int base, const bool to_upper = false)
{
    std::string result = to_string(x, base, to_upper);
    result.insert(std::size_t(x.is_negative()), base_prefix(base, to_upper));
    return result;
}

inline std::ostream& operator<<(std::ostream& out, const Big_Int& x)
{
    x.print_to([&](const std::string_view str) { out << str; });
    return out;
}

} // namespace numeric

#endif
