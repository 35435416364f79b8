#ifndef NUMERIC_DIAGNOSTIC_HPP
#define NUMERIC_DIAGNOSTIC_HPP

#include <compare>
#include <string_view>

#include "numeric/util/severity.hpp"

#include "numeric/fwd.hpp"

namespace numeric {

[[nodiscard]]
constexpr std::strong_ordering operator<=>(Severity x, Severity y) noexcept
{
    return Default_Underlying(x) <=> Default_Underlying(y);
}

[[nodiscard]]
constexpr bool severity_is_emittable(Severity x) noexcept
{
    return x >= Severity::min && x <= Severity::max;
}

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifier for this diagnostic.
    std::u8string_view id;
    /// @brief The diagnostic message.
    std::u8string_view message;
};

namespace diagnostic {

// INTERNER DIAGNOSTICS ============================================================================

/// @brief A new chunk of slots was appended to an interner.
inline constexpr std::u8string_view interner_grow = u8"interner.grow";

/// @brief A dead slot which still held an equal value was brought back to life
/// instead of storing the value anew.
inline constexpr std::u8string_view interner_revive = u8"interner.revive";

/// @brief A dead slot was overwritten with a different value.
inline constexpr std::u8string_view interner_reuse = u8"interner.reuse";

} // namespace diagnostic

} // namespace numeric

#endif
