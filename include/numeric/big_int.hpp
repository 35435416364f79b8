#ifndef NUMERIC_BIG_INT_HPP
#define NUMERIC_BIG_INT_HPP

#include <compare>
#include <cstddef>
#include <limits>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "numeric/util/assert.hpp"
#include "numeric/util/function_ref.hpp"
#include "numeric/util/meta.hpp"
#include "numeric/util/result.hpp"

#include "numeric/fwd.hpp"
#include "numeric/settings.hpp"

namespace numeric {

/// @brief The error of a checked narrowing conversion.
enum struct Out_Of_Range_Error : Default_Underlying {
    /// @brief The value is greater than the maximum of the target type.
    above,
    /// @brief The value is less than the minimum of the target type.
    below,
};

[[nodiscard]]
constexpr std::u8string_view out_of_range_error_name(Out_Of_Range_Error e)
{
    using enum Out_Of_Range_Error;
    switch (e) {
        NUMERIC_ENUM_STRING_CASE8(above);
        NUMERIC_ENUM_STRING_CASE8(below);
    }
    NUMERIC_ASSERT_UNREACHABLE(u8"Invalid error.");
}

enum struct From_String_Error_Kind : Default_Underlying {
    /// @brief The radix was negative or greater than 36.
    invalid_radix,
    /// @brief A character was not a digit in the given radix.
    invalid_char,
};

[[nodiscard]]
constexpr std::u8string_view from_string_error_kind_name(From_String_Error_Kind kind)
{
    using enum From_String_Error_Kind;
    switch (kind) {
        NUMERIC_ENUM_STRING_CASE8(invalid_radix);
        NUMERIC_ENUM_STRING_CASE8(invalid_char);
    }
    NUMERIC_ASSERT_UNREACHABLE(u8"Invalid error kind.");
}

/// @brief The error of `Big_Int::from_string`.
struct From_String_Error {
    From_String_Error_Kind kind;
    /// @brief The radix that was passed to the conversion.
    int radix;
    /// @brief The offending character if `kind` is `invalid_char`,
    /// otherwise the null character.
    /// For non-ASCII characters, this is the first UTF-8 code unit of the character.
    char32_t character = 0;

    [[nodiscard]]
    friend constexpr bool operator==(const From_String_Error&, const From_String_Error&)
        = default;
};

template <typename Q, typename R = Q>
struct Div_Result {
    Q quotient;
    R remainder;

    [[nodiscard]]
    friend bool operator==(const Div_Result&, const Div_Result&)
        = default;
};

namespace detail {

enum struct Tag : Default_Underlying {
    /// @brief Non-negative, the offset is an interner id.
    none = 0b00,
    /// @brief Negative, the offset is an interner id.
    neg = 0b01,
    /// @brief Non-negative, the offset is the magnitude.
    inline_pos = 0b10,
    /// @brief Negative, the offset is the magnitude.
    inline_neg = 0b11,
};

/// @brief A single word which packs an offset with a two-bit `Tag`,
/// where the tag occupies the least significant bits.
struct Tagged_Offset {
    static constexpr int tag_bits = 2;
    static constexpr std::size_t offset_max = std::size_t(-1) >> tag_bits;

    std::size_t bits;

    [[nodiscard]]
    static constexpr Tagged_Offset make(const std::size_t offset, const Tag tag) noexcept
    {
        NUMERIC_ASSERT(offset <= offset_max);
        return { (offset << tag_bits) | std::size_t(tag) };
    }

    [[nodiscard]]
    constexpr std::size_t offset() const noexcept
    {
        return bits >> tag_bits;
    }

    [[nodiscard]]
    constexpr Tag tag() const noexcept
    {
        return Tag(bits & 0b11);
    }

    [[nodiscard]]
    constexpr bool is_inline() const noexcept
    {
        return (bits & 0b10) != 0;
    }

    [[nodiscard]]
    constexpr bool is_negative() const noexcept
    {
        return (bits & 0b01) != 0;
    }

    /// @brief Returns the same offset with the sign bit of the tag flipped.
    [[nodiscard]]
    constexpr Tagged_Offset with_negated() const noexcept
    {
        return { bits ^ 0b01 };
    }

    [[nodiscard]]
    friend constexpr bool operator==(Tagged_Offset, Tagged_Offset)
        = default;
};

inline constexpr Tagged_Offset zero_offset = Tagged_Offset::make(0, Tag::inline_pos);

} // namespace detail

/// @brief Sets the logger of the interner that holds the magnitudes of all large `Big_Int`s.
/// By default, that interner logs to `ignorant_logger`.
/// `logger` shall outlive any further `Big_Int` operation.
void set_global_interner_logger(Logger& logger) noexcept;

/// @brief Returns the interner that holds the magnitudes of all large `Big_Int`s.
/// The interner is created upon first use and is never destroyed.
[[nodiscard]]
Interner<std::vector<Big_Int_Word>>& global_interner() noexcept;

// BIG_INT OPERATIONS ==============================================================================
// These are befriended by Big_Int, and declared up front so that they can carry attributes.

[[nodiscard]]
bool operator==(const Big_Int& x, const Big_Int& y) noexcept;

[[nodiscard]]
std::strong_ordering operator<=>(const Big_Int& x, const Big_Int& y) noexcept;

[[nodiscard]]
Big_Int operator+(const Big_Int& x, const Big_Int& y);
[[nodiscard]]
Big_Int operator-(const Big_Int& x, const Big_Int& y);
[[nodiscard]]
Big_Int operator*(const Big_Int& x, const Big_Int& y);

/// @brief Returns `x / y`, rounded towards zero.
/// `y` shall not be zero.
[[nodiscard]]
Big_Int operator/(const Big_Int& x, const Big_Int& y);

/// @brief Returns the remainder of `x / y`.
/// Its magnitude is `|x| % |y|`,
/// and it is negative iff exactly one of `x` and `y` is negative (unless it is zero).
/// `y` shall not be zero.
[[nodiscard]]
Big_Int operator%(const Big_Int& x, const Big_Int& y);

/// @brief Returns `{ x / y, x % y }`.
/// `y` shall not be zero.
[[nodiscard]]
Div_Result<Big_Int> div_rem(const Big_Int& x, const Big_Int& y);

/// @brief Like `x / y`, but returns `std::nullopt` if `y` is zero.
[[nodiscard]]
std::optional<Big_Int> checked_div(const Big_Int& x, const Big_Int& y);

/// @brief Like `x % y`, but returns `std::nullopt` if `y` is zero.
[[nodiscard]]
std::optional<Big_Int> checked_rem(const Big_Int& x, const Big_Int& y);

/// @brief Returns `x` with its magnitude shifted to the left by `s` bits.
/// Negative `s` shifts in the opposite direction.
[[nodiscard]]
Big_Int operator<<(const Big_Int& x, int s);

/// @brief Returns `x` with its magnitude shifted to the right by `s` bits,
/// which rounds towards zero and keeps the sign unless the result is zero.
/// Negative `s` shifts in the opposite direction.
[[nodiscard]]
Big_Int operator>>(const Big_Int& x, int s);

/// @brief Returns x raised to the power of y,
/// where `pow(x, 0)` is one for any `x`.
[[nodiscard]]
Big_Int pow(const Big_Int& x, unsigned y);

// The bitwise operators combine the canonical magnitude words of both operands,
// and the result takes the sign of the left operand.

[[nodiscard]]
Big_Int operator&(const Big_Int& x, const Big_Int& y);
[[nodiscard]]
Big_Int operator|(const Big_Int& x, const Big_Int& y);
[[nodiscard]]
Big_Int operator^(const Big_Int& x, const Big_Int& y);

// The two's complement operations treat negative numbers
// as having an infinite sequence of leading one-bits,
// like the builtin operators on signed integers.

[[nodiscard]]
Big_Int twos_complement_and(const Big_Int& x, const Big_Int& y);
[[nodiscard]]
Big_Int twos_complement_or(const Big_Int& x, const Big_Int& y);
[[nodiscard]]
Big_Int twos_complement_xor(const Big_Int& x, const Big_Int& y);

/// @brief An arbitrary precision integer.
///
/// A `Big_Int` is a single word which holds a sign and either the magnitude itself,
/// if it is no greater than `inline_magnitude_max`,
/// or the id of the magnitude's words in the `global_interner()`.
/// Equal magnitudes share the same interned words,
/// and copying a `Big_Int` only increments a reference count.
///
/// All operations produce new values rather than modifying interned words,
/// so `Big_Int`s can be shared between threads like any other value type.
struct Big_Int {
    /// @brief The greatest magnitude that is stored inline.
    static constexpr Big_Int_Word inline_magnitude_max = detail::Tagged_Offset::offset_max;

    static const Big_Int zero;
    static const Big_Int one;

    /// @brief Creates an integer from a sequence of words of the magnitude,
    /// least significant word first.
    /// A negative zero yields plain zero.
    [[nodiscard]]
    static Big_Int from_words(std::span<const Big_Int_Word> words, bool negative = false);

    /// @brief Parses a sequence of digits in the given `radix`,
    /// optionally preceded by a single `+` or `-` sign.
    /// Letters of either case represent the digits `10` to `35`.
    /// An empty digit sequence is zero.
    [[nodiscard]]
    static Result<Big_Int, From_String_Error>
    from_string(std::u8string_view digits, int radix = 10);

    [[nodiscard]]
    static Result<Big_Int, From_String_Error>
    from_string(std::string_view digits, int radix = 10);

    /// @brief Equivalent to `Big_Int(1) << exponent`.
    [[nodiscard]]
    static Big_Int pow2(std::size_t exponent);

private:
    struct Magnitude;

    detail::Tagged_Offset m_offset = detail::zero_offset;

    [[nodiscard]]
    constexpr explicit Big_Int(const detail::Tagged_Offset offset) noexcept
        : m_offset { offset }
    {
    }

public:
    /// @brief Initializes to zero.
    [[nodiscard]]
    constexpr Big_Int() noexcept
        = default;

    /// @brief Initializes to the given value.
    template <signed_or_unsigned T>
    [[nodiscard]]
    constexpr explicit Big_Int(const T x)
    {
        using U = make_unsigned_t<T>;
        bool negative = false;
        if constexpr (signed_integer<T>) {
            negative = x < 0;
        }
        const U magnitude = negative ? U(U(0) - U(x)) : U(x);
        if (magnitude <= inline_magnitude_max) {
            m_offset = detail::Tagged_Offset::make(
                std::size_t(magnitude),
                negative ? detail::Tag::inline_neg : detail::Tag::inline_pos
            );
            return;
        }
        if constexpr (sizeof(U) <= sizeof(Big_Int_Word)) {
            const Big_Int_Word word = magnitude;
            *this = from_words({ &word, 1 }, negative);
        }
        else {
            constexpr int word_bits = value_bits<Big_Int_Word>;
            Big_Int_Word words[sizeof(U) / sizeof(Big_Int_Word)];
            for (std::size_t i = 0; i < std::size(words); ++i) {
                words[i] = Big_Int_Word(magnitude >> (word_bits * int(i)));
            }
            *this = from_words(words, negative);
        }
    }

    /// @brief Initializes from a given digit sequence as if by `from_string`,
    /// except that the digit sequence shall be valid.
    [[nodiscard]]
    explicit Big_Int(std::u8string_view digits, int radix = 10);

    [[nodiscard]]
    constexpr Big_Int(const Big_Int& other) noexcept
        : m_offset { other.m_offset }
    {
        if (!m_offset.is_inline()) {
            add_reference();
        }
    }

    /// @brief Move constructor.
    /// `other.is_zero()` is `true` after this operation.
    [[nodiscard]]
    constexpr Big_Int(Big_Int&& other) noexcept
        : m_offset { std::exchange(other.m_offset, detail::zero_offset) }
    {
    }

    /// @brief Copy assignment operator.
    /// Safe for self-copy-assignment.
    constexpr Big_Int& operator=(const Big_Int& other) noexcept
    {
        if (this != &other) {
            auto copy = other;
            swap(copy);
        }
        return *this;
    }

    /// @brief Move assignment operator.
    /// `other.is_zero()` is `true` after this operation,
    /// unless this is a self-move-assignment.
    constexpr Big_Int& operator=(Big_Int&& other) noexcept
    {
        if (this != &other) {
            set_zero();
            m_offset = std::exchange(other.m_offset, detail::zero_offset);
        }
        return *this;
    }

    constexpr ~Big_Int()
    {
        set_zero();
    }

    /// @brief Exchanges the value of this object with the given one.
    constexpr void swap(Big_Int& other) noexcept
    {
        std::swap(m_offset, other.m_offset);
    }

    /// @brief Equivalent to `x.swap(y)`.
    friend constexpr void swap(Big_Int& x, Big_Int& y) noexcept
    {
        x.swap(y);
    }

    /// @brief Sets this value to zero, releasing the interned magnitude if there is one.
    constexpr void set_zero() noexcept
    {
        if (!m_offset.is_inline()) {
            drop_reference();
        }
        m_offset = detail::zero_offset;
    }

    // QUERIES =====================================================================================

    [[nodiscard]]
    constexpr bool is_zero() const noexcept
    {
        return m_offset == detail::zero_offset;
    }

    [[nodiscard]]
    constexpr bool is_one() const noexcept
    {
        return m_offset == detail::Tagged_Offset::make(1, detail::Tag::inline_pos);
    }

    [[nodiscard]]
    constexpr bool is_negative() const noexcept
    {
        return m_offset.is_negative();
    }

    /// @brief Returns `true` if this value is greater than zero.
    [[nodiscard]]
    constexpr bool is_positive() const noexcept
    {
        return !is_negative() && !is_zero();
    }

    /// @brief Returns `true` if the magnitude is stored within this object.
    [[nodiscard]]
    constexpr bool is_inline() const noexcept
    {
        return m_offset.is_inline();
    }

    /// @brief Returns `true` if the magnitude is stored in the `global_interner()`.
    [[nodiscard]]
    constexpr bool is_interned() const noexcept
    {
        return !m_offset.is_inline();
    }

    /// @brief Returns the id of the interned magnitude,
    /// or `std::nullopt` if the magnitude is inline.
    [[nodiscard]]
    std::optional<Interner_Id> get_interner_id() const noexcept;

    /// @brief Equivalent to `(*this > 0) - (*this < 0)`.
    [[nodiscard]]
    constexpr int signum() const noexcept
    {
        return is_negative() ? -1 : int(!is_zero());
    }

    /// @brief Returns the amount of bits needed to represent the magnitude,
    /// which is zero for zero.
    [[nodiscard]]
    std::size_t bit_width() const noexcept;

    /// @brief Returns the words of the magnitude, least significant word first,
    /// in canonical form.
    [[nodiscard]]
    std::vector<Big_Int_Word> to_words() const;

    // TYPE CONVERSION =============================================================================

    /// @brief Converts to `T` if the value is representable by `T`.
    template <signed_or_unsigned T>
    [[nodiscard]]
    Result<T, Out_Of_Range_Error> to_int() const noexcept
    {
        using U = make_unsigned_t<T>;
        constexpr auto bits = std::size_t(value_bits<T>);
        const std::size_t width = bit_width();
        if (is_negative()) {
            if constexpr (unsigned_integer<T>) {
                return Out_Of_Range_Error::below;
            }
            else {
                // The magnitude of the minimum is 2^bits, which has one more bit than the maximum.
                if (width > bits + 1 || (width == bits + 1 && low_magnitude() != Uint128(1) << bits)) {
                    return Out_Of_Range_Error::below;
                }
                return T(U(U(0) - U(low_magnitude())));
            }
        }
        if (width > bits) {
            return Out_Of_Range_Error::above;
        }
        return T(low_magnitude());
    }

    /// @brief Returns the value modulo `2^N`, where `N` is the width of `T`,
    /// reinterpreted as `T`.
    template <signed_or_unsigned T>
    [[nodiscard]]
    T truncate() const noexcept
    {
        using U = make_unsigned_t<T>;
        const auto low = U(low_magnitude());
        return T(is_negative() ? U(U(0) - low) : low);
    }

    /// @brief Converts to `T`, clamping values outside the range of `T`
    /// to its minimum or maximum.
    template <signed_or_unsigned T>
    [[nodiscard]]
    T saturate() const noexcept
    {
        const Result<T, Out_Of_Range_Error> result = to_int<T>();
        if (result) {
            return *result;
        }
        return result.error() == Out_Of_Range_Error::above ? std::numeric_limits<T>::max()
                                                           : std::numeric_limits<T>::min();
    }

    /// @brief Returns the nearest `double`, rounding ties to even,
    /// or positive or negative infinity if the magnitude exceeds the range of `double`.
    [[nodiscard]]
    double approx_float() const noexcept;

    /// @brief Equivalent to `!is_zero()`.
    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return !is_zero();
    }

    // UNARY OPERATIONS ============================================================================

    /// @brief Returns a copy of this value.
    [[nodiscard]]
    constexpr Big_Int operator+() const noexcept
    {
        return *this;
    }

    /// @brief Returns this value negated.
    [[nodiscard]]
    constexpr Big_Int operator-() const noexcept
    {
        Big_Int result = *this;
        if (!result.is_zero()) {
            result.m_offset = result.m_offset.with_negated();
        }
        return result;
    }

    /// @brief Returns this value with every bit of its canonical magnitude words inverted,
    /// keeping the sign.
    /// Because the magnitude is canonical, this is not an involution:
    /// leading words which become zero are dropped.
    [[nodiscard]]
    Big_Int operator~() const;

    /// @brief Returns the absolute of `x`.
    [[nodiscard]]
    friend constexpr Big_Int abs(const Big_Int& x) noexcept
    {
        return x.is_negative() ? -x : x;
    }

    Big_Int& operator++();

    [[nodiscard("++x is better if the result is discarded anyway.")]]
    Big_Int operator++(int)
    {
        auto copy = *this;
        ++*this;
        return copy;
    }

    Big_Int& operator--();

    [[nodiscard("--x is better if the result is discarded anyway.")]]
    Big_Int operator--(int)
    {
        auto copy = *this;
        --*this;
        return copy;
    }

    // BINARY OPERATIONS ===========================================================================

    friend bool operator==(const Big_Int& x, const Big_Int& y) noexcept;

    template <signed_or_unsigned T>
    [[nodiscard]]
    friend bool operator==(const Big_Int& x, const T y)
    {
        return x == Big_Int { y };
    }

    friend std::strong_ordering operator<=>(const Big_Int& x, const Big_Int& y) noexcept;

    template <signed_or_unsigned T>
    [[nodiscard]]
    friend std::strong_ordering operator<=>(const Big_Int& x, const T y)
    {
        return x <=> Big_Int { y };
    }

    friend Big_Int operator+(const Big_Int& x, const Big_Int& y);
    friend Big_Int operator-(const Big_Int& x, const Big_Int& y);
    friend Big_Int operator*(const Big_Int& x, const Big_Int& y);
    friend Big_Int operator/(const Big_Int& x, const Big_Int& y);
    friend Big_Int operator%(const Big_Int& x, const Big_Int& y);
    friend Div_Result<Big_Int> div_rem(const Big_Int& x, const Big_Int& y);
    friend std::optional<Big_Int> checked_div(const Big_Int& x, const Big_Int& y);
    friend std::optional<Big_Int> checked_rem(const Big_Int& x, const Big_Int& y);
    friend Big_Int operator<<(const Big_Int& x, int s);
    friend Big_Int operator>>(const Big_Int& x, int s);
    friend Big_Int pow(const Big_Int& x, unsigned y);
    friend Big_Int operator&(const Big_Int& x, const Big_Int& y);
    friend Big_Int operator|(const Big_Int& x, const Big_Int& y);
    friend Big_Int operator^(const Big_Int& x, const Big_Int& y);
    friend Big_Int twos_complement_and(const Big_Int& x, const Big_Int& y);
    friend Big_Int twos_complement_or(const Big_Int& x, const Big_Int& y);
    friend Big_Int twos_complement_xor(const Big_Int& x, const Big_Int& y);

    /// @brief Returns `-x - 1`,
    /// which is the two's complement counterpart of `~x`.
    [[nodiscard]]
    friend Big_Int twos_complement_not(const Big_Int& x)
    {
        return -x - one;
    }

    Big_Int& operator+=(const Big_Int& x)
    {
        return *this = *this + x;
    }

    Big_Int& operator-=(const Big_Int& x)
    {
        return *this = *this - x;
    }

    Big_Int& operator*=(const Big_Int& x)
    {
        return *this = *this * x;
    }

    Big_Int& operator/=(const Big_Int& x)
    {
        return *this = *this / x;
    }

    Big_Int& operator%=(const Big_Int& x)
    {
        return *this = *this % x;
    }

    Big_Int& operator&=(const Big_Int& x)
    {
        return *this = *this & x;
    }

    Big_Int& operator|=(const Big_Int& x)
    {
        return *this = *this | x;
    }

    Big_Int& operator^=(const Big_Int& x)
    {
        return *this = *this ^ x;
    }

    Big_Int& operator<<=(const int s)
    {
        return *this = *this << s;
    }

    Big_Int& operator>>=(const int s)
    {
        return *this = *this >> s;
    }

    // STRING CONVERSIONS ==========================================================================

    /// @brief Passes the digits representing this integer to `out`,
    /// possibly in multiple pieces.
    /// @param base The base of the digits.
    /// Shall be in [2, 36].
    /// @param to_upper If `true`, outputs digits for base 11 or more in uppercase.
    void print_to(
        String_Sink out, //
        int base = 10,
        bool to_upper = false
    ) const;

    void print_to(
        U8_String_Sink out, //
        int base = 10,
        bool to_upper = false
    ) const;

private:
    void add_reference() const noexcept;
    void drop_reference() const noexcept;

    /// @brief Returns the least significant 128 bits of the magnitude.
    [[nodiscard]]
    Uint128 low_magnitude() const noexcept;

    /// @brief Like `from_words`, but takes ownership of the words,
    /// which are interned without copying them if the magnitude is too large to be inline.
    [[nodiscard]]
    static Big_Int from_magnitude(std::vector<Big_Int_Word>&& magnitude, bool negative);

    /// @brief Returns `x + y` for the given magnitudes and signs.
    [[nodiscard]]
    static Big_Int add_signed(
        std::span<const Big_Int_Word> x,
        bool x_negative,
        std::span<const Big_Int_Word> y,
        bool y_negative
    );

    /// @brief Returns `x << s` if `left`, otherwise `x >> s`.
    [[nodiscard]]
    static Big_Int shift(const Big_Int& x, std::size_t s, bool left);

    /// @brief Converts words in two's complement, with a sign bit at the top,
    /// back into a sign and magnitude.
    [[nodiscard]]
    static Big_Int from_twos_complement(std::vector<Big_Int_Word>&& words, bool negative);

    [[nodiscard]]
    std::vector<Big_Int_Word> to_twos_complement(std::size_t length) const;
};

inline constexpr Big_Int Big_Int::zero { 0 };
inline constexpr Big_Int Big_Int::one { 1 };

inline namespace literals {

/// @brief Creates a `Big_Int` from a decimal integer literal of any size.
[[nodiscard]]
inline Big_Int operator""_n(const char* digits)
{
    return Big_Int { std::u8string_view { reinterpret_cast<const char8_t*>(digits) } };
}

} // namespace literals

static_assert(sizeof(Big_Int) == sizeof(Big_Int_Word));

} // namespace numeric

#endif
