#include <algorithm>
#include <cmath>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "numeric/util/assert.hpp"
#include "numeric/util/chars.hpp"
#include "numeric/util/function_ref.hpp"
#include "numeric/util/meta.hpp"
#include "numeric/util/result.hpp"
#include "numeric/util/strings.hpp"

#include "numeric/big_int.hpp"
#include "numeric/bits/element.hpp"
#include "numeric/bits/word_span.hpp"
#include "numeric/interner.hpp"
#include "numeric/services.hpp"
#include "numeric/settings.hpp"
#include "numeric/word.hpp"

namespace numeric {
namespace {

using Words = std::vector<Big_Int_Word>;
using Word_Span = std::span<const Big_Int_Word>;
using Kernel = bits::Element<Big_Int_Word>;

constexpr int word_bits = Word_Traits<Big_Int_Word>::bit_len;

/// @brief The greatest power of some radix that fits into a single word,
/// and the amount of digits that this power corresponds to.
struct Radix_Chunk {
    Big_Int_Word base;
    int digits;
};

[[nodiscard]]
constexpr Radix_Chunk radix_chunk(const int radix) noexcept
{
    const auto r = Big_Int_Word(radix);
    Radix_Chunk result { .base = r, .digits = 1 };
    while (result.base <= std::numeric_limits<Big_Int_Word>::max() / r) {
        result.base *= r;
        ++result.digits;
    }
    return result;
}

static_assert(radix_chunk(10).base == 10'000'000'000'000'000'000uz);
static_assert(radix_chunk(10).digits == 19);
static_assert(radix_chunk(16).digits == 15);

[[nodiscard]]
constexpr Big_Int_Word int_pow(const Big_Int_Word base, int exponent) noexcept
{
    Big_Int_Word result = 1;
    while (exponent-- > 0) {
        result *= base;
    }
    return result;
}

/// @brief Returns the least significant 128 bits of the magnitude in `words`.
[[nodiscard]]
Uint128 low_bits(const Word_Span words) noexcept
{
    Uint128 result = 0;
    for (std::size_t i = 0; i < words.size() && i * word_bits < 128; ++i) {
        result |= Uint128(words[i]) << (i * word_bits);
    }
    return result;
}

/// @brief Returns `true` if any of the `n` least significant bits in `words` is set.
[[nodiscard]]
bool any_low_bit_set(const Word_Span words, const std::size_t n) noexcept
{
    const std::size_t whole_words = std::min(n / word_bits, words.size());
    if (!bits::is_zero<Big_Int_Word>(words.first(whole_words))) {
        return true;
    }
    const int rest = int(n % word_bits);
    if (rest == 0 || whole_words == words.size()) {
        return false;
    }
    const Big_Int_Word mask = (Big_Int_Word(1) << rest) - 1;
    return (words[whole_words] & mask) != 0;
}

/// @brief Returns the absolute value of `s` as a shift amount.
[[nodiscard]]
constexpr std::size_t shift_amount(const int s) noexcept
{
    return s < 0 ? std::size_t(0) - std::size_t(s) : std::size_t(s);
}

} // namespace

// GLOBAL INTERNER =================================================================================

Interner<Words>& global_interner() noexcept
{
    // Leaked, so that Big_Ints with static storage duration can be destroyed at any point.
    static auto* const interner = new Interner<Words>;
    return *interner;
}

void set_global_interner_logger(Logger& logger) noexcept
{
    global_interner().set_logger(logger);
}

/// @brief A view of the words of a magnitude.
/// For inline values, the single word is stored in this object.
struct Big_Int::Magnitude {
    Big_Int_Word inline_word;
    Word_Span words;

    [[nodiscard]]
    explicit Magnitude(const Big_Int& x) noexcept
        : inline_word { x.m_offset.is_inline() ? x.m_offset.offset() : 0 }
        , words { x.m_offset.is_inline()
                      ? Word_Span { &inline_word, 1 }
                      : Word_Span { global_interner().get(Interner_Id(x.m_offset.offset())) } }
    {
    }

    Magnitude(const Magnitude&) = delete;
    Magnitude& operator=(const Magnitude&) = delete;
};

// CONSTRUCTION ====================================================================================

Big_Int Big_Int::from_words(const std::span<const Big_Int_Word> words, const bool negative)
{
    const Word_Span canonical = bits::shrink<Big_Int_Word>(words);
    return from_magnitude(Words(canonical.begin(), canonical.end()), negative);
}

Big_Int Big_Int::from_magnitude(Words&& magnitude, const bool negative)
{
    bits::shrink(magnitude);
    if (magnitude.size() <= 1) {
        const Big_Int_Word small = magnitude.empty() ? 0 : magnitude.front();
        if (small == 0) {
            return Big_Int {};
        }
        if (small <= inline_magnitude_max) {
            return Big_Int { detail::Tagged_Offset::make(
                small, negative ? detail::Tag::inline_neg : detail::Tag::inline_pos
            ) };
        }
    }
    const Interner_Id id = global_interner().add(std::move(magnitude));
    return Big_Int { detail::Tagged_Offset::make(
        std::to_underlying(id), negative ? detail::Tag::neg : detail::Tag::none
    ) };
}

Big_Int Big_Int::pow2(const std::size_t exponent)
{
    constexpr Big_Int_Word one_word = 1;
    return from_magnitude(Kernel::shl_growing({ &one_word, 1 }, exponent), false);
}

Big_Int::Big_Int(const std::u8string_view digits, const int radix)
{
    Result<Big_Int, From_String_Error> result = from_string(digits, radix);
    NUMERIC_ASSERT(result);
    *this = std::move(*result);
}

void Big_Int::add_reference() const noexcept
{
    global_interner().incr(Interner_Id(m_offset.offset()));
}

void Big_Int::drop_reference() const noexcept
{
    global_interner().decr(Interner_Id(m_offset.offset()));
}

// QUERIES =========================================================================================

std::optional<Interner_Id> Big_Int::get_interner_id() const noexcept
{
    if (is_inline()) {
        return {};
    }
    return Interner_Id(m_offset.offset());
}

std::size_t Big_Int::bit_width() const noexcept
{
    const Magnitude magnitude { *this };
    return bits::bit_width<Big_Int_Word>(magnitude.words);
}

std::vector<Big_Int_Word> Big_Int::to_words() const
{
    const Magnitude magnitude { *this };
    return { magnitude.words.begin(), magnitude.words.end() };
}

Uint128 Big_Int::low_magnitude() const noexcept
{
    const Magnitude magnitude { *this };
    return low_bits(magnitude.words);
}

double Big_Int::approx_float() const noexcept
{
    // The conversion from 64 bits to double is the only rounding step.
    // Bits below the top 64 are folded into a sticky bit,
    // which is far enough below the 53-bit mantissa to only break ties.
    constexpr std::size_t window = 64;
    const Magnitude magnitude { *this };
    const std::size_t width = bits::bit_width<Big_Int_Word>(magnitude.words);
    double result = 0;
    if (width <= window) {
        result = double(std::uint64_t(low_bits(magnitude.words)));
    }
    else {
        const std::size_t shift = width - window;
        const Words top_words = Kernel::shr_growing(magnitude.words, shift);
        std::uint64_t top = std::uint64_t(low_bits(top_words));
        if (any_low_bit_set(magnitude.words, shift)) {
            top |= 1;
        }
        constexpr auto max_exponent = std::size_t(std::numeric_limits<int>::max());
        // Once infinite, ldexp stays infinite.
        result = std::ldexp(double(top), int(std::min(shift, max_exponent)));
    }
    return is_negative() ? -result : result;
}

// COMPARISON ======================================================================================

bool operator==(const Big_Int& x, const Big_Int& y) noexcept
{
    if (x.m_offset == y.m_offset) {
        return true;
    }
    // Inline magnitudes are never equal to interned ones.
    if (x.is_inline() || y.is_inline() || x.is_negative() != y.is_negative()) {
        return false;
    }
    const Big_Int::Magnitude x_magnitude { x };
    const Big_Int::Magnitude y_magnitude { y };
    return std::ranges::equal(x_magnitude.words, y_magnitude.words);
}

std::strong_ordering operator<=>(const Big_Int& x, const Big_Int& y) noexcept
{
    if (x.m_offset == y.m_offset) {
        return std::strong_ordering::equal;
    }
    if (x.is_negative() != y.is_negative()) {
        return x.is_negative() ? std::strong_ordering::less : std::strong_ordering::greater;
    }
    const Big_Int::Magnitude x_magnitude { x };
    const Big_Int::Magnitude y_magnitude { y };
    const std::strong_ordering result = Kernel::compare(x_magnitude.words, y_magnitude.words);
    return x.is_negative() ? 0 <=> result : result;
}

// ARITHMETIC ======================================================================================

Big_Int Big_Int::add_signed(
    const std::span<const Big_Int_Word> x,
    const bool x_negative,
    const std::span<const Big_Int_Word> y,
    const bool y_negative
)
{
    if (x_negative == y_negative) {
        return from_magnitude(Kernel::add_growing(x, y), x_negative);
    }
    // x + y == sign(x) * (|x| - |y|) for operands of opposite signs.
    bits::Sub_Result<Big_Int_Word> difference = Kernel::sub_growing(x, y);
    return from_magnitude(std::move(difference.magnitude), x_negative != difference.negated);
}

Big_Int operator+(const Big_Int& x, const Big_Int& y)
{
    const Big_Int::Magnitude x_magnitude { x };
    const Big_Int::Magnitude y_magnitude { y };
    return Big_Int::add_signed(
        x_magnitude.words, x.is_negative(), y_magnitude.words, y.is_negative()
    );
}

Big_Int operator-(const Big_Int& x, const Big_Int& y)
{
    const Big_Int::Magnitude x_magnitude { x };
    const Big_Int::Magnitude y_magnitude { y };
    return Big_Int::add_signed(
        x_magnitude.words, x.is_negative(), y_magnitude.words, !y.is_negative()
    );
}

Big_Int operator*(const Big_Int& x, const Big_Int& y)
{
    const Big_Int::Magnitude x_magnitude { x };
    const Big_Int::Magnitude y_magnitude { y };
    return Big_Int::from_magnitude(
        Kernel::mul_growing(x_magnitude.words, y_magnitude.words),
        x.is_negative() != y.is_negative()
    );
}

Div_Result<Big_Int> div_rem(const Big_Int& x, const Big_Int& y)
{
    NUMERIC_ASSERT(!y.is_zero());
    const Big_Int::Magnitude x_magnitude { x };
    const Big_Int::Magnitude y_magnitude { y };
    bits::Div_Rem_Result<Big_Int_Word> result
        = Kernel::div_rem_growing(x_magnitude.words, y_magnitude.words);
    return {
        .quotient = Big_Int::from_magnitude(
            std::move(result.quotient), x.is_negative() != y.is_negative()
        ),
        .remainder = Big_Int::from_magnitude(
            std::move(result.remainder), x.is_negative() != y.is_negative()
        ),
    };
}

Big_Int operator/(const Big_Int& x, const Big_Int& y)
{
    return div_rem(x, y).quotient;
}

Big_Int operator%(const Big_Int& x, const Big_Int& y)
{
    return div_rem(x, y).remainder;
}

std::optional<Big_Int> checked_div(const Big_Int& x, const Big_Int& y)
{
    if (y.is_zero()) {
        return {};
    }
    return x / y;
}

std::optional<Big_Int> checked_rem(const Big_Int& x, const Big_Int& y)
{
    if (y.is_zero()) {
        return {};
    }
    return x % y;
}

Big_Int pow(const Big_Int& x, unsigned y)
{
    Big_Int result = Big_Int::one;
    Big_Int base = x;
    while (y != 0) {
        if (y & 1) {
            result *= base;
        }
        y >>= 1;
        if (y != 0) {
            base *= base;
        }
    }
    return result;
}

Big_Int& Big_Int::operator++()
{
    return *this += one;
}

Big_Int& Big_Int::operator--()
{
    return *this -= one;
}

// SHIFTS ==========================================================================================

Big_Int Big_Int::shift(const Big_Int& x, const std::size_t s, const bool left)
{
    const Magnitude magnitude { x };
    Words result = left ? Kernel::shl_growing(magnitude.words, s)
                        : Kernel::shr_growing(magnitude.words, s);
    return from_magnitude(std::move(result), x.is_negative());
}

Big_Int operator<<(const Big_Int& x, const int s)
{
    return Big_Int::shift(x, shift_amount(s), s >= 0);
}

Big_Int operator>>(const Big_Int& x, const int s)
{
    return Big_Int::shift(x, shift_amount(s), s < 0);
}

// BITWISE LOGIC ===================================================================================

std::vector<Big_Int_Word> Big_Int::to_twos_complement(const std::size_t length) const
{
    const Magnitude magnitude { *this };
    NUMERIC_ASSERT(length > magnitude.words.size());
    Words result(length, 0);
    std::ranges::copy(magnitude.words, result.begin());
    if (is_negative()) {
        bits::negate_in_place<Big_Int_Word>(result);
    }
    return result;
}

Big_Int Big_Int::from_twos_complement(Words&& words, const bool negative)
{
    if (negative) {
        bits::negate_in_place<Big_Int_Word>(words);
    }
    return from_magnitude(std::move(words), negative);
}

namespace {

/// @brief Returns the amount of words that hold `x` and `y` in two's complement,
/// including at least one bit for the sign.
[[nodiscard]]
std::size_t twos_complement_length(const Big_Int& x, const Big_Int& y) noexcept
{
    const std::size_t width = std::max(x.bit_width(), y.bit_width());
    const std::size_t magnitude_length = std::max((width + word_bits - 1) / word_bits, 1uz);
    return magnitude_length + 1;
}

} // namespace

Big_Int twos_complement_and(const Big_Int& x, const Big_Int& y)
{
    const std::size_t length = twos_complement_length(x, y);
    const Words x_words = x.to_twos_complement(length);
    const Words y_words = y.to_twos_complement(length);
    Words result(length, 0);
    Kernel::bit_and(result, x_words, y_words);
    return Big_Int::from_twos_complement(std::move(result), x.is_negative() && y.is_negative());
}

Big_Int twos_complement_or(const Big_Int& x, const Big_Int& y)
{
    const std::size_t length = twos_complement_length(x, y);
    const Words x_words = x.to_twos_complement(length);
    const Words y_words = y.to_twos_complement(length);
    Words result(length, 0);
    Kernel::bit_or(result, x_words, y_words);
    return Big_Int::from_twos_complement(std::move(result), x.is_negative() || y.is_negative());
}

Big_Int twos_complement_xor(const Big_Int& x, const Big_Int& y)
{
    const std::size_t length = twos_complement_length(x, y);
    const Words x_words = x.to_twos_complement(length);
    const Words y_words = y.to_twos_complement(length);
    Words result(length, 0);
    Kernel::bit_xor(result, x_words, y_words);
    return Big_Int::from_twos_complement(std::move(result), x.is_negative() != y.is_negative());
}

Big_Int operator&(const Big_Int& x, const Big_Int& y)
{
    const Big_Int::Magnitude x_magnitude { x };
    const Big_Int::Magnitude y_magnitude { y };
    return Big_Int::from_magnitude(
        Kernel::bit_and_growing(x_magnitude.words, y_magnitude.words), x.is_negative()
    );
}

Big_Int operator|(const Big_Int& x, const Big_Int& y)
{
    const Big_Int::Magnitude x_magnitude { x };
    const Big_Int::Magnitude y_magnitude { y };
    return Big_Int::from_magnitude(
        Kernel::bit_or_growing(x_magnitude.words, y_magnitude.words), x.is_negative()
    );
}

Big_Int operator^(const Big_Int& x, const Big_Int& y)
{
    const Big_Int::Magnitude x_magnitude { x };
    const Big_Int::Magnitude y_magnitude { y };
    return Big_Int::from_magnitude(
        Kernel::bit_xor_growing(x_magnitude.words, y_magnitude.words), x.is_negative()
    );
}

Big_Int Big_Int::operator~() const
{
    const Magnitude magnitude { *this };
    Words result { magnitude.words.begin(), magnitude.words.end() };
    Kernel::bit_not(result);
    return from_magnitude(std::move(result), is_negative());
}

// STRING CONVERSIONS ==============================================================================

Result<Big_Int, From_String_Error>
Big_Int::from_string(std::u8string_view digits, const int radix)
{
    if (radix < 0 || radix > max_digit_base) {
        return From_String_Error { .kind = From_String_Error_Kind::invalid_radix, .radix = radix };
    }
    bool negative = false;
    if (digits.starts_with(u8'+') || digits.starts_with(u8'-')) {
        negative = digits.front() == u8'-';
        digits.remove_prefix(1);
    }
    // Radix 0 has no digits, and the only digit of radix 1 is zero,
    // so either way, the value is zero if every character is a digit.
    if (radix <= 1) {
        for (const char8_t c : digits) {
            if (!is_digit_in_base(char32_t(c), radix)) {
                return From_String_Error {
                    .kind = From_String_Error_Kind::invalid_char,
                    .radix = radix,
                    .character = char32_t(c),
                };
            }
        }
        return Big_Int {};
    }

    const Radix_Chunk chunk = radix_chunk(radix);
    Words words;
    Big_Int_Word chunk_value = 0;
    int chunk_length = 0;
    for (const char8_t c : digits) {
        const int value = digit_value(char32_t(c));
        if (value < 0 || value >= radix) {
            return From_String_Error {
                .kind = From_String_Error_Kind::invalid_char,
                .radix = radix,
                .character = char32_t(c),
            };
        }
        chunk_value = (chunk_value * Big_Int_Word(radix)) + Big_Int_Word(value);
        if (++chunk_length == chunk.digits) {
            Kernel::mul_add_word(words, chunk.base, chunk_value);
            chunk_value = 0;
            chunk_length = 0;
        }
    }
    if (chunk_length != 0) {
        Kernel::mul_add_word(words, int_pow(Big_Int_Word(radix), chunk_length), chunk_value);
    }
    return from_magnitude(std::move(words), negative);
}

Result<Big_Int, From_String_Error>
Big_Int::from_string(const std::string_view digits, const int radix)
{
    return from_string(as_u8string_view(digits), radix);
}

void Big_Int::print_to(
    const String_Sink out,
    const int base,
    const bool to_upper
) const
{
    NUMERIC_ASSERT(base >= 2 && base <= max_digit_base);
    if (is_zero()) {
        out("0");
        return;
    }
    const Magnitude magnitude { *this };
    Words words { magnitude.words.begin(), magnitude.words.end() };
    const Radix_Chunk chunk = radix_chunk(base);

    // No base has more digits than base 2, plus one character for the sign.
    const std::size_t capacity = bits::bit_width<Big_Int_Word>(words) + 1;

    const auto print_into = [&](const std::span<char> buffer) {
        std::size_t position = buffer.size();
        while (!bits::is_zero<Big_Int_Word>(words)) {
            Big_Int_Word remainder = Kernel::div_rem_word(words, chunk.base);
            bits::shrink(words);
            const bool is_last_chunk = bits::is_zero<Big_Int_Word>(words);
            // Every chunk but the most significant one is padded with zeros.
            for (int i = 0; i < chunk.digits && (!is_last_chunk || remainder != 0); ++i) {
                const auto digit = int(remainder % Big_Int_Word(base));
                buffer[--position] = char(digit_character(digit, to_upper));
                remainder /= Big_Int_Word(base);
            }
        }
        if (is_negative()) {
            buffer[--position] = '-';
        }
        out(std::string_view { buffer.data() + position, buffer.size() - position });
    };

    if (capacity <= big_int_print_buffer_size) {
        char buffer[big_int_print_buffer_size];
        print_into(std::span<char> { buffer, capacity });
    }
    else {
        std::string buffer(capacity, '\0');
        print_into(buffer);
    }
}

void Big_Int::print_to(
    const U8_String_Sink out,
    const int base,
    const bool to_upper
) const
{
    const String_Sink delegate = {
        const_v<[](decltype(out)* const u8out, const std::string_view str) {
            (*u8out)(as_u8string_view(str));
        }>,
        &out,
    };
    print_to(delegate, base, to_upper);
}

} // namespace numeric
