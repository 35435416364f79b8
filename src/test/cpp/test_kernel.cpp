#include <array>
#include <compare>
#include <cstddef>
#include <optional>
#include <random>
#include <span>
#include <vector>

#include <boost/multiprecision/cpp_int.hpp>

#include <gtest/gtest.h>

#include "numeric/bits/bitwise.hpp"
#include "numeric/bits/element.hpp"
#include "numeric/bits/variants.hpp"
#include "numeric/word.hpp"

namespace numeric::bits {
namespace {

using boost::multiprecision::cpp_int;

template <typename W>
[[nodiscard]]
cpp_int to_cpp_int(const std::span<const W> words)
{
    cpp_int result = 0;
    for (std::size_t i = words.size(); i-- > 0;) {
        result <<= Word_Traits<W>::bit_len;
        result += words[i];
    }
    return result;
}

/// @brief Returns the canonical words of `x`, which shall not be negative.
template <typename W>
[[nodiscard]]
std::vector<W> from_cpp_int(cpp_int x)
{
    const cpp_int mask = (cpp_int(1) << Word_Traits<W>::bit_len) - 1;
    std::vector<W> result;
    while (x != 0) {
        result.push_back(static_cast<W>(x & mask));
        x >>= Word_Traits<W>::bit_len;
    }
    if (result.empty()) {
        result.push_back(W(0));
    }
    return result;
}

[[nodiscard]]
std::strong_ordering reference_compare(const cpp_int& x, const cpp_int& y)
{
    return x < y ? std::strong_ordering::less
        : x > y  ? std::strong_ordering::greater
                 : std::strong_ordering::equal;
}

/// @brief Produces operands with a mix of random, zero, and all-one words,
/// which are the words most likely to expose carry and borrow bugs.
template <typename W>
struct Operand_Generator {
    std::mt19937_64 random { 12345 };

    [[nodiscard]]
    std::vector<W> operator()(const std::size_t max_length)
    {
        std::uniform_int_distribution<std::size_t> length_distribution { 1, max_length };
        std::uniform_int_distribution<int> kind_distribution { 0, 3 };
        std::vector<W> result(length_distribution(random));
        for (W& w : result) {
            switch (kind_distribution(random)) {
            case 0: w = W(0); break;
            case 1: w = Word_Traits<W>::max(); break;
            default: w = W(random()); break;
            }
        }
        return result;
    }
};

template <typename Algo>
void check_against_reference(const std::size_t max_length, const int iterations)
{
    using W = typename Algo::Word;
    Operand_Generator<W> generate;

    for (int i = 0; i < iterations; ++i) {
        const std::vector<W> x = generate(max_length);
        const std::vector<W> y = generate(max_length);
        const cpp_int big_x = to_cpp_int<W>(x);
        const cpp_int big_y = to_cpp_int<W>(y);

        EXPECT_EQ(Algo::add_growing(x, y), from_cpp_int<W>(big_x + big_y));

        const Sub_Result<W> difference = Algo::sub_growing(x, y);
        EXPECT_EQ(difference.negated, big_x < big_y);
        EXPECT_EQ(difference.magnitude, from_cpp_int<W>(cpp_int(abs(big_x - big_y))));

        EXPECT_EQ(Algo::mul_growing(x, y), from_cpp_int<W>(big_x * big_y));

        if (big_y != 0) {
            const Div_Rem_Result<W> division = Algo::div_rem_growing(x, y);
            EXPECT_EQ(division.quotient, from_cpp_int<W>(big_x / big_y));
            EXPECT_EQ(division.remainder, from_cpp_int<W>(big_x % big_y));
        }

        EXPECT_EQ(Algo::compare(x, y), reference_compare(big_x, big_y));

        EXPECT_EQ(Algo::bit_and_growing(x, y), from_cpp_int<W>(big_x & big_y));
        EXPECT_EQ(Algo::bit_or_growing(x, y), from_cpp_int<W>(big_x | big_y));
        EXPECT_EQ(Algo::bit_xor_growing(x, y), from_cpp_int<W>(big_x ^ big_y));

        const std::size_t bits = Word_Traits<W>::bit_len;
        for (const std::size_t s : { 0uz, 1uz, 7uz, bits - 1, bits, bits + 1, 2 * bits + 3 }) {
            EXPECT_EQ(Algo::shl_growing(x, s), from_cpp_int<W>(big_x << s));
            EXPECT_EQ(Algo::shr_growing(x, s), from_cpp_int<W>(big_x >> s));
        }
    }
}

TEST(Element, matches_reference_u8)
{
    check_against_reference<Element<unsigned char>>(6, 300);
}

TEST(Element, matches_reference_u32)
{
    check_against_reference<Element<unsigned int>>(5, 300);
}

TEST(Element, matches_reference_u64)
{
    check_against_reference<Element<unsigned long long>>(5, 300);
}

TEST(Bitwise, matches_reference_u8)
{
    check_against_reference<Bitwise<unsigned char>>(6, 200);
}

TEST(Bitwise, matches_reference_u64)
{
    check_against_reference<Bitwise<unsigned long long>>(3, 100);
}

TEST(Element, matches_bitwise_overflowing)
{
    using W = unsigned char;
    Operand_Generator<W> generate;
    for (int i = 0; i < 300; ++i) {
        const std::vector<W> x = generate(4);
        const std::vector<W> y = generate(4);

        std::array<W, 2> element_out {};
        std::array<W, 2> bitwise_out {};

        EXPECT_EQ(
            Element<W>::add_overflowing(element_out, x, y),
            Bitwise<W>::add_overflowing(bitwise_out, x, y)
        );
        EXPECT_EQ(element_out, bitwise_out);

        EXPECT_EQ(
            Element<W>::sub_overflowing(element_out, x, y),
            Bitwise<W>::sub_overflowing(bitwise_out, x, y)
        );
        EXPECT_EQ(element_out, bitwise_out);

        EXPECT_EQ(
            Element<W>::mul_overflowing(element_out, x, y),
            Bitwise<W>::mul_overflowing(bitwise_out, x, y)
        );
        EXPECT_EQ(element_out, bitwise_out);

        EXPECT_EQ(
            Element<W>::shl_overflowing(element_out, x, 5),
            Bitwise<W>::shl_overflowing(bitwise_out, x, 5)
        );
        EXPECT_EQ(element_out, bitwise_out);

        EXPECT_EQ(
            Element<W>::shr_overflowing(element_out, x, 5),
            Bitwise<W>::shr_overflowing(bitwise_out, x, 5)
        );
        EXPECT_EQ(element_out, bitwise_out);
    }
}

TEST(Element, add_overflowing_wraps)
{
    using W = unsigned char;
    Operand_Generator<W> generate;
    const cpp_int modulus = cpp_int(1) << 16;
    for (int i = 0; i < 300; ++i) {
        const std::vector<W> x = generate(3);
        const std::vector<W> y = generate(3);
        const cpp_int sum = to_cpp_int<W>(x) + to_cpp_int<W>(y);

        std::array<W, 2> out {};
        const bool overflow = Element<W>::add_overflowing(out, x, y);
        EXPECT_EQ(overflow, sum >= modulus);
        EXPECT_EQ(to_cpp_int<W>(out), sum % modulus);
    }
}

TEST(Element, sub_growing_negates_on_borrow)
{
    const std::vector<unsigned> x { 5 };
    const std::vector<unsigned> y { 7, 1 };
    const Sub_Result<unsigned> result = Element<unsigned>::sub_growing(x, y);
    // (2^32 + 7) - 5
    EXPECT_EQ(result.magnitude, (std::vector<unsigned> { 2, 1 }));
    EXPECT_TRUE(result.negated);

    const Sub_Result<unsigned> zero = Element<unsigned>::sub_growing(y, y);
    EXPECT_EQ(zero.magnitude, std::vector<unsigned> { 0 });
    EXPECT_FALSE(zero.negated);
}

TEST(Element, compare_cross_length)
{
    using Kernel = Element<unsigned long long>;
    const std::vector<unsigned long long> one_then_zero { 0, 1 };
    const std::vector<unsigned long long> max { Word_Traits<unsigned long long>::max() };
    const std::vector<unsigned long long> max_padded { max[0], 0, 0 };

    EXPECT_EQ(Kernel::compare(one_then_zero, max), std::strong_ordering::greater);
    EXPECT_EQ(Kernel::compare(max, one_then_zero), std::strong_ordering::less);
    EXPECT_EQ(Kernel::compare(max, max_padded), std::strong_ordering::equal);
}

TEST(Element, div_rem_by_zero)
{
    using Kernel = Element<unsigned>;
    const std::vector<unsigned> x { 123 };
    const std::vector<unsigned> zero { 0 };
    std::array<unsigned, 1> quotient { 9 };
    std::array<unsigned, 1> remainder { 9 };
    EXPECT_TRUE(Kernel::div_rem_overflowing(quotient, remainder, x, zero));
    EXPECT_EQ(quotient[0], 0);
    EXPECT_EQ(remainder[0], 0);
}

TEST(Element, single_word_helpers)
{
    using Kernel = Element<unsigned long long>;
    Operand_Generator<unsigned long long> generate;
    for (int i = 0; i < 100; ++i) {
        std::vector<unsigned long long> words = generate(4);
        const cpp_int original = to_cpp_int<unsigned long long>(words);

        const unsigned long long divisor = 10'000'000'000'000'000'000ull;
        const unsigned long long remainder = Kernel::div_rem_word(words, divisor);
        EXPECT_EQ(to_cpp_int<unsigned long long>(words), original / divisor);
        EXPECT_EQ(cpp_int(remainder), original % divisor);

        Kernel::mul_add_word(words, divisor, remainder);
        EXPECT_EQ(to_cpp_int<unsigned long long>(words), original);
    }
}

TEST(Element, div_rem_word_with_and_without_wider_type)
{
    static_assert(numeric::detail::widenable<unsigned>);
    static_assert(!numeric::detail::widenable<Uint128>);

    Operand_Generator<unsigned> generate;
    for (int i = 0; i < 100; ++i) {
        std::vector<unsigned> narrow = generate(8);
        if (narrow.size() % 4 != 0) {
            narrow.resize(narrow.size() + 4 - (narrow.size() % 4), 0u);
        }
        // The same value, stored in 128-bit words.
        std::vector<Uint128> wide(narrow.size() / 4);
        for (std::size_t j = 0; j < narrow.size(); ++j) {
            wide[j / 4] |= Uint128(narrow[j]) << (32 * (j % 4));
        }
        const cpp_int original = to_cpp_int<unsigned>(narrow);

        const unsigned narrow_remainder = Element<unsigned>::div_rem_word(narrow, 1'000'000'007u);
        const Uint128 wide_remainder = Element<Uint128>::div_rem_word(wide, 1'000'000'007u);
        EXPECT_EQ(cpp_int(narrow_remainder), original % 1'000'000'007u);
        EXPECT_EQ(to_cpp_int<unsigned>(narrow), original / 1'000'000'007u);
        EXPECT_TRUE(wide_remainder == Uint128(narrow_remainder));
        for (std::size_t j = 0; j < narrow.size(); ++j) {
            EXPECT_EQ(unsigned(wide[j / 4] >> (32 * (j % 4))), narrow[j]);
        }
    }
}

// VARIANTS ========================================================================================

TEST(Variants, wrapping)
{
    using Algo = Element<unsigned char>;
    const std::array<unsigned char, 1> x { 0xff };
    const std::array<unsigned char, 1> y { 0x02 };
    std::array<unsigned char, 1> out {};

    wrapping<Add_Op, Algo>(out, x, y);
    EXPECT_EQ(out[0], 0x01);

    wrapping<Sub_Op, Algo>(out, y, x);
    EXPECT_EQ(out[0], 0x03);

    wrapping<Mul_Op, Algo>(out, x, y);
    EXPECT_EQ(out[0], 0xfe);

    wrapping<Shl_Op, Algo>(out, x, 4uz);
    EXPECT_EQ(out[0], 0xf0);
}

TEST(Variants, checked)
{
    using Algo = Bitwise<unsigned char>;
    const std::array<unsigned char, 1> x { 0xff };
    const std::array<unsigned char, 1> y { 0x02 };
    const std::array<unsigned char, 1> zero { 0 };
    std::array<unsigned char, 1> out {};

    EXPECT_FALSE((checked<Add_Op, Algo>(out, x, y)));
    EXPECT_FALSE((checked<Sub_Op, Algo>(out, y, x)));
    EXPECT_FALSE((checked<Mul_Op, Algo>(out, x, y)));
    EXPECT_FALSE((checked<Div_Op, Algo>(out, x, zero)));
    EXPECT_FALSE((checked<Rem_Op, Algo>(out, x, zero)));
    EXPECT_FALSE((checked<Shl_Op, Algo>(out, x, 1uz)));

    const std::optional<std::span<unsigned char>> result = checked<Sub_Op, Algo>(out, x, y);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->data(), out.data());
    EXPECT_EQ(out[0], 0xfd);

    ASSERT_TRUE((checked<Div_Op, Algo>(out, x, y)));
    EXPECT_EQ(out[0], 0x7f);
    ASSERT_TRUE((checked<Rem_Op, Algo>(out, x, y)));
    EXPECT_EQ(out[0], 0x01);
    ASSERT_TRUE((checked<Shr_Op, Algo>(out, x, 3uz)));
    EXPECT_EQ(out[0], 0x1f);
}

TEST(Variants, saturating)
{
    using Algo = Element<unsigned char>;
    const std::array<unsigned char, 1> x { 0xff };
    const std::array<unsigned char, 1> y { 0x02 };
    const std::array<unsigned char, 1> zero { 0 };
    const std::array<unsigned char, 2> wide { 0x00, 0x01 };
    std::array<unsigned char, 1> out {};

    EXPECT_TRUE((saturating<Add_Op, Algo>(out, x, y)));
    EXPECT_EQ(out[0], 0xff);

    EXPECT_TRUE((saturating<Sub_Op, Algo>(out, y, x)));
    EXPECT_EQ(out[0], 0x00);

    EXPECT_TRUE((saturating<Mul_Op, Algo>(out, x, y)));
    EXPECT_EQ(out[0], 0xff);

    EXPECT_TRUE((saturating<Div_Op, Algo>(out, x, zero)));
    EXPECT_EQ(out[0], 0xff);

    EXPECT_TRUE((saturating<Rem_Op, Algo>(out, x, zero)));
    EXPECT_EQ(out[0], 0x00);

    EXPECT_TRUE((saturating<Shl_Op, Algo>(out, y, 7uz)));
    EXPECT_EQ(out[0], 0xff);

    // 256 >> 0 does not fit into a single byte.
    EXPECT_TRUE((saturating<Shr_Op, Algo>(out, wide, 0uz)));
    EXPECT_EQ(out[0], 0xff);

    EXPECT_FALSE((saturating<Add_Op, Algo>(out, y, y)));
    EXPECT_EQ(out[0], 0x04);
}

} // namespace
} // namespace numeric::bits
