#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "numeric/interner.hpp"
#include "numeric/spin_lock.hpp"

namespace numeric {
namespace {

using String_Interner = Interner<std::string>;

TEST(Interner, equal_values_share_slot)
{
    String_Interner interner;
    const Interner_Id a = interner.add("awoo");
    const Interner_Id b = interner.add("awoo");
    EXPECT_EQ(a, b);
    EXPECT_EQ(interner.reference_count(a), 2);
    EXPECT_EQ(interner.get(a), "awoo");
    EXPECT_EQ(interner.live_count(), 1);
}

TEST(Interner, different_values)
{
    String_Interner interner;
    const Interner_Id a = interner.add("a");
    const Interner_Id b = interner.add("b");
    EXPECT_NE(a, b);
    EXPECT_EQ(interner.get(a), "a");
    EXPECT_EQ(interner.get(b), "b");
    EXPECT_EQ(interner.reference_count(a), 1);
    EXPECT_EQ(interner.reference_count(b), 1);
    EXPECT_EQ(interner.live_count(), 2);
}

TEST(Interner, incr_decr)
{
    String_Interner interner;
    const Interner_Id id = interner.add("x");
    interner.incr(id);
    EXPECT_EQ(interner.reference_count(id), 2);
    EXPECT_EQ(interner.decr(id), 1);
    EXPECT_EQ(interner.decr(id), 0);
    // Saturates instead of wrapping around.
    EXPECT_EQ(interner.decr(id), 0);
    EXPECT_EQ(interner.reference_count(id), 0);
}

TEST(Interner, try_get_dead)
{
    String_Interner interner;
    const Interner_Id id = interner.add("x");
    ASSERT_NE(interner.try_get(id), nullptr);
    EXPECT_EQ(*interner.try_get(id), "x");

    EXPECT_EQ(interner.decr(id), 0);
    EXPECT_EQ(interner.try_get(id), nullptr);
    EXPECT_EQ(interner.live_count(), 0);

    EXPECT_EQ(interner.try_get(Interner_Id(1000)), nullptr);
}

TEST(Interner, revive)
{
    String_Interner interner;
    const Interner_Id a = interner.add("a");
    const Interner_Id b = interner.add("b");
    EXPECT_EQ(interner.decr(a), 0);

    // "a" is still stored in its dead slot, so it is brought back to life there.
    const Interner_Id revived = interner.add("a");
    EXPECT_EQ(revived, a);
    EXPECT_EQ(interner.reference_count(a), 1);
    EXPECT_EQ(interner.reference_count(b), 1);
}

TEST(Interner, reuse)
{
    String_Interner interner;
    const Interner_Id a = interner.add("a");
    const Interner_Id b = interner.add("b");
    EXPECT_EQ(interner.decr(a), 0);

    const Interner_Id c = interner.add("c");
    EXPECT_EQ(c, a);
    EXPECT_EQ(interner.get(c), "c");
    EXPECT_EQ(interner.get(b), "b");
    EXPECT_EQ(interner.slot_count(), interner_chunk_size);
}

TEST(Interner, grows_by_chunks)
{
    String_Interner interner;
    EXPECT_EQ(interner.chunk_count(), 0);

    std::vector<Interner_Id> ids;
    for (std::size_t i = 0; i <= interner_chunk_size; ++i) {
        ids.push_back(interner.add(std::to_string(i)));
    }
    EXPECT_EQ(interner.chunk_count(), 2);
    EXPECT_EQ(interner.slot_count(), 2 * interner_chunk_size);
    EXPECT_EQ(interner.live_count(), interner_chunk_size + 1);

    for (std::size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(std::to_underlying(ids[i]), i);
        EXPECT_EQ(interner.get(ids[i]), std::to_string(i));
    }
}

TEST(Interner, initial_capacity)
{
    String_Interner interner { Interner_Options { .initial_capacity = 40 } };
    EXPECT_EQ(interner.chunk_count(), 2);
    EXPECT_EQ(interner.live_count(), 0);

    for (int i = 0; i < 64; ++i) {
        [[maybe_unused]]
        const Interner_Id id
            = interner.add(std::to_string(i));
    }
    EXPECT_EQ(interner.chunk_count(), 2);
}

TEST(Interner, concurrent_add_keeps_every_reference)
{
    constexpr std::size_t thread_count = 8;
    constexpr std::size_t values_per_thread = 200;
    constexpr std::size_t distinct_values = 50;

    String_Interner interner;
    std::vector<std::vector<Interner_Id>> ids(thread_count);
    {
        std::vector<std::jthread> threads;
        for (std::size_t t = 0; t < thread_count; ++t) {
            threads.emplace_back([&, t] {
                for (std::size_t i = 0; i < values_per_thread; ++i) {
                    ids[t].push_back(interner.add(std::to_string(i % distinct_values)));
                }
            });
        }
    }

    // Racing additions of equal values may end up in separate slots,
    // but no reference may ever be lost.
    std::size_t total = 0;
    for (std::size_t i = 0; i < interner.slot_count(); ++i) {
        total += interner.reference_count(Interner_Id(i));
    }
    EXPECT_EQ(total, thread_count * values_per_thread);

    for (std::size_t t = 0; t < thread_count; ++t) {
        for (std::size_t i = 0; i < values_per_thread; ++i) {
            EXPECT_EQ(interner.get(ids[t][i]), std::to_string(i % distinct_values));
        }
    }
}

TEST(Interner, concurrent_add_decr_balances)
{
    constexpr std::size_t thread_count = 8;
    constexpr int iterations = 500;

    String_Interner interner;
    {
        std::vector<std::jthread> threads;
        for (std::size_t t = 0; t < thread_count; ++t) {
            threads.emplace_back([&, t] {
                for (int i = 0; i < iterations; ++i) {
                    const Interner_Id id = interner.add(std::to_string((i + int(t)) % 17));
                    EXPECT_EQ(interner.get(id), std::to_string((i + int(t)) % 17));
                    interner.decr(id);
                }
            });
        }
    }

    EXPECT_EQ(interner.live_count(), 0);
    for (std::size_t i = 0; i < interner.slot_count(); ++i) {
        EXPECT_EQ(interner.reference_count(Interner_Id(i)), 0);
    }
}

// SPIN LOCK =======================================================================================

TEST(Spin_Lock, try_lock)
{
    Spin_Lock lock;
    EXPECT_FALSE(lock.is_locked());
    EXPECT_TRUE(lock.try_lock());
    EXPECT_TRUE(lock.is_locked());
    EXPECT_FALSE(lock.try_lock());
    lock.unlock();
    EXPECT_FALSE(lock.is_locked());
}

TEST(Spin_Lock, mutual_exclusion)
{
    constexpr int thread_count = 4;
    constexpr int iterations = 10'000;

    Spin_Lock lock;
    long counter = 0;
    {
        std::vector<std::jthread> threads;
        for (int t = 0; t < thread_count; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < iterations; ++i) {
                    const std::scoped_lock guard { lock };
                    ++counter;
                }
            });
        }
    }
    EXPECT_EQ(counter, thread_count * iterations);
}

} // namespace
} // namespace numeric
