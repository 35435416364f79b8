#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "numeric/linked_chunks.hpp"

namespace numeric {
namespace {

using Int_Chunks = Linked_Chunks<int, 32>;

TEST(Linked_Chunks, default_empty)
{
    const Int_Chunks chunks;
    EXPECT_EQ(chunks.head().load(), nullptr);
    EXPECT_EQ(chunks.chunk_count(), 0);
    EXPECT_EQ(chunks.size(), 0);
    EXPECT_EQ(chunks.find(0), nullptr);
}

TEST(Linked_Chunks, initial_capacity)
{
    const Int_Chunks exact { 64 };
    EXPECT_EQ(exact.chunk_count(), 2);

    const Int_Chunks rounded_up { 65 };
    EXPECT_EQ(rounded_up.chunk_count(), 3);
    EXPECT_EQ(rounded_up.size(), 96);
    EXPECT_NE(rounded_up.find(95), nullptr);
    EXPECT_EQ(rounded_up.find(96), nullptr);
}

TEST(Linked_Chunks, append_at)
{
    Int_Chunks chunks;

    const Int_Chunks::Append_Result first = chunks.append_at(chunks.head());
    ASSERT_NE(first.chunk, nullptr);
    EXPECT_TRUE(first.appended);
    EXPECT_EQ(chunks.head().load(), first.chunk);

    const Int_Chunks::Append_Result again = chunks.append_at(chunks.head());
    EXPECT_EQ(again.chunk, first.chunk);
    EXPECT_FALSE(again.appended);
    EXPECT_EQ(chunks.chunk_count(), 1);

    const Int_Chunks::Append_Result second = chunks.append_at(first.chunk->next);
    EXPECT_TRUE(second.appended);
    EXPECT_NE(second.chunk, first.chunk);
    EXPECT_EQ(chunks.chunk_count(), 2);
}

TEST(Linked_Chunks, index_across_chunks)
{
    Int_Chunks chunks { 100 };
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        chunks[i] = int(i);
    }
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i], int(i));
    }
    Int_Chunks::Chunk* const second = chunks.head().load()->next.load();
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->items[0], 32);
    EXPECT_EQ(&chunks[33], &second->items[1]);
}

TEST(Linked_Chunks, elements_do_not_move)
{
    Int_Chunks chunks { 1 };
    int* const first = &chunks[0];
    Int_Chunks::Link* link = &chunks.head().load()->next;
    for (int i = 0; i < 10; ++i) {
        link = &chunks.append_at(*link).chunk->next;
    }
    EXPECT_EQ(&chunks[0], first);
    EXPECT_EQ(chunks.chunk_count(), 11);
}

TEST(Linked_Chunks, concurrent_append_at_head)
{
    constexpr int thread_count = 8;
    Int_Chunks chunks;
    std::atomic<int> appended_count = 0;
    std::atomic<Int_Chunks::Chunk*> results[thread_count] {};

    {
        std::vector<std::jthread> threads;
        for (int t = 0; t < thread_count; ++t) {
            threads.emplace_back([&, t] {
                const Int_Chunks::Append_Result result = chunks.append_at(chunks.head());
                appended_count += result.appended;
                results[t] = result.chunk;
            });
        }
    }

    EXPECT_EQ(appended_count.load(), 1);
    EXPECT_EQ(chunks.chunk_count(), 1);
    for (const auto& result : results) {
        EXPECT_EQ(result.load(), chunks.head().load());
    }
}

} // namespace
} // namespace numeric
