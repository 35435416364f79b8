#ifndef NUMERIC_LINKED_CHUNKS_HPP
#define NUMERIC_LINKED_CHUNKS_HPP

#include <array>
#include <atomic>
#include <cstddef>
#include <memory>

#include "numeric/util/assert.hpp"

#include "numeric/fwd.hpp"

namespace numeric {

/// @brief An append-only singly linked list of fixed-size arrays ("chunks").
///
/// Chunks are appended by a compare-and-swap on the `next` link of the last chunk,
/// so any number of threads may traverse and append concurrently without a lock.
/// Once appended, a chunk never moves and is never removed until the list is destroyed,
/// which means that references to elements remain valid for the lifetime of the list.
///
/// Elements are indexed consecutively across chunks,
/// i.e. element `i` lives in chunk `i / N` at position `i % N`.
template <typename T, std::size_t N>
struct Linked_Chunks {
    static_assert(N != 0);

    static constexpr std::size_t chunk_size = N;

    struct Chunk {
        std::array<T, N> items {};
        std::atomic<Chunk*> next = nullptr;
    };

    using Link = std::atomic<Chunk*>;

    struct Append_Result {
        /// @brief The chunk which the link points to after the operation.
        Chunk* chunk;
        /// @brief `true` if `chunk` was appended by this call,
        /// `false` if another thread appended first.
        bool appended;
    };

private:
    Link m_head = nullptr;
    std::atomic<std::size_t> m_chunk_count = 0;

public:
    [[nodiscard]]
    Linked_Chunks() noexcept
        = default;

    /// @brief Initializes the list with as many chunks as are needed
    /// to hold at least `initial_capacity` elements.
    [[nodiscard]]
    explicit Linked_Chunks(const std::size_t initial_capacity)
    {
        Link* link = &m_head;
        for (std::size_t i = 0; i < initial_capacity; i += N) {
            link = &append_at(*link).chunk->next;
        }
    }

    Linked_Chunks(const Linked_Chunks&) = delete;
    Linked_Chunks& operator=(const Linked_Chunks&) = delete;

    ~Linked_Chunks()
    {
        Chunk* chunk = m_head.load(std::memory_order_acquire);
        while (chunk) {
            Chunk* const next = chunk->next.load(std::memory_order_acquire);
            delete chunk;
            chunk = next;
        }
    }

    /// @brief Returns the link to the first chunk.
    /// A null link indicates the end of the list.
    [[nodiscard]]
    Link& head() noexcept
    {
        return m_head;
    }

    [[nodiscard]]
    const Link& head() const noexcept
    {
        return m_head;
    }

    /// @brief Appends a new chunk at `link` unless another chunk is already linked there.
    /// `link` shall be `head()` or the `next` link of a chunk in this list.
    [[nodiscard]]
    Append_Result append_at(Link& link)
    {
        Chunk* expected = link.load(std::memory_order_acquire);
        if (expected) {
            return { expected, false };
        }
        auto fresh = std::make_unique<Chunk>();
        if (link.compare_exchange_strong(
                expected, fresh.get(), std::memory_order_acq_rel, std::memory_order_acquire
            )) {
            m_chunk_count.fetch_add(1, std::memory_order_relaxed);
            return { fresh.release(), true };
        }
        // Another thread won the race; its chunk is used instead of ours.
        return { expected, false };
    }

    /// @brief Returns a pointer to the element with the given `index`,
    /// or a null pointer if no chunk holds such an element (yet).
    /// The cost is linear in the amount of chunks.
    [[nodiscard]]
    T* find(const std::size_t index) const noexcept
    {
        Chunk* chunk = m_head.load(std::memory_order_acquire);
        for (std::size_t skip = index / N; chunk && skip != 0; --skip) {
            chunk = chunk->next.load(std::memory_order_acquire);
        }
        return chunk ? &chunk->items[index % N] : nullptr;
    }

    /// @brief Returns the element with the given `index`.
    /// The element shall exist.
    [[nodiscard]]
    T& operator[](const std::size_t index) const noexcept
    {
        T* const result = find(index);
        NUMERIC_ASSERT(result);
        return *result;
    }

    /// @brief Returns the amount of chunks that have been appended so far.
    [[nodiscard]]
    std::size_t chunk_count() const noexcept
    {
        return m_chunk_count.load(std::memory_order_relaxed);
    }

    /// @brief Returns the amount of elements in all chunks that have been appended so far.
    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return chunk_count() * N;
    }
};

} // namespace numeric

#endif
