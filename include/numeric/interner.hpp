#ifndef NUMERIC_INTERNER_HPP
#define NUMERIC_INTERNER_HPP

#include <atomic>
#include <cstddef>
#include <initializer_list>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "numeric/util/assert.hpp"
#include "numeric/util/severity.hpp"
#include "numeric/util/to_chars.hpp"

#include "numeric/diagnostic.hpp"
#include "numeric/fwd.hpp"
#include "numeric/linked_chunks.hpp"
#include "numeric/services.hpp"
#include "numeric/settings.hpp"
#include "numeric/spin_lock.hpp"

namespace numeric {

/// @brief Identifies a slot within an `Interner`.
/// The underlying value is the index of the slot across all chunks.
enum struct Interner_Id : std::size_t { };

struct Interner_Options {
    /// @brief The minimum amount of slots that are allocated upfront.
    std::size_t initial_capacity = 0;
    /// @brief The logger which receives diagnostics about the growth and reuse of slots.
    /// Shall not be null.
    Logger* logger = &ignorant_logger;
};

/// @brief A concurrent, reference-counted store of unique values.
///
/// Equal values added to the interner share the same slot,
/// and every slot counts the references that are held to it.
/// A slot whose count drops to zero is "dead":
/// its value remains in place and is revived if an equal value is added later,
/// but the slot may also be overwritten with a different value.
///
/// Slots are stored in `Linked_Chunks`, so they never move,
/// and the interner only grows.
/// All operations may be called concurrently from any number of threads.
template <typename T>
struct Interner {
    struct Slot {
        std::atomic<std::size_t> reference_count = 0;
        /// @brief Guards every inspection and modification of `value`
        /// as well as the transition of `reference_count` from zero to one.
        Spin_Lock lock;
        std::optional<T> value;
    };

    using Chunks = Linked_Chunks<Slot, interner_chunk_size>;
    using Chunk = typename Chunks::Chunk;

private:
    Chunks m_chunks;
    std::atomic<Logger*> m_logger;

public:
    [[nodiscard]]
    explicit Interner(const Interner_Options& options = {})
        : m_chunks { options.initial_capacity }
        , m_logger { options.logger }
    {
        NUMERIC_ASSERT(options.logger);
    }

    Interner(const Interner&) = delete;
    Interner& operator=(const Interner&) = delete;

    /// @brief Adds a reference to the given `value`.
    /// If an equal value is already stored (even in a dead slot),
    /// the reference count of that slot is incremented.
    /// Otherwise, the value is stored in the first dead slot,
    /// or in a newly appended chunk if there is no dead slot.
    ///
    /// Two concurrent calls with equal values which both find no equal value
    /// may store the value in two separate slots.
    /// @returns The id of the slot holding the value, with a reference held by the caller.
    [[nodiscard]]
    Interner_Id add(T value)
    {
        // Locks are acquired in ascending slot order,
        // and at most two (candidate and current) are held at a time.
        Slot* candidate = nullptr;
        std::size_t candidate_index = 0;
        std::unique_lock<Spin_Lock> candidate_lock;

        std::size_t index = 0;
        typename Chunks::Link* link = &m_chunks.head();
        while (true) {
            Chunk* const chunk = link->load(std::memory_order_acquire);
            if (chunk == nullptr) {
                if (candidate != nullptr) {
                    const bool had_value = candidate->value.has_value();
                    candidate->value = std::move(value);
                    candidate->reference_count.store(1, std::memory_order_release);
                    candidate_lock.unlock();
                    if (had_value) {
                        log(Severity::trace, diagnostic::interner_reuse,
                            { u8"Slot ", to_characters8(candidate_index).as_string(),
                              u8" was overwritten with a new value." });
                    }
                    return Interner_Id(candidate_index);
                }
                if (m_chunks.append_at(*link).appended) {
                    log(Severity::debug, diagnostic::interner_grow,
                        { u8"Appended a chunk. The interner now has ",
                          to_characters8(m_chunks.chunk_count()).as_string(), u8" chunks with ",
                          to_characters8(m_chunks.size()).as_string(), u8" slots." });
                }
                continue;
            }

            for (Slot& slot : chunk->items) {
                std::unique_lock<Spin_Lock> lock { slot.lock };
                if (slot.value && *slot.value == value) {
                    const std::size_t previous
                        = slot.reference_count.fetch_add(1, std::memory_order_acq_rel);
                    lock.unlock();
                    if (candidate_lock) {
                        candidate_lock.unlock();
                    }
                    if (previous == 0) {
                        log(Severity::trace, diagnostic::interner_revive,
                            { u8"Slot ", to_characters8(index).as_string(), u8" was revived." });
                    }
                    return Interner_Id(index);
                }
                if (candidate == nullptr
                    && slot.reference_count.load(std::memory_order_acquire) == 0) {
                    candidate = &slot;
                    candidate_index = index;
                    candidate_lock = std::move(lock);
                }
                ++index;
            }
            link = &chunk->next;
        }
    }

    /// @brief Returns the value in the slot with the given `id`.
    /// The caller shall hold a reference to that slot.
    [[nodiscard]]
    const T& get(const Interner_Id id) const noexcept
    {
        const Slot& slot = slot_at(id);
        NUMERIC_ASSERT(slot.reference_count.load(std::memory_order_acquire) != 0);
        NUMERIC_ASSERT(slot.value);
        return *slot.value;
    }

    /// @brief Like `get`, but returns a null pointer if the slot is dead
    /// instead of failing an assertion.
    /// If no reference is held by the caller,
    /// the result may become dangling due to concurrent additions.
    [[nodiscard]]
    const T* try_get(const Interner_Id id) const noexcept
    {
        const Slot* const slot = m_chunks.find(std::to_underlying(id));
        if (slot == nullptr || slot->reference_count.load(std::memory_order_acquire) == 0) {
            return nullptr;
        }
        return slot->value ? &*slot->value : nullptr;
    }

    /// @brief Adds a reference to an existing live slot.
    void incr(const Interner_Id id) noexcept
    {
        [[maybe_unused]]
        const std::size_t previous
            = slot_at(id).reference_count.fetch_add(1, std::memory_order_relaxed);
        NUMERIC_DEBUG_ASSERT(previous != 0);
    }

    /// @brief Removes a reference from a slot.
    /// The count saturates at zero.
    /// @returns The remaining reference count.
    std::size_t decr(const Interner_Id id) noexcept
    {
        std::atomic<std::size_t>& count = slot_at(id).reference_count;
        std::size_t expected = count.load(std::memory_order_relaxed);
        while (expected != 0) {
            if (count.compare_exchange_weak(
                    expected, expected - 1, std::memory_order_acq_rel, std::memory_order_relaxed
                )) {
                return expected - 1;
            }
        }
        return 0;
    }

    [[nodiscard]]
    std::size_t reference_count(const Interner_Id id) const noexcept
    {
        return slot_at(id).reference_count.load(std::memory_order_acquire);
    }

    /// @brief Returns the amount of slots, dead or alive.
    [[nodiscard]]
    std::size_t slot_count() const noexcept
    {
        return m_chunks.size();
    }

    [[nodiscard]]
    std::size_t chunk_count() const noexcept
    {
        return m_chunks.chunk_count();
    }

    /// @brief Returns the amount of slots with a nonzero reference count.
    /// The result is only a snapshot if other threads modify the interner concurrently.
    [[nodiscard]]
    std::size_t live_count() const noexcept
    {
        std::size_t result = 0;
        for (const Chunk* chunk = m_chunks.head().load(std::memory_order_acquire); chunk;
             chunk = chunk->next.load(std::memory_order_acquire)) {
            for (const Slot& slot : chunk->items) {
                result += slot.reference_count.load(std::memory_order_relaxed) != 0;
            }
        }
        return result;
    }

    /// @brief Sets the logger for subsequent operations.
    /// The logger shall outlive its use in this interner.
    void set_logger(Logger& logger) noexcept
    {
        m_logger.store(&logger, std::memory_order_release);
    }

    [[nodiscard]]
    Logger& get_logger() const noexcept
    {
        return *m_logger.load(std::memory_order_acquire);
    }

private:
    [[nodiscard]]
    Slot& slot_at(const Interner_Id id) const noexcept
    {
        return m_chunks[std::to_underlying(id)];
    }

    /// @brief Logs the concatenation of `message_parts`.
    void log(
        const Severity severity,
        const std::u8string_view id,
        const std::initializer_list<std::u8string_view> message_parts
    ) const
    {
        Logger& logger = get_logger();
        if (!logger.can_log(severity)) {
            return;
        }
        std::u8string message;
        for (const std::u8string_view part : message_parts) {
            message += part;
        }
        logger(Diagnostic { severity, id, message });
    }
};

} // namespace numeric

#endif
