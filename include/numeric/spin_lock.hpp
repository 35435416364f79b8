#ifndef NUMERIC_SPIN_LOCK_HPP
#define NUMERIC_SPIN_LOCK_HPP

#include <atomic>

#include "numeric/fwd.hpp"

namespace numeric {

/// @brief A minimal mutual exclusion lock which busy-waits instead of sleeping.
/// This satisfies the standard *Lockable* requirements,
/// so it can be used with `std::scoped_lock` and `std::unique_lock`.
///
/// Spin locks are only appropriate for critical sections which are very short
/// and never block.
struct Spin_Lock {
private:
    std::atomic_flag m_flag;

public:
    [[nodiscard]]
    constexpr Spin_Lock() noexcept
        = default;

    Spin_Lock(const Spin_Lock&) = delete;
    Spin_Lock& operator=(const Spin_Lock&) = delete;

    void lock() noexcept
    {
        while (m_flag.test_and_set(std::memory_order_acquire)) {
            // Wait for the release without writing to the flag.
            while (m_flag.test(std::memory_order_relaxed)) { }
        }
    }

    [[nodiscard]]
    bool try_lock() noexcept
    {
        return !m_flag.test_and_set(std::memory_order_acquire);
    }

    void unlock() noexcept
    {
        m_flag.clear(std::memory_order_release);
    }

    /// @brief Returns `true` if the lock is currently held by any thread.
    /// This is only meaningful for diagnostics and tests.
    [[nodiscard]]
    bool is_locked() const noexcept
    {
        return m_flag.test(std::memory_order_relaxed);
    }
};

} // namespace numeric

#endif
