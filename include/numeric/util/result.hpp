#ifndef NUMERIC_RESULT_HPP
#define NUMERIC_RESULT_HPP

#include <expected>
#include <type_traits>
#include <utility>

namespace numeric {

/// @brief Either a value of type `T` or an error of type `E`.
///
/// Unlike `std::expected`, a `Result` can be implicitly constructed from an error,
/// which allows `return error;` in functions returning `Result`.
template <typename T, typename E>
struct Result : std::expected<T, E> {
    static_assert(!std::is_convertible_v<E, T>, "The error type must be distinguishable.");

    using std::expected<T, E>::expected;

    [[nodiscard]]
    constexpr Result(const E& error)
        : std::expected<T, E> { std::unexpect, error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        : std::expected<T, E> { std::unexpect, std::move(error) }
    {
    }
};

} // namespace numeric

#endif
