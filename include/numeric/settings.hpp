#ifndef NUMERIC_SETTINGS_HPP
#define NUMERIC_SETTINGS_HPP

#include <cstddef>

#include "ulight/impl/platform.h"

#ifndef NDEBUG // debug builds
#define NUMERIC_DEBUG 1
#define NUMERIC_IF_DEBUG(...) __VA_ARGS__
#define NUMERIC_IF_NOT_DEBUG(...)
#else // release builds
#define NUMERIC_IF_DEBUG(...)
#define NUMERIC_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

#ifdef ULIGHT_CLANG
#define NUMERIC_CLANG 1
#endif

#ifdef ULIGHT_GCC
#define NUMERIC_GCC 1
#endif

#define NUMERIC_UNREACHABLE() __builtin_unreachable()

#define NUMERIC_HOT ULIGHT_HOT
#define NUMERIC_COLD ULIGHT_COLD

#ifdef ULIGHT_EXCEPTIONS
#define NUMERIC_EXCEPTIONS ULIGHT_EXCEPTIONS
#endif

namespace numeric {

#if defined(NUMERIC_CLANG) || defined(NUMERIC_GCC)
__extension__ typedef signed __int128 Int128; // NOLINT modernize-use-using
__extension__ typedef unsigned __int128 Uint128; // NOLINT modernize-use-using
#else
#error "numeric currently only supports Clang or GCC."
#endif

/// @brief If `true`, the current build is a debug build (not a release build).
inline constexpr bool is_debug_build = NUMERIC_IF_DEBUG(true) NUMERIC_IF_NOT_DEBUG(false);

/// @brief The amount of slots in one chunk of an `Interner`.
/// Chunks are allocated as a whole and never move,
/// so this is also the granularity in which interners grow.
inline constexpr std::size_t interner_chunk_size = 32;

/// @brief The initial buffer size used when printing a `Big_Int`
/// before falling back to a dynamic allocation.
inline constexpr std::size_t big_int_print_buffer_size = 1024;

} // namespace numeric

#endif
