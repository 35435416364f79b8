#ifndef NUMERIC_ASSERT_HPP
#define NUMERIC_ASSERT_HPP

#include "ulight/impl/assert.hpp"

// Failed assertions are reported through the ulight assertion handler,
// which throws or aborts depending on how ulight was configured.

#define NUMERIC_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define NUMERIC_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define NUMERIC_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)

#endif
