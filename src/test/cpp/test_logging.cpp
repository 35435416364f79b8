#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "numeric/util/severity.hpp"

#include "numeric/big_int.hpp"
#include "numeric/collecting_logger.hpp"
#include "numeric/diagnostic.hpp"
#include "numeric/interner.hpp"
#include "numeric/services.hpp"

namespace numeric {
namespace {

TEST(Logger, min_severity)
{
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory, Severity::debug };

    EXPECT_FALSE(logger.can_log(Severity::trace));
    EXPECT_TRUE(logger.can_log(Severity::debug));
    EXPECT_TRUE(logger.can_log(Severity::fatal));

    logger.set_min_severity(Severity::none);
    EXPECT_FALSE(logger.can_log(Severity::fatal));

    EXPECT_FALSE(ignorant_logger.can_log(Severity::max));
}

TEST(Logger, severity_tag)
{
    EXPECT_EQ(severity_tag(Severity::trace), u8"TRACE");
    EXPECT_EQ(severity_tag(Severity::warning), u8"WARNING");
    EXPECT_TRUE(severity_is_emittable(Severity::debug));
    EXPECT_FALSE(severity_is_emittable(Severity::none));
}

TEST(Logger, interner_diagnostics)
{
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    Interner<std::string> interner { Interner_Options { .logger = &logger } };
    EXPECT_EQ(&interner.get_logger(), &logger);

    const Interner_Id a = interner.add("a");
    ASSERT_EQ(logger.diagnostics.size(), 1);
    const Collected_Diagnostic& grow = logger.diagnostics.front();
    EXPECT_EQ(grow.severity, Severity::debug);
    EXPECT_EQ(grow.id, diagnostic::interner_grow);
    EXPECT_EQ(
        std::u8string_view { grow.message },
        u8"Appended a chunk. The interner now has 1 chunks with 32 slots."
    );

    // An equal value in a live slot is neither a revival nor a reuse.
    interner.incr(interner.add("a"));
    EXPECT_EQ(logger.diagnostics.size(), 1);
    interner.decr(a);
    interner.decr(a);
    interner.decr(a);

    const Interner_Id revived = interner.add("a");
    EXPECT_EQ(revived, a);
    EXPECT_EQ(logger.count_logged(diagnostic::interner_revive), 1);
    EXPECT_EQ(std::u8string_view { logger.diagnostics.back().message }, u8"Slot 0 was revived.");

    interner.decr(revived);
    const Interner_Id reused = interner.add("b");
    EXPECT_EQ(reused, a);
    EXPECT_EQ(logger.count_logged(diagnostic::interner_reuse), 1);
    EXPECT_EQ(logger.diagnostics.back().severity, Severity::trace);
    EXPECT_EQ(
        std::u8string_view { logger.diagnostics.back().message },
        u8"Slot 0 was overwritten with a new value."
    );

    EXPECT_EQ(logger.count_logged(diagnostic::interner_grow), 1);
}

TEST(Logger, interner_filters_by_severity)
{
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory, Severity::debug };
    Interner<std::string> interner { Interner_Options { .logger = &logger } };

    const Interner_Id id = interner.add("x");
    interner.decr(id);
    [[maybe_unused]]
    const Interner_Id revived
        = interner.add("x");

    EXPECT_TRUE(logger.was_logged(diagnostic::interner_grow));
    EXPECT_FALSE(logger.was_logged(diagnostic::interner_revive));

    Collecting_Logger other_logger { &memory };
    interner.set_logger(other_logger);
    for (std::size_t i = 0; i < interner_chunk_size; ++i) {
        [[maybe_unused]]
        const Interner_Id fresh
            = interner.add(std::to_string(i));
    }
    EXPECT_EQ(logger.count_logged(diagnostic::interner_grow), 1);
    EXPECT_EQ(other_logger.count_logged(diagnostic::interner_grow), 1);
}

TEST(Logger, global_interner)
{
    std::pmr::monotonic_buffer_resource memory;
    Collecting_Logger logger { &memory };
    set_global_interner_logger(logger);

    const auto make_value = [] { return Big_Int::pow2(4321) + Big_Int(7); };
    {
        const Big_Int value = make_value();
        EXPECT_TRUE(value.is_interned());
    }
    {
        const Big_Int value = make_value();
        EXPECT_TRUE(value.is_interned());
    }
    set_global_interner_logger(ignorant_logger);

    EXPECT_TRUE(logger.was_logged(diagnostic::interner_revive));
    EXPECT_EQ(&global_interner().get_logger(), &ignorant_logger);
}

} // namespace
} // namespace numeric
