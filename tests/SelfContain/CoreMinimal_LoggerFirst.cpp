// Compile-only include-order check: Logger.hpp included before the rest of the core headers
#include "VMath/Logger.hpp"
#include "VMath/CoreMinimal.hpp"

namespace {
    void TouchLoggerFirst() noexcept
    {
        VMATH_LOG_INFO("Math", "logger-first include order synthesised info path");
        VMATH_LOG_WARNING("Math", "logger-first include order synthesised warning path %d", 1);
        VMATH_LOG_ERROR("Math", "logger-first include order synthesised error path");
        VMATH_ASSERT(true, "logger-first include order synthesised assert path");
    }
}

static_assert(true, "Logger-first include order compiles with active logging macros");
