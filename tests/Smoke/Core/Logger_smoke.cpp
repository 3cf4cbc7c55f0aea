// ============================================================================
// VMath - tests/Smoke/Core/Logger_smoke.cpp
// ----------------------------------------------------------------------------
// Purpose : Exercise the logger filters, output redirection and the
//           non-aborting assert path.
// Contract: Returns 0 on success, a distinct non-zero code per failed check.
//           Leaves the logger at its default configuration on exit.
// ============================================================================

#include "VMath/CoreMinimal.hpp"
#include "VMath/Math/Math.hpp"
#include "VMath/Math/Matrix.hpp"
#include "VMath/Math/Vector.hpp"
#include "SmokeSupport.hpp"

using namespace vmath;
using vmath::core::Logger;
using vmath::core::LogLevel;

int RunLoggerSmoke()
{
    // Runtime minimum level
    {
        tests::ScopedLogLevel level(LogLevel::Warn);
        if (Logger::GetMinLevel() != LogLevel::Warn)
        {
            return 1;
        }

        if (!Logger::IsEnabled(LogLevel::Error, VMATH_MATH_LOG_CATEGORY) ||
            Logger::IsEnabled(LogLevel::Info, VMATH_MATH_LOG_CATEGORY) ||
            Logger::IsEnabled(LogLevel::Disabled, VMATH_MATH_LOG_CATEGORY))
        {
            return 2;
        }
    }

    if (Logger::GetMinLevel() != LogLevel::Info)
    {
        return 3;
    }

    // Category filter
    {
        Logger::SetCategoryEqualsFilter(VMATH_MATH_LOG_CATEGORY);
        const bool mathEnabled = Logger::IsEnabled(LogLevel::Info, "Math");
        const bool colorEnabled = Logger::IsEnabled(LogLevel::Info, "Color");
        const bool anonymousEnabled = Logger::IsEnabled(LogLevel::Info, nullptr);
        Logger::SetCategoryEqualsFilter(nullptr);

        if (!mathEnabled || colorEnabled || anonymousEnabled)
        {
            return 4;
        }

        if (!Logger::IsEnabled(LogLevel::Info, "Color"))
        {
            return 5;
        }
    }

    // Emission through the public macros
    VMATH_LOG_INFO(VMATH_MATH_LOG_CATEGORY, "Logger smoke: epsilon=%g pi=%g", static_cast<double>(Epsilon), static_cast<double>(Pi));
    VMATH_LOG_VERBOSE(VMATH_MATH_LOG_CATEGORY, "Logger smoke: verbose line is filtered at the default level");

    // Asserts report and continue.
    {
        tests::ExpectedAssertScope quiet;
        int reached = 0;
        VMATH_ASSERT(reached == 1);
        VMATH_ASSERT(reached == 1, "Logger smoke: expected assert report");
        ++reached;
        if (reached != 1)
        {
            return 6;
        }
    }

    // VMATH_VERIFY always evaluates its condition.
    {
        int evaluations = 0;
        VMATH_VERIFY(++evaluations == 1);
        VMATH_CHECK(evaluations == 1);
        if (evaluations != 1)
        {
            return 7;
        }
    }

#if VMATH_ENABLE_LOG_ASSERT
    // Math precondition reports go out under the math category, so a category
    // filter on it keeps them while hiding generic asserts.
    {
        tests::ScopedLogCapture capture;
        if (capture.IsOpen())
        {
            Logger::SetCategoryEqualsFilter(VMATH_MATH_LOG_CATEGORY);
            const Mat2f fallback = Inverse(Mat2f::Zero());
            const float32 angle = AngleBetween(Vec3f::Zero(), Vec3f::Right());
            const bool reportedOutsideMath = false;
            VMATH_ASSERT(reportedOutsideMath, "Logger smoke: generic report hidden by the category filter");
            Logger::SetCategoryEqualsFilter(nullptr);

            if (fallback != Mat2f::Identity() || angle != 0.0f)
            {
                return 8;
            }

            if (!capture.Contains("[E][" VMATH_MATH_LOG_CATEGORY "] ") ||
                !capture.Contains("singular") ||
                !capture.Contains("zero-length"))
            {
                return 9;
            }

            if (capture.Contains("[E][" VMATH_ASSERT_CATEGORY "] "))
            {
                return 10;
            }
        }
    }

    if (Logger::GetOutputStream() != nullptr)
    {
        return 11;
    }
#endif

    return 0;
}
